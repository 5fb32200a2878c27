#include "Logging.hpp"
#include "api/matchHandler.hpp"
#include "cli/boardRenderer.hpp"
#include "cli/command.hpp"
#include "cli/options.hpp"
#include "core/botRegistry.hpp"
#include "core/gameController.hpp"
#include "core/transcriptNotation.hpp"

#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <variant>

namespace connex::cli {

//! Prints bot moves and forfeits as they happen.
class MoveAnnouncer : public IGameStateListener {
public:
	explicit MoveAnnouncer(const GameController& match) : m_match(match) {
	}

	void onGameDelta(const GameDelta& delta) override {
		if (m_match.isBot(moveOwner(delta.move))) {
			std::cout << std::format("Bot played {}\n", encodeMove(delta.move));
		}
	}
	void onBotForfeit(const BotForfeit& forfeit) override {
		std::cout << std::format("Bot of player {} forfeits its turn: {}\n", forfeit.player, toString(forfeit.reason));
	}

private:
	const GameController& m_match;
};

//! Session state shared by the command handlers.
struct Session {
	GameController& match;
	bool running{true};
};

static void reportViolation(const std::optional<RuleViolation>& violation) {
	if (violation) {
		std::cout << std::format("Move rejected: {}\n", toString(*violation));
	}
}

static void saveTranscript(const GameController& match, const std::string& path) {
	std::ofstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Cli] Could not open '{}' for writing.", path));
		std::cout << std::format("Could not write '{}'.\n", path);
		return;
	}

	file << match.exportTranscript();
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Cli] Failed writing '{}'.", path));
		std::cout << std::format("Could not write '{}'.\n", path);
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Cli] Saved transcript to '{}'.", path));
	std::cout << std::format("Saved to {}\n", path);
}

static void loadTranscript(GameController& match, const std::string& path) {
	std::ifstream file(path);
	if (!file) {
		std::cout << std::format("Could not read '{}'.\n", path);
		return;
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	if (const auto error = match.loadTranscript(buffer.str())) {
		std::cout << std::format("Could not load '{}': {}\n", path, describe(*error));
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Cli] Loaded transcript from '{}'.", path));
	std::cout << renderBoard(match.state());
}

static void execute(Session& session, const Command& command) {
	auto& match       = session.match;
	const auto player = match.state().currentPlayer();

	std::visit(
	        [&](const auto& cmd) {
		        using T = std::decay_t<decltype(cmd)>;
		        if constexpr (std::is_same_v<T, PlaceCommand>) {
			        reportViolation(match.submitMove(Placement{player, cmd.coord}));
		        } else if constexpr (std::is_same_v<T, SwapCommand>) {
			        reportViolation(match.submitMove(Action{player, ActionKind::Swap}));
		        } else if constexpr (std::is_same_v<T, ResignCommand>) {
			        reportViolation(match.submitMove(Action{player, ActionKind::Resign}));
		        } else if constexpr (std::is_same_v<T, ShowCommand>) {
			        std::cout << renderBoard(match.state());
		        } else if constexpr (std::is_same_v<T, PositionCommand>) {
			        std::cout << match.exportPosition();
		        } else if constexpr (std::is_same_v<T, TranscriptCommand>) {
			        std::cout << match.exportTranscript();
		        } else if constexpr (std::is_same_v<T, SaveCommand>) {
			        saveTranscript(match, cmd.path);
		        } else if constexpr (std::is_same_v<T, LoadCommand>) {
			        loadTranscript(match, cmd.path);
		        } else if constexpr (std::is_same_v<T, HelpCommand>) {
			        std::cout << helpText();
		        } else if constexpr (std::is_same_v<T, ExitCommand>) {
			        session.running = false;
		        } else if constexpr (std::is_same_v<T, InvalidCommand>) {
			        std::cout << cmd.message << '\n';
		        }
	        },
	        command);
}

//! Terminal play until the match ends, stdin closes or the user exits.
static int runInteractive(const Options& options, const BotRegistry& registry) {
	GameController match(options.config, registry, options.match);
	if (options.mode == Mode::Computer) {
		if (const auto error = match.assignBot(1u, options.botName)) {
			std::cerr << std::format("Bot '{}' not available ({}).\n", options.botName, toString(*error));
			return 1;
		}
	}

	MoveAnnouncer announcer(match);
	match.subscribe(&announcer);

	Session session{match};
	std::cout << renderBoard(match.state());

	std::string line;
	while (session.running) {
		if (match.isBotTurn()) {
			if (const auto error = match.playBotTurn()) {
				Logger().Log(Logging::LogLevel::Warning, std::format("[Cli] Bot turn forfeited: {}.", toString(*error)));
			}
			std::cout << renderBoard(match.state());
			continue;
		}
		if (match.phase() == Phase::Finished) {
			std::cout << std::format("Game over: {}\n", toString(match.state().status()));
			break;
		}

		std::cout << std::format("Player {}, move (help = show commands)? ", match.state().currentPlayer());
		if (!std::getline(std::cin, line)) {
			break;
		}

		const auto movesBefore = match.state().moveCount();
		execute(session, parseCommand(line, match.state().size()));
		if (match.state().moveCount() != movesBefore) {
			std::cout << renderBoard(match.state());
		}
	}

	match.unsubscribe(&announcer);
	return 0;
}

//! One JSON request per input line, one JSON response per output line.
static int runService(const Options& options, const BotRegistry& registry) {
	api::MatchHandler handler(registry, options.match);

	std::string line;
	while (std::getline(std::cin, line)) {
		if (line.empty()) {
			continue;
		}
		std::cout << handler.handleMessage(line) << std::endl;
	}
	return 0;
}

} // namespace connex::cli

int main(int argc, char** argv) {
	using namespace connex;

	cli::Options options;
	if (const auto error = cli::parseOptions(argc, argv, options)) {
		std::cerr << *error << '\n' << cli::usageText();
		return 1;
	}

	BotRegistry registry;
	if (!registerDefaultBots(registry)) {
		std::cerr << "Could not register the built-in bots.\n";
		return 1;
	}
	registry.freeze();

	cli::Logger().Log(Logging::LogLevel::Info, "[Cli] Starting.");
	if (options.mode == cli::Mode::Service) {
		return cli::runService(options, registry);
	}
	return cli::runInteractive(options, registry);
}
