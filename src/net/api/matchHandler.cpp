#include "api/matchHandler.hpp"

#include "Logging.hpp"
#include "core/botRunner.hpp"
#include "core/positionNotation.hpp"
#include "core/ruleEngine.hpp"

#include <format>
#include <utility>

namespace connex::api {

static constexpr std::string_view ERROR_MALFORMED = "MalformedRequest";
static constexpr std::string_view ERROR_NO_MATCH  = "NoMatch";
static constexpr std::string_view ERROR_CONFIG    = "InvalidConfig";
static constexpr std::string_view ERROR_SEAT      = "InvalidSeat";

static ErrorReply requestError(std::string_view kind, std::string message) {
	return ErrorReply{.category = ErrorCategory::Request, .kind = std::string{kind}, .message = std::move(message)};
}

static ErrorReply ruleError(RuleViolation violation) {
	return ErrorReply{.category = ErrorCategory::Rule, .kind = std::string{toString(violation)}, .message = "Move rejected."};
}

static ErrorReply botError(BotError error, std::string message) {
	return ErrorReply{.category = ErrorCategory::Bot, .kind = std::string{toString(error)}, .message = std::move(message)};
}

static ErrorReply parseError(const ParseError& error) {
	return ErrorReply{.category = ErrorCategory::Parse, .kind = std::string{toString(error.kind)}, .message = describe(error)};
}

static std::string joinNames(const std::vector<std::string>& names) {
	std::string joined;
	for (const auto& name: names) {
		if (!joined.empty()) {
			joined += ", ";
		}
		joined += name;
	}
	return joined;
}

MatchHandler::MatchHandler(const BotRegistry& registry, MatchOptions options) : m_registry(registry), m_options(options) {
}

Response MatchHandler::handle(const Request& request) {
	return std::visit([&](const auto& r) { return handleRequest(r); }, request);
}

std::string MatchHandler::handleMessage(const std::string& message) {
	const auto request = fromRequestMessage(message);
	if (!request) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[MatchHandler] Malformed request: {}", message));
		return toMessage(Response{requestError(ERROR_MALFORMED, "Request is not a valid message.")});
	}
	return toMessage(handle(*request));
}

bool MatchHandler::hasMatch() const {
	return m_match != nullptr;
}

const GameController* MatchHandler::match() const {
	return m_match.get();
}

Response MatchHandler::handleRequest(const NewGame& request) {
	if (!isValid(request.config)) {
		return requestError(ERROR_CONFIG, std::format("Board size {} with {} players is not supported.", request.config.size, request.config.numPlayers));
	}
	if (request.botSeat && *request.botSeat >= request.config.numPlayers) {
		return requestError(ERROR_SEAT, std::format("Seat {} is not part of the match.", *request.botSeat));
	}

	auto match = std::make_unique<GameController>(request.config, m_registry, m_options);
	if (request.botSeat) {
		if (const auto error = match->assignBot(*request.botSeat, request.botName)) {
			return botError(*error, std::format("Unknown bot '{}'. Available: {}.", request.botName, joinNames(m_registry.names())));
		}
	}

	m_match = std::move(match);
	Logger().Log(Logging::LogLevel::Info, "[MatchHandler] Started a new match.");

	playBots();
	return result();
}

Response MatchHandler::handleRequest(const SubmitMove& request) {
	if (!m_match) {
		return requestError(ERROR_NO_MATCH, "No match has been started.");
	}

	if (const auto violation = m_match->submitMove(request.move)) {
		return ruleError(*violation);
	}

	playBots();
	return result();
}

Response MatchHandler::handleRequest(const ExportTranscript&) {
	if (!m_match) {
		return requestError(ERROR_NO_MATCH, "No match has been started.");
	}
	return TranscriptText{m_match->exportTranscript()};
}

Response MatchHandler::handleRequest(const ExportPosition&) {
	if (!m_match) {
		return requestError(ERROR_NO_MATCH, "No match has been started.");
	}
	return PositionText{m_match->exportPosition()};
}

Response MatchHandler::handleRequest(const ChooseMove& request) {
	std::shared_ptr<IBot> bot;
	if (const auto error = m_registry.lookup(request.botName, bot)) {
		return botError(*error, std::format("Unknown bot '{}'. Available: {}.", request.botName, joinNames(m_registry.names())));
	}

	BoardState state;
	if (const auto error = decodePosition(request.position, state, {.numPlayers = request.numPlayers, .variant = request.variant})) {
		return parseError(*error);
	}
	if (state.isOver()) {
		return ruleError(RuleViolation::GameAlreadyOver);
	}

	Move move{};
	if (const auto error = requestBotMove(bot, state, m_options.botTimeBudget, move)) {
		return botError(*error, std::format("Bot '{}' did not answer.", request.botName));
	}
	const auto violation = isPass(move) ? std::optional{RuleViolation::PassNotAllowed} : checkMove(state, move);
	if (violation) {
		return botError(BotError::IllegalMove, std::format("Bot '{}' chose an illegal move: {}.", request.botName, toString(*violation)));
	}
	return BotMove{.botName = request.botName, .move = move};
}

void MatchHandler::playBots() {
	while (m_match->isBotTurn()) {
		const auto player = m_match->state().currentPlayer();
		if (const auto error = m_match->playBotTurn()) {
			Logger().Log(Logging::LogLevel::Info, std::format("[MatchHandler] Bot of player {} forfeited: {}.", player, toString(*error)));
		}
	}
}

MoveResult MatchHandler::result() const {
	const auto& state = m_match->state();
	return MoveResult{.moveCount = state.moveCount(), .next = state.currentPlayer(), .status = state.status()};
}

} // namespace connex::api
