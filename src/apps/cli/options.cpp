#include "cli/options.hpp"

#include <charconv>
#include <format>
#include <string_view>
#include <utility>

namespace connex::cli {

static bool parseNumber(std::string_view text, long long& out) {
	const auto* end      = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, out);
	return !text.empty() && ec == std::errc{} && ptr == end;
}

static std::optional<Mode> modeFromString(std::string_view text) {
	if (text == "human") {
		return Mode::Human;
	}
	if (text == "computer") {
		return Mode::Computer;
	}
	if (text == "service") {
		return Mode::Service;
	}
	return {};
}

static std::optional<ForfeitPolicy> policyFromString(std::string_view text) {
	if (text == "loss") {
		return ForfeitPolicy::Loss;
	}
	if (text == "skip") {
		return ForfeitPolicy::SkipTurn;
	}
	return {};
}

std::optional<std::string> parseOptions(int argc, const char* const* argv, Options& out) {
	Options options;

	for (int i = 1; i < argc; ++i) {
		const std::string_view flag = argv[i];
		if (i + 1 >= argc) {
			return std::format("Missing value for '{}'.", flag);
		}
		const std::string_view value = argv[++i];

		long long number{};
		if (flag == "--size") {
			if (!parseNumber(value, number) || number < static_cast<long long>(MIN_BOARD_SIZE) || number > static_cast<long long>(MAX_BOARD_SIZE)) {
				return std::format("Board size must be between {} and {}.", MIN_BOARD_SIZE, MAX_BOARD_SIZE);
			}
			options.config.size = static_cast<std::size_t>(number);
		} else if (flag == "--players") {
			if (!parseNumber(value, number) || number < MIN_PLAYERS || number > MAX_PLAYERS) {
				return std::format("Player count must be between {} and {}.", MIN_PLAYERS, MAX_PLAYERS);
			}
			options.config.numPlayers = static_cast<unsigned>(number);
		} else if (flag == "--variant") {
			const auto variant = variantFromString(value);
			if (!variant) {
				return std::format("Unknown variant '{}'.", value);
			}
			options.config.variant = *variant;
		} else if (flag == "--mode") {
			const auto mode = modeFromString(value);
			if (!mode) {
				return std::format("Unknown mode '{}'.", value);
			}
			options.mode = *mode;
		} else if (flag == "--bot") {
			options.botName = std::string{value};
		} else if (flag == "--budget") {
			if (!parseNumber(value, number) || number < 0) {
				return std::format("Invalid time budget '{}'.", value);
			}
			options.match.botTimeBudget = std::chrono::milliseconds(number);
		} else if (flag == "--forfeit") {
			const auto policy = policyFromString(value);
			if (!policy) {
				return std::format("Unknown forfeit policy '{}'.", value);
			}
			options.match.forfeitPolicy = *policy;
		} else {
			return std::format("Unknown option '{}'.", flag);
		}
	}

	out = std::move(options);
	return {};
}

std::string usageText() {
	return "Usage: connex [options]\n"
	       "  --size N                      Board size (default 7)\n"
	       "  --players N                   Number of players (default 2)\n"
	       "  --variant Standard|Square     Board geometry (default Standard)\n"
	       "  --mode human|computer|service Terminal play, play against a bot or JSON service (default human)\n"
	       "  --bot NAME                    Bot for computer mode (default random_bot)\n"
	       "  --budget MS                   Time per bot move, 0 for no limit (default 2000)\n"
	       "  --forfeit loss|skip           What a failing bot loses (default skip)\n";
}

} // namespace connex::cli
