#pragma once

#include "core/botRegistry.hpp"
#include "core/gameController.hpp"
#include "model/config.hpp"

#include <optional>
#include <string>

namespace connex::cli {

enum class Mode {
	Human,    //!< All seats typed at the terminal.
	Computer, //!< Seat 1 is played by a bot.
	Service   //!< JSON requests on stdin, responses on stdout.
};

struct Options {
	Config config{};
	Mode mode{Mode::Human};
	std::string botName{RANDOM_BOT_NAME};
	MatchOptions match{};
};

//! Parse command line flags.
//! \returns Error message for unknown flags, missing values or values out of range.
std::optional<std::string> parseOptions(int argc, const char* const* argv, Options& out);

std::string usageText();

} // namespace connex::cli
