#pragma once

#include "model/coordinate.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace connex::cli {

struct PlaceCommand {
	Coord coord;
};
struct SwapCommand {};
struct ResignCommand {};
struct ShowCommand {};
struct PositionCommand {};
struct TranscriptCommand {};
struct SaveCommand {
	std::string path;
};
struct LoadCommand {
	std::string path;
};
struct HelpCommand {};
struct ExitCommand {};
struct EmptyCommand {};
struct InvalidCommand {
	std::string message;
};

using Command = std::variant<PlaceCommand, SwapCommand, ResignCommand, ShowCommand, PositionCommand, TranscriptCommand, SaveCommand,
                             LoadCommand, HelpCommand, ExitCommand, EmptyCommand, InvalidCommand>;

//! Parse one line of terminal input.
//! \param boardSize Placements outside the board are reported as invalid.
Command parseCommand(std::string_view line, std::size_t boardSize);

//! Text listing every command.
std::string helpText();

} // namespace connex::cli
