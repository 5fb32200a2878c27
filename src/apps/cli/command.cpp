#include "cli/command.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace connex::cli {

static std::vector<std::string_view> splitWords(std::string_view line) {
	std::vector<std::string_view> words;

	std::size_t pos = 0;
	while (pos < line.size()) {
		const auto start = line.find_first_not_of(" \t\r", pos);
		if (start == std::string_view::npos) {
			break;
		}
		const auto end = line.find_first_of(" \t\r", start);
		words.push_back(line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
		pos = end == std::string_view::npos ? line.size() : end;
	}
	return words;
}

static bool parseIndex(std::string_view text, Id& out) {
	const auto* end      = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, out);
	return !text.empty() && ec == std::errc{} && ptr == end;
}

static Command parsePlacement(std::string_view word, std::size_t boardSize) {
	const auto comma = word.find(',');
	if (comma == std::string_view::npos) {
		return InvalidCommand{std::format("Unknown command '{}'. Type 'help' for a list of commands.", word)};
	}

	Id row{}, col{};
	if (!parseIndex(word.substr(0, comma), row) || !parseIndex(word.substr(comma + 1), col)) {
		return InvalidCommand{std::format("Invalid cell '{}'. Expected <row>,<col>.", word)};
	}
	if (row >= boardSize || col >= boardSize) {
		return InvalidCommand{std::format("Cell {},{} is off the board (size {}).", row, col, boardSize)};
	}
	return PlaceCommand{Coord{row, col}};
}

Command parseCommand(std::string_view line, std::size_t boardSize) {
	const auto words = splitWords(line);
	if (words.empty()) {
		return EmptyCommand{};
	}

	const auto name = words.front();
	if (name == "save" || name == "load") {
		if (words.size() < 2u) {
			return InvalidCommand{std::format("File name required for {}.", name)};
		}
		if (name == "save") {
			return SaveCommand{std::string{words[1]}};
		}
		return LoadCommand{std::string{words[1]}};
	}

	if (words.size() > 1u) {
		return InvalidCommand{std::format("Command '{}' takes no arguments.", name)};
	}

	if (name == "swap") {
		return SwapCommand{};
	}
	if (name == "resign") {
		return ResignCommand{};
	}
	if (name == "show") {
		return ShowCommand{};
	}
	if (name == "position") {
		return PositionCommand{};
	}
	if (name == "transcript") {
		return TranscriptCommand{};
	}
	if (name == "help") {
		return HelpCommand{};
	}
	if (name == "exit" || name == "quit") {
		return ExitCommand{};
	}
	return parsePlacement(name, boardSize);
}

std::string helpText() {
	return "Available commands:\n"
	       "  <row>,<col>   Place a stone on the cell\n"
	       "  swap          Take over the first stone (second move only)\n"
	       "  resign        Give up the match\n"
	       "  show          Print the board\n"
	       "  position      Print the position notation\n"
	       "  transcript    Print the transcript notation\n"
	       "  save <file>   Save the transcript to a file\n"
	       "  load <file>   Load a transcript from a file\n"
	       "  help          Show this help\n"
	       "  exit          Leave the program\n";
}

} // namespace connex::cli
