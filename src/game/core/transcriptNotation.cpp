#include "core/transcriptNotation.hpp"

#include "core/ruleEngine.hpp"
#include "notationText.hpp"

#include <format>
#include <utility>

namespace connex {

static constexpr std::string_view CONFIG_PREFIX = "config:";
static constexpr std::string_view MOVES_HEADER  = "moves:";
static constexpr std::string_view KEY_SIZE      = "size=";
static constexpr std::string_view KEY_PLAYERS   = "players=";
static constexpr std::string_view KEY_VARIANT   = "variant=";

static constexpr std::string_view ACTION_SWAP   = "swap";
static constexpr std::string_view ACTION_RESIGN = "resign";
static constexpr std::string_view ACTION_PASS   = "pass";

//! Lines before the first move.
static constexpr std::size_t HEADER_LINES = 2u;

static std::string_view actionName(ActionKind kind) {
	switch (kind) {
	case ActionKind::Swap:
		return ACTION_SWAP;
	case ActionKind::Resign:
		return ACTION_RESIGN;
	case ActionKind::Pass:
		return ACTION_PASS;
	}
	return {};
}

std::string encodeMove(const Move& move) {
	if (const auto* placement = std::get_if<Placement>(&move)) {
		return std::format("P{} {},{}", placement->player, placement->coord.row, placement->coord.col);
	}

	const auto& action = std::get<Action>(move);
	return std::format("P{} {}", action.player, actionName(action.kind));
}

std::string encodeTranscript(const Transcript& transcript) {
	const auto& config = transcript.config;

	std::string text = std::format("{} {}{} {}{} {}{}\n{}\n", CONFIG_PREFIX, KEY_SIZE, config.size, KEY_PLAYERS, config.numPlayers, KEY_VARIANT,
	                               toString(config.variant), MOVES_HEADER);
	for (const auto& move: transcript.moves) {
		text += encodeMove(move);
		text += '\n';
	}
	return text;
}

std::optional<ParseError> replayTranscript(const Transcript& transcript, BoardState& out) {
	if (!isValid(transcript.config)) {
		return makeError(ParseError::Kind::OutOfRange, 1u, "Unsupported board config.");
	}

	BoardState state{transcript.config};
	for (std::size_t i = 0; i < transcript.moves.size(); ++i) {
		const auto& move = transcript.moves[i];
		if (const auto violation = applyMoveInPlace(state, move)) {
			const auto kind = *violation == RuleViolation::CellOccupied ? ParseError::Kind::DuplicateCell : ParseError::Kind::IllegalMove;

			auto error      = makeError(kind, HEADER_LINES + i + 1u, std::format("Move {} '{}' rejected: {}.", i + 1u, encodeMove(move), toString(*violation)));
			error.violation = *violation;
			return error;
		}
	}

	out = std::move(state);
	return {};
}

//! Take the next " key=value" token off the front of fields.
static bool nextField(std::string_view& fields, std::string_view key, std::string_view& value) {
	if (!fields.starts_with(' ')) {
		return false;
	}
	fields = fields.substr(1u);

	const auto end   = fields.find(' ');
	const auto token = fields.substr(0u, end);
	fields           = end == std::string_view::npos ? std::string_view{} : fields.substr(end);

	const auto rest = valueAfter(token, key);
	if (!rest) {
		return false;
	}
	value = *rest;
	return true;
}

//! Split "key=value" tokens of the config line in their fixed order.
static std::optional<ParseError> parseConfigLine(std::string_view line, std::size_t lineNo, Config& out) {
	const auto unexpected = [&](std::string_view what) {
		return makeError(ParseError::Kind::UnexpectedToken, lineNo, std::format("Malformed config line: {}.", what));
	};

	const auto rest = valueAfter(line, CONFIG_PREFIX);
	if (!rest) {
		return unexpected("missing 'config:'");
	}

	std::string_view fields = *rest;

	std::string_view sizeText, playersText, variantText;
	if (!nextField(fields, KEY_SIZE, sizeText)) {
		return unexpected("expected 'size='");
	}
	if (!nextField(fields, KEY_PLAYERS, playersText)) {
		return unexpected("expected 'players='");
	}
	if (!nextField(fields, KEY_VARIANT, variantText)) {
		return unexpected("expected 'variant='");
	}
	if (!fields.empty()) {
		return unexpected("trailing text");
	}

	std::size_t size{}, players{};
	if (auto error = parseNumber(sizeText, lineNo, "size", size)) {
		return error;
	}
	if (auto error = parseNumber(playersText, lineNo, "players", players)) {
		return error;
	}
	if (size < MIN_BOARD_SIZE || size > MAX_BOARD_SIZE) {
		return makeError(ParseError::Kind::OutOfRange, lineNo, std::format("Board size {} is not supported.", size));
	}
	if (players < MIN_PLAYERS || players > MAX_PLAYERS) {
		return makeError(ParseError::Kind::OutOfRange, lineNo, std::format("Player count {} is not supported.", players));
	}

	const auto variant = variantFromString(variantText);
	if (!variant) {
		return makeError(ParseError::Kind::UnsupportedVariant, lineNo, std::format("Unknown variant '{}'.", variantText));
	}

	out = Config{.size = size, .numPlayers = static_cast<unsigned>(players), .variant = *variant};
	return {};
}

static std::optional<ParseError> parseMoveLine(std::string_view line, std::size_t lineNo, const Config& config, Move& out) {
	if (!line.starts_with('P')) {
		return makeError(ParseError::Kind::UnexpectedToken, lineNo, "Move line must start with 'P'.");
	}

	const auto space = line.find(' ');
	if (space == std::string_view::npos) {
		return makeError(ParseError::Kind::UnexpectedToken, lineNo, "Move line is missing the move.");
	}

	std::size_t player{};
	if (auto error = parseNumber(line.substr(1u, space - 1u), lineNo, "player", player)) {
		return error;
	}
	if (player >= config.numPlayers) {
		return makeError(ParseError::Kind::OutOfRange, lineNo, std::format("Player {} is not part of the match.", player));
	}
	const auto id = static_cast<PlayerId>(player);

	const auto body = line.substr(space + 1u);
	if (body == ACTION_SWAP) {
		out = Action{id, ActionKind::Swap};
		return {};
	}
	if (body == ACTION_RESIGN) {
		out = Action{id, ActionKind::Resign};
		return {};
	}
	if (body == ACTION_PASS) {
		out = Action{id, ActionKind::Pass};
		return {};
	}

	const auto comma = body.find(',');
	if (comma == std::string_view::npos) {
		return makeError(ParseError::Kind::UnexpectedToken, lineNo, std::format("Unknown move '{}'.", body));
	}

	std::size_t row{}, col{};
	if (auto error = parseNumber(body.substr(0u, comma), lineNo, "row", row)) {
		return error;
	}
	if (auto error = parseNumber(body.substr(comma + 1u), lineNo, "column", col)) {
		return error;
	}
	if (row >= config.size || col >= config.size) {
		return makeError(ParseError::Kind::OutOfRange, lineNo, std::format("Cell {},{} is off the board.", row, col));
	}

	out = Placement{id, Coord{static_cast<Id>(row), static_cast<Id>(col)}};
	return {};
}

std::optional<ParseError> decodeTranscript(std::string_view text, Transcript& outTranscript, BoardState& outState) {
	LineReader reader{text};
	Transcript transcript;

	const auto configLine = reader.next();
	if (!configLine) {
		return makeError(ParseError::Kind::UnexpectedToken, 1u, "Missing config line.");
	}
	if (auto error = parseConfigLine(*configLine, reader.line(), transcript.config)) {
		return error;
	}

	const auto header = reader.next();
	if (!header) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line() + 1u, "Missing 'moves:' line.");
	}
	if (*header != MOVES_HEADER) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line(), "Expected 'moves:'.");
	}

	while (const auto line = reader.next()) {
		Move move{};
		if (auto error = parseMoveLine(*line, reader.line(), transcript.config, move)) {
			return error;
		}
		transcript.moves.push_back(move);
	}

	BoardState state{transcript.config};
	if (auto error = replayTranscript(transcript, state)) {
		return error;
	}

	outTranscript = std::move(transcript);
	outState      = std::move(state);
	return {};
}

} // namespace connex
