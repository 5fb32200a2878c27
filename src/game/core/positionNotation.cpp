#include "core/positionNotation.hpp"

#include "notationText.hpp"

#include <format>
#include <utility>

namespace connex {

static constexpr std::string_view KEY_SIZE   = "size=";
static constexpr std::string_view KEY_GRID   = "grid=";
static constexpr std::string_view KEY_TURN   = "turn=";
static constexpr std::string_view KEY_STATUS = "status=";
static constexpr char EMPTY_CELL             = '.';

std::string encodePosition(const BoardState& state) {
	const auto size = state.size();

	std::string text = std::format("{}{}\n{}\n", KEY_SIZE, size, KEY_GRID);
	text.reserve(text.size() + size * (size + 1u) + 32u);

	for (Id row = 0; row < size; ++row) {
		for (Id col = 0; col < size; ++col) {
			const auto owner = state.ownerAt({row, col});
			text += owner ? static_cast<char>('0' + *owner) : EMPTY_CELL;
		}
		text += '\n';
	}

	text += std::format("{}{}\n{}{}\n", KEY_TURN, state.currentPlayer(), KEY_STATUS, toString(state.status()));
	return text;
}

//! Read the next line and strip its key. Reports missing lines and wrong keys.
static std::optional<ParseError> readField(LineReader& reader, std::string_view key, std::string_view& value) {
	const auto line = reader.next();
	if (!line) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line() + 1u, std::format("Missing '{}' line.", key));
	}

	const auto rest = valueAfter(*line, key);
	if (!rest) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line(), std::format("Expected '{}'.", key));
	}
	value = *rest;
	return {};
}

static std::optional<ParseError> readRows(LineReader& reader, BoardState& state) {
	const auto size       = state.size();
	const auto numPlayers = state.config().numPlayers;

	for (Id row = 0; row < size; ++row) {
		const auto line = reader.next();
		if (!line) {
			return makeError(ParseError::Kind::UnexpectedToken, reader.line() + 1u, std::format("Missing grid row {}.", row));
		}
		if (line->size() != size) {
			return makeError(ParseError::Kind::UnexpectedToken, reader.line(), std::format("Grid row {} has {} cells, expected {}.", row, line->size(), size));
		}

		for (Id col = 0; col < size; ++col) {
			const auto cell = (*line)[col];
			if (cell == EMPTY_CELL) {
				continue;
			}
			if (cell < '0' || cell > '9') {
				return makeError(ParseError::Kind::UnexpectedToken, reader.line(), std::format("Invalid cell byte {:#04x} in column {}.", static_cast<unsigned char>(cell), col));
			}

			const auto owner = static_cast<PlayerId>(cell - '0');
			if (owner >= numPlayers) {
				return makeError(ParseError::Kind::OutOfRange, reader.line(), std::format("Owner {} in column {} is not a player.", owner, col));
			}
			state.place({row, col}, owner);
		}
	}
	return {};
}

//! The status line has to be explainable by the stones on the board.
static std::optional<ParseError> checkStatus(const BoardState& state, std::size_t line) {
	const auto& status    = state.status();
	const auto numPlayers = state.config().numPlayers;

	for (PlayerId p = 0; p < numPlayers; ++p) {
		if (!state.hasConnected(p)) {
			continue;
		}
		if (status.kind != GameStatus::Kind::Won || status.player != p) {
			return makeError(ParseError::Kind::InconsistentStatus, line, std::format("Player {} is connected but status is {}.", p, toString(status)));
		}
	}

	switch (status.kind) {
	case GameStatus::Kind::InProgress:
		break;
	case GameStatus::Kind::Won:
		if (!state.hasConnected(status.player)) {
			return makeError(ParseError::Kind::InconsistentStatus, line, std::format("Winner {} has no connection.", status.player));
		}
		if (state.currentPlayer() != nextPlayer(status.player, numPlayers)) {
			return makeError(ParseError::Kind::InconsistentStatus, line, std::format("Turn {} cannot follow a win by {}.", state.currentPlayer(), status.player));
		}
		break;
	case GameStatus::Kind::Resigned:
		if (state.currentPlayer() != status.player) {
			return makeError(ParseError::Kind::InconsistentStatus, line, std::format("Player {} resigned while {} is on turn.", status.player, state.currentPlayer()));
		}
		break;
	}
	return {};
}

//! Stones plus one for a swap and one for a resignation.
//! A swap is visible as the turn running one seat ahead of the stone count.
static unsigned deriveMoveCount(const BoardState& state) {
	const auto stones     = static_cast<unsigned>(state.stones().size());
	const auto numPlayers = state.config().numPlayers;

	unsigned count = stones;
	if (stones >= 1u && state.currentPlayer() == (stones + 1u) % numPlayers) {
		++count;
	}
	if (state.status().kind == GameStatus::Kind::Resigned) {
		++count;
	}
	return count;
}

std::optional<ParseError> decodePosition(std::string_view text, BoardState& out, const PositionContext& context) {
	LineReader reader{text};
	std::string_view value;

	if (auto error = readField(reader, KEY_SIZE, value)) {
		return error;
	}
	std::size_t size{};
	if (auto error = parseNumber(value, reader.line(), "size", size)) {
		return error;
	}

	const Config config{.size = size, .numPlayers = context.numPlayers, .variant = context.variant};
	if (!isValid(config)) {
		return makeError(ParseError::Kind::OutOfRange, reader.line(),
		                 std::format("Board size {} with {} players is not supported.", size, context.numPlayers));
	}
	BoardState state{config};

	if (auto error = readField(reader, KEY_GRID, value)) {
		return error;
	}
	if (!value.empty()) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line(), "Unexpected text after 'grid='.");
	}

	if (auto error = readRows(reader, state)) {
		return error;
	}

	if (auto error = readField(reader, KEY_TURN, value)) {
		return error;
	}
	std::size_t turn{};
	if (auto error = parseNumber(value, reader.line(), "turn", turn)) {
		return error;
	}
	if (turn >= config.numPlayers) {
		return makeError(ParseError::Kind::OutOfRange, reader.line(), std::format("Turn {} is not a player.", turn));
	}
	state.setCurrentPlayer(static_cast<PlayerId>(turn));

	if (auto error = readField(reader, KEY_STATUS, value)) {
		return error;
	}
	const auto status = statusFromString(value);
	if (!status) {
		return makeError(ParseError::Kind::UnexpectedToken, reader.line(), std::format("Invalid status '{}'.", value));
	}
	if (status->kind != GameStatus::Kind::InProgress && status->player >= config.numPlayers) {
		return makeError(ParseError::Kind::OutOfRange, reader.line(), std::format("Status player {} is not a player.", status->player));
	}
	state.setStatus(*status);
	const auto statusLine = reader.line();

	while (const auto line = reader.next()) {
		if (!line->empty()) {
			return makeError(ParseError::Kind::UnexpectedToken, reader.line(), "Unexpected text after the status line.");
		}
	}

	if (auto error = checkStatus(state, statusLine)) {
		return error;
	}
	state.setMoveCount(deriveMoveCount(state));

	out = std::move(state);
	return {};
}

} // namespace connex
