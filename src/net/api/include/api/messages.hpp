#pragma once

#include "model/config.hpp"
#include "model/gameStatus.hpp"
#include "model/move.hpp"

#include <optional>
#include <string>
#include <variant>

namespace connex::api {

// Requests (transport -> match)
struct NewGame {
	Config config;
	std::optional<PlayerId> botSeat{}; //!< Seat to hand to a bot.
	std::string botName{};             //!< Bot for botSeat.
};
struct SubmitMove {
	Move move;
};
struct ExportTranscript {};
struct ExportPosition {};

//! Stateless bot query on a position.
struct ChooseMove {
	std::string botName;
	std::string position; //!< Position notation.
	unsigned numPlayers{2u};
	Variant variant{Variant::Standard};
};

// Responses (match -> transport)
struct MoveResult {
	unsigned moveCount;
	PlayerId next;
	GameStatus status;
};
struct PositionText {
	std::string position;
};
struct TranscriptText {
	std::string transcript;
};
struct BotMove {
	std::string botName;
	Move move;
};

//! Error category on the wire.
enum class ErrorCategory { Parse, Rule, Bot, Request };

struct ErrorReply {
	ErrorCategory category;
	std::string kind;    //!< Name of the error kind, e.g. CellOccupied.
	std::string message; //!< Human readable detail.
};

using Request  = std::variant<NewGame, SubmitMove, ExportTranscript, ExportPosition, ChooseMove>;
using Response = std::variant<MoveResult, PositionText, TranscriptText, BotMove, ErrorReply>;

// Serialize typed messages to JSON.
std::string toMessage(const Request& request);
std::string toMessage(const Response& response);

// Parse JSON messages into typed messages. Returns empty on invalid input.
std::optional<Request> fromRequestMessage(const std::string& message);
std::optional<Response> fromResponseMessage(const std::string& message);

} // namespace connex::api
