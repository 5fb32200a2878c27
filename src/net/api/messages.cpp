#include "api/messages.hpp"

#include "core/botRegistry.hpp"

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <string_view>
#include <utility>

namespace connex::api {

using nlohmann::json;

static constexpr std::string_view TYPE_NEW        = "new";
static constexpr std::string_view TYPE_MOVE       = "move";
static constexpr std::string_view TYPE_TRANSCRIPT = "transcript";
static constexpr std::string_view TYPE_POSITION   = "position";
static constexpr std::string_view TYPE_CHOOSE     = "choose";
static constexpr std::string_view TYPE_MOVED      = "moved";
static constexpr std::string_view TYPE_BOT_MOVE   = "botMove";
static constexpr std::string_view TYPE_ERROR      = "error";

static std::string_view actionName(ActionKind kind) {
	switch (kind) {
	case ActionKind::Swap:
		return "swap";
	case ActionKind::Resign:
		return "resign";
	case ActionKind::Pass:
		return "pass";
	}
	return {};
}

//! Players and bots never pass. Passes only appear in transcripts as forfeit records.
static std::optional<ActionKind> actionFromName(std::string_view name) {
	if (name == "swap") {
		return ActionKind::Swap;
	}
	if (name == "resign") {
		return ActionKind::Resign;
	}
	return {};
}

static std::string_view categoryName(ErrorCategory category) {
	switch (category) {
	case ErrorCategory::Parse:
		return "parse";
	case ErrorCategory::Rule:
		return "rule";
	case ErrorCategory::Bot:
		return "bot";
	case ErrorCategory::Request:
		return "request";
	}
	return {};
}

static std::optional<ErrorCategory> categoryFromName(std::string_view name) {
	for (const auto category: {ErrorCategory::Parse, ErrorCategory::Rule, ErrorCategory::Bot, ErrorCategory::Request}) {
		if (categoryName(category) == name) {
			return category;
		}
	}
	return {};
}

//! Move fields shared by move requests and bot answers.
static void writeMove(json& j, const Move& move) {
	if (const auto* placement = std::get_if<Placement>(&move)) {
		j["player"] = placement->player;
		j["row"]    = placement->coord.row;
		j["col"]    = placement->coord.col;
		return;
	}

	const auto& action = std::get<Action>(move);
	j["player"]        = action.player;
	j["action"]        = actionName(action.kind);
}

// Field readers. Missing or ill-typed fields yield empty.
static std::optional<unsigned> readUnsigned(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_number_unsigned()) {
		return {};
	}

	const auto value = it->get<std::uint64_t>();
	if (value > std::numeric_limits<unsigned>::max()) {
		return {};
	}
	return static_cast<unsigned>(value);
}

static std::optional<std::string> readString(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_string()) {
		return {};
	}
	return it->get<std::string>();
}

static std::optional<Move> readMove(const json& j) {
	const auto player = readUnsigned(j, "player");
	if (!player) {
		return {};
	}

	if (j.contains("action")) {
		const auto name = readString(j, "action");
		if (!name) {
			return {};
		}
		const auto kind = actionFromName(*name);
		if (!kind) {
			return {};
		}
		return Action{*player, *kind};
	}

	const auto row = readUnsigned(j, "row");
	const auto col = readUnsigned(j, "col");
	if (!row || !col) {
		return {};
	}
	return Placement{*player, Coord{*row, *col}};
}

//! Variant field defaults to Standard when absent, unknown tags are rejected.
static std::optional<Variant> readVariant(const json& j) {
	if (!j.contains("variant")) {
		return Variant::Standard;
	}
	const auto tag = readString(j, "variant");
	if (!tag) {
		return {};
	}
	return variantFromString(*tag);
}

static std::optional<json> parseObject(const std::string& message) {
	auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return {};
	}
	return j;
}

static json toJson(const NewGame& r) {
	json j{{"type", TYPE_NEW}, {"size", r.config.size}, {"players", r.config.numPlayers}, {"variant", toString(r.config.variant)}};
	if (r.botSeat) {
		j["botSeat"] = *r.botSeat;
		j["bot"]     = r.botName;
	}
	return j;
}
static json toJson(const SubmitMove& r) {
	json j{{"type", TYPE_MOVE}};
	writeMove(j, r.move);
	return j;
}
static json toJson(const ExportTranscript&) {
	return json{{"type", TYPE_TRANSCRIPT}};
}
static json toJson(const ExportPosition&) {
	return json{{"type", TYPE_POSITION}};
}
static json toJson(const ChooseMove& r) {
	return json{{"type", TYPE_CHOOSE}, {"bot", r.botName}, {"position", r.position}, {"players", r.numPlayers}, {"variant", toString(r.variant)}};
}

static json toJson(const MoveResult& r) {
	return json{{"type", TYPE_MOVED}, {"moveCount", r.moveCount}, {"next", r.next}, {"status", toString(r.status)}};
}
static json toJson(const PositionText& r) {
	return json{{"type", TYPE_POSITION}, {"position", r.position}};
}
static json toJson(const TranscriptText& r) {
	return json{{"type", TYPE_TRANSCRIPT}, {"transcript", r.transcript}};
}
static json toJson(const BotMove& r) {
	json j{{"type", TYPE_BOT_MOVE}, {"bot", r.botName}};
	writeMove(j, r.move);
	return j;
}
static json toJson(const ErrorReply& r) {
	return json{{"type", TYPE_ERROR}, {"category", categoryName(r.category)}, {"kind", r.kind}, {"message", r.message}};
}

//! Error messages may quote rejected input, which is not always valid UTF-8.
static std::string serialize(const json& j) {
	return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string toMessage(const Request& request) {
	return std::visit([](const auto& r) { return serialize(toJson(r)); }, request);
}

std::string toMessage(const Response& response) {
	return std::visit([](const auto& r) { return serialize(toJson(r)); }, response);
}

static std::optional<Request> newGameFromJson(const json& j) {
	const auto size    = readUnsigned(j, "size");
	const auto players = readUnsigned(j, "players");
	const auto variant = readVariant(j);
	if (!size || !players || !variant) {
		return {};
	}

	NewGame request{.config = Config{.size = *size, .numPlayers = *players, .variant = *variant}};
	if (j.contains("botSeat") || j.contains("bot")) {
		const auto seat = readUnsigned(j, "botSeat");
		if (!seat) {
			return {};
		}
		request.botSeat = *seat;
		request.botName = std::string(RANDOM_BOT_NAME);
		if (j.contains("bot")) {
			auto name = readString(j, "bot");
			if (!name) {
				return {};
			}
			request.botName = std::move(*name);
		}
	}
	return request;
}

static std::optional<Request> chooseMoveFromJson(const json& j) {
	auto bot      = readString(j, "bot");
	auto position = readString(j, "position");
	if (!bot || !position) {
		return {};
	}

	ChooseMove request{.botName = std::move(*bot), .position = std::move(*position)};
	if (j.contains("players")) {
		const auto players = readUnsigned(j, "players");
		if (!players) {
			return {};
		}
		request.numPlayers = *players;
	}

	const auto variant = readVariant(j);
	if (!variant) {
		return {};
	}
	request.variant = *variant;
	return request;
}

std::optional<Request> fromRequestMessage(const std::string& message) {
	const auto j = parseObject(message);
	if (!j) {
		return {};
	}

	const auto type = readString(*j, "type");
	if (!type) {
		return {};
	}

	if (*type == TYPE_NEW) {
		return newGameFromJson(*j);
	}
	if (*type == TYPE_MOVE) {
		if (const auto move = readMove(*j)) {
			return SubmitMove{*move};
		}
		return {};
	}
	if (*type == TYPE_TRANSCRIPT) {
		return ExportTranscript{};
	}
	if (*type == TYPE_POSITION) {
		return ExportPosition{};
	}
	if (*type == TYPE_CHOOSE) {
		return chooseMoveFromJson(*j);
	}

	// Invalid
	return {};
}

std::optional<Response> fromResponseMessage(const std::string& message) {
	const auto j = parseObject(message);
	if (!j) {
		return {};
	}

	const auto type = readString(*j, "type");
	if (!type) {
		return {};
	}

	if (*type == TYPE_MOVED) {
		const auto moveCount = readUnsigned(*j, "moveCount");
		const auto next      = readUnsigned(*j, "next");
		const auto status    = readString(*j, "status");
		if (!moveCount || !next || !status) {
			return {};
		}
		const auto parsed = statusFromString(*status);
		if (!parsed) {
			return {};
		}
		return MoveResult{.moveCount = *moveCount, .next = *next, .status = *parsed};
	}
	if (*type == TYPE_POSITION) {
		if (auto text = readString(*j, "position")) {
			return PositionText{std::move(*text)};
		}
		return {};
	}
	if (*type == TYPE_TRANSCRIPT) {
		if (auto text = readString(*j, "transcript")) {
			return TranscriptText{std::move(*text)};
		}
		return {};
	}
	if (*type == TYPE_BOT_MOVE) {
		auto bot        = readString(*j, "bot");
		const auto move = readMove(*j);
		if (!bot || !move) {
			return {};
		}
		return BotMove{.botName = std::move(*bot), .move = *move};
	}
	if (*type == TYPE_ERROR) {
		const auto category = readString(*j, "category");
		auto kind           = readString(*j, "kind");
		auto text           = readString(*j, "message");
		if (!category || !kind || !text) {
			return {};
		}
		const auto parsed = categoryFromName(*category);
		if (!parsed) {
			return {};
		}
		return ErrorReply{.category = *parsed, .kind = std::move(*kind), .message = std::move(*text)};
	}

	// Invalid
	return {};
}

} // namespace connex::api
