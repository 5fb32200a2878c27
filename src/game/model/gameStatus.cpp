#include "model/gameStatus.hpp"

#include <charconv>
#include <format>

namespace connex {

static constexpr std::string_view STATUS_IN_PROGRESS = "InProgress";
static constexpr std::string_view STATUS_WON         = "Won:";
static constexpr std::string_view STATUS_RESIGNED    = "Resigned:";

std::string toString(const GameStatus& status) {
	switch (status.kind) {
	case GameStatus::Kind::InProgress:
		return std::string{STATUS_IN_PROGRESS};
	case GameStatus::Kind::Won:
		return std::format("{}{}", STATUS_WON, status.player);
	case GameStatus::Kind::Resigned:
		return std::format("{}{}", STATUS_RESIGNED, status.player);
	}
	return {};
}

static std::optional<PlayerId> parsePlayer(std::string_view text) {
	PlayerId player{};
	const auto* end = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, player);
	if (text.empty() || ec != std::errc{} || ptr != end) {
		return {};
	}
	return player;
}

std::optional<GameStatus> statusFromString(std::string_view text) {
	if (text == STATUS_IN_PROGRESS) {
		return GameStatus::inProgress();
	}
	if (text.starts_with(STATUS_WON)) {
		if (const auto player = parsePlayer(text.substr(STATUS_WON.size()))) {
			return GameStatus::won(*player);
		}
		return {};
	}
	if (text.starts_with(STATUS_RESIGNED)) {
		if (const auto player = parsePlayer(text.substr(STATUS_RESIGNED.size()))) {
			return GameStatus::resigned(*player);
		}
	}
	return {};
}

} // namespace connex
