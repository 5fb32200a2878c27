#include "core/gameController.hpp"

#include "Logging.hpp"
#include "core/botRunner.hpp"
#include "core/positionNotation.hpp"
#include "core/ruleEngine.hpp"

#include <cassert>
#include <format>
#include <utility>

namespace connex {

GameController::GameController(const Config& config, const BotRegistry& registry, MatchOptions options)
    : m_registry(registry), m_options(options), m_state(config) {
	m_phase = Phase::InProgress;
	Logger().Log(Logging::LogLevel::Info, std::format("[GameController] New match: size {}, {} players, variant {}.", config.size, config.numPlayers,
	                                                  toString(config.variant)));
}

std::optional<BotError> GameController::assignBot(PlayerId player, std::string_view name) {
	assert(player < m_state.config().numPlayers);

	std::shared_ptr<IBot> bot;
	if (const auto error = m_registry.lookup(name, bot)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameController] No bot named '{}' for player {}.", name, player));
		return error;
	}

	m_bots[player] = std::move(bot);
	Logger().Log(Logging::LogLevel::Info, std::format("[GameController] Player {} is played by '{}'.", player, name));
	return {};
}

bool GameController::isBot(PlayerId player) const {
	return m_bots.contains(player);
}

bool GameController::isBotTurn() const {
	return m_phase == Phase::InProgress && isBot(m_state.currentPlayer());
}

std::optional<RuleViolation> GameController::submitMove(const Move& move) {
	if (!m_state.isOver() && isBot(moveOwner(move))) {
		return RuleViolation::OutOfTurn;
	}

	if (const auto violation = play(move)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[GameController] Rejected '{}': {}.", encodeMove(move), toString(*violation)));
		return violation;
	}
	return {};
}

std::optional<BotError> GameController::playBotTurn() {
	assert(isBotTurn());

	const auto player = m_state.currentPlayer();
	const auto& bot   = m_bots.at(player);

	Move move{};
	if (const auto error = requestBotMove(bot, m_state, m_options.botTimeBudget, move)) {
		forfeit(player, *error);
		return error;
	}

	if (const auto violation = play(move)) {
		Logger().Log(Logging::LogLevel::Warning,
		             std::format("[GameController] Bot of player {} chose illegal move '{}': {}.", player, encodeMove(move), toString(*violation)));
		forfeit(player, BotError::IllegalMove);
		return BotError::IllegalMove;
	}
	return {};
}

std::optional<ParseError> GameController::loadTranscript(std::string_view text) {
	Transcript loaded;
	BoardState state;
	if (auto error = decodeTranscript(text, loaded, state)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameController] Could not load transcript: {}", describe(*error)));
		return error;
	}

	m_state   = std::move(state);
	m_history = std::move(loaded.moves);
	m_phase   = m_state.isOver() ? Phase::Finished : Phase::InProgress;

	std::erase_if(m_bots, [&](const auto& entry) { return entry.first >= m_state.config().numPlayers; });

	Logger().Log(Logging::LogLevel::Info, std::format("[GameController] Loaded transcript with {} moves.", m_history.size()));
	return {};
}

Phase GameController::phase() const {
	return m_phase;
}

const BoardState& GameController::state() const {
	return m_state;
}

const std::vector<Move>& GameController::history() const {
	return m_history;
}

Transcript GameController::transcript() const {
	return Transcript{.config = m_state.config(), .moves = m_history};
}

std::string GameController::exportTranscript() const {
	return encodeTranscript(transcript());
}

std::string GameController::exportPosition() const {
	return encodePosition(m_state);
}

void GameController::subscribe(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void GameController::unsubscribe(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

std::optional<RuleViolation> GameController::play(const Move& move) {
	if (isPass(move)) {
		return RuleViolation::PassNotAllowed;
	}
	if (const auto violation = applyMoveInPlace(m_state, move)) {
		return violation;
	}

	commit(move);
	return {};
}

void GameController::commit(const Move& move) {
	m_history.push_back(move);
	assert(m_history.size() == m_state.moveCount());

	if (m_state.isOver()) {
		m_phase = Phase::Finished;
		Logger().Log(Logging::LogLevel::Info, std::format("[GameController] Match finished: {}.", toString(m_state.status())));
	}
	Logger().Log(Logging::LogLevel::Debug, std::format("[GameController] Move {}: {}.", m_state.moveCount(), encodeMove(move)));

	m_eventHub.signalDelta({
	        .moveId     = m_state.moveCount(),
	        .move       = move,
	        .nextPlayer = m_state.currentPlayer(),
	        .status     = m_state.status(),
	});
}

void GameController::forfeit(PlayerId player, BotError reason) {
	const Move recorded = m_options.forfeitPolicy == ForfeitPolicy::Loss ? Move{Action{player, ActionKind::Resign}} : Move{Action{player, ActionKind::Pass}};
	Logger().Log(Logging::LogLevel::Warning, std::format("[GameController] Player {} forfeits its turn ({}), recording '{}'.", player, toString(reason), encodeMove(recorded)));

	[[maybe_unused]] const auto violation = applyMoveInPlace(m_state, recorded);
	assert(!violation); // Resign and pass are legal for the player on turn.

	m_eventHub.signalForfeit({.player = player, .reason = reason, .recorded = recorded});
	commit(recorded);
}

} // namespace connex
