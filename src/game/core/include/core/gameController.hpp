#pragma once

#include "core/boardState.hpp"
#include "core/botRegistry.hpp"
#include "core/eventHub.hpp"
#include "core/parseError.hpp"
#include "core/transcriptNotation.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace connex {

//! What happens to a bot that times out or answers with an illegal move.
enum class ForfeitPolicy {
	Loss,    //!< The bot resigns.
	SkipTurn //!< The bot passes and the match continues.
};

struct MatchOptions {
	std::chrono::milliseconds botTimeBudget{2000}; //!< Per bot turn. Zero or negative means no limit.
	ForfeitPolicy forfeitPolicy{ForfeitPolicy::SkipTurn};
};

enum class Phase { Setup, InProgress, Finished };

//! Runs one match.
//! Owns the board state and the move history, takes moves from human callers or from bots and applies them through the
//! rule engine. Moves are applied one at a time from the calling thread.
class GameController {
public:
	//! Start a match on an empty board. Throws std::invalid_argument for an unsupported config.
	//! \note The registry must outlive the controller.
	GameController(const Config& config, const BotRegistry& registry, MatchOptions options = {});

	//! Let a registered bot play the seat.
	std::optional<BotError> assignBot(PlayerId player, std::string_view name);
	bool isBot(PlayerId player) const;
	bool isBotTurn() const; //!< Match running and the seat on turn is played by a bot.

	//! Apply a human move. Moves for bot seats are rejected as OutOfTurn, passes as PassNotAllowed.
	std::optional<RuleViolation> submitMove(const Move& move);

	//! Let the bot on turn move.
	//! A timeout, a failing bot or an illegal answer (a pass included) forfeits the turn according to the forfeit policy.
	//! \returns Reason of the forfeit, empty if the bot's move was applied.
	//! \note Only call if isBotTurn().
	std::optional<BotError> playBotTurn();

	//! Replace board and history by a replayed transcript. Seats beyond the new player count lose their bot.
	std::optional<ParseError> loadTranscript(std::string_view text);

	Phase phase() const;
	const BoardState& state() const;
	const std::vector<Move>& history() const;
	Transcript transcript() const;

	std::string exportTranscript() const;
	std::string exportPosition() const;

public:
	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

private:
	std::optional<RuleViolation> play(const Move& move); //!< Apply a move in place and record it when legal.
	void commit(const Move& move);                      //!< Record a move already applied to the state.
	void forfeit(PlayerId player, BotError reason);

private:
	const BotRegistry& m_registry;
	MatchOptions m_options;

	Phase m_phase{Phase::Setup};
	BoardState m_state;
	std::vector<Move> m_history;

	std::map<PlayerId, std::shared_ptr<IBot>> m_bots; //!< Bot controlled seats.
	EventHub m_eventHub;                              //!< Hub to signal match progress to external components.
};

} // namespace connex
