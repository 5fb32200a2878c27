#pragma once

#include "core/IBot.hpp"
#include "model/errors.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace connex {

//! Ask a bot for a move on a worker thread.
//! The bot works on its own copy of the state. When the budget runs out, stop is requested and the worker is left to
//! finish on its own; its late answer is dropped.
//! \param budget Time limit. Zero or negative waits without limit.
//! \param [out] out Move chosen by the bot, written only on success.
//! \returns Timeout, or IllegalMove if the bot threw. Legality of the move is not checked here.
std::optional<BotError> requestBotMove(const std::shared_ptr<IBot>& bot, const BoardState& state, std::chrono::milliseconds budget, Move& out);

} // namespace connex
