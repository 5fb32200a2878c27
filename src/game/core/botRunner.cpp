#include "core/botRunner.hpp"

#include "Logging.hpp"

#include <exception>
#include <format>
#include <future>
#include <memory>
#include <thread>

namespace connex {

std::optional<BotError> requestBotMove(const std::shared_ptr<IBot>& bot, const BoardState& state, std::chrono::milliseconds budget, Move& out) {
	auto promise = std::make_shared<std::promise<Move>>();
	auto future  = promise->get_future();

	std::jthread worker([bot, snapshot = state, promise](std::stop_token stop) {
		try {
			promise->set_value(bot->chooseMove(snapshot, stop));
		} catch (...) {
			promise->set_exception(std::current_exception());
		}
	});

	if (budget > std::chrono::milliseconds::zero() && future.wait_for(budget) == std::future_status::timeout) {
		worker.request_stop();
		worker.detach();
		Logger().Log(Logging::LogLevel::Warning, std::format("[BotRunner] Bot exceeded its budget of {}ms.", budget.count()));
		return BotError::Timeout;
	}

	try {
		out = future.get();
	} catch (const std::exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[BotRunner] Bot failed: {}", e.what()));
		return BotError::IllegalMove;
	} catch (...) {
		Logger().Log(Logging::LogLevel::Warning, "[BotRunner] Bot failed with an unknown exception.");
		return BotError::IllegalMove;
	}
	return {};
}

} // namespace connex
