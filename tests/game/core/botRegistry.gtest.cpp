#include "core/botRegistry.hpp"
#include "core/botRunner.hpp"
#include "core/randomBot.hpp"
#include "core/ruleEngine.hpp"
#include "testBots.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace connex::gtest {

TEST(BotRegistry, RegisterAndLookup) {
	BotRegistry registry;
	const auto bot = std::make_shared<FixedBot>(Action{0u, ActionKind::Pass});
	EXPECT_TRUE(registry.registerBot("fixed", bot));

	std::shared_ptr<IBot> found;
	EXPECT_FALSE(registry.lookup("fixed", found).has_value());
	EXPECT_EQ(found, bot);

	std::shared_ptr<IBot> missing;
	EXPECT_EQ(registry.lookup("unknown", missing), BotError::NotFound);
	EXPECT_EQ(missing, nullptr);
}

TEST(BotRegistry, ReplaceExistingName) {
	BotRegistry registry;
	const auto first  = std::make_shared<FixedBot>(Action{0u, ActionKind::Pass});
	const auto second = std::make_shared<FixedBot>(Action{0u, ActionKind::Resign});
	registry.registerBot("bot", first);
	registry.registerBot("bot", second);

	std::shared_ptr<IBot> found;
	ASSERT_FALSE(registry.lookup("bot", found).has_value());
	EXPECT_EQ(found, second);
	EXPECT_EQ(registry.names().size(), 1u);
}

TEST(BotRegistry, FreezeRejectsRegistration) {
	BotRegistry registry;
	EXPECT_TRUE(registerDefaultBots(registry));
	EXPECT_FALSE(registry.isFrozen());

	registry.freeze();
	EXPECT_TRUE(registry.isFrozen());
	EXPECT_FALSE(registry.registerBot("late", std::make_shared<RandomBot>()));
	EXPECT_FALSE(registerDefaultBots(registry));

	EXPECT_EQ(registry.names(), std::vector<std::string>{std::string{RANDOM_BOT_NAME}});
}

TEST(BotRegistry, NamesSorted) {
	BotRegistry registry;
	registry.registerBot("zeta", std::make_shared<RandomBot>(1u));
	registry.registerBot("alpha", std::make_shared<RandomBot>(2u));
	registerDefaultBots(registry);

	const std::vector<std::string> expected{"alpha", "random_bot", "zeta"};
	EXPECT_EQ(registry.names(), expected);
}

TEST(BotRegistry, ConcurrentLookups) {
	BotRegistry registry;
	registerDefaultBots(registry);
	registry.registerBot("fixed", std::make_shared<FixedBot>(Action{0u, ActionKind::Pass}));
	registry.freeze();

	std::atomic<unsigned> hits{0u};
	std::vector<std::thread> threads;
	for (int t = 0; t < 8; ++t) {
		threads.emplace_back([&] {
			for (int i = 0; i < 1000; ++i) {
				std::shared_ptr<IBot> bot;
				if (!registry.lookup(i % 2 ? "fixed" : RANDOM_BOT_NAME, bot)) {
					++hits;
				}
			}
		});
	}
	for (auto& thread: threads) {
		thread.join();
	}

	EXPECT_EQ(hits.load(), 8000u);
}

TEST(RandomBot, PicksFreeCell) {
	RandomBot bot(3u);
	BoardState state(Config{.size = 3u});
	std::stop_source source;

	for (int i = 0; i < 9 && !state.isOver(); ++i) {
		const auto move = bot.chooseMove(state, source.get_token());
		ASSERT_TRUE(std::holds_alternative<Placement>(move));
		EXPECT_EQ(moveOwner(move), state.currentPlayer());
		ASSERT_FALSE(applyMove(state, move, state).has_value());
	}
}

TEST(RandomBot, ResignsOnFullBoard) {
	BoardState state(Config{.size = 2u});
	state.place({0u, 0u}, 0u);
	state.place({0u, 1u}, 1u);
	state.place({1u, 0u}, 1u);
	state.place({1u, 1u}, 0u);

	RandomBot bot;
	std::stop_source source;
	EXPECT_EQ(bot.chooseMove(state, source.get_token()), (Move{Action{0u, ActionKind::Resign}}));
}

TEST(BotRunner, ReturnsMove) {
	const BoardState state(Config{.size = 3u});
	Move move{};
	EXPECT_FALSE(requestBotMove(std::make_shared<FixedBot>(Placement{0u, {1u, 1u}}), state, std::chrono::milliseconds(1000), move).has_value());
	EXPECT_EQ(move, (Move{Placement{0u, {1u, 1u}}}));
}

TEST(BotRunner, Timeout) {
	const BoardState state(Config{.size = 3u});
	Move move = Placement{0u, {2u, 2u}};

	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(requestBotMove(std::make_shared<SlowBot>(), state, std::chrono::milliseconds(50), move), BotError::Timeout);
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
	EXPECT_EQ(move, (Move{Placement{0u, {2u, 2u}}}));
}

TEST(BotRunner, ThrowingBot) {
	const BoardState state(Config{.size = 3u});
	Move move{};
	EXPECT_EQ(requestBotMove(std::make_shared<ThrowingBot>(), state, std::chrono::milliseconds(0), move), BotError::IllegalMove);
	EXPECT_EQ(requestBotMove(std::make_shared<ThrowingIntBot>(), state, std::chrono::milliseconds(0), move), BotError::IllegalMove);
}

} // namespace connex::gtest
