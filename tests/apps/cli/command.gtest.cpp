#include "cli/boardRenderer.hpp"
#include "cli/command.hpp"
#include "cli/options.hpp"

#include <gtest/gtest.h>

#include <array>
#include <initializer_list>
#include <vector>

namespace connex::gtest {

TEST(CliCommand, Placement) {
	const auto command = cli::parseCommand("3,4", 7u);
	ASSERT_TRUE(std::holds_alternative<cli::PlaceCommand>(command));
	EXPECT_EQ(std::get<cli::PlaceCommand>(command).coord, (Coord{3u, 4u}));

	EXPECT_TRUE(std::holds_alternative<cli::PlaceCommand>(cli::parseCommand("  0,0  ", 1u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("7,0", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("a,1", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("1,", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("-1,2", 7u)));
}

TEST(CliCommand, Keywords) {
	EXPECT_TRUE(std::holds_alternative<cli::SwapCommand>(cli::parseCommand("swap", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::ResignCommand>(cli::parseCommand("resign", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::ShowCommand>(cli::parseCommand("show", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::PositionCommand>(cli::parseCommand("position", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::TranscriptCommand>(cli::parseCommand("transcript", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::HelpCommand>(cli::parseCommand("help", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::ExitCommand>(cli::parseCommand("exit", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::EmptyCommand>(cli::parseCommand("   ", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("jump", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("pass", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("swap now", 7u)));
}

TEST(CliCommand, SaveAndLoad) {
	const auto save = cli::parseCommand("save game.txt", 7u);
	ASSERT_TRUE(std::holds_alternative<cli::SaveCommand>(save));
	EXPECT_EQ(std::get<cli::SaveCommand>(save).path, "game.txt");

	const auto load = cli::parseCommand("load  match.txt", 7u);
	ASSERT_TRUE(std::holds_alternative<cli::LoadCommand>(load));
	EXPECT_EQ(std::get<cli::LoadCommand>(load).path, "match.txt");

	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("save", 7u)));
	EXPECT_TRUE(std::holds_alternative<cli::InvalidCommand>(cli::parseCommand("load", 7u)));
}

TEST(CliOptions, Defaults) {
	const std::array<const char*, 1> argv{"connex"};
	cli::Options options;
	ASSERT_FALSE(cli::parseOptions(static_cast<int>(argv.size()), argv.data(), options).has_value());

	EXPECT_EQ(options.config, Config{});
	EXPECT_EQ(options.mode, cli::Mode::Human);
	EXPECT_EQ(options.botName, RANDOM_BOT_NAME);
	EXPECT_EQ(options.match.forfeitPolicy, ForfeitPolicy::SkipTurn);
}

TEST(CliOptions, AllFlags) {
	const std::array<const char*, 15> argv{"connex",   "--size",   "9",     "--players", "3",      "--variant", "Square", "--mode",
	                                       "computer", "--bot",    "other", "--budget",  "150",    "--forfeit", "loss"};
	cli::Options options;
	ASSERT_FALSE(cli::parseOptions(static_cast<int>(argv.size()), argv.data(), options).has_value());

	EXPECT_EQ(options.config, (Config{.size = 9u, .numPlayers = 3u, .variant = Variant::Square}));
	EXPECT_EQ(options.mode, cli::Mode::Computer);
	EXPECT_EQ(options.botName, "other");
	EXPECT_EQ(options.match.botTimeBudget, std::chrono::milliseconds(150));
	EXPECT_EQ(options.match.forfeitPolicy, ForfeitPolicy::Loss);
}

TEST(CliOptions, Errors) {
	cli::Options options;
	const auto fails = [&](std::initializer_list<const char*> args) {
		std::vector<const char*> argv{"connex"};
		argv.insert(argv.end(), args);
		return cli::parseOptions(static_cast<int>(argv.size()), argv.data(), options).has_value();
	};

	EXPECT_TRUE(fails({"--size"}));
	EXPECT_TRUE(fails({"--size", "0"}));
	EXPECT_TRUE(fails({"--size", "65"}));
	EXPECT_TRUE(fails({"--players", "1"}));
	EXPECT_TRUE(fails({"--variant", "Triangle"}));
	EXPECT_TRUE(fails({"--mode", "robot"}));
	EXPECT_TRUE(fails({"--budget", "-5"}));
	EXPECT_TRUE(fails({"--forfeit", "never"}));
	EXPECT_TRUE(fails({"--colour", "red"}));
	EXPECT_FALSE(fails({"--mode", "service"}));
}

TEST(BoardRenderer, ShearsHexRows) {
	BoardState state(Config{.size = 3u});
	state.place({1u, 1u}, 0u);

	EXPECT_EQ(cli::renderBoard(state), "    0 1 2 \n"
	                                   "  0 . . . \n"
	                                   "  1  . 0 . \n"
	                                   "  2   . . . \n"
	                                   "Move 0, player 0 to move, InProgress\n");

	BoardState square(Config{.size = 2u, .variant = Variant::Square});
	EXPECT_EQ(cli::renderBoard(square), "    0 1 \n"
	                                    "  0 . . \n"
	                                    "  1 . . \n"
	                                    "Move 0, player 0 to move, InProgress\n");
}

} // namespace connex::gtest
