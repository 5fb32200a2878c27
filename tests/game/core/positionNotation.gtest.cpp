#include "core/positionNotation.hpp"
#include "core/ruleEngine.hpp"

#include <gtest/gtest.h>

#include <random>

namespace connex::gtest {

static BoardState apply(const BoardState& state, const Move& move) {
	BoardState next = state;
	EXPECT_FALSE(applyMove(state, move, next).has_value());
	return next;
}

static ParseError expectError(std::string_view text, const PositionContext& context = {}) {
	BoardState out;
	const auto error = decodePosition(text, out, context);
	EXPECT_TRUE(error.has_value()) << text;
	return error.value_or(ParseError{ParseError::Kind::UnexpectedToken, 0u, "no error"});
}

TEST(PositionNotation, EncodeEmpty) {
	const BoardState state(Config{.size = 3u});
	EXPECT_EQ(encodePosition(state), "size=3\ngrid=\n...\n...\n...\nturn=0\nstatus=InProgress\n");
}

TEST(PositionNotation, EncodeStonesAndStatus) {
	BoardState state(Config{.size = 3u});
	state = apply(state, Placement{0u, {0u, 1u}});
	state = apply(state, Placement{1u, {2u, 0u}});
	state = apply(state, Action{0u, ActionKind::Resign});

	EXPECT_EQ(encodePosition(state), "size=3\ngrid=\n.0.\n...\n1..\nturn=0\nstatus=Resigned:0\n");
}

TEST(PositionNotation, Decode) {
	BoardState state;
	ASSERT_FALSE(decodePosition("size=3\ngrid=\n.0.\n.1.\n...\nturn=0\nstatus=InProgress\n", state).has_value());

	EXPECT_EQ(state.size(), 3u);
	EXPECT_EQ(state.ownerAt({0u, 1u}), 0u);
	EXPECT_EQ(state.ownerAt({1u, 1u}), 1u);
	EXPECT_FALSE(state.ownerAt({2u, 2u}).has_value());
	EXPECT_EQ(state.currentPlayer(), 0u);
	EXPECT_EQ(state.moveCount(), 2u);
	EXPECT_EQ(state.status(), GameStatus::inProgress());
}

TEST(PositionNotation, DecodeSizeZero) {
	const auto error = expectError("size=0\ngrid=\nturn=0\nstatus=InProgress\n");
	EXPECT_EQ(error.kind, ParseError::Kind::OutOfRange);
	EXPECT_EQ(error.line, 1u);
}

TEST(PositionNotation, DecodeMalformed) {
	EXPECT_EQ(expectError("").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=x\n").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=-1\n").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=65\n").kind, ParseError::Kind::OutOfRange);
	EXPECT_EQ(expectError("size=99999999999999999999999\n").kind, ParseError::Kind::OutOfRange);
	EXPECT_EQ(expectError("size=2\n").line, 2u);

	const auto shortRow = expectError("size=2\ngrid=\n..\n.\nturn=0\nstatus=InProgress\n");
	EXPECT_EQ(shortRow.kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(shortRow.line, 4u);

	EXPECT_EQ(expectError("size=2\ngrid=\n..\n.x\nturn=0\nstatus=InProgress\n").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=2\ngrid=\n..\n..\nturn=0\nstatus=Finished\n").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=2\ngrid=\n..\n..\nturn=0\nstatus=InProgress\nextra\n").kind, ParseError::Kind::UnexpectedToken);
	EXPECT_EQ(expectError("size=2\ngrid=x\n..\n..\nturn=0\nstatus=InProgress\n").kind, ParseError::Kind::UnexpectedToken);
}

TEST(PositionNotation, DecodeOutOfRangeFields) {
	// Owner and turn must be players of the match.
	EXPECT_EQ(expectError("size=2\ngrid=\n2.\n..\nturn=0\nstatus=InProgress\n").kind, ParseError::Kind::OutOfRange);
	EXPECT_EQ(expectError("size=2\ngrid=\n..\n..\nturn=2\nstatus=InProgress\n").kind, ParseError::Kind::OutOfRange);
	EXPECT_EQ(expectError("size=2\ngrid=\n..\n..\nturn=0\nstatus=Resigned:4\n").kind, ParseError::Kind::OutOfRange);

	BoardState state;
	EXPECT_FALSE(decodePosition("size=2\ngrid=\n2.\n..\nturn=2\nstatus=InProgress\n", state, {.numPlayers = 3u}).has_value());

	EXPECT_EQ(expectError("size=2\ngrid=\n..\n..\nturn=0\nstatus=InProgress\n", {.numPlayers = 11u}).kind, ParseError::Kind::OutOfRange);
}

TEST(PositionNotation, InconsistentStatus) {
	// Column of player 0 from top to bottom.
	const auto connected = "size=3\ngrid=\n0..\n011\n0..\n";

	auto error = expectError(std::string{connected} + "turn=1\nstatus=InProgress\n");
	EXPECT_EQ(error.kind, ParseError::Kind::InconsistentStatus);
	EXPECT_EQ(error.line, 7u);

	EXPECT_EQ(expectError(std::string{connected} + "turn=1\nstatus=Resigned:1\n").kind, ParseError::Kind::InconsistentStatus);
	EXPECT_EQ(expectError(std::string{connected} + "turn=1\nstatus=Won:1\n").kind, ParseError::Kind::InconsistentStatus);
	EXPECT_EQ(expectError(std::string{connected} + "turn=0\nstatus=Won:0\n").kind, ParseError::Kind::InconsistentStatus);

	EXPECT_EQ(expectError("size=3\ngrid=\n0..\n...\n...\nturn=1\nstatus=Won:0\n").kind, ParseError::Kind::InconsistentStatus);
	EXPECT_EQ(expectError("size=3\ngrid=\n0..\n...\n...\nturn=0\nstatus=Resigned:1\n").kind, ParseError::Kind::InconsistentStatus);

	BoardState state;
	ASSERT_FALSE(decodePosition(std::string{connected} + "turn=1\nstatus=Won:0\n", state).has_value());
	EXPECT_EQ(state.status(), GameStatus::won(0u));
	EXPECT_EQ(state.moveCount(), 5u);
}

TEST(PositionNotation, ErrorLeavesOutput) {
	const BoardState sentinel(Config{.size = 4u});
	BoardState out = sentinel;
	EXPECT_TRUE(decodePosition("size=3\ngrid=\n...\n", out).has_value());
	EXPECT_EQ(out, sentinel);
}

TEST(PositionNotation, SwapAndResignMoveCount) {
	BoardState state(Config{.size = 5u});
	state = apply(state, Placement{0u, {2u, 2u}});
	state = apply(state, Action{1u, ActionKind::Swap});

	BoardState decoded;
	ASSERT_FALSE(decodePosition(encodePosition(state), decoded).has_value());
	EXPECT_EQ(decoded, state);
	EXPECT_EQ(decoded.moveCount(), 2u);

	state = apply(state, Action{0u, ActionKind::Resign});
	ASSERT_FALSE(decodePosition(encodePosition(state), decoded).has_value());
	EXPECT_EQ(decoded, state);
	EXPECT_EQ(decoded.moveCount(), 3u);
}

// Every state of random matches survives encoding and decoding.
TEST(PositionNotation, RoundTripSelfPlay) {
	std::mt19937 rng(42u);

	for (int game = 0; game < 24; ++game) {
		const Config config{.size = 2u + static_cast<std::size_t>(game % 9), .numPlayers = 2u + static_cast<unsigned>(game % 3),
		                    .variant = game % 2 ? Variant::Square : Variant::Standard};
		const PositionContext context{.numPlayers = config.numPlayers, .variant = config.variant};

		BoardState state(config);
		while (true) {
			BoardState decoded;
			const auto error = decodePosition(encodePosition(state), decoded, context);
			ASSERT_FALSE(error.has_value()) << describe(*error) << "\n" << encodePosition(state);
			ASSERT_EQ(decoded, state) << encodePosition(state);

			const auto free = state.emptyCells();
			if (state.isOver() || free.empty()) {
				break;
			}

			Move move = Placement{state.currentPlayer(), free[rng() % free.size()]};
			if (isSwapAvailable(state) && rng() % 2u == 0u) {
				move = Action{state.currentPlayer(), ActionKind::Swap};
			} else if (rng() % 40u == 0u) {
				move = Action{state.currentPlayer(), ActionKind::Resign};
			}
			state = gtest::apply(state, move);
		}
	}
}

} // namespace connex::gtest
