#include "core/positionNotation.hpp"
#include "core/ruleEngine.hpp"
#include "core/transcriptNotation.hpp"

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

namespace connex::gtest {

//! Characters the notations are made of, so mutations hit the parsers deeper than plain noise does.
static constexpr std::string_view ALPHABET = "0123456789.,:= \nPsizegridturnstatusInProgressWonResignedconfigplayersvariantStandardSquaremovesswapresignpass\r\t-+";

static std::string randomText(std::mt19937& rng, std::size_t maxLength) {
	std::string text(rng() % (maxLength + 1u), '\0');
	for (auto& c: text) {
		c = rng() % 4u == 0u ? static_cast<char>(rng() % 256u) : ALPHABET[rng() % ALPHABET.size()];
	}
	return text;
}

static std::string mutate(std::string text, std::mt19937& rng) {
	const auto edits = 1u + rng() % 4u;
	for (unsigned i = 0; i < edits; ++i) {
		const auto pos = text.empty() ? 0u : rng() % text.size();
		switch (rng() % 4u) {
		case 0:
			if (!text.empty()) {
				text.erase(pos, 1u);
			}
			break;
		case 1:
			text.insert(text.begin() + static_cast<std::ptrdiff_t>(pos), ALPHABET[rng() % ALPHABET.size()]);
			break;
		case 2:
			if (!text.empty()) {
				text[pos] = ALPHABET[rng() % ALPHABET.size()];
			}
			break;
		default:
			text.resize(pos);
			break;
		}
	}
	return text;
}

//! A decoded position must be usable: it encodes and decodes to itself.
static void checkPosition(std::string_view text, const PositionContext& context) {
	BoardState state;
	if (decodePosition(text, state, context)) {
		return;
	}

	BoardState again;
	ASSERT_FALSE(decodePosition(encodePosition(state), again, context).has_value());
	EXPECT_EQ(again, state);
}

static void checkTranscript(std::string_view text) {
	Transcript transcript;
	BoardState state;
	if (decodeTranscript(text, transcript, state)) {
		return;
	}

	EXPECT_EQ(state.moveCount(), transcript.moves.size());
	Transcript again;
	BoardState replayed;
	ASSERT_FALSE(decodeTranscript(encodeTranscript(transcript), again, replayed).has_value());
	EXPECT_EQ(replayed, state);
}

static std::vector<std::string> seedPositions() {
	BoardState state(Config{.size = 5u});
	std::vector<std::string> seeds{encodePosition(state)};

	for (const auto& move: {Move{Placement{0u, {2u, 2u}}}, Move{Action{1u, ActionKind::Swap}}, Move{Placement{0u, {0u, 0u}}}, Move{Placement{1u, {4u, 4u}}}}) {
		EXPECT_FALSE(applyMove(state, move, state).has_value());
		seeds.push_back(encodePosition(state));
	}
	return seeds;
}

TEST(NotationFuzz, RandomBytes) {
	std::mt19937 rng(2024u);

	for (int i = 0; i < 3000; ++i) {
		const auto text = randomText(rng, 200u);
		checkPosition(text, {});
		checkTranscript(text);
	}
}

TEST(NotationFuzz, MutatedPositions) {
	std::mt19937 rng(17u);
	const auto seeds = seedPositions();

	for (int i = 0; i < 5000; ++i) {
		const auto text = mutate(seeds[rng() % seeds.size()], rng);
		checkPosition(text, {});
		checkPosition(text, {.numPlayers = 3u, .variant = Variant::Square});
	}
}

TEST(NotationFuzz, MutatedTranscripts) {
	std::mt19937 rng(23u);
	const std::vector<std::string> seeds{
	        "config: size=5 players=2 variant=Standard\nmoves:\nP0 2,2\nP1 swap\nP0 0,0\nP1 4,4\n",
	        "config: size=3 players=3 variant=Square\nmoves:\nP0 1,1\nP1 pass\nP2 0,0\nP0 resign\n",
	        "config: size=2 players=2 variant=Standard\nmoves:\nP0 0,0\nP1 0,1\nP0 1,0\n",
	};

	for (int i = 0; i < 5000; ++i) {
		checkTranscript(mutate(seeds[rng() % seeds.size()], rng));
	}
}

TEST(NotationFuzz, Truncations) {
	const auto positions = seedPositions();
	const std::string transcript = "config: size=5 players=2 variant=Standard\nmoves:\nP0 2,2\nP1 swap\nP0 0,0\n";

	for (const auto& text: positions) {
		for (std::size_t length = 0; length <= text.size(); ++length) {
			checkPosition(std::string_view{text}.substr(0u, length), {});
		}
	}
	for (std::size_t length = 0; length <= transcript.size(); ++length) {
		checkTranscript(std::string_view{transcript}.substr(0u, length));
	}
}

} // namespace connex::gtest
