#pragma once

#include "core/IBot.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace connex {

//! Places on a uniformly random free cell. Resigns when the board is full.
class RandomBot : public IBot {
public:
	RandomBot();
	explicit RandomBot(std::uint64_t seed);

	Move chooseMove(const BoardState& state, std::stop_token stop) override;

private:
	std::mutex m_rngMutex;
	std::mt19937_64 m_rng;
};

} // namespace connex
