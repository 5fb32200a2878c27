#include "core/boardState.hpp"

#include "core/geometry.hpp"

#include <cassert>
#include <format>
#include <stdexcept>

namespace connex {

static const Config& validated(const Config& config) {
	if (!isValid(config)) {
		throw std::invalid_argument(std::format("Unsupported board config: size {}, {} players.", config.size, config.numPlayers));
	}
	return config;
}

BoardState::BoardState(const Config& config)
    : m_config(validated(config)), m_links(config.size * config.size + 2u * config.numPlayers) {
}

const Config& BoardState::config() const {
	return m_config;
}

std::size_t BoardState::size() const {
	return m_config.size;
}

bool BoardState::inBounds(Coord c) const {
	return c.row < m_config.size && c.col < m_config.size;
}

bool BoardState::isEmpty(Coord c) const {
	assert(inBounds(c));
	return !m_stones.contains(c);
}

std::optional<PlayerId> BoardState::ownerAt(Coord c) const {
	const auto it = m_stones.find(c);
	if (it == m_stones.end()) {
		return {};
	}
	return it->second;
}

const std::map<Coord, PlayerId>& BoardState::stones() const {
	return m_stones;
}

std::vector<Coord> BoardState::emptyCells() const {
	std::vector<Coord> cells;
	cells.reserve(m_config.size * m_config.size - m_stones.size());

	for (Id row = 0; row < m_config.size; ++row) {
		for (Id col = 0; col < m_config.size; ++col) {
			if (!m_stones.contains({row, col})) {
				cells.push_back({row, col});
			}
		}
	}
	return cells;
}

unsigned BoardState::moveCount() const {
	return m_moveCount;
}

PlayerId BoardState::currentPlayer() const {
	return m_currentPlayer;
}

const GameStatus& BoardState::status() const {
	return m_status;
}

bool BoardState::isOver() const {
	return m_status.kind != GameStatus::Kind::InProgress;
}

bool BoardState::hasConnected(PlayerId player) const {
	assert(player < m_config.numPlayers);
	return m_links.same(firstEdgeNode(player), secondEdgeNode(player));
}

bool BoardState::place(Coord c, PlayerId player) {
	assert(inBounds(c));
	assert(player < m_config.numPlayers);

	[[maybe_unused]] const auto inserted = m_stones.emplace(c, player).second;
	assert(inserted); // Rule engine checks occupancy.

	link(c, player);
	return hasConnected(player);
}

void BoardState::reassign(Coord c, PlayerId player) {
	const auto it = m_stones.find(c);
	assert(it != m_stones.end());

	it->second = player;
	relinkAll();
}

void BoardState::setCurrentPlayer(PlayerId player) {
	assert(player < m_config.numPlayers);
	m_currentPlayer = player;
}

void BoardState::setStatus(GameStatus status) {
	m_status = status;
}

void BoardState::setMoveCount(unsigned count) {
	m_moveCount = count;
}

bool BoardState::operator==(const BoardState& other) const {
	return m_config == other.m_config && m_stones == other.m_stones && m_moveCount == other.m_moveCount && m_currentPlayer == other.m_currentPlayer &&
	       m_status == other.m_status;
}

std::size_t BoardState::cellIndex(Coord c) const {
	return c.row * m_config.size + c.col;
}

std::size_t BoardState::firstEdgeNode(PlayerId player) const {
	return m_config.size * m_config.size + 2u * player;
}

std::size_t BoardState::secondEdgeNode(PlayerId player) const {
	return firstEdgeNode(player) + 1u;
}

void BoardState::link(Coord c, PlayerId player) {
	const auto index = cellIndex(c);

	for (const auto neighbour: neighbours(c, m_config.size, m_config.variant)) {
		const auto owner = ownerAt(neighbour);
		if (owner && *owner == player) {
			m_links.unite(index, cellIndex(neighbour));
		}
	}

	const auto axis = playerAxis(player);
	if (touchesFirstEdge(c, m_config.size, axis)) {
		m_links.unite(index, firstEdgeNode(player));
	}
	if (touchesSecondEdge(c, m_config.size, axis)) {
		m_links.unite(index, secondEdgeNode(player));
	}
}

void BoardState::relinkAll() {
	m_links.reset();
	for (const auto& [c, player]: m_stones) {
		link(c, player);
	}
}

} // namespace connex
