#pragma once

#include "core/disjointSet.hpp"
#include "model/config.hpp"
#include "model/coordinate.hpp"
#include "model/gameStatus.hpp"
#include "model/player.hpp"

#include <map>
#include <optional>
#include <vector>

namespace connex {

//! State of one match: stones on the board, whose turn it is and the outcome so far.
//! Keeps a union-find over the cells plus two virtual edge nodes per player so a connection is detected when
//! the connecting stone is placed.
//! \note Only the rule engine and the notation decoders should call the mutating functions. They do not check legality.
//! \note Copies are O(size^2) because the union-find holds every cell. Swap relinks all stones once.
class BoardState {
public:
	//! Empty board. Throws std::invalid_argument for a config outside the supported range.
	explicit BoardState(const Config& config = {});

	const Config& config() const;
	std::size_t size() const;

	bool inBounds(Coord c) const;
	bool isEmpty(Coord c) const;                    //!< \note Coordinate must be in bounds.
	std::optional<PlayerId> ownerAt(Coord c) const; //!< Empty for free or off-board cells.

	const std::map<Coord, PlayerId>& stones() const; //!< Occupied cells in row-major order.
	std::vector<Coord> emptyCells() const;           //!< Free cells in row-major order.

	unsigned moveCount() const;
	PlayerId currentPlayer() const;
	const GameStatus& status() const;
	bool isOver() const;

	//! Whether the player's stones link both of its edges.
	bool hasConnected(PlayerId player) const;

public:
	//! Put a stone on a free cell. Returns true if the owner's edges are connected afterwards.
	bool place(Coord c, PlayerId player);

	//! Hand an existing stone to another player.
	void reassign(Coord c, PlayerId player);

	void setCurrentPlayer(PlayerId player);
	void setStatus(GameStatus status);
	void setMoveCount(unsigned count);

	//! Compares config, stones, move count, turn and status. The connectivity cache is derived data.
	bool operator==(const BoardState& other) const;

private:
	std::size_t cellIndex(Coord c) const;
	std::size_t firstEdgeNode(PlayerId player) const;
	std::size_t secondEdgeNode(PlayerId player) const;

	void link(Coord c, PlayerId player); //!< Union a stone with its friendly neighbours and edges.
	void relinkAll();                    //!< Rebuild the union-find from the stone map.

private:
	Config m_config;
	std::map<Coord, PlayerId> m_stones{}; //!< Sparse ownership. Free cells are absent.

	unsigned m_moveCount{0u};
	PlayerId m_currentPlayer{0u};
	GameStatus m_status{};

	DisjointSet m_links; //!< Cells followed by two edge nodes per player.
};

} // namespace connex
