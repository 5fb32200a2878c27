#pragma once

#include <cstddef>
#include <vector>

namespace connex {

//! Union-find over plain integer indices.
//! Union by size and path compression keep operations near constant amortized time.
//! Storage is linear in the element count, so copying the structure is not.
class DisjointSet {
public:
	explicit DisjointSet(std::size_t count = 0u);

	std::size_t count() const; //!< Number of elements.

	std::size_t find(std::size_t element);       //!< Root of the element's set. Compresses the path.
	std::size_t root(std::size_t element) const; //!< Root of the element's set without touching the structure.

	bool unite(std::size_t a, std::size_t b);     //!< Merge two sets. Returns false if they were already one.
	bool same(std::size_t a, std::size_t b) const; //!< Whether both elements share a set.

	void reset(); //!< Every element back in its own set.

private:
	std::vector<std::size_t> m_parent;
	std::vector<std::size_t> m_setSize;
};

} // namespace connex
