#include "core/disjointSet.hpp"

#include <algorithm>
#include <cassert>
#include <numeric>
#include <utility>

namespace connex {

DisjointSet::DisjointSet(std::size_t count) : m_parent(count), m_setSize(count, 1u) {
	std::iota(m_parent.begin(), m_parent.end(), std::size_t{0u});
}

std::size_t DisjointSet::count() const {
	return m_parent.size();
}

std::size_t DisjointSet::find(std::size_t element) {
	assert(element < m_parent.size());

	auto rootId = element;
	while (m_parent[rootId] != rootId) {
		rootId = m_parent[rootId];
	}

	// Point every element on the path directly to the root.
	while (m_parent[element] != rootId) {
		const auto next   = m_parent[element];
		m_parent[element] = rootId;
		element           = next;
	}
	return rootId;
}

std::size_t DisjointSet::root(std::size_t element) const {
	assert(element < m_parent.size());

	while (m_parent[element] != element) {
		element = m_parent[element];
	}
	return element;
}

bool DisjointSet::unite(std::size_t a, std::size_t b) {
	auto rootA = find(a);
	auto rootB = find(b);
	if (rootA == rootB) {
		return false;
	}

	if (m_setSize[rootA] < m_setSize[rootB]) {
		std::swap(rootA, rootB);
	}
	m_parent[rootB] = rootA;
	m_setSize[rootA] += m_setSize[rootB];
	return true;
}

bool DisjointSet::same(std::size_t a, std::size_t b) const {
	return root(a) == root(b);
}

void DisjointSet::reset() {
	std::iota(m_parent.begin(), m_parent.end(), std::size_t{0u});
	std::fill(m_setSize.begin(), m_setSize.end(), std::size_t{1u});
}

} // namespace connex
