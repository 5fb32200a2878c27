#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace connex {

//! Board geometry. Decides adjacency between cells.
enum class Variant {
	Standard, //!< Rhombus board, six neighbours per cell (hex).
	Square    //!< Square board, four orthogonal neighbours per cell.
};

inline constexpr std::size_t MIN_BOARD_SIZE = 1u;
inline constexpr std::size_t MAX_BOARD_SIZE = 64u;
inline constexpr unsigned MIN_PLAYERS       = 2u;
inline constexpr unsigned MAX_PLAYERS       = 10u; //!< Notations store owners as a single digit.

//! Match setup.
struct Config {
	std::size_t size{7u};
	unsigned numPlayers{2u};
	Variant variant{Variant::Standard};

	bool operator==(const Config&) const = default;
};

//! Returns whether size and player count are within the supported range.
bool isValid(const Config& config);

std::string_view toString(Variant variant);

//! Parse a variant tag. Returns empty on unknown tags.
std::optional<Variant> variantFromString(std::string_view tag);

} // namespace connex
