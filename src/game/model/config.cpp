#include "model/config.hpp"

namespace connex {

static constexpr std::string_view VARIANT_STANDARD = "Standard";
static constexpr std::string_view VARIANT_SQUARE   = "Square";

bool isValid(const Config& config) {
	return config.size >= MIN_BOARD_SIZE && config.size <= MAX_BOARD_SIZE && config.numPlayers >= MIN_PLAYERS && config.numPlayers <= MAX_PLAYERS;
}

std::string_view toString(Variant variant) {
	switch (variant) {
	case Variant::Standard:
		return VARIANT_STANDARD;
	case Variant::Square:
		return VARIANT_SQUARE;
	}
	return {};
}

std::optional<Variant> variantFromString(std::string_view tag) {
	if (tag == VARIANT_STANDARD) {
		return Variant::Standard;
	}
	if (tag == VARIANT_SQUARE) {
		return Variant::Square;
	}
	return {};
}

} // namespace connex
