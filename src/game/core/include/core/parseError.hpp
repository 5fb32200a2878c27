#pragma once

#include "model/errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace connex {

//! Failure decoding position or transcript notation.
struct ParseError {
	enum class Kind {
		UnexpectedToken,    //!< Malformed line or token.
		OutOfRange,         //!< Number or field outside its valid range.
		DuplicateCell,      //!< A cell is claimed twice.
		InconsistentStatus, //!< Status line disagrees with the board.
		UnsupportedVariant, //!< Unknown variant tag.
		IllegalMove         //!< Transcript move rejected on replay.
	};

	Kind kind;
	std::size_t line; //!< 1-based line of the offending input, or of the missing line when the input ends early.
	std::string message;
	std::optional<RuleViolation> violation{}; //!< Set for moves rejected on transcript replay.
};

std::string_view toString(ParseError::Kind kind);

//! One line summary for logs and terminal output.
std::string describe(const ParseError& error);

} // namespace connex
