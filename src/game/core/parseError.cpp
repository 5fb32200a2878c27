#include "core/parseError.hpp"

#include <format>

namespace connex {

std::string_view toString(ParseError::Kind kind) {
	switch (kind) {
	case ParseError::Kind::UnexpectedToken:
		return "UnexpectedToken";
	case ParseError::Kind::OutOfRange:
		return "OutOfRange";
	case ParseError::Kind::DuplicateCell:
		return "DuplicateCell";
	case ParseError::Kind::InconsistentStatus:
		return "InconsistentStatus";
	case ParseError::Kind::UnsupportedVariant:
		return "UnsupportedVariant";
	case ParseError::Kind::IllegalMove:
		return "IllegalMove";
	}
	return {};
}

std::string describe(const ParseError& error) {
	if (error.violation) {
		return std::format("{} at line {} ({}): {}", toString(error.kind), error.line, toString(*error.violation), error.message);
	}
	return std::format("{} at line {}: {}", toString(error.kind), error.line, error.message);
}

} // namespace connex
