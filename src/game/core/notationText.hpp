#pragma once

#include "core/parseError.hpp"

#include <charconv>
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace connex {

//! Splits notation text into lines and counts them.
//! A trailing newline does not start another line.
class LineReader {
public:
	explicit LineReader(std::string_view text) : m_rest(text) {
	}

	bool atEnd() const {
		return m_rest.empty();
	}

	//! Next line without its newline. Empty when the text is exhausted.
	std::optional<std::string_view> next() {
		if (m_rest.empty()) {
			return {};
		}

		++m_line;
		const auto pos  = m_rest.find('\n');
		const auto line = m_rest.substr(0u, pos);
		m_rest          = pos == std::string_view::npos ? std::string_view{} : m_rest.substr(pos + 1u);
		return line;
	}

	//! Number of the last line returned.
	std::size_t line() const {
		return m_line;
	}

private:
	std::string_view m_rest;
	std::size_t m_line{0u};
};

inline ParseError makeError(ParseError::Kind kind, std::size_t line, std::string message) {
	return ParseError{.kind = kind, .line = line, .message = std::move(message)};
}

//! Parse a decimal number made only of digits.
//! Signs, blanks and empty tokens are UnexpectedToken, overflow is OutOfRange.
inline std::optional<ParseError> parseNumber(std::string_view token, std::size_t line, std::string_view field, std::size_t& out) {
	if (token.empty() || token.find_first_not_of("0123456789") != std::string_view::npos) {
		return makeError(ParseError::Kind::UnexpectedToken, line, std::format("Expected a number for {}, got '{}'.", field, token));
	}

	const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
	if (ec == std::errc::result_out_of_range) {
		return makeError(ParseError::Kind::OutOfRange, line, std::format("Number for {} is too large.", field));
	}
	if (ec != std::errc{} || ptr != token.data() + token.size()) {
		return makeError(ParseError::Kind::UnexpectedToken, line, std::format("Expected a number for {}, got '{}'.", field, token));
	}
	return {};
}

//! Strip a fixed key prefix such as "size=". Returns empty if the line does not start with it.
inline std::optional<std::string_view> valueAfter(std::string_view line, std::string_view key) {
	if (!line.starts_with(key)) {
		return {};
	}
	return line.substr(key.size());
}

} // namespace connex
