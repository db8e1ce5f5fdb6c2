#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace serde {

class read_buffer_t;

// =============================================================================
// Backslash escapes shared by the JSON writer and YAML double-quoted scalars
// =============================================================================
//
// Written: \" \\ \b \f \n \r \t, and \u00XX (uppercase hex) for the other
// C0 control bytes, NUL included, and 0x7F. Every other byte passes through
// unchanged.
//
// Read: the written set plus \/, \0 and \uXXXX, which is decoded to UTF-8
// (surrogate pairs are combined).

void backslash_escape(std::string_view text, std::string& out);

auto backslash_escape(std::string_view text) -> std::string;

// Reads characters up to the unescaped terminator and consumes it
auto read_escaped(read_buffer_t& buffer, char terminator) -> std::string;

// =============================================================================
// UTF-8
// =============================================================================

void append_utf8(std::string& out, char32_t code_point);

// Decode the code point starting at pos and advance pos past it
auto decode_utf8(std::string_view text, std::size_t& pos) -> char32_t;

// The only code point in text; throws type_error_t otherwise
auto single_code_point(std::string_view text) -> char32_t;

// =============================================================================
// Floating point text
// =============================================================================
//
// Shortest text that parses back to the same value. Finite values only; the
// writers spell non-finite values in their own format.

auto format_float(double value, int width) -> std::string;

auto format_real(long double value) -> std::string;

// Full-token parse; false when the token is not a number
auto parse_float(std::string_view token, double& value) -> bool;

auto parse_real(std::string_view token, long double& value) -> bool;

} // namespace serde
