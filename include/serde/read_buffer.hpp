#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

namespace serde {

// =============================================================================
// read_buffer_t - pull-based character buffer
// =============================================================================
//
// Wraps a source function that fills a caller-provided chunk and returns the
// number of characters written (zero at end of input). The source is asked
// for more only when the lookahead requested by a parser runs past the
// buffered data. Consumed characters advance a line/column position used in
// error messages.
//
// Example:
//
//   auto buf = read_buffer_t("[1, 2]");
//   buf.skip_whitespace();
//   buf.expect('[');

class read_buffer_t {
public:
    using source_fn = std::function<std::size_t(char* data, std::size_t capacity)>;

    static constexpr int eof = -1;

    explicit read_buffer_t(std::string_view text);
    explicit read_buffer_t(std::istream& stream, std::size_t chunk_size = 4096);
    explicit read_buffer_t(source_fn source, std::size_t chunk_size = 4096);

    // True when no characters remain
    auto at_end() -> bool;

    // Character at offset from the front, or eof
    auto peek(std::size_t offset = 0) -> int;

    // Consume and return one character; throws unexpected_end_t at end
    auto get() -> char;

    // Consume n characters (fewer at end of input)
    void skip(std::size_t n = 1);

    auto starts_with(std::string_view prefix) -> bool;

    // Consume the character c or throw a syntax error naming it
    void expect(char c);

    // Consume prefix or throw a syntax error naming it
    void expect(std::string_view prefix);

    // Spaces, tabs, carriage returns and newlines
    void skip_whitespace();

    // Spaces and tabs only
    void skip_blanks();

    auto line() const -> std::size_t { return line_; }
    auto column() const -> std::size_t { return column_; }
    auto position() const -> std::string;

    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_end() const;

private:
    auto fill(std::size_t needed) -> bool;

    std::string data_;
    std::size_t front_ = 0;
    source_fn source_;
    std::size_t chunk_size_ = 0;
    bool exhausted_ = false;
    std::size_t line_ = 1;
    std::size_t column_ = 0;
};

} // namespace serde
