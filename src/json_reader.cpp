// json_reader.cpp - implementation of json_reader_t

#include "serde/json.hpp"
#include "serde/error.hpp"
#include "serde/escape.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace serde {

namespace {

// =============================================================================
// Container cursors
// =============================================================================

class json_seq_reader_t : public deserializer_t::seq_access_t {
public:
    explicit json_seq_reader_t(json_reader_t& reader) : reader_(reader) {}

    auto read_element() -> deserializer_t* override {
        auto& buf = reader_.buffer();
        buf.skip_whitespace();

        if (buf.peek() == ']') {
            return nullptr;
        }
        if (!first_) {
            buf.expect(',');
            buf.skip_whitespace();

            if (buf.peek() == ']') {
                if (reader_.options().strict) {
                    buf.fail("trailing comma before ']'");
                }
                return nullptr;
            }
        }
        first_ = false;
        return &reader_;
    }

    void end() override {
        auto& buf = reader_.buffer();
        buf.skip_whitespace();
        buf.expect(']');
    }

private:
    json_reader_t& reader_;
    bool first_ = true;
};

class json_map_reader_t : public deserializer_t::map_access_t {
public:
    explicit json_map_reader_t(json_reader_t& reader) : reader_(reader) {}

    auto read_key(any_value_t& key) -> bool override {
        auto& buf = reader_.buffer();
        buf.skip_whitespace();

        if (buf.peek() == '}') {
            return false;
        }
        if (!first_) {
            buf.expect(',');
            buf.skip_whitespace();

            if (buf.peek() == '}') {
                if (reader_.options().strict) {
                    buf.fail("trailing comma before '}'");
                }
                return false;
            }
        }
        first_ = false;
        key = reader_.read_string();
        return true;
    }

    auto read_value() -> deserializer_t& override {
        auto& buf = reader_.buffer();
        buf.skip_whitespace();
        buf.expect(':');
        return reader_;
    }

    void ignore_value() override {
        read_value().read_ignore();
    }

    void end() override {
        auto& buf = reader_.buffer();
        buf.skip_whitespace();
        buf.expect('}');
    }

private:
    json_reader_t& reader_;
    bool first_ = true;
};

// Smallest signed width holding value
auto smallest_integer(std::int64_t value) -> any_value_t {
    if (value >= std::numeric_limits<std::int8_t>::min() && value <= std::numeric_limits<std::int8_t>::max()) {
        return static_cast<std::int8_t>(value);
    }
    if (value >= std::numeric_limits<std::int16_t>::min() && value <= std::numeric_limits<std::int16_t>::max()) {
        return static_cast<std::int16_t>(value);
    }
    if (value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max()) {
        return static_cast<std::int32_t>(value);
    }
    return value;
}

auto is_number_char(int c) -> bool {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

} // namespace

// =============================================================================
// json_reader_t
// =============================================================================

json_reader_t::json_reader_t(std::string_view text, json_options_t options)
    : buffer_(text)
    , options_(std::move(options)) {}

json_reader_t::json_reader_t(std::istream& stream, json_options_t options)
    : buffer_(stream)
    , options_(std::move(options)) {}

json_reader_t::json_reader_t(read_buffer_t::source_fn source, json_options_t options)
    : buffer_(std::move(source))
    , options_(std::move(options)) {}

void json_reader_t::fail_type(const std::string& message) const {
    throw type_error_t(message + " at " + buffer_.position());
}

void json_reader_t::finish() {
    buffer_.skip_whitespace();
    if (!buffer_.at_end()) {
        buffer_.fail("unexpected trailing characters");
    }
}

// Consume word only when no identifier character follows it
auto json_reader_t::read_literal(std::string_view word) -> bool {
    if (!buffer_.starts_with(word)) {
        return false;
    }
    auto next = buffer_.peek(word.size());

    if (next != read_buffer_t::eof && (std::isalnum(next) || next == '_')) {
        return false;
    }
    buffer_.skip(word.size());
    return true;
}

auto json_reader_t::read_bool() -> bool {
    buffer_.skip_whitespace();

    if (read_literal("true")) {
        return true;
    }
    if (read_literal("false")) {
        return false;
    }
    if (buffer_.at_end()) {
        buffer_.fail_end();
    }
    fail_type("expected boolean");
}

auto json_reader_t::read_magnitude(const char* expected) -> std::uint64_t {
    auto c = buffer_.peek();

    if (c < '0' || c > '9') {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type(std::string("expected ") + expected);
    }
    auto value = std::uint64_t(0);

    while (c >= '0' && c <= '9') {
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            fail_type("cannot fit integer");
        }
        value = value * 10 + digit;
        buffer_.get();
        c = buffer_.peek();
    }
    if (c == '.' || c == 'e' || c == 'E') {
        fail_type(std::string("expected ") + expected + ", found a fractional number");
    }
    return value;
}

auto json_reader_t::read_signed(int width) -> std::int64_t {
    buffer_.skip_whitespace();

    auto negative = buffer_.peek() == '-';
    if (negative) {
        buffer_.get();
    }
    auto magnitude = read_magnitude("integer");
    auto limit = static_cast<std::uint64_t>(signed_max(width));

    if (magnitude > limit + (negative ? 1 : 0)) {
        fail_type("cannot fit integer into " + std::to_string(width) + "-byte signed integer");
    }
    if (negative) {
        return static_cast<std::int64_t>(std::uint64_t(0) - magnitude);
    }
    return static_cast<std::int64_t>(magnitude);
}

auto json_reader_t::read_unsigned(int width) -> std::uint64_t {
    buffer_.skip_whitespace();

    if (buffer_.peek() == '-') {
        fail_type("cannot fit negative integer into unsigned integer");
    }
    auto magnitude = read_magnitude("unsigned integer");

    if (magnitude > unsigned_max(width)) {
        fail_type("cannot fit integer into " + std::to_string(width) + "-byte unsigned integer");
    }
    return magnitude;
}

auto json_reader_t::read_non_finite() -> std::optional<double> {
    auto value = std::optional<double>();

    if (read_literal("NaN")) {
        value = std::numeric_limits<double>::quiet_NaN();
    } else if (read_literal("Infinity")) {
        value = std::numeric_limits<double>::infinity();
    } else if (read_literal("-Infinity")) {
        value = -std::numeric_limits<double>::infinity();
    }
    if (value && options_.strict) {
        buffer_.fail("non-finite number in strict mode");
    }
    return value;
}

auto json_reader_t::read_number_token() -> std::string {
    auto token = std::string();
    while (is_number_char(buffer_.peek())) {
        token += buffer_.get();
    }
    if (token.empty()) {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type("expected number");
    }
    return token;
}

auto json_reader_t::read_float(int width) -> double {
    buffer_.skip_whitespace();

    if (auto special = read_non_finite()) {
        return *special;
    }
    auto token = read_number_token();
    auto value = 0.0;

    if (!parse_float(token, value)) {
        fail_type("invalid number '" + token + "'");
    }
    if (width == 4 && std::isfinite(value) && std::abs(value) > std::numeric_limits<float>::max()) {
        fail_type("cannot fit '" + token + "' into a 4-byte float");
    }
    return value;
}

auto json_reader_t::read_real() -> long double {
    buffer_.skip_whitespace();

    if (auto special = read_non_finite()) {
        return *special;
    }
    auto token = read_number_token();
    auto value = 0.0L;

    if (!parse_real(token, value)) {
        fail_type("invalid number '" + token + "'");
    }
    return value;
}

auto json_reader_t::read_char() -> char32_t {
    buffer_.skip_whitespace();

    if (buffer_.peek() == '"') {
        return single_code_point(read_string());
    }
    auto code_point = read_unsigned(4);
    if (code_point > 0x10FFFF) {
        fail_type("code point out of range");
    }
    return static_cast<char32_t>(code_point);
}

auto json_reader_t::read_string() -> std::string {
    buffer_.skip_whitespace();

    if (buffer_.peek() != '"') {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type("expected string");
    }
    buffer_.get();
    return read_escaped(buffer_, '"');
}

auto json_reader_t::read_enum() -> any_value_t {
    buffer_.skip_whitespace();

    if (buffer_.peek() == '"') {
        return read_string();
    }
    return read_signed(8);
}

auto json_reader_t::read_optional() -> bool {
    buffer_.skip_whitespace();

    if (read_literal("null")) {
        return false;
    }
    return true;
}

void json_reader_t::read_ignore() {
    buffer_.skip_whitespace();

    switch (buffer_.peek()) {
        case '"':
            read_string();
            return;
        case 't':
        case 'f':
            read_bool();
            return;
        case 'n':
            if (!read_literal("null")) {
                fail_type("expected null");
            }
            return;
        case '[':
        case '{':
            break;
        default:
            read_float(8);
            return;
    }

    // Bracket matching; strings are skipped whole so their brackets don't count
    auto closers = std::string();

    while (true) {
        auto c = buffer_.get();

        if (c == '"') {
            read_escaped(buffer_, '"');
        } else if (c == '[') {
            closers += ']';
        } else if (c == '{') {
            closers += '}';
        } else if (c == ']' || c == '}') {
            if (closers.empty() || closers.back() != c) {
                buffer_.fail(std::string("unexpected '") + c + "'");
            }
            closers.pop_back();
            if (closers.empty()) {
                return;
            }
        }
    }
}

auto json_reader_t::read_any() -> any_value_t {
    buffer_.skip_whitespace();

    switch (buffer_.peek()) {
        case read_buffer_t::eof:
            buffer_.fail_end();
        case 'n':
            if (!read_literal("null")) {
                fail_type("expected null");
            }
            return any_value_t();
        case 't':
        case 'f':
            return read_bool();
        case '"':
            return read_string();
        case '[': {
            auto items = any_seq_t();
            auto seq = read_seq();
            while (auto* element = seq->read_element()) {
                items.push_back(element->read_any());
            }
            seq->end();
            return items;
        }
        case '{': {
            auto map = any_map_t();
            auto access = read_map();
            auto key = any_value_t();
            while (access->read_key(key)) {
                map.set(key, access->read_value().read_any());
            }
            access->end();
            return map;
        }
        default:
            break;
    }

    if (auto special = read_non_finite()) {
        return *special;
    }
    auto token = read_number_token();

    if (token.find_first_of(".eE") == std::string::npos) {
        auto i = std::int64_t(0);
        auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), i);
        if (ec == std::errc() && end == token.data() + token.size()) {
            return smallest_integer(i);
        }
        auto u = std::uint64_t(0);
        auto [uend, uec] = std::from_chars(token.data(), token.data() + token.size(), u);
        if (uec == std::errc() && uend == token.data() + token.size()) {
            return u;
        }
    }
    auto value = 0.0;

    if (!parse_float(token, value)) {
        fail_type("invalid number '" + token + "'");
    }
    if (value == std::trunc(value) && std::abs(value) < 9.2e18) {
        return smallest_integer(static_cast<std::int64_t>(value));
    }
    return value;
}

// =============================================================================
// Containers
// =============================================================================

auto json_reader_t::read_seq() -> std::unique_ptr<seq_access_t> {
    buffer_.skip_whitespace();

    if (buffer_.peek() != '[') {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type("expected array");
    }
    buffer_.get();
    return std::make_unique<json_seq_reader_t>(*this);
}

auto json_reader_t::read_tuple(std::size_t) -> std::unique_ptr<seq_access_t> {
    return read_seq();
}

auto json_reader_t::read_map() -> std::unique_ptr<map_access_t> {
    buffer_.skip_whitespace();

    if (buffer_.peek() != '{') {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type("expected object");
    }
    buffer_.get();
    return std::make_unique<json_map_reader_t>(*this);
}

auto json_reader_t::read_struct(std::string_view) -> std::unique_ptr<map_access_t> {
    buffer_.skip_whitespace();

    if (read_literal("null")) {
        return nullptr;
    }
    return read_map();
}

} // namespace serde
