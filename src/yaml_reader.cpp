// yaml_reader.cpp - implementation of yaml_reader_t

#include "serde/yaml.hpp"
#include "serde/error.hpp"
#include "serde/escape.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace serde {

namespace {

using context_t = yaml_reader_t::context_t;
using pending_t = yaml_reader_t::pending_t;

// =============================================================================
// Character classes
// =============================================================================

auto is_blank_or_end(int c) -> bool {
    return c == read_buffer_t::eof || c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto is_flow_indicator(int c) -> bool {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

// A block sequence entry: '-' followed by a separator
auto is_dash(read_buffer_t& buffer) -> bool {
    return buffer.peek() == '-' && is_blank_or_end(buffer.peek(1));
}

// "---" or "..." at the start of a line ends every open block collection
auto is_document_marker(read_buffer_t& buffer) -> bool {
    return buffer.column() == 0
        && (buffer.starts_with("---") || buffer.starts_with("..."))
        && is_blank_or_end(buffer.peek(3));
}

auto lower(std::string_view text) -> std::string {
    auto out = std::string(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto all_digits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Decimal digit or '.' after an optional sign; rules out inf and nan spellings
auto starts_numeric(std::string_view text) -> bool {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        text.remove_prefix(1);
    }
    return !text.empty() && (std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.');
}

// =============================================================================
// Scalar resolution
// =============================================================================

enum class number_t { ok, invalid, overflow };

// Decimal, 0x hex or 0o octal with an optional sign
auto parse_integer(std::string_view token, bool& negative, std::uint64_t& magnitude) -> number_t {
    negative = false;

    if (!token.empty() && (token.front() == '-' || token.front() == '+')) {
        negative = token.front() == '-';
        token.remove_prefix(1);
    }
    auto base = 10;

    if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X')) {
        base = 16;
        token.remove_prefix(2);
    } else if (token.size() > 2 && token[0] == '0' && (token[1] == 'o' || token[1] == 'O')) {
        base = 8;
        token.remove_prefix(2);
    }
    if (token.empty()) {
        return number_t::invalid;
    }
    auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), magnitude, base);

    if (end != token.data() + token.size()) {
        return number_t::invalid;
    }
    if (ec == std::errc::result_out_of_range) {
        return number_t::overflow;
    }
    return ec == std::errc() ? number_t::ok : number_t::invalid;
}

auto special_float(std::string_view token) -> std::optional<long double> {
    auto word = lower(token);

    if (word == ".inf" || word == "+.inf") {
        return std::numeric_limits<long double>::infinity();
    }
    if (word == "-.inf") {
        return -std::numeric_limits<long double>::infinity();
    }
    if (word == ".nan") {
        return std::numeric_limits<long double>::quiet_NaN();
    }
    return std::nullopt;
}

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

// %XX escapes in tag text
auto decode_uri(std::string_view text) -> std::string {
    auto out = std::string();

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            auto byte = 0u;
            auto [end, ec] = std::from_chars(text.data() + i + 1, text.data() + i + 3, byte, 16);
            if (ec == std::errc() && end == text.data() + i + 3) {
                out += static_cast<char>(byte);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

auto read_word(read_buffer_t& buffer) -> std::string {
    auto word = std::string();
    while (!is_blank_or_end(buffer.peek())) {
        word += buffer.get();
    }
    return word;
}

void skip_line(read_buffer_t& buffer) {
    while (buffer.peek() != '\n' && buffer.peek() != read_buffer_t::eof) {
        buffer.get();
    }
}

// Consume one line break (LF or CRLF); false when none is next
auto skip_break(read_buffer_t& buffer) -> bool {
    if (buffer.peek() == '\r') {
        buffer.get();
    }
    if (buffer.peek() == '\n') {
        buffer.get();
        return true;
    }
    return false;
}

// =============================================================================
// Block collections
// =============================================================================

class yaml_block_seq_reader_t : public deserializer_t::seq_access_t {
public:
    yaml_block_seq_reader_t(yaml_reader_t& reader, std::size_t column)
        : reader_(reader)
        , column_(static_cast<long>(column))
        , saved_indent_(reader.indent())
        , saved_context_(reader.context()) {
        reader_.set_indent(column_);
    }

    auto read_element() -> deserializer_t* override {
        auto& buf = reader_.buffer();

        if (!first_) {
            reader_.skip_space();

            if (buf.at_end() || is_document_marker(buf)) {
                return nullptr;
            }
            auto column = static_cast<long>(buf.column());

            if (column < column_) {
                return nullptr;
            }
            if (column > column_) {
                buf.fail("mismatching indentation in block sequence");
            }
            if (!is_dash(buf)) {
                return nullptr;
            }
        }
        first_ = false;
        buf.get();
        reader_.set_indent(column_);
        reader_.set_context(context_t::block_in);
        reader_.set_pending(pending_t::seq_item);
        return &reader_;
    }

    void end() override {
        reader_.set_indent(saved_indent_);
        reader_.set_context(saved_context_);
    }

private:
    yaml_reader_t& reader_;
    long column_;
    long saved_indent_;
    context_t saved_context_;
    bool first_ = true;
};

// Every key sits at the column of the first one. A shallower line ends the
// mapping; a deeper one is an error.
class yaml_block_map_reader_t : public deserializer_t::map_access_t {
public:
    yaml_block_map_reader_t(yaml_reader_t& reader, std::size_t column, std::optional<std::string> first_key)
        : reader_(reader)
        , column_(static_cast<long>(column))
        , saved_indent_(reader.indent())
        , saved_context_(reader.context())
        , first_key_(std::move(first_key)) {
        reader_.set_indent(column_);
    }

    auto read_key(any_value_t& key) -> bool override {
        auto& buf = reader_.buffer();
        reader_.set_indent(column_);

        if (first_key_) {
            key = std::move(*first_key_);
            first_key_.reset();
            first_ = false;
            reader_.set_context(context_t::block_in);
            return true;
        }
        if (!first_) {
            reader_.skip_space();

            if (buf.at_end() || is_document_marker(buf)) {
                return false;
            }
            auto column = static_cast<long>(buf.column());

            if (column < column_) {
                return false;
            }
            if (column > column_) {
                buf.fail("mismatching indentation in block mapping");
            }
            if (is_dash(buf)) {
                return false;
            }
        }
        first_ = false;
        reader_.set_context(context_t::block_key);
        key = reader_.read_key_scalar();
        buf.skip_blanks();
        buf.expect(':');
        reader_.set_context(context_t::block_in);
        return true;
    }

    auto read_value() -> deserializer_t& override {
        reader_.set_pending(pending_t::map_value);
        return reader_;
    }

    void ignore_value() override {
        read_value().read_ignore();
    }

    void end() override {
        reader_.set_indent(saved_indent_);
        reader_.set_context(saved_context_);
    }

private:
    yaml_reader_t& reader_;
    long column_;
    long saved_indent_;
    context_t saved_context_;
    std::optional<std::string> first_key_;
    bool first_ = true;
};

// =============================================================================
// Flow collections
// =============================================================================

class yaml_flow_seq_reader_t : public deserializer_t::seq_access_t {
public:
    explicit yaml_flow_seq_reader_t(yaml_reader_t& reader)
        : reader_(reader)
        , saved_context_(reader.context()) {
        reader_.set_context(context_t::flow_in);
    }

    auto read_element() -> deserializer_t* override {
        auto& buf = reader_.buffer();
        reader_.skip_space();

        if (buf.peek() == ']') {
            return nullptr;
        }
        if (!first_) {
            buf.expect(',');
            reader_.skip_space();

            if (buf.peek() == ']') {
                return nullptr;
            }
        }
        first_ = false;
        reader_.set_context(context_t::flow_in);
        return &reader_;
    }

    void end() override {
        reader_.skip_space();
        reader_.buffer().expect(']');
        reader_.set_context(saved_context_);
    }

private:
    yaml_reader_t& reader_;
    context_t saved_context_;
    bool first_ = true;
};

class yaml_flow_map_reader_t : public deserializer_t::map_access_t {
public:
    explicit yaml_flow_map_reader_t(yaml_reader_t& reader)
        : reader_(reader)
        , saved_context_(reader.context()) {
        reader_.set_context(context_t::flow_in);
    }

    auto read_key(any_value_t& key) -> bool override {
        auto& buf = reader_.buffer();
        reader_.skip_space();

        if (buf.peek() == '}') {
            return false;
        }
        if (!first_) {
            buf.expect(',');
            reader_.skip_space();

            if (buf.peek() == '}') {
                return false;
            }
        }
        first_ = false;
        reader_.set_context(context_t::flow_key);
        key = reader_.read_key_scalar();
        reader_.skip_space();
        buf.expect(':');
        reader_.set_context(context_t::flow_in);
        return true;
    }

    auto read_value() -> deserializer_t& override {
        return reader_;
    }

    void ignore_value() override {
        read_value().read_ignore();
    }

    void end() override {
        reader_.skip_space();
        reader_.buffer().expect('}');
        reader_.set_context(saved_context_);
    }

private:
    yaml_reader_t& reader_;
    context_t saved_context_;
    bool first_ = true;
};

} // namespace

// =============================================================================
// yaml_reader_t
// =============================================================================

yaml_reader_t::yaml_reader_t(std::string_view text, yaml_options_t options)
    : buffer_(text)
    , options_(std::move(options)) {}

yaml_reader_t::yaml_reader_t(std::istream& stream, yaml_options_t options)
    : buffer_(stream)
    , options_(std::move(options)) {}

yaml_reader_t::yaml_reader_t(read_buffer_t::source_fn source, yaml_options_t options)
    : buffer_(std::move(source))
    , options_(std::move(options)) {}

void yaml_reader_t::fail_type(const std::string& message) const {
    throw type_error_t(message + " at " + buffer_.position());
}

auto yaml_reader_t::in_flow() const -> bool {
    return context_ == context_t::flow_in || context_ == context_t::flow_out || context_ == context_t::flow_key;
}

auto yaml_reader_t::at_delimiter(std::size_t offset) -> bool {
    auto c = buffer_.peek(offset);
    return is_blank_or_end(c) || (in_flow() && (c == ',' || c == ']' || c == '}'));
}

auto yaml_reader_t::at_dash() -> bool {
    return is_dash(buffer_);
}

auto yaml_reader_t::at_flow_end() -> bool {
    auto c = buffer_.peek();
    return c == ',' || c == ']' || c == '}';
}

void yaml_reader_t::skip_space() {
    while (true) {
        auto c = buffer_.peek();

        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            buffer_.get();
        } else if (c == '#') {
            skip_line(buffer_);
        } else {
            return;
        }
    }
}

void yaml_reader_t::read_directives() {
    skip_space();

    while (buffer_.peek() == '%') {
        buffer_.get();
        auto directive = read_word(buffer_);

        if (directive == "TAG") {
            buffer_.skip_blanks();
            auto handle = read_word(buffer_);
            buffer_.skip_blanks();
            auto prefix = read_word(buffer_);

            if (handle.empty() || prefix.empty()) {
                buffer_.fail("malformed %TAG directive");
            }
            options_.tag_handles[handle] = prefix;
        }
        skip_line(buffer_);
        skip_space();
    }
    if (buffer_.starts_with("---") && is_blank_or_end(buffer_.peek(3))) {
        buffer_.skip(3);
    }
}

void yaml_reader_t::finish() {
    if (!started_) {
        started_ = true;
        read_directives();
    }
    skip_space();

    if (buffer_.starts_with("...") && is_blank_or_end(buffer_.peek(3))) {
        buffer_.skip(3);
        skip_space();
    }
    if (!buffer_.at_end()) {
        buffer_.fail("unexpected trailing characters");
    }
}

// Position at the next node and report whether one is there. A node on a
// later line than the ':' or '-' that introduced it must be indented deeper
// than the enclosing block collection; a sequence may sit at the same
// column as the key that owns it.
auto yaml_reader_t::begin_node() -> bool {
    if (!started_) {
        started_ = true;
        read_directives();
    }
    auto pending = pending_;
    auto line = buffer_.line();
    pending_ = pending_t::none;

    skip_space();

    if (buffer_.at_end()) {
        return false;
    }
    if (in_flow()) {
        if (at_flow_end()) {
            return false;
        }
    } else if (pending != pending_t::none && buffer_.line() != line) {
        auto column = static_cast<long>(buffer_.column());

        if (column < indent_ || (column == indent_ && !(pending == pending_t::map_value && at_dash()))) {
            return false;
        }
    }
    if (buffer_.peek() == '!') {
        read_tag();
        line = buffer_.line();
        skip_space();

        if (buffer_.at_end()) {
            return false;
        }
        if (in_flow()) {
            return !at_flow_end();
        }
        if (buffer_.line() != line && static_cast<long>(buffer_.column()) <= indent_) {
            return false;
        }
    }
    return true;
}

void yaml_reader_t::require_node(const char* expected) {
    if (!begin_node()) {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        fail_type(std::string("expected ") + expected + ", found an empty value");
    }
}

auto yaml_reader_t::skip_null() -> bool {
    if (buffer_.peek() == '~' && at_delimiter(1)) {
        buffer_.skip(1);
        return true;
    }
    for (auto word : {"null", "Null", "NULL"}) {
        if (buffer_.starts_with(word) && at_delimiter(4)) {
            buffer_.skip(4);
            return true;
        }
    }
    return false;
}

// =============================================================================
// Tags
// =============================================================================

auto yaml_reader_t::read_tag() -> std::string {
    if (buffer_.peek() != '!') {
        return {};
    }
    buffer_.get();

    auto read_tag_chars = [this](bool stop_at_bang) {
        auto text = std::string();
        while (true) {
            auto c = buffer_.peek();
            if (is_blank_or_end(c) || is_flow_indicator(c) || (stop_at_bang && c == '!')) {
                return text;
            }
            text += buffer_.get();
        }
    };

    if (buffer_.peek() == '<') {
        buffer_.get();
        auto uri = std::string();

        while (buffer_.peek() != '>') {
            if (buffer_.at_end()) {
                buffer_.fail_end();
            }
            if (is_blank_or_end(buffer_.peek())) {
                buffer_.fail("unterminated verbatim tag");
            }
            uri += buffer_.get();
        }
        buffer_.get();
        return decode_uri(uri);
    }
    if (buffer_.peek() == '!') {
        buffer_.get();
        auto handle = options_.tag_handles.find("!!");
        auto prefix = handle != options_.tag_handles.end() ? handle->second : std::string("tag:yaml.org,2002:");
        return prefix + decode_uri(read_tag_chars(false));
    }
    auto word = read_tag_chars(true);

    if (buffer_.peek() == '!') {
        buffer_.get();
        auto name = "!" + word + "!";
        auto handle = options_.tag_handles.find(name);

        if (handle == options_.tag_handles.end()) {
            buffer_.fail("undefined tag handle '" + name + "'");
        }
        return handle->second + decode_uri(read_tag_chars(false));
    }
    if (word.empty()) {
        return "!";
    }
    return decode_uri(word);
}

// =============================================================================
// Scalars
// =============================================================================

auto yaml_reader_t::read_scalar() -> std::optional<std::string> {
    switch (buffer_.peek()) {
        case '"':
            buffer_.get();
            return read_escaped(buffer_, '"');
        case '\'':
            return read_single_quoted();
        case '|':
        case '>':
            if (!in_flow()) {
                return read_block_scalar();
            }
            return std::nullopt;
        default:
            return read_plain();
    }
}

// No escapes at all; the text runs to the next quote
auto yaml_reader_t::read_single_quoted() -> std::string {
    buffer_.expect('\'');
    auto text = std::string();

    while (buffer_.peek() != '\'') {
        text += buffer_.get();
    }
    buffer_.get();
    return text;
}

// Single line. Inside flow collections the flow indicators end the scalar;
// ": " and " #" end it everywhere.
auto yaml_reader_t::read_plain() -> std::optional<std::string> {
    static constexpr std::string_view indicators = "-?:,[]{}#&*!|>'\"%@`";

    auto flow = context_ == context_t::flow_in || context_ == context_t::flow_key;
    auto safe = [flow](int c) {
        return !is_blank_or_end(c) && !(flow && is_flow_indicator(c));
    };
    auto c = buffer_.peek();

    if (c == read_buffer_t::eof) {
        return std::nullopt;
    }
    if (indicators.find(static_cast<char>(c)) != std::string_view::npos) {
        if (!((c == '-' || c == '?' || c == ':') && safe(buffer_.peek(1)))) {
            return std::nullopt;
        }
    }
    auto text = std::string();

    while (true) {
        c = buffer_.peek();

        if (c == read_buffer_t::eof || c == '\n' || c == '\r') {
            break;
        }
        if (c == ':' && !safe(buffer_.peek(1))) {
            break;
        }
        if (c == '#' && !text.empty() && (text.back() == ' ' || text.back() == '\t')) {
            break;
        }
        if (flow && is_flow_indicator(c)) {
            break;
        }
        text += buffer_.get();
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

// Literal '|' or folded '>' with an optional indentation digit and chomping
// indicator. An explicit indentation is relative to the enclosing block
// collection; otherwise the first non-empty line sets it.
auto yaml_reader_t::read_block_scalar() -> std::string {
    enum class chomp_t { clip, strip, keep };

    auto folded = buffer_.get() == '>';
    auto chomp = chomp_t::clip;
    auto explicit_indent = 0L;

    for (int i = 0; i < 2; ++i) {
        auto c = buffer_.peek();

        if (c == '-') {
            chomp = chomp_t::strip;
        } else if (c == '+') {
            chomp = chomp_t::keep;
        } else if (c >= '1' && c <= '9') {
            explicit_indent = c - '0';
        } else {
            break;
        }
        buffer_.get();
    }
    buffer_.skip_blanks();

    if (buffer_.peek() == '#') {
        skip_line(buffer_);
    }
    if (!skip_break(buffer_) && !buffer_.at_end()) {
        buffer_.fail("expected line break after block scalar header");
    }

    auto indent = explicit_indent > 0 ? std::max(indent_, 0L) + explicit_indent : -1L;
    auto text = std::string();
    auto breaks = std::size_t(0);
    auto has_content = false;
    auto last_more_indented = false;

    while (true) {
        auto n = std::size_t(0);
        while (buffer_.peek(n) == ' ') {
            ++n;
        }
        auto c = buffer_.peek(n);
        auto blank = c == read_buffer_t::eof || c == '\n' || c == '\r';

        // Spaces past the indentation on a blank line are content
        if (blank && (indent < 0 || static_cast<long>(n) <= indent)) {
            buffer_.skip(n);

            if (c == read_buffer_t::eof) {
                break;
            }
            skip_break(buffer_);
            ++breaks;
            continue;
        }
        if (indent < 0) {
            if (static_cast<long>(n) <= indent_) {
                break;
            }
            indent = static_cast<long>(n);
        }
        if (static_cast<long>(n) < indent) {
            break;
        }
        buffer_.skip(static_cast<std::size_t>(indent));

        auto line = std::string();
        while (buffer_.peek() != '\n' && buffer_.peek() != '\r' && buffer_.peek() != read_buffer_t::eof) {
            line += buffer_.get();
        }
        auto more_indented = !line.empty() && (line.front() == ' ' || line.front() == '\t');

        if (!has_content || !folded || more_indented || last_more_indented) {
            text.append(breaks, '\n');
        } else if (breaks == 1) {
            text += ' ';
        } else {
            text.append(breaks - 1, '\n');
        }
        text += line;
        has_content = true;
        last_more_indented = more_indented;
        breaks = 0;

        if (!skip_break(buffer_)) {
            break;
        }
        breaks = 1;
    }

    switch (chomp) {
        case chomp_t::strip:
            break;
        case chomp_t::clip:
            if (has_content && breaks > 0) {
                text += '\n';
            }
            break;
        case chomp_t::keep:
            text.append(breaks, '\n');
            break;
    }
    return text;
}

auto yaml_reader_t::read_key_scalar() -> std::string {
    auto c = buffer_.peek();

    if (c == '|' || c == '>') {
        buffer_.fail("a block scalar cannot be a mapping key");
    }
    auto text = read_scalar();

    if (!text) {
        if (buffer_.at_end()) {
            buffer_.fail_end();
        }
        buffer_.fail("expected mapping key");
    }
    return *text;
}

auto yaml_reader_t::read_number_token(const char* expected) -> std::string {
    require_node(expected);
    auto token = read_scalar();

    if (!token) {
        fail_type(std::string("expected ") + expected);
    }
    return *token;
}

auto yaml_reader_t::read_bool() -> bool {
    auto token = read_number_token("boolean");
    auto word = lower(token);

    if (word == "true" || word == "yes") {
        return true;
    }
    if (word == "false" || word == "no") {
        return false;
    }
    fail_type("expected boolean, found '" + token + "'");
}

auto yaml_reader_t::read_signed(int width) -> std::int64_t {
    auto token = read_number_token("integer");
    auto negative = false;
    auto magnitude = std::uint64_t(0);

    switch (parse_integer(token, negative, magnitude)) {
        case number_t::invalid:
            fail_type("expected integer, found '" + token + "'");
        case number_t::overflow:
            fail_type("cannot fit integer '" + token + "'");
        case number_t::ok:
            break;
    }
    auto limit = static_cast<std::uint64_t>(signed_max(width));

    if (magnitude > limit + (negative ? 1 : 0)) {
        fail_type("cannot fit integer into " + std::to_string(width) + "-byte signed integer");
    }
    if (negative) {
        return static_cast<std::int64_t>(std::uint64_t(0) - magnitude);
    }
    return static_cast<std::int64_t>(magnitude);
}

auto yaml_reader_t::read_unsigned(int width) -> std::uint64_t {
    auto token = read_number_token("unsigned integer");
    auto negative = false;
    auto magnitude = std::uint64_t(0);

    switch (parse_integer(token, negative, magnitude)) {
        case number_t::invalid:
            fail_type("expected unsigned integer, found '" + token + "'");
        case number_t::overflow:
            fail_type("cannot fit integer '" + token + "'");
        case number_t::ok:
            break;
    }
    if (negative && magnitude != 0) {
        fail_type("cannot fit negative integer into unsigned integer");
    }
    if (magnitude > unsigned_max(width)) {
        fail_type("cannot fit integer into " + std::to_string(width) + "-byte unsigned integer");
    }
    return magnitude;
}

auto yaml_reader_t::read_float(int width) -> double {
    auto token = read_number_token("float");

    if (auto special = special_float(token)) {
        return static_cast<double>(*special);
    }
    auto value = 0.0;

    if (!starts_numeric(token) || !parse_float(token, value)) {
        fail_type("expected float, found '" + token + "'");
    }
    if (width == 4 && std::abs(value) > std::numeric_limits<float>::max()) {
        fail_type("cannot fit '" + token + "' into a 4-byte float");
    }
    return value;
}

auto yaml_reader_t::read_real() -> long double {
    auto token = read_number_token("float");

    if (auto special = special_float(token)) {
        return *special;
    }
    auto value = 0.0L;

    if (!starts_numeric(token) || !parse_real(token, value)) {
        fail_type("expected float, found '" + token + "'");
    }
    return value;
}

auto yaml_reader_t::read_char() -> char32_t {
    require_node("character");
    auto quoted = buffer_.peek() == '"' || buffer_.peek() == '\'';
    auto text = read_scalar();

    if (!text) {
        fail_type("expected character");
    }
    if (!quoted && text->size() > 1 && all_digits(*text)) {
        auto code_point = std::uint32_t(0);
        auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), code_point);

        if (ec != std::errc() || code_point > 0x10FFFF) {
            fail_type("code point out of range");
        }
        return static_cast<char32_t>(code_point);
    }
    return single_code_point(*text);
}

auto yaml_reader_t::read_string() -> std::string {
    require_node("string");
    auto text = read_scalar();

    if (!text) {
        fail_type("expected string");
    }
    return *text;
}

auto yaml_reader_t::read_enum() -> any_value_t {
    require_node("enum");
    auto text = read_scalar();

    if (!text) {
        fail_type("expected enum");
    }
    if (all_digits(*text)) {
        auto ordinal = std::uint64_t(0);
        auto [end, ec] = std::from_chars(text->data(), text->data() + text->size(), ordinal);

        if (ec != std::errc()) {
            fail_type("enum ordinal out of range: " + *text);
        }
        return ordinal;
    }
    return *text;
}

auto yaml_reader_t::read_optional() -> bool {
    if (!begin_node()) {
        return false;
    }
    return !skip_null();
}

void yaml_reader_t::read_ignore() {
    read_any();
}

// Core schema for plain scalars
auto yaml_reader_t::resolve_plain(const std::string& text) -> any_value_t {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return any_value_t();
    }
    auto word = lower(text);

    if (word == "true" || word == "yes") {
        return true;
    }
    if (word == "false" || word == "no") {
        return false;
    }
    auto negative = false;
    auto magnitude = std::uint64_t(0);

    if (parse_integer(text, negative, magnitude) == number_t::ok) {
        auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

        if (negative && magnitude <= limit + 1) {
            return smallest_integer(static_cast<std::int64_t>(std::uint64_t(0) - magnitude));
        }
        if (!negative && magnitude <= limit) {
            return smallest_integer(static_cast<std::int64_t>(magnitude));
        }
        if (!negative) {
            return magnitude;
        }
    }
    if (auto special = special_float(text)) {
        return static_cast<double>(*special);
    }
    auto value = 0.0;

    if (starts_numeric(text) && parse_float(text, value)) {
        return value;
    }
    return text;
}

auto yaml_reader_t::read_any() -> any_value_t {
    if (!begin_node()) {
        return any_value_t();
    }
    if (auto collection = read_any_collection()) {
        return std::move(*collection);
    }
    auto column = buffer_.column();
    auto c = buffer_.peek();
    auto block = c == '|' || c == '>';
    auto plain = !block && c != '"' && c != '\'';
    auto text = read_scalar();

    if (!text) {
        buffer_.fail(std::string("unexpected '") + static_cast<char>(c) + "'");
    }
    if (!in_flow() && !block) {
        buffer_.skip_blanks();

        if (buffer_.peek() == ':' && is_blank_or_end(buffer_.peek(1))) {
            buffer_.get();
            return read_block_map(std::move(*text), column);
        }
    }
    if (plain) {
        return resolve_plain(*text);
    }
    return std::move(*text);
}

auto yaml_reader_t::read_any_collection() -> std::optional<any_value_t> {
    auto c = buffer_.peek();

    if (c == '{') {
        auto map = any_map_t();
        auto access = open_map();
        auto key = any_value_t();

        while (access->read_key(key)) {
            map.set(key, access->read_value().read_any());
        }
        access->end();
        return any_value_t(std::move(map));
    }
    if (c == '[' || (!in_flow() && at_dash())) {
        auto items = any_seq_t();
        auto seq = open_seq();

        while (auto* element = seq->read_element()) {
            items.push_back(element->read_any());
        }
        seq->end();
        return any_value_t(std::move(items));
    }
    return std::nullopt;
}

auto yaml_reader_t::read_block_map(std::string first_key, std::size_t column) -> any_value_t {
    auto map = any_map_t();
    auto access = yaml_block_map_reader_t(*this, column, std::move(first_key));
    auto key = any_value_t();

    while (access.read_key(key)) {
        map.set(key, access.read_value().read_any());
    }
    access.end();
    return map;
}

// =============================================================================
// Containers
// =============================================================================

auto yaml_reader_t::open_seq() -> std::unique_ptr<seq_access_t> {
    if (buffer_.peek() == '[') {
        buffer_.get();
        return std::make_unique<yaml_flow_seq_reader_t>(*this);
    }
    if (!in_flow() && at_dash()) {
        return std::make_unique<yaml_block_seq_reader_t>(*this, buffer_.column());
    }
    fail_type("expected sequence");
}

auto yaml_reader_t::open_map() -> std::unique_ptr<map_access_t> {
    if (buffer_.peek() == '{') {
        buffer_.get();
        return std::make_unique<yaml_flow_map_reader_t>(*this);
    }
    if (in_flow()) {
        fail_type("expected mapping");
    }
    if (at_dash() || buffer_.peek() == '[') {
        fail_type("expected mapping, found sequence");
    }
    return std::make_unique<yaml_block_map_reader_t>(*this, buffer_.column(), std::nullopt);
}

auto yaml_reader_t::read_seq() -> std::unique_ptr<seq_access_t> {
    require_node("sequence");
    return open_seq();
}

auto yaml_reader_t::read_tuple(std::size_t) -> std::unique_ptr<seq_access_t> {
    return read_seq();
}

auto yaml_reader_t::read_map() -> std::unique_ptr<map_access_t> {
    require_node("mapping");
    return open_map();
}

auto yaml_reader_t::read_struct(std::string_view) -> std::unique_ptr<map_access_t> {
    if (!begin_node() || skip_null()) {
        return nullptr;
    }
    return open_map();
}

} // namespace serde
