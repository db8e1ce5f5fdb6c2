// yaml_writer.cpp - implementation of yaml_writer_t

#include "serde/yaml.hpp"
#include "serde/error.hpp"
#include "serde/escape.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace serde {

namespace {

using slot_t = yaml_writer_t::slot_t;

// =============================================================================
// Scalar classification
// =============================================================================

// YAML printable set, excluding tab and carriage return
auto is_printable(std::string_view text) -> bool {
    auto pos = std::size_t(0);
    while (pos < text.size()) {
        auto cp = char32_t(0);
        try {
            cp = decode_utf8(text, pos);
        } catch (const type_error_t&) {
            return false;
        }
        auto printable = cp == 0x0A
            || (cp >= 0x20 && cp <= 0x7E)
            || cp == 0x85
            || (cp >= 0xA0 && cp <= 0xD7FF)
            || (cp >= 0xE000 && cp <= 0xFFFD)
            || (cp >= 0x10000 && cp <= 0x10FFFF);
        if (!printable) {
            return false;
        }
    }
    return true;
}

auto lower(std::string_view text) -> std::string {
    auto out = std::string(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

// Plain text that a reader would take for something other than this string
auto needs_quotes(std::string_view text, bool flow) -> bool {
    static const std::string_view indicators = "-?:,[]{}#&*!|>'\"%@`";

    if (indicators.find(text.front()) != std::string_view::npos) {
        return true;
    }
    if (text.front() == ' ' || text.back() == ' ' || text.back() == ':') {
        return true;
    }
    if (text.find(": ") != std::string_view::npos || text.find(" #") != std::string_view::npos) {
        return true;
    }
    if (flow && text.find_first_of(",[]{}") != std::string_view::npos) {
        return true;
    }
    auto word = lower(text);
    if (word == "null" || word == "~" || word == "true" || word == "false" || word == "yes" || word == "no") {
        return true;
    }
    if (word == ".inf" || word == "+.inf" || word == ".nan") {
        return true;
    }
    auto c0 = text.front();
    auto c1 = text.size() > 1 ? text[1] : '\0';
    if (std::isdigit(static_cast<unsigned char>(c0))) {
        return true;
    }
    if ((c0 == '+' || c0 == '.') && (std::isdigit(static_cast<unsigned char>(c1)) || c1 == '.')) {
        return true;
    }
    return false;
}

auto double_quoted(std::string_view text) -> std::string {
    auto out = std::string("\"");
    backslash_escape(text, out);
    out += '"';
    return out;
}

// =============================================================================
// Container cursors
// =============================================================================

class yaml_optional_writer_t : public serializer_t::optional_t {
public:
    explicit yaml_optional_writer_t(yaml_writer_t& writer) : writer_(writer) {}

    auto write_some() -> serializer_t& override { return writer_; }
    void write_none() override { writer_.write_null(); }
    void end() override {}

private:
    yaml_writer_t& writer_;
};

// Block sequence, mapping or struct one level below the current one
class yaml_block_writer_t
    : public serializer_t::seq_t
    , public serializer_t::map_t
    , public serializer_t::struct_t {
public:
    yaml_block_writer_t(yaml_writer_t& writer, const char* empty)
        : writer_(writer)
        , parent_(writer.slot())
        , level_(writer.level() + 1)
        , empty_(empty) {
        writer_.set_level(level_);
    }

    auto write_element() -> serializer_t& override {
        separate();
        writer_.put("- ");
        writer_.set_slot(slot_t::after_dash);
        return writer_;
    }

    auto write_key() -> serializer_t& override {
        separate();
        writer_.set_slot(slot_t::key);
        return writer_;
    }

    auto write_value() -> serializer_t& override {
        writer_.put(":");
        writer_.set_slot(slot_t::after_key);
        return writer_;
    }

    auto write_field(std::string_view name) -> serializer_t& override {
        separate();
        writer_.set_slot(slot_t::key);
        writer_.write_string(name);
        return write_value();
    }

    void end() override {
        if (first_) {
            writer_.put(parent_ == slot_t::after_key ? std::string(" ") + empty_ : std::string(empty_));
        }
        writer_.set_level(level_ - 1);
    }

private:
    // A first entry after "- " shares the dash's line; every other entry
    // starts a new line at this level's indentation
    void separate() {
        if (!first_ || parent_ != slot_t::after_dash) {
            if (!first_ || parent_ != slot_t::document) {
                writer_.line_break();
            }
            writer_.indent(level_);
        }
        first_ = false;
        writer_.set_level(level_);
    }

    yaml_writer_t& writer_;
    slot_t parent_;
    int level_;
    const char* empty_;
    bool first_ = true;
};

// Flow collection: [a, b] or {k: v}
class yaml_flow_writer_t
    : public serializer_t::seq_t
    , public serializer_t::map_t
    , public serializer_t::struct_t {
public:
    yaml_flow_writer_t(yaml_writer_t& writer, char open, char close)
        : writer_(writer)
        , close_(close) {
        if (writer_.slot() == slot_t::after_key) {
            writer_.put(" ");
        }
        writer_.put(std::string_view(&open, 1));
    }

    auto write_element() -> serializer_t& override {
        separate();
        writer_.set_slot(slot_t::flow);
        return writer_;
    }

    auto write_key() -> serializer_t& override {
        separate();
        writer_.set_slot(slot_t::flow_key);
        return writer_;
    }

    auto write_value() -> serializer_t& override {
        writer_.put(": ");
        writer_.set_slot(slot_t::flow);
        return writer_;
    }

    auto write_field(std::string_view name) -> serializer_t& override {
        separate();
        writer_.set_slot(slot_t::flow_key);
        writer_.write_string(name);
        return write_value();
    }

    void end() override {
        writer_.put(std::string_view(&close_, 1));
    }

private:
    void separate() {
        if (!first_) {
            writer_.put(", ");
        }
        first_ = false;
    }

    yaml_writer_t& writer_;
    char close_;
    bool first_ = true;
};

} // namespace

// =============================================================================
// yaml_writer_t
// =============================================================================

yaml_writer_t::yaml_writer_t(sink_fn sink, yaml_options_t options)
    : sink_(std::move(sink))
    , options_(std::move(options)) {}

void yaml_writer_t::put(std::string_view text) {
    if (!text.empty()) {
        sink_(text);
        last_ = text.back();
    }
}

void yaml_writer_t::indent(int level) {
    for (int i = 0; i < level; ++i) {
        put(options_.indent);
    }
}

void yaml_writer_t::line_break() {
    if (last_ != '\n') {
        put("\n");
    }
}

void yaml_writer_t::write_scalar(std::string_view text) {
    if (slot_ == slot_t::after_key) {
        put(" ");
    }
    put(text);
}

void yaml_writer_t::write_bool(bool value) {
    write_scalar(value ? "true" : "false");
}

void yaml_writer_t::write_signed(std::int64_t value, int) {
    write_scalar(std::to_string(value));
}

void yaml_writer_t::write_unsigned(std::uint64_t value, int) {
    write_scalar(std::to_string(value));
}

void yaml_writer_t::write_float(double value, int width) {
    if (std::isnan(value)) {
        write_scalar(".nan");
    } else if (std::isinf(value)) {
        write_scalar(value > 0 ? ".inf" : "-.inf");
    } else {
        write_scalar(format_float(value, width));
    }
}

void yaml_writer_t::write_real(long double value) {
    if (std::isnan(value)) {
        write_scalar(".nan");
    } else if (std::isinf(value)) {
        write_scalar(value > 0 ? ".inf" : "-.inf");
    } else {
        write_scalar(format_real(value));
    }
}

void yaml_writer_t::write_char(char32_t value) {
    auto text = std::string();
    append_utf8(text, value);

    if (value == U'\'' || !is_printable(text) || value == U'\n') {
        write_scalar(double_quoted(text));
    } else {
        write_scalar("'" + text + "'");
    }
}

void yaml_writer_t::write_string(std::string_view value) {
    auto is_key = slot_ == slot_t::key || slot_ == slot_t::flow_key;
    auto multiline = value.find('\n') != std::string_view::npos;

    if (value.empty()) {
        write_scalar("\"\"");
    } else if (!is_printable(value) || (multiline && (is_key || in_flow()))) {
        write_scalar(double_quoted(value));
    } else if (multiline) {
        if (value.front() == ' ' || value.front() == '\n') {
            write_scalar(double_quoted(value));
        } else {
            write_block_scalar(value);
        }
    } else if (needs_quotes(value, in_flow())) {
        write_scalar(double_quoted(value));
    } else {
        write_scalar(value);
    }
}

// Literal block scalar; the chomping indicator restores the trailing newlines
void yaml_writer_t::write_block_scalar(std::string_view value) {
    auto content = value;
    auto trailing = std::size_t(0);

    while (!content.empty() && content.back() == '\n') {
        content.remove_suffix(1);
        ++trailing;
    }
    write_scalar(trailing == 0 ? "|-" : trailing == 1 ? "|" : "|+");

    while (true) {
        auto eol = content.find('\n');
        auto line = content.substr(0, eol);
        put("\n");
        if (!line.empty()) {
            indent(level_ + 1);
            put(line);
        }
        if (eol == std::string_view::npos) {
            break;
        }
        content.remove_prefix(eol + 1);
    }
    put("\n");

    for (std::size_t i = 1; i < trailing; ++i) {
        put("\n");
    }
}

void yaml_writer_t::write_raw(std::string_view value) {
    write_scalar(value);
}

void yaml_writer_t::write_enum(std::string_view name, std::uint64_t) {
    write_string(name);
}

void yaml_writer_t::write_null() {
    write_scalar("null");
}

auto yaml_writer_t::start_optional() -> std::unique_ptr<optional_t> {
    return std::make_unique<yaml_optional_writer_t>(*this);
}

auto yaml_writer_t::start_seq(std::optional<std::size_t>) -> std::unique_ptr<seq_t> {
    if (slot_ == slot_t::key || slot_ == slot_t::flow_key) {
        throw type_error_t("YAML mapping keys must be scalars");
    }
    if (in_flow()) {
        return std::make_unique<yaml_flow_writer_t>(*this, '[', ']');
    }
    return std::make_unique<yaml_block_writer_t>(*this, "[]");
}

auto yaml_writer_t::start_tuple(std::size_t) -> std::unique_ptr<seq_t> {
    if (slot_ == slot_t::key || slot_ == slot_t::flow_key) {
        throw type_error_t("YAML mapping keys must be scalars");
    }
    return std::make_unique<yaml_flow_writer_t>(*this, '[', ']');
}

auto yaml_writer_t::start_map(std::optional<std::size_t>) -> std::unique_ptr<map_t> {
    if (slot_ == slot_t::key || slot_ == slot_t::flow_key) {
        throw type_error_t("YAML mapping keys must be scalars");
    }
    if (in_flow()) {
        return std::make_unique<yaml_flow_writer_t>(*this, '{', '}');
    }
    return std::make_unique<yaml_block_writer_t>(*this, "{}");
}

auto yaml_writer_t::start_struct(std::string_view) -> std::unique_ptr<struct_t> {
    if (slot_ == slot_t::key || slot_ == slot_t::flow_key) {
        throw type_error_t("YAML mapping keys must be scalars");
    }
    if (in_flow()) {
        return std::make_unique<yaml_flow_writer_t>(*this, '{', '}');
    }
    return std::make_unique<yaml_block_writer_t>(*this, "{}");
}

} // namespace serde
