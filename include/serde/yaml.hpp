#pragma once

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include "serde/contract.hpp"
#include "serde/protocol.hpp"
#include "serde/read_buffer.hpp"

namespace serde {

// =============================================================================
// yaml_options_t
// =============================================================================

struct yaml_options_t {
    std::string indent = "  ";
    std::map<std::string, std::string> tag_handles;     // "!!" or a named handle -> prefix

    auto fields() const {
        return std::make_tuple(
            field("indent", indent).optional(),
            field("tag_handles", tag_handles).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("indent", indent).optional(),
            field("tag_handles", tag_handles).optional()
        );
    }
};

// =============================================================================
// yaml_writer_t - serializer producing block-style YAML
// =============================================================================
//
// Sequences are written with "- " and maps with "key: value", nested one
// indent deeper. A map or sequence inside a sequence item starts on the
// item's line. Tuples, and anything nested inside one, use flow style.

class yaml_writer_t : public serializer_t {
public:
    using sink_fn = std::function<void(std::string_view)>;

    // Where the next value lands
    enum class slot_t {
        document,           // top level
        after_key,          // "key:" was written
        after_dash,         // "- " was written
        key,                // a block mapping key
        flow,               // inside a flow collection
        flow_key,           // a flow mapping key
    };

    explicit yaml_writer_t(sink_fn sink, yaml_options_t options = {});

    void write_bool(bool value) override;
    void write_signed(std::int64_t value, int width) override;
    void write_unsigned(std::uint64_t value, int width) override;
    void write_float(double value, int width) override;
    void write_real(long double value) override;
    void write_char(char32_t value) override;
    void write_string(std::string_view value) override;
    void write_raw(std::string_view value) override;
    void write_enum(std::string_view name, std::uint64_t ordinal) override;
    void write_null() override;

    auto start_optional() -> std::unique_ptr<optional_t> override;
    auto start_seq(std::optional<std::size_t> length) -> std::unique_ptr<seq_t> override;
    auto start_tuple(std::size_t length) -> std::unique_ptr<seq_t> override;
    auto start_map(std::optional<std::size_t> length) -> std::unique_ptr<map_t> override;
    auto start_struct(std::string_view name) -> std::unique_ptr<struct_t> override;

    auto name() const -> std::string override { return "yaml writer"; }

    // Used by the container cursors
    void put(std::string_view text);
    void indent(int level);
    void line_break();
    auto slot() const -> slot_t { return slot_; }
    void set_slot(slot_t slot) { slot_ = slot; }
    auto level() const -> int { return level_; }
    void set_level(int level) { level_ = level; }

private:
    void write_scalar(std::string_view text);
    void write_block_scalar(std::string_view value);
    auto in_flow() const -> bool { return slot_ == slot_t::flow || slot_ == slot_t::flow_key; }

    sink_fn sink_;
    yaml_options_t options_;
    slot_t slot_ = slot_t::document;
    int level_ = -1;
    char last_ = '\n';
};

// =============================================================================
// yaml_reader_t - deserializer over the YAML subset
// =============================================================================
//
// Tracks the grammar context, which decides the characters allowed in plain
// scalars, and the indentation of the innermost block collection. A node
// that starts on a later line belongs to the current block collection only
// if it is indented deeper than that collection.

class yaml_reader_t : public deserializer_t {
public:
    enum class context_t {
        block_in,
        block_out,
        block_key,
        flow_in,
        flow_out,
        flow_key,
    };

    // What the reader has just consumed before the next node
    enum class pending_t {
        none,
        map_value,          // a block mapping ':'
        seq_item,           // a block sequence '-'
    };

    explicit yaml_reader_t(std::string_view text, yaml_options_t options = {});
    explicit yaml_reader_t(std::istream& stream, yaml_options_t options = {});
    explicit yaml_reader_t(read_buffer_t::source_fn source, yaml_options_t options = {});

    auto read_bool() -> bool override;
    auto read_signed(int width) -> std::int64_t override;
    auto read_unsigned(int width) -> std::uint64_t override;
    auto read_float(int width) -> double override;
    auto read_real() -> long double override;
    auto read_char() -> char32_t override;
    auto read_string() -> std::string override;
    auto read_enum() -> any_value_t override;
    void read_ignore() override;
    auto read_any() -> any_value_t override;
    auto read_optional() -> bool override;

    auto read_seq() -> std::unique_ptr<seq_access_t> override;
    auto read_tuple(std::size_t length) -> std::unique_ptr<seq_access_t> override;
    auto read_map() -> std::unique_ptr<map_access_t> override;
    auto read_struct(std::string_view name) -> std::unique_ptr<map_access_t> override;

    auto name() const -> std::string override { return "yaml reader"; }

    // Parse an optional node tag at the front of the input; empty when none
    auto read_tag() -> std::string;

    // Require that only whitespace and comments remain
    void finish();

    // Used by the container cursors
    auto buffer() -> read_buffer_t& { return buffer_; }
    auto context() const -> context_t { return context_; }
    void set_context(context_t context) { context_ = context; }
    auto indent() const -> long { return indent_; }
    void set_indent(long indent) { indent_ = indent; }
    void set_pending(pending_t pending) { pending_ = pending; }
    void skip_space();
    auto at_flow_end() -> bool;
    auto read_key_scalar() -> std::string;

private:
    auto begin_node() -> bool;
    void require_node(const char* expected);
    auto skip_null() -> bool;
    auto at_delimiter(std::size_t offset = 0) -> bool;
    auto at_dash() -> bool;
    auto in_flow() const -> bool;
    auto read_scalar() -> std::optional<std::string>;
    auto read_plain() -> std::optional<std::string>;
    auto read_single_quoted() -> std::string;
    auto read_block_scalar() -> std::string;
    auto read_number_token(const char* expected) -> std::string;
    auto read_any_collection() -> std::optional<any_value_t>;
    auto read_block_map(std::string first_key, std::size_t column) -> any_value_t;
    auto resolve_plain(const std::string& text) -> any_value_t;
    auto open_seq() -> std::unique_ptr<seq_access_t>;
    auto open_map() -> std::unique_ptr<map_access_t>;
    void read_directives();
    [[noreturn]] void fail_type(const std::string& message) const;

    read_buffer_t buffer_;
    yaml_options_t options_;
    context_t context_ = context_t::block_in;
    pending_t pending_ = pending_t::none;
    long indent_ = -1;
    bool started_ = false;
};

// =============================================================================
// Top-level helpers
// =============================================================================

template <typename T>
void to_yaml(const T& value, yaml_writer_t::sink_fn sink, yaml_options_t options = {}) {
    auto writer = yaml_writer_t(std::move(sink), std::move(options));
    serialize(writer, value);
}

template <typename T>
auto to_yaml(const T& value, yaml_options_t options = {}) -> std::string {
    auto out = std::string();
    to_yaml(value, [&out](std::string_view text) { out += text; }, std::move(options));
    return out;
}

template <typename T>
void from_yaml(T& value, std::string_view text, yaml_options_t options = {}) {
    auto reader = yaml_reader_t(text, std::move(options));
    deserialize(reader, value);
    reader.finish();
}

template <typename T>
void from_yaml(T& value, std::istream& stream, yaml_options_t options = {}) {
    auto reader = yaml_reader_t(stream, std::move(options));
    deserialize(reader, value);
    reader.finish();
}

template <typename T>
auto parse_yaml(std::string_view text, yaml_options_t options = {}) -> T {
    auto value = T();
    from_yaml(value, text, std::move(options));
    return value;
}

// =============================================================================
// Config field setter by path
// =============================================================================

namespace detail {

template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value);

// Leaf values are parsed as YAML, so any deserializable type can be set
template <typename T>
void set_field(T& target, const std::string& rest, const std::string& value) {
    if (rest.empty()) {
        from_yaml(target, value);
    } else if constexpr (HasFields<T>) {
        set_impl(target, rest, value);
    } else if constexpr (is_optional_v<T>) {
        if (!target) {
            target.emplace();
        }
        set_field(*target, rest, value);
    } else {
        throw error_t("cannot descend into '" + rest + "': not a record");
    }
}

template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value) {
    auto dot = path.find('.');
    auto key = path.substr(0, dot);
    auto rest = dot != std::string::npos ? path.substr(dot + 1) : std::string();
    auto found = false;
    auto fields = obj.fields();
    auto try_set = [&](auto& f) {
        if (!found && !f.is_skipped && f.matches(key)) {
            f.update([&](auto& target) { set_field(target, rest, value); });
            found = true;
        }
    };

    std::apply([&](auto&... f) { (try_set(f), ...); }, fields);

    if (!found) {
        throw error_t("field not found: " + key);
    }
}

} // namespace detail

/**
 * Set a field in a record by dot-separated path.
 *
 * Example:
 *   set(config, "output.indent", "'    '");
 *   set(config, "output.strict", "true");
 */
template <HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    detail::set_impl(obj, path, value);
}

} // namespace serde
