#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include "serde/contract.hpp"
#include "serde/protocol.hpp"
#include "serde/read_buffer.hpp"

namespace serde {

// =============================================================================
// json_options_t
// =============================================================================

struct json_options_t {
    std::string indent;     // empty for compact output
    bool strict = false;    // reject trailing commas and non-finite numbers

    auto fields() const {
        return std::make_tuple(
            field("indent", indent).optional(),
            field("strict", strict).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("indent", indent).optional(),
            field("strict", strict).optional()
        );
    }
};

// =============================================================================
// json_writer_t - serializer producing JSON text
// =============================================================================
//
// Every piece of output is passed to the sink as soon as it is produced.
// With a non-empty indent, each element and field starts on its own line.

class json_writer_t : public serializer_t {
public:
    using sink_fn = std::function<void(std::string_view)>;

    explicit json_writer_t(sink_fn sink, json_options_t options = {});

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

    auto name() const -> std::string override { return "json writer"; }

    // Used by the container cursors
    void put(std::string_view text);
    void newline();
    void open(char bracket);
    void close(char bracket, bool empty);
    auto options() const -> const json_options_t& { return options_; }

private:
    sink_fn sink_;
    json_options_t options_;
    int level_ = 0;
};

// =============================================================================
// json_reader_t - recursive descent deserializer over a read_buffer_t
// =============================================================================

class json_reader_t : public deserializer_t {
public:
    explicit json_reader_t(std::string_view text, json_options_t options = {});
    explicit json_reader_t(std::istream& stream, json_options_t options = {});
    explicit json_reader_t(read_buffer_t::source_fn source, json_options_t options = {});

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

    auto name() const -> std::string override { return "json reader"; }

    // Require that only whitespace remains
    void finish();

    // Used by the container cursors
    auto buffer() -> read_buffer_t& { return buffer_; }
    auto options() const -> const json_options_t& { return options_; }

private:
    auto read_literal(std::string_view word) -> bool;
    auto read_number_token() -> std::string;
    auto read_non_finite() -> std::optional<double>;
    auto read_magnitude(const char* expected) -> std::uint64_t;
    [[noreturn]] void fail_type(const std::string& message) const;

    read_buffer_t buffer_;
    json_options_t options_;
};

// =============================================================================
// Top-level helpers
// =============================================================================

template <typename T>
void to_json(const T& value, json_writer_t::sink_fn sink, json_options_t options = {}) {
    auto writer = json_writer_t(std::move(sink), std::move(options));
    serialize(writer, value);
}

template <typename T>
auto to_json(const T& value, json_options_t options = {}) -> std::string {
    auto out = std::string();
    to_json(value, [&out](std::string_view text) { out += text; }, std::move(options));
    return out;
}

template <typename T>
auto to_pretty_json(const T& value, std::string indent = "  ") -> std::string {
    auto options = json_options_t();
    options.indent = std::move(indent);
    return to_json(value, std::move(options));
}

template <typename T>
void from_json(T& value, std::string_view text, json_options_t options = {}) {
    auto reader = json_reader_t(text, std::move(options));
    deserialize(reader, value);
    reader.finish();
}

template <typename T>
void from_json(T& value, std::istream& stream, json_options_t options = {}) {
    auto reader = json_reader_t(stream, std::move(options));
    deserialize(reader, value);
    reader.finish();
}

template <typename T>
void from_json_strict(T& value, std::string_view text) {
    auto options = json_options_t();
    options.strict = true;
    from_json(value, text, std::move(options));
}

template <typename T>
auto parse_json(std::string_view text, json_options_t options = {}) -> T {
    auto value = T();
    from_json(value, text, std::move(options));
    return value;
}

template <typename T>
auto parse_json_strict(std::string_view text) -> T {
    auto value = T();
    from_json_strict(value, text);
    return value;
}

} // namespace serde
