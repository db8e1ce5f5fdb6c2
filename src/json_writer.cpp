// json_writer.cpp - implementation of json_writer_t

#include "serde/json.hpp"
#include "serde/escape.hpp"
#include <cmath>

namespace serde {

namespace {

// =============================================================================
// Container cursors
// =============================================================================

class json_optional_writer_t : public serializer_t::optional_t {
public:
    explicit json_optional_writer_t(json_writer_t& writer) : writer_(writer) {}

    auto write_some() -> serializer_t& override { return writer_; }
    void write_none() override { writer_.write_null(); }
    void end() override {}

private:
    json_writer_t& writer_;
};

class json_seq_writer_t : public serializer_t::seq_t {
public:
    explicit json_seq_writer_t(json_writer_t& writer) : writer_(writer) {
        writer_.open('[');
    }

    auto write_element() -> serializer_t& override {
        if (!first_) {
            writer_.put(",");
        }
        first_ = false;
        writer_.newline();
        return writer_;
    }

    void end() override {
        writer_.close(']', first_);
    }

private:
    json_writer_t& writer_;
    bool first_ = true;
};

// Object keys must be strings, so scalar keys are written quoted
class json_key_writer_t : public serializer_t {
public:
    explicit json_key_writer_t(json_writer_t& writer) : writer_(writer) {}

    void write_bool(bool value) override { writer_.write_string(value ? "true" : "false"); }
    void write_signed(std::int64_t value, int) override { writer_.write_string(std::to_string(value)); }
    void write_unsigned(std::uint64_t value, int) override { writer_.write_string(std::to_string(value)); }
    void write_float(double value, int width) override { writer_.write_string(format_float(value, width)); }
    void write_real(long double value) override { writer_.write_string(format_real(value)); }
    void write_char(char32_t value) override { writer_.write_char(value); }
    void write_string(std::string_view value) override { writer_.write_string(value); }
    void write_enum(std::string_view name, std::uint64_t) override { writer_.write_string(name); }

    auto name() const -> std::string override { return "json object key writer"; }

private:
    json_writer_t& writer_;
};

class json_map_writer_t : public serializer_t::map_t, public serializer_t::struct_t {
public:
    explicit json_map_writer_t(json_writer_t& writer) : writer_(writer), key_writer_(writer) {
        writer_.open('{');
    }

    auto write_key() -> serializer_t& override {
        separate();
        return key_writer_;
    }

    auto write_value() -> serializer_t& override {
        writer_.put(writer_.options().indent.empty() ? ":" : ": ");
        return writer_;
    }

    auto write_field(std::string_view name) -> serializer_t& override {
        separate();
        writer_.write_string(name);
        return write_value();
    }

    void end() override {
        writer_.close('}', first_);
    }

private:
    void separate() {
        if (!first_) {
            writer_.put(",");
        }
        first_ = false;
        writer_.newline();
    }

    json_writer_t& writer_;
    json_key_writer_t key_writer_;
    bool first_ = true;
};

} // namespace

// =============================================================================
// json_writer_t
// =============================================================================

json_writer_t::json_writer_t(sink_fn sink, json_options_t options)
    : sink_(std::move(sink))
    , options_(std::move(options)) {}

void json_writer_t::put(std::string_view text) {
    sink_(text);
}

void json_writer_t::newline() {
    if (!options_.indent.empty()) {
        put("\n");
        for (int i = 0; i < level_; ++i) {
            put(options_.indent);
        }
    }
}

void json_writer_t::open(char bracket) {
    put(std::string_view(&bracket, 1));
    ++level_;
}

void json_writer_t::close(char bracket, bool empty) {
    --level_;
    if (!empty) {
        newline();
    }
    put(std::string_view(&bracket, 1));
}

void json_writer_t::write_bool(bool value) {
    put(value ? "true" : "false");
}

void json_writer_t::write_signed(std::int64_t value, int) {
    put(std::to_string(value));
}

void json_writer_t::write_unsigned(std::uint64_t value, int) {
    put(std::to_string(value));
}

void json_writer_t::write_float(double value, int width) {
    if (std::isnan(value)) {
        put("NaN");
    } else if (std::isinf(value)) {
        put(value > 0 ? "Infinity" : "-Infinity");
    } else {
        put(format_float(value, width));
    }
}

void json_writer_t::write_real(long double value) {
    if (std::isnan(value)) {
        put("NaN");
    } else if (std::isinf(value)) {
        put(value > 0 ? "Infinity" : "-Infinity");
    } else {
        put(format_real(value));
    }
}

void json_writer_t::write_char(char32_t value) {
    auto text = std::string();
    append_utf8(text, value);
    write_string(text);
}

void json_writer_t::write_string(std::string_view value) {
    auto out = std::string("\"");
    backslash_escape(value, out);
    out += '"';
    put(out);
}

void json_writer_t::write_raw(std::string_view value) {
    put(value);
}

void json_writer_t::write_enum(std::string_view name, std::uint64_t) {
    write_string(name);
}

void json_writer_t::write_null() {
    put("null");
}

auto json_writer_t::start_optional() -> std::unique_ptr<optional_t> {
    return std::make_unique<json_optional_writer_t>(*this);
}

auto json_writer_t::start_seq(std::optional<std::size_t>) -> std::unique_ptr<seq_t> {
    return std::make_unique<json_seq_writer_t>(*this);
}

auto json_writer_t::start_tuple(std::size_t) -> std::unique_ptr<seq_t> {
    return std::make_unique<json_seq_writer_t>(*this);
}

auto json_writer_t::start_map(std::optional<std::size_t>) -> std::unique_ptr<map_t> {
    return std::make_unique<json_map_writer_t>(*this);
}

auto json_writer_t::start_struct(std::string_view) -> std::unique_ptr<struct_t> {
    return std::make_unique<json_map_writer_t>(*this);
}

} // namespace serde
