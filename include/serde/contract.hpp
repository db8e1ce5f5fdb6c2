#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace serde {

class any_value_t;

// =============================================================================
// serializer_t - push side of the data model
// =============================================================================
//
// A backend overrides the operations it supports; every other operation
// throws error_t("unimplemented <op> in <name>"). Opening a container returns
// a cursor owned by the caller. Each slot-opening call on a cursor hands back
// a serializer that must receive exactly one value before the cursor is used
// again, and every cursor is closed by exactly one call to end().

class serializer_t {
public:
    struct optional_t {
        virtual ~optional_t() = default;
        virtual auto write_some() -> serializer_t& = 0;
        virtual void write_none() = 0;
        virtual void end() = 0;
    };

    struct seq_t {
        virtual ~seq_t() = default;
        virtual auto write_element() -> serializer_t& = 0;
        virtual void end() = 0;
    };

    struct map_t {
        virtual ~map_t() = default;
        virtual auto write_key() -> serializer_t& = 0;
        virtual auto write_value() -> serializer_t& = 0;
        virtual void end() = 0;
    };

    struct struct_t {
        virtual ~struct_t() = default;
        virtual auto write_field(std::string_view name) -> serializer_t& = 0;
        virtual void end() = 0;
    };

    virtual ~serializer_t() = default;

    virtual void write_bool(bool value);
    virtual void write_signed(std::int64_t value, int width);
    virtual void write_unsigned(std::uint64_t value, int width);
    virtual void write_float(double value, int width);
    virtual void write_real(long double value);
    virtual void write_char(char32_t value);
    virtual void write_string(std::string_view value);
    virtual void write_raw(std::string_view value);
    virtual void write_enum(std::string_view name, std::uint64_t ordinal);
    virtual void write_null();

    virtual auto start_optional() -> std::unique_ptr<optional_t>;
    virtual auto start_seq(std::optional<std::size_t> length) -> std::unique_ptr<seq_t>;
    virtual auto start_tuple(std::size_t length) -> std::unique_ptr<seq_t>;
    virtual auto start_map(std::optional<std::size_t> length) -> std::unique_ptr<map_t>;
    virtual auto start_struct(std::string_view name) -> std::unique_ptr<struct_t>;

    // Name used in error messages
    virtual auto name() const -> std::string = 0;

protected:
    [[noreturn]] void unimplemented(const char* operation) const;
};

// =============================================================================
// deserializer_t - pull side of the data model
// =============================================================================
//
// read_element returns nullptr once a sequence is exhausted; the pointer it
// returns otherwise stays valid until the next call. read_key returns false
// once a map is exhausted. read_struct returns nullptr when the value was a
// null, which it has then consumed.

class deserializer_t {
public:
    struct seq_access_t {
        virtual ~seq_access_t() = default;
        virtual auto size_hint() const -> std::optional<std::size_t> { return std::nullopt; }
        virtual auto read_element() -> deserializer_t* = 0;
        virtual void end() = 0;
    };

    struct map_access_t {
        virtual ~map_access_t() = default;
        virtual auto read_key(any_value_t& key) -> bool = 0;
        virtual auto read_value() -> deserializer_t& = 0;
        virtual void ignore_value() = 0;
        virtual void end() = 0;
    };

    virtual ~deserializer_t() = default;

    virtual auto read_bool() -> bool;
    virtual auto read_signed(int width) -> std::int64_t;
    virtual auto read_unsigned(int width) -> std::uint64_t;
    virtual auto read_float(int width) -> double;
    virtual auto read_real() -> long double;
    virtual auto read_char() -> char32_t;
    virtual auto read_string() -> std::string;
    virtual auto read_enum() -> any_value_t;
    virtual void read_ignore();
    virtual auto read_any() -> any_value_t;
    virtual auto read_optional() -> bool;

    virtual auto read_seq() -> std::unique_ptr<seq_access_t>;
    virtual auto read_tuple(std::size_t length) -> std::unique_ptr<seq_access_t>;
    virtual auto read_map() -> std::unique_ptr<map_access_t>;
    virtual auto read_struct(std::string_view name) -> std::unique_ptr<map_access_t>;

    virtual auto name() const -> std::string = 0;

protected:
    [[noreturn]] void unimplemented(const char* operation) const;
};

// =============================================================================
// Width limits shared by the readers
// =============================================================================

auto signed_min(int width) -> std::int64_t;
auto signed_max(int width) -> std::int64_t;
auto unsigned_max(int width) -> std::uint64_t;

} // namespace serde
