#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include "serde/contract.hpp"

namespace serde {

class any_value_t;

using any_seq_t = std::vector<any_value_t>;

// =============================================================================
// any_map_t - insertion-ordered map keyed by any_value_t
// =============================================================================
//
// Lookup is a linear scan by structural equality. Assigning to an existing
// key overwrites the value in place.

class any_map_t {
public:
    struct entry_t;
    using iterator = std::vector<entry_t>::iterator;
    using const_iterator = std::vector<entry_t>::const_iterator;

    any_map_t() = default;
    any_map_t(std::initializer_list<entry_t> entries);

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }

    auto begin() -> iterator;
    auto end() -> iterator;
    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    auto find(const any_value_t& key) -> any_value_t*;
    auto find(const any_value_t& key) const -> const any_value_t*;
    auto contains(const any_value_t& key) const -> bool;
    auto at(const any_value_t& key) const -> const any_value_t&;
    auto operator[](const any_value_t& key) -> any_value_t&;
    void set(any_value_t key, any_value_t value);

    friend auto operator==(const any_map_t& a, const any_map_t& b) -> bool;

private:
    std::vector<entry_t> entries_;
};

// =============================================================================
// any_value_t - closed dynamic union over the data model
// =============================================================================

class any_value_t {
public:
    using variant_t = std::variant<
        std::monostate,
        bool,
        std::int8_t,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        std::uint8_t,
        std::uint16_t,
        std::uint32_t,
        std::uint64_t,
        float,
        double,
        long double,
        char32_t,
        std::string,
        any_seq_t,
        any_map_t>;

    any_value_t() = default;
    any_value_t(std::nullptr_t) {}
    any_value_t(bool value) : value_(value) {}
    any_value_t(char32_t value) : value_(value) {}
    any_value_t(float value) : value_(value) {}
    any_value_t(double value) : value_(value) {}
    any_value_t(long double value) : value_(value) {}
    any_value_t(const char* value) : value_(std::string(value)) {}
    any_value_t(std::string_view value) : value_(std::string(value)) {}
    any_value_t(std::string value) : value_(std::move(value)) {}
    any_value_t(any_seq_t value) : value_(std::move(value)) {}
    any_value_t(any_map_t value) : value_(std::move(value)) {}

    template <typename T>
        requires std::is_integral_v<T> && (!std::is_same_v<T, bool>) && (!std::is_same_v<T, char32_t>)
    any_value_t(T value) : value_(normalize_integer(value)) {}

    auto is_null() const -> bool { return holds<std::monostate>(); }
    auto is_bool() const -> bool { return holds<bool>(); }
    auto is_integer() const -> bool;
    auto is_floating() const -> bool;
    auto is_number() const -> bool { return is_integer() || is_floating(); }
    auto is_char() const -> bool { return holds<char32_t>(); }
    auto is_string() const -> bool { return holds<std::string>(); }
    auto is_seq() const -> bool { return holds<any_seq_t>(); }
    auto is_map() const -> bool { return holds<any_map_t>(); }

    template <typename T>
    auto holds() const -> bool { return std::holds_alternative<T>(value_); }

    // Exact access; throws type_error_t when the value holds another kind
    template <typename T>
    auto get() const -> const T& {
        if (auto* p = std::get_if<T>(&value_)) {
            return *p;
        }
        throw_kind_mismatch(kind_for<T>());
    }

    // Converting access across numeric widths
    auto as_bool() const -> bool;
    auto as_int64() const -> std::int64_t;
    auto as_uint64() const -> std::uint64_t;
    auto as_double() const -> double;
    auto as_long_double() const -> long double;
    auto as_string() const -> const std::string&;
    auto as_seq() const -> const any_seq_t&;
    auto as_seq() -> any_seq_t&;
    auto as_map() const -> const any_map_t&;
    auto as_map() -> any_map_t&;

    auto kind_name() const -> const char*;
    auto variant() const -> const variant_t& { return value_; }

    friend auto operator==(const any_value_t& a, const any_value_t& b) -> bool;

private:
    template <typename T>
    static auto normalize_integer(T value) -> variant_t {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) return variant_t(std::in_place_type<std::int8_t>, value);
            else if constexpr (sizeof(T) == 2) return variant_t(std::in_place_type<std::int16_t>, value);
            else if constexpr (sizeof(T) == 4) return variant_t(std::in_place_type<std::int32_t>, value);
            else return variant_t(std::in_place_type<std::int64_t>, value);
        } else {
            if constexpr (sizeof(T) == 1) return variant_t(std::in_place_type<std::uint8_t>, value);
            else if constexpr (sizeof(T) == 2) return variant_t(std::in_place_type<std::uint16_t>, value);
            else if constexpr (sizeof(T) == 4) return variant_t(std::in_place_type<std::uint32_t>, value);
            else return variant_t(std::in_place_type<std::uint64_t>, value);
        }
    }

    template <typename T>
    static constexpr auto kind_for() -> const char* {
        if constexpr (std::is_same_v<T, std::monostate>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, char32_t>) return "char";
        else if constexpr (std::is_integral_v<T>) return "integer";
        else if constexpr (std::is_floating_point_v<T>) return "float";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, any_seq_t>) return "sequence";
        else return "map";
    }

    [[noreturn]] void throw_kind_mismatch(const char* expected) const;

    variant_t value_;
};

struct any_map_t::entry_t {
    any_value_t key;
    any_value_t value;
};

inline auto any_map_t::begin() -> iterator { return entries_.begin(); }
inline auto any_map_t::end() -> iterator { return entries_.end(); }
inline auto any_map_t::begin() const -> const_iterator { return entries_.begin(); }
inline auto any_map_t::end() const -> const_iterator { return entries_.end(); }

// =============================================================================
// any_serializer_t - builds an any_value_t from a serializer stream
// =============================================================================

class any_serializer_t : public serializer_t {
public:
    explicit any_serializer_t(any_value_t& target) : target_(target) {}

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

    auto name() const -> std::string override { return "any_serializer"; }

private:
    any_value_t& target_;
};

// =============================================================================
// any_deserializer_t - reads from a captured any_value_t
// =============================================================================

class any_deserializer_t : public deserializer_t {
public:
    explicit any_deserializer_t(any_value_t value) : value_(std::move(value)) {}

    auto read_bool() -> bool override;
    auto read_signed(int width) -> std::int64_t override;
    auto read_unsigned(int width) -> std::uint64_t override;
    auto read_float(int width) -> double override;
    auto read_real() -> long double override;
    auto read_char() -> char32_t override;
    auto read_string() -> std::string override;
    auto read_enum() -> any_value_t override;
    void read_ignore() override {}
    auto read_any() -> any_value_t override { return value_; }
    auto read_optional() -> bool override { return !value_.is_null(); }

    auto read_seq() -> std::unique_ptr<seq_access_t> override;
    auto read_tuple(std::size_t length) -> std::unique_ptr<seq_access_t> override;
    auto read_map() -> std::unique_ptr<map_access_t> override;
    auto read_struct(std::string_view name) -> std::unique_ptr<map_access_t> override;

    auto name() const -> std::string override { return "any_deserializer"; }

private:
    any_value_t value_;
};

} // namespace serde
