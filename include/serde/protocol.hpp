#pragma once

// Generic value <-> data model protocol.
// Provides serialize/deserialize free functions for common types and for
// records that describe themselves with a fields() method.

#include <algorithm>
#include <array>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "serde/any_value.hpp"
#include "serde/contract.hpp"
#include "serde/error.hpp"
#include "serde/log.hpp"

namespace serde {

// ============================================================================
// Marker types
// ============================================================================

// Pre-formatted text copied verbatim into the output
struct raw_t {
    std::string text;
};

// Skips one value of any shape when deserialized
struct ignore_t {};

// ============================================================================
// Field descriptors
// ============================================================================
//
// Returned by serde::field from a record's fields() method. A descriptor
// binds either a member by reference, or a getter and an optional setter.
// Options return a modified copy, so they chain:
//
//   field("user", user).rename("user", "username").alias("login")
//   field("celsius", [this] { return celsius(); }, [this](double c) { set_celsius(c); })

template <typename Derived>
struct field_options_t {
    const char* name;
    const char* read_name = nullptr;
    std::vector<const char*> aliases = {};
    bool is_optional = false;
    bool is_skipped = false;
    bool is_raw = false;

    // Write under one name, read under another
    auto rename(const char* write_as, const char* read_as) const -> Derived {
        auto f = derived();
        f.name = write_as;
        f.read_name = read_as;
        return f;
    }

    // Extra name accepted on read
    auto alias(const char* other) const -> Derived {
        auto f = derived();
        f.aliases.push_back(other);
        return f;
    }

    // May be absent or repeated on read
    auto optional() const -> Derived {
        auto f = derived();
        f.is_optional = true;
        return f;
    }

    // Never written, never matched on read
    auto skip() const -> Derived {
        auto f = derived();
        f.is_skipped = true;
        return f;
    }

    // String written verbatim; its value is ignored on read
    auto raw() const -> Derived {
        auto f = derived();
        f.is_raw = true;
        return f;
    }

    auto input_name() const -> const char* {
        return read_name ? read_name : name;
    }

    auto matches(std::string_view key) const -> bool {
        if (key == input_name()) {
            return true;
        }
        for (auto a : aliases) {
            if (key == a) {
                return true;
            }
        }
        return false;
    }

private:
    auto derived() const -> Derived { return static_cast<const Derived&>(*this); }
};

template <typename T>
struct field_t : field_options_t<field_t<T>> {
    using value_type = std::remove_cv_t<T>;
    static constexpr bool is_writable = true;

    T& value;

    field_t(const char* name, T& member) : field_options_t<field_t<T>>{name}, value(member) {}

    auto get() const -> const T& { return value; }

    // Apply fn to the bound member in place
    template <typename F>
    void update(F&& fn) const { fn(value); }
};

// No setter: the field is written but never read
struct no_setter_t {};

template <typename Get, typename Set>
struct property_t : field_options_t<property_t<Get, Set>> {
    using value_type = std::remove_cvref_t<std::invoke_result_t<const Get&>>;
    static constexpr bool is_writable = !std::is_same_v<Set, no_setter_t>;

    Get getter;
    Set setter;

    property_t(const char* name, Get get, Set set)
        : field_options_t<property_t<Get, Set>>{name}
        , getter(std::move(get))
        , setter(std::move(set)) {}

    auto get() const -> value_type { return getter(); }

    // Apply fn to a copy of the current value, then pass it to the setter
    template <typename F>
    void update(F&& fn) const {
        if constexpr (is_writable) {
            auto v = getter();
            fn(v);
            setter(std::move(v));
        } else {
            throw error_t(std::string("field '") + this->name + "' has no setter");
        }
    }
};

template <typename T>
auto field(const char* name, T& value) -> field_t<T> {
    return field_t<T>(name, value);
}

template <typename Get, typename Set>
    requires std::invocable<const Get&>
auto field(const char* name, Get getter, Set setter) -> property_t<Get, Set> {
    return property_t<Get, Set>(name, std::move(getter), std::move(setter));
}

// Read-only accessor; only a temporary callable selects this overload
template <typename Get>
    requires std::invocable<const Get&> && (!std::is_lvalue_reference_v<Get>)
auto field(const char* name, Get&& getter) -> property_t<std::remove_cvref_t<Get>, no_setter_t> {
    return property_t<std::remove_cvref_t<Get>, no_setter_t>(name, std::forward<Get>(getter), no_setter_t{});
}

// ============================================================================
// Concepts
// ============================================================================

template <typename T>
concept HasFields = requires(T& t) {
    { t.fields() };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { t.fields() };
};

template <typename T>
concept DeniesUnknownFields = requires {
    requires T::deny_unknown_fields;
};

template <typename T>
concept HasTypeName = requires {
    { T::type_name } -> std::convertible_to<const char*>;
};

template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<std::string_view>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

// Declaration order of the enumerators, used for ordinals
template <typename E>
concept HasEnumValues = std::is_enum_v<E> && requires {
    { enum_values(std::type_identity<E>{}) } -> std::ranges::random_access_range;
};

template <typename E>
concept Enumeration = HasEnumStrings<E> && HasEnumValues<E>;

template <typename T>
concept Boolean = std::same_as<T, bool>;

template <typename T>
concept Character = std::same_as<T, char32_t>;

template <typename T>
concept Integer = std::integral<T> && !Boolean<T> && !Character<T>;

template <typename T>
concept Floating = std::floating_point<T>;

// Polymorphic base dispatched through the typetag registry (typetag.hpp)
template <typename B>
concept TypetagBase = std::is_polymorphic_v<B> && requires(const B& b) {
    B::typetag_format();
    { b.typetag_name() } -> std::convertible_to<std::string_view>;
};

// Name used for records in error messages and struct headers
template <typename T>
auto type_name() -> std::string {
    if constexpr (HasTypeName<T>) {
        return T::type_name;
    } else {
        return typeid(T).name();
    }
}

// ============================================================================
// Serialize declarations
// ============================================================================

template <typename T>
    requires Boolean<T>
void serialize(serializer_t& ser, const T& value);

template <typename T>
    requires Integer<T>
void serialize(serializer_t& ser, const T& value);

template <typename T>
    requires Floating<T>
void serialize(serializer_t& ser, const T& value);

template <typename T>
    requires Character<T>
void serialize(serializer_t& ser, const T& value);

inline void serialize(serializer_t& ser, const std::string& value);
inline void serialize(serializer_t& ser, std::string_view value);
inline void serialize(serializer_t& ser, const char* value);
inline void serialize(serializer_t& ser, const raw_t& value);
inline void serialize(serializer_t& ser, const any_value_t& value);

template <typename E>
    requires Enumeration<E>
void serialize(serializer_t& ser, const E& value);

template <typename T>
void serialize(serializer_t& ser, const std::optional<T>& value);

template <typename T>
void serialize(serializer_t& ser, const std::vector<T>& value);

template <typename T>
void serialize(serializer_t& ser, const std::list<T>& value);

template <typename T, std::size_t N>
void serialize(serializer_t& ser, const std::array<T, N>& value);

template <typename T1, typename T2>
void serialize(serializer_t& ser, const std::pair<T1, T2>& value);

template <typename... Ts>
void serialize(serializer_t& ser, const std::tuple<Ts...>& value);

template <typename K, typename V, typename C, typename A>
void serialize(serializer_t& ser, const std::map<K, V, C, A>& value);

template <typename K, typename V, typename H, typename E, typename A>
void serialize(serializer_t& ser, const std::unordered_map<K, V, H, E, A>& value);

template <typename T>
    requires HasConstFields<T>
void serialize(serializer_t& ser, const T& value);

template <typename B>
    requires TypetagBase<B>
void serialize(serializer_t& ser, const std::unique_ptr<B>& value);

template <typename B>
    requires TypetagBase<B>
void serialize(serializer_t& ser, const std::shared_ptr<B>& value);

// ============================================================================
// Deserialize declarations
// ============================================================================

template <typename T>
    requires Boolean<T>
void deserialize(deserializer_t& de, T& value);

template <typename T>
    requires Integer<T>
void deserialize(deserializer_t& de, T& value);

template <typename T>
    requires Floating<T>
void deserialize(deserializer_t& de, T& value);

template <typename T>
    requires Character<T>
void deserialize(deserializer_t& de, T& value);

inline void deserialize(deserializer_t& de, std::string& value);
inline void deserialize(deserializer_t& de, any_value_t& value);
inline void deserialize(deserializer_t& de, ignore_t& value);

template <typename E>
    requires Enumeration<E>
void deserialize(deserializer_t& de, E& value);

template <typename T>
void deserialize(deserializer_t& de, std::optional<T>& value);

template <typename T>
void deserialize(deserializer_t& de, std::vector<T>& value);

template <typename T>
void deserialize(deserializer_t& de, std::list<T>& value);

template <typename T, std::size_t N>
void deserialize(deserializer_t& de, std::array<T, N>& value);

template <typename T1, typename T2>
void deserialize(deserializer_t& de, std::pair<T1, T2>& value);

template <typename... Ts>
void deserialize(deserializer_t& de, std::tuple<Ts...>& value);

template <typename K, typename V, typename C, typename A>
void deserialize(deserializer_t& de, std::map<K, V, C, A>& value);

template <typename K, typename V, typename H, typename E, typename A>
void deserialize(deserializer_t& de, std::unordered_map<K, V, H, E, A>& value);

template <typename T>
    requires HasFields<T>
void deserialize(deserializer_t& de, T& value);

template <typename B>
    requires TypetagBase<B>
void deserialize(deserializer_t& de, std::unique_ptr<B>& value);

template <typename B>
    requires TypetagBase<B>
void deserialize(deserializer_t& de, std::shared_ptr<B>& value);

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<std::remove_cvref_t<T>>::value;

template <typename Field>
void write_field(serializer_t::struct_t& s, const Field& f) {
    if (f.is_skipped) {
        return;
    }
    if (f.is_raw) {
        if constexpr (std::is_convertible_v<typename Field::value_type, std::string_view>) {
            s.write_field(f.name).write_raw(f.get());
        } else {
            throw error_t(std::string("raw field '") + f.name + "' must be a string");
        }
    } else {
        serialize(s.write_field(f.name), f.get());
    }
}

// Deserialize into the member, or into a temporary handed to the setter
template <typename Field>
void read_field(deserializer_t& de, const Field& f) {
    f.update([&de](auto& target) { deserialize(de, target); });
}

template <typename Container>
void write_seq(serializer_t& ser, const Container& items) {
    auto seq = ser.start_seq(items.size());
    for (const auto& item : items) {
        serialize(seq->write_element(), item);
    }
    seq->end();
}

template <typename Container>
void read_seq(deserializer_t& de, Container& items) {
    using value_type = typename Container::value_type;
    auto seq = de.read_seq();
    items.clear();
    while (auto* element = seq->read_element()) {
        auto item = value_type();
        deserialize(*element, item);
        items.push_back(std::move(item));
    }
    seq->end();
}

template <typename Map>
void write_map(serializer_t& ser, const Map& map) {
    auto m = ser.start_map(map.size());
    for (const auto& [key, val] : map) {
        serialize(m->write_key(), key);
        serialize(m->write_value(), val);
    }
    m->end();
}

auto parse_bool_key(const std::string& text) -> bool;
auto parse_float_key(const std::string& text) -> long double;

// Map keys arrive as strings from text formats; numeric and boolean keys are
// parsed back from that text
template <typename K>
auto key_from_any(const any_value_t& key) -> K {
    auto result = K();
    if (key.is_string()) {
        const auto& text = key.as_string();
        if constexpr (Integer<K>) {
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
            if (ec != std::errc() || end != text.data() + text.size()) {
                throw type_error_t("expected integer map key, found '" + text + "'");
            }
            return result;
        } else if constexpr (Boolean<K>) {
            return parse_bool_key(text);
        } else if constexpr (Floating<K>) {
            return static_cast<K>(parse_float_key(text));
        }
    }
    auto de = any_deserializer_t(key);
    deserialize(de, result);
    return result;
}

template <typename Map>
void read_map(deserializer_t& de, Map& map) {
    using key_type = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;
    auto access = de.read_map();
    auto key = any_value_t();
    map.clear();
    while (access->read_key(key)) {
        auto k = key_from_any<key_type>(key);
        auto v = mapped_type();
        deserialize(access->read_value(), v);
        map.insert_or_assign(std::move(k), std::move(v));
    }
    access->end();
}

inline auto next_element(deserializer_t::seq_access_t& access, std::size_t index, std::size_t length) -> deserializer_t& {
    auto* element = access.read_element();
    if (!element) {
        throw type_error_t("expected " + std::to_string(length) + " elements, found " + std::to_string(index));
    }
    return *element;
}

inline auto key_text(const any_value_t& key) -> std::string {
    if (key.is_string()) {
        return key.as_string();
    }
    if (key.is_integer()) {
        return std::to_string(key.as_int64());
    }
    return std::string("<") + key.kind_name() + ">";
}

template <typename Tuple, typename F, std::size_t... I>
void visit_field_impl(Tuple& fields, std::size_t index, F& f, std::index_sequence<I...>) {
    ((I == index ? (void)f(std::get<I>(fields)) : void()), ...);
}

// Invoke f on the field at a runtime index
template <typename Tuple, typename F>
void visit_field(Tuple& fields, std::size_t index, F&& f) {
    visit_field_impl(fields, index, f, std::make_index_sequence<std::tuple_size_v<std::remove_cvref_t<Tuple>>>{});
}

// Index of the field a key refers to: by name, alias or position
template <typename Tuple>
auto match_field(Tuple& fields, const any_value_t& key) -> std::optional<std::size_t> {
    auto result = std::optional<std::size_t>();

    if (key.is_string()) {
        const auto& name = key.as_string();
        auto i = std::size_t(0);
        auto check = [&](const auto& f) {
            if (!result && !f.is_skipped && f.matches(name)) {
                result = i;
            }
            ++i;
        };
        std::apply([&](const auto&... f) { (check(f), ...); }, fields);
    } else if (key.is_integer()) {
        auto index = key.as_int64();
        if (index >= 0 && static_cast<std::size_t>(index) < std::tuple_size_v<std::remove_cvref_t<Tuple>>) {
            auto skipped = false;
            visit_field(fields, static_cast<std::size_t>(index), [&](const auto& f) { skipped = f.is_skipped; });
            if (!skipped) {
                result = static_cast<std::size_t>(index);
            }
        }
    }
    return result;
}

} // namespace detail

// ============================================================================
// Record walkers
// ============================================================================

// Write every non-skipped field of value into an open struct
template <typename T>
    requires HasConstFields<T>
void serialize_fields(serializer_t::struct_t& s, const T& value) {
    std::apply([&s](const auto&... f) {
        (detail::write_field(s, f), ...);
    }, value.fields());
}

// Read fields of value from an open map until it is exhausted
template <typename T>
    requires HasFields<T>
void deserialize_fields(deserializer_t::map_access_t& access, T& value) {
    auto fields = value.fields();
    constexpr auto count = std::tuple_size_v<decltype(fields)>;
    auto seen = std::array<bool, count>{};
    auto key = any_value_t();

    while (access.read_key(key)) {
        auto index = detail::match_field(fields, key);

        if (!index) {
            if constexpr (DeniesUnknownFields<T>) {
                throw unknown_field_error_t(type_name<T>(), detail::key_text(key));
            }
            log("skipping unknown field '" + detail::key_text(key) + "' of " + type_name<T>());
            access.ignore_value();
            continue;
        }
        detail::visit_field(fields, *index, [&](auto& f) {
            if (seen[*index] && !f.is_optional) {
                throw duplicate_field_error_t(type_name<T>(), f.input_name());
            }
            if (f.is_raw || !f.is_writable) {
                access.ignore_value();
            } else {
                detail::read_field(access.read_value(), f);
            }
            seen[*index] = true;
        });
    }

    auto i = std::size_t(0);
    auto check = [&](const auto& f) {
        using field_type = std::remove_cvref_t<decltype(f)>;
        auto required = !f.is_optional && !f.is_skipped && !f.is_raw && field_type::is_writable
            && !detail::is_optional_v<typename field_type::value_type>;
        if (required && !seen[i]) {
            throw missing_field_error_t(type_name<T>(), f.input_name());
        }
        ++i;
    };
    std::apply([&](const auto&... f) { (check(f), ...); }, fields);
}

// ============================================================================
// Serialize implementations
// ============================================================================

template <typename T>
    requires Boolean<T>
void serialize(serializer_t& ser, const T& value) {
    ser.write_bool(value);
}

template <typename T>
    requires Integer<T>
void serialize(serializer_t& ser, const T& value) {
    if constexpr (std::is_signed_v<T>) {
        ser.write_signed(value, sizeof(T));
    } else {
        ser.write_unsigned(value, sizeof(T));
    }
}

template <typename T>
    requires Floating<T>
void serialize(serializer_t& ser, const T& value) {
    if constexpr (std::is_same_v<T, long double>) {
        ser.write_real(value);
    } else {
        ser.write_float(value, sizeof(T));
    }
}

template <typename T>
    requires Character<T>
void serialize(serializer_t& ser, const T& value) {
    ser.write_char(value);
}

inline void serialize(serializer_t& ser, const std::string& value) {
    ser.write_string(value);
}

inline void serialize(serializer_t& ser, std::string_view value) {
    ser.write_string(value);
}

inline void serialize(serializer_t& ser, const char* value) {
    ser.write_string(value);
}

inline void serialize(serializer_t& ser, const raw_t& value) {
    ser.write_raw(value.text);
}

inline void serialize(serializer_t& ser, const any_value_t& value) {
    std::visit([&ser](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            ser.write_null();
        } else if constexpr (std::is_same_v<T, any_seq_t>) {
            detail::write_seq(ser, x);
        } else if constexpr (std::is_same_v<T, any_map_t>) {
            auto m = ser.start_map(x.size());
            for (const auto& entry : x) {
                serialize(m->write_key(), entry.key);
                serialize(m->write_value(), entry.value);
            }
            m->end();
        } else {
            serialize(ser, x);
        }
    }, value.variant());
}

// The ordinal is the position of value in enum_values
template <typename E>
    requires Enumeration<E>
void serialize(serializer_t& ser, const E& value) {
    const auto& values = enum_values(std::type_identity<E>{});
    auto it = std::ranges::find(values, value);

    if (it == std::ranges::end(values)) {
        throw type_error_t("value " + std::to_string(static_cast<std::int64_t>(value)) + " is not listed for enum " + type_name<E>());
    }
    auto ordinal = static_cast<std::uint64_t>(std::ranges::distance(std::ranges::begin(values), it));
    ser.write_enum(to_string(value), ordinal);
}

template <typename T>
void serialize(serializer_t& ser, const std::optional<T>& value) {
    auto opt = ser.start_optional();
    if (value) {
        serialize(opt->write_some(), *value);
    } else {
        opt->write_none();
    }
    opt->end();
}

template <typename T>
void serialize(serializer_t& ser, const std::vector<T>& value) {
    detail::write_seq(ser, value);
}

template <typename T>
void serialize(serializer_t& ser, const std::list<T>& value) {
    detail::write_seq(ser, value);
}

template <typename T, std::size_t N>
void serialize(serializer_t& ser, const std::array<T, N>& value) {
    auto tuple = ser.start_tuple(N);
    for (const auto& item : value) {
        serialize(tuple->write_element(), item);
    }
    tuple->end();
}

template <typename T1, typename T2>
void serialize(serializer_t& ser, const std::pair<T1, T2>& value) {
    auto tuple = ser.start_tuple(2);
    serialize(tuple->write_element(), value.first);
    serialize(tuple->write_element(), value.second);
    tuple->end();
}

template <typename... Ts>
void serialize(serializer_t& ser, const std::tuple<Ts...>& value) {
    auto tuple = ser.start_tuple(sizeof...(Ts));
    std::apply([&tuple](const auto&... items) {
        (serialize(tuple->write_element(), items), ...);
    }, value);
    tuple->end();
}

template <typename K, typename V, typename C, typename A>
void serialize(serializer_t& ser, const std::map<K, V, C, A>& value) {
    detail::write_map(ser, value);
}

template <typename K, typename V, typename H, typename E, typename A>
void serialize(serializer_t& ser, const std::unordered_map<K, V, H, E, A>& value) {
    detail::write_map(ser, value);
}

template <typename T>
    requires HasConstFields<T>
void serialize(serializer_t& ser, const T& value) {
    auto s = ser.start_struct(type_name<T>());
    serialize_fields(*s, value);
    s->end();
}

// ============================================================================
// Deserialize implementations
// ============================================================================

template <typename T>
    requires Boolean<T>
void deserialize(deserializer_t& de, T& value) {
    value = de.read_bool();
}

template <typename T>
    requires Integer<T>
void deserialize(deserializer_t& de, T& value) {
    if constexpr (std::is_signed_v<T>) {
        value = static_cast<T>(de.read_signed(sizeof(T)));
    } else {
        value = static_cast<T>(de.read_unsigned(sizeof(T)));
    }
}

template <typename T>
    requires Floating<T>
void deserialize(deserializer_t& de, T& value) {
    if constexpr (std::is_same_v<T, long double>) {
        value = de.read_real();
    } else {
        value = static_cast<T>(de.read_float(sizeof(T)));
    }
}

template <typename T>
    requires Character<T>
void deserialize(deserializer_t& de, T& value) {
    value = de.read_char();
}

inline void deserialize(deserializer_t& de, std::string& value) {
    value = de.read_string();
}

inline void deserialize(deserializer_t& de, any_value_t& value) {
    value = de.read_any();
}

inline void deserialize(deserializer_t& de, ignore_t&) {
    de.read_ignore();
}

// Enums accept a name, or an ordinal position in enum_values
template <typename E>
    requires Enumeration<E>
void deserialize(deserializer_t& de, E& value) {
    auto raw = de.read_enum();

    if (raw.is_string()) {
        value = from_string(std::type_identity<E>{}, raw.as_string());
        return;
    }
    const auto& values = enum_values(std::type_identity<E>{});
    auto ordinal = raw.as_int64();
    auto count = static_cast<std::int64_t>(std::ranges::size(values));

    if (ordinal < 0 || ordinal >= count) {
        throw type_error_t("invalid ordinal " + std::to_string(ordinal) + " for enum " + type_name<E>());
    }
    value = std::ranges::begin(values)[ordinal];
}

template <typename T>
void deserialize(deserializer_t& de, std::optional<T>& value) {
    if (de.read_optional()) {
        auto temp = T();
        deserialize(de, temp);
        value = std::move(temp);
    } else {
        value.reset();
    }
}

template <typename T>
void deserialize(deserializer_t& de, std::vector<T>& value) {
    detail::read_seq(de, value);
}

template <typename T>
void deserialize(deserializer_t& de, std::list<T>& value) {
    detail::read_seq(de, value);
}

template <typename T, std::size_t N>
void deserialize(deserializer_t& de, std::array<T, N>& value) {
    auto tuple = de.read_tuple(N);
    for (std::size_t i = 0; i < N; ++i) {
        deserialize(detail::next_element(*tuple, i, N), value[i]);
    }
    tuple->end();
}

template <typename T1, typename T2>
void deserialize(deserializer_t& de, std::pair<T1, T2>& value) {
    auto tuple = de.read_tuple(2);
    deserialize(detail::next_element(*tuple, 0, 2), value.first);
    deserialize(detail::next_element(*tuple, 1, 2), value.second);
    tuple->end();
}

template <typename... Ts>
void deserialize(deserializer_t& de, std::tuple<Ts...>& value) {
    auto tuple = de.read_tuple(sizeof...(Ts));
    auto i = std::size_t(0);
    std::apply([&](auto&... items) {
        ((deserialize(detail::next_element(*tuple, i, sizeof...(Ts)), items), ++i), ...);
    }, value);
    tuple->end();
}

template <typename K, typename V, typename C, typename A>
void deserialize(deserializer_t& de, std::map<K, V, C, A>& value) {
    detail::read_map(de, value);
}

template <typename K, typename V, typename H, typename E, typename A>
void deserialize(deserializer_t& de, std::unordered_map<K, V, H, E, A>& value) {
    detail::read_map(de, value);
}

template <typename T>
    requires HasFields<T>
void deserialize(deserializer_t& de, T& value) {
    auto access = de.read_struct(type_name<T>());
    if (!access) {
        return;
    }
    deserialize_fields(*access, value);
    access->end();
}

// ============================================================================
// any_value_t conversion
// ============================================================================

template <typename T>
auto to_any(const T& value) -> any_value_t {
    auto result = any_value_t();
    auto ser = any_serializer_t(result);
    serialize(ser, value);
    return result;
}

template <typename T>
void from_any(const any_value_t& any, T& value) {
    auto de = any_deserializer_t(any);
    deserialize(de, value);
}

} // namespace serde
