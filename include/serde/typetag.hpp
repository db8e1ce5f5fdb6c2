#pragma once

// Polymorphic values behind a base type, tagged with the name of their
// concrete variant. The variant is recovered on read through a registry of
// decode functions keyed by tag.

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "serde/any_value.hpp"
#include "serde/contract.hpp"
#include "serde/error.hpp"
#include "serde/log.hpp"
#include "serde/protocol.hpp"

namespace serde {
namespace typetag {

// ============================================================================
// Wire placement of the tag
// ============================================================================
//
//   internal  {"type": "circle", "radius": 1}
//   external  {"circle": {"radius": 1}}
//   adjacent  {"type": "circle", "value": {"radius": 1}}
//   tuple     ["circle", {"radius": 1}]

enum class placement_t {
    internal,
    external,
    adjacent,
    tuple,
};

struct format_t {
    placement_t placement = placement_t::external;
    const char* tag_key = "type";
    const char* value_key = "value";
};

constexpr auto internal(const char* tag_key = "type") -> format_t {
    return {placement_t::internal, tag_key, nullptr};
}

constexpr auto external() -> format_t {
    return {placement_t::external, nullptr, nullptr};
}

constexpr auto adjacent(const char* tag_key = "type", const char* value_key = "value") -> format_t {
    return {placement_t::adjacent, tag_key, value_key};
}

constexpr auto tuple() -> format_t {
    return {placement_t::tuple, nullptr, nullptr};
}

// ============================================================================
// base_t - interface of a tagged base type
// ============================================================================
//
// A base type derives from base_t and declares its placement:
//
//   struct shape_t : serde::typetag::base_t {
//       static auto typetag_format() { return serde::typetag::internal("kind"); }
//       virtual auto area() const -> double = 0;
//   };

class base_t {
public:
    virtual ~base_t() = default;
    virtual auto typetag_name() const -> std::string_view = 0;
    virtual void typetag_serialize(serializer_t::struct_t& s) const = 0;
};

// ============================================================================
// variant_t - implements base_t for a record with fields()
// ============================================================================
//
//   struct circle_t : serde::typetag::variant_t<circle_t, shape_t> {
//       static constexpr const char* typetag = "circle";
//       double radius = 0.0;
//       auto fields() const { return std::make_tuple(serde::field("radius", radius)); }
//       auto fields() { return std::make_tuple(serde::field("radius", radius)); }
//   };

template <typename Derived, typename Base>
class variant_t : public Base {
public:
    using Base::Base;

    auto typetag_name() const -> std::string_view override {
        return Derived::typetag;
    }

    void typetag_serialize(serializer_t::struct_t& s) const override {
        serialize_fields(s, static_cast<const Derived&>(*this));
    }
};

// ============================================================================
// registry_t - tag -> decode function, one per base type
// ============================================================================
//
// Filled by register_variant before any value of the base type is read, and
// only looked up afterwards.

template <typename Base>
class registry_t {
public:
    using decode_fn = std::function<void(std::unique_ptr<Base>&, deserializer_t&)>;

    static auto instance() -> registry_t& {
        static registry_t registry;
        return registry;
    }

    void add(std::string tag, decode_fn decode) {
        if (entries_.count(tag)) {
            log("rejected duplicate typetag '" + tag + "' for " + type_name<Base>());
            throw typetag_error_t("typetag '" + tag + "' is already registered for " + type_name<Base>());
        }
        log("registered typetag '" + tag + "' for " + type_name<Base>());
        entries_.emplace(std::move(tag), std::move(decode));
    }

    auto find(std::string_view tag) const -> const decode_fn* {
        auto it = entries_.find(tag);
        return it != entries_.end() ? &it->second : nullptr;
    }

    auto size() const -> std::size_t { return entries_.size(); }

private:
    registry_t() = default;

    std::map<std::string, decode_fn, std::less<>> entries_;
};

// Register Variant under tag as a decodable implementation of Base
template <typename Base, typename Variant>
void register_variant(std::string tag) {
    static_assert(std::is_base_of_v<Base, Variant>, "variant must derive from its base");

    registry_t<Base>::instance().add(std::move(tag), [](std::unique_ptr<Base>& out, deserializer_t& de) {
        auto value = std::make_unique<Variant>();
        deserialize(de, *value);
        out = std::move(value);
    });
}

template <typename Base, typename Variant>
void register_variant() {
    register_variant<Base, Variant>(std::string(Variant::typetag));
}

// ============================================================================
// Implementation helpers (typetag.cpp)
// ============================================================================

namespace detail {

void serialize_tagged(serializer_t& ser, const base_t& value, const format_t& format);

// A deserializer whose read_struct yields the buffered entries first and then
// continues with the live map; ending it ends the live map.
auto replay(std::vector<any_map_t::entry_t> entries, deserializer_t::map_access_t& live)
    -> std::unique_ptr<deserializer_t>;

} // namespace detail

} // namespace typetag

// ============================================================================
// Pointer serialization
// ============================================================================

template <typename B>
    requires TypetagBase<B>
void serialize(serializer_t& ser, const std::unique_ptr<B>& value) {
    static_assert(std::is_base_of_v<typetag::base_t, B>, "tagged base must derive from typetag::base_t");

    if (!value) {
        ser.write_null();
        return;
    }
    typetag::detail::serialize_tagged(ser, *value, B::typetag_format());
}

template <typename B>
    requires TypetagBase<B>
void serialize(serializer_t& ser, const std::shared_ptr<B>& value) {
    static_assert(std::is_base_of_v<typetag::base_t, B>, "tagged base must derive from typetag::base_t");

    if (!value) {
        ser.write_null();
        return;
    }
    typetag::detail::serialize_tagged(ser, *value, B::typetag_format());
}

template <typename B>
    requires TypetagBase<B>
void deserialize(deserializer_t& de, std::unique_ptr<B>& value) {
    const auto format = typetag::format_t(B::typetag_format());
    const auto& registry = typetag::registry_t<B>::instance();

    auto decode = [&](const std::string& tag, deserializer_t& body) {
        auto* fn = registry.find(tag);
        if (!fn) {
            throw unknown_tag_error_t(tag, type_name<B>());
        }
        (*fn)(value, body);
    };

    if (format.placement == typetag::placement_t::tuple) {
        if (!de.read_optional()) {
            value.reset();
            return;
        }
        auto seq = de.read_tuple(2);
        auto* element = seq->read_element();

        if (!element) {
            throw typetag_error_t("expected [tag, value] for " + type_name<B>() + ", found an empty sequence");
        }
        auto tag = element->read_string();
        element = seq->read_element();

        if (!element) {
            throw typetag_error_t("missing value after tag '" + tag + "' for " + type_name<B>());
        }
        decode(tag, *element);

        if (seq->read_element()) {
            throw typetag_error_t("expected a 2-element tuple for " + type_name<B>());
        }
        seq->end();
        return;
    }

    auto access = de.read_struct(type_name<B>());
    auto key = any_value_t();

    if (!access) {
        value.reset();
        return;
    }

    switch (format.placement) {
        case typetag::placement_t::internal: {
            auto entries = std::vector<any_map_t::entry_t>();

            while (access->read_key(key)) {
                if (key.is_string() && key.as_string() == format.tag_key) {
                    auto tag = access->read_value().read_string();
                    auto body = typetag::detail::replay(std::move(entries), *access);
                    decode(tag, *body);
                    return;
                }
                entries.push_back({key, access->read_value().read_any()});
            }
            throw missing_tag_error_t(format.tag_key, type_name<B>());
        }
        case typetag::placement_t::external: {
            if (!access->read_key(key)) {
                throw typetag_error_t("expected a tagged value for " + type_name<B>() + ", found an empty map");
            }
            decode(detail::key_text(key), access->read_value());

            if (access->read_key(key)) {
                throw typetag_error_t("unexpected key '" + detail::key_text(key) + "' after the tagged value of " + type_name<B>());
            }
            access->end();
            return;
        }
        case typetag::placement_t::adjacent: {
            auto tag = std::optional<std::string>();
            auto buffered = std::optional<any_value_t>();
            auto decoded = false;

            while (access->read_key(key)) {
                auto name = detail::key_text(key);

                if (name == format.tag_key) {
                    if (tag) {
                        throw typetag_error_t("duplicate key '" + name + "' for " + type_name<B>());
                    }
                    tag = access->read_value().read_string();

                    if (buffered) {
                        auto body = any_deserializer_t(std::move(*buffered));
                        buffered.reset();
                        decode(*tag, body);
                        decoded = true;
                    }
                } else if (name == format.value_key) {
                    if (decoded || buffered) {
                        throw typetag_error_t("duplicate key '" + name + "' for " + type_name<B>());
                    }
                    if (tag) {
                        decode(*tag, access->read_value());
                        decoded = true;
                    } else {
                        buffered = access->read_value().read_any();
                    }
                } else {
                    throw typetag_error_t("unknown key '" + name + "', expected '" + format.tag_key + "' or '" + format.value_key + "'");
                }
            }
            if (!tag) {
                throw missing_tag_error_t(format.tag_key, type_name<B>());
            }
            if (!decoded) {
                throw typetag_error_t("missing key '" + std::string(format.value_key) + "' for " + type_name<B>());
            }
            access->end();
            return;
        }
        case typetag::placement_t::tuple:
            break;
    }
}

template <typename B>
    requires TypetagBase<B>
void deserialize(deserializer_t& de, std::shared_ptr<B>& value) {
    auto unique = std::unique_ptr<B>();
    deserialize(de, unique);
    value = std::move(unique);
}

} // namespace serde
