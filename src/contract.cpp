// contract.cpp - default implementations of serializer_t and deserializer_t

#include "serde/contract.hpp"
#include "serde/any_value.hpp"
#include "serde/error.hpp"
#include <limits>

namespace serde {

// =============================================================================
// serializer_t
// =============================================================================

void serializer_t::unimplemented(const char* operation) const {
    throw error_t(std::string("unimplemented ") + operation + " in " + name());
}

void serializer_t::write_bool(bool) { unimplemented("write_bool"); }
void serializer_t::write_signed(std::int64_t, int) { unimplemented("write_signed"); }
void serializer_t::write_unsigned(std::uint64_t, int) { unimplemented("write_unsigned"); }
void serializer_t::write_float(double, int) { unimplemented("write_float"); }
void serializer_t::write_real(long double) { unimplemented("write_real"); }
void serializer_t::write_char(char32_t) { unimplemented("write_char"); }
void serializer_t::write_string(std::string_view) { unimplemented("write_string"); }
void serializer_t::write_raw(std::string_view) { unimplemented("write_raw"); }
void serializer_t::write_enum(std::string_view, std::uint64_t) { unimplemented("write_enum"); }
void serializer_t::write_null() { unimplemented("write_null"); }

auto serializer_t::start_optional() -> std::unique_ptr<optional_t> {
    unimplemented("start_optional");
}

auto serializer_t::start_seq(std::optional<std::size_t>) -> std::unique_ptr<seq_t> {
    unimplemented("start_seq");
}

auto serializer_t::start_tuple(std::size_t) -> std::unique_ptr<seq_t> {
    unimplemented("start_tuple");
}

auto serializer_t::start_map(std::optional<std::size_t>) -> std::unique_ptr<map_t> {
    unimplemented("start_map");
}

auto serializer_t::start_struct(std::string_view) -> std::unique_ptr<struct_t> {
    unimplemented("start_struct");
}

// =============================================================================
// deserializer_t
// =============================================================================

void deserializer_t::unimplemented(const char* operation) const {
    throw error_t(std::string("unimplemented ") + operation + " in " + name());
}

auto deserializer_t::read_bool() -> bool { unimplemented("read_bool"); }
auto deserializer_t::read_signed(int) -> std::int64_t { unimplemented("read_signed"); }
auto deserializer_t::read_unsigned(int) -> std::uint64_t { unimplemented("read_unsigned"); }
auto deserializer_t::read_float(int) -> double { unimplemented("read_float"); }
auto deserializer_t::read_real() -> long double { unimplemented("read_real"); }
auto deserializer_t::read_char() -> char32_t { unimplemented("read_char"); }
auto deserializer_t::read_string() -> std::string { unimplemented("read_string"); }
auto deserializer_t::read_enum() -> any_value_t { unimplemented("read_enum"); }
void deserializer_t::read_ignore() { unimplemented("read_ignore"); }
auto deserializer_t::read_any() -> any_value_t { unimplemented("read_any"); }
auto deserializer_t::read_optional() -> bool { unimplemented("read_optional"); }

auto deserializer_t::read_seq() -> std::unique_ptr<seq_access_t> {
    unimplemented("read_seq");
}

auto deserializer_t::read_tuple(std::size_t) -> std::unique_ptr<seq_access_t> {
    unimplemented("read_tuple");
}

auto deserializer_t::read_map() -> std::unique_ptr<map_access_t> {
    unimplemented("read_map");
}

auto deserializer_t::read_struct(std::string_view) -> std::unique_ptr<map_access_t> {
    unimplemented("read_struct");
}

// =============================================================================
// Width limits
// =============================================================================

auto signed_min(int width) -> std::int64_t {
    switch (width) {
        case 1: return std::numeric_limits<std::int8_t>::min();
        case 2: return std::numeric_limits<std::int16_t>::min();
        case 4: return std::numeric_limits<std::int32_t>::min();
        default: return std::numeric_limits<std::int64_t>::min();
    }
}

auto signed_max(int width) -> std::int64_t {
    switch (width) {
        case 1: return std::numeric_limits<std::int8_t>::max();
        case 2: return std::numeric_limits<std::int16_t>::max();
        case 4: return std::numeric_limits<std::int32_t>::max();
        default: return std::numeric_limits<std::int64_t>::max();
    }
}

auto unsigned_max(int width) -> std::uint64_t {
    switch (width) {
        case 1: return std::numeric_limits<std::uint8_t>::max();
        case 2: return std::numeric_limits<std::uint16_t>::max();
        case 4: return std::numeric_limits<std::uint32_t>::max();
        default: return std::numeric_limits<std::uint64_t>::max();
    }
}

} // namespace serde
