// any_value.cpp - implementation of any_value_t, any_map_t and their codecs

#include "serde/any_value.hpp"
#include "serde/error.hpp"
#include "serde/escape.hpp"
#include <limits>
#include <utility>

namespace serde {

// =============================================================================
// any_map_t
// =============================================================================

any_map_t::any_map_t(std::initializer_list<entry_t> entries) {
    for (const auto& entry : entries) {
        set(entry.key, entry.value);
    }
}

auto any_map_t::find(const any_value_t& key) -> any_value_t* {
    for (auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

auto any_map_t::find(const any_value_t& key) const -> const any_value_t* {
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

auto any_map_t::contains(const any_value_t& key) const -> bool {
    return find(key) != nullptr;
}

auto any_map_t::at(const any_value_t& key) const -> const any_value_t& {
    if (auto* value = find(key)) {
        return *value;
    }
    throw error_t("key not found in map");
}

auto any_map_t::operator[](const any_value_t& key) -> any_value_t& {
    if (auto* value = find(key)) {
        return *value;
    }
    entries_.push_back({key, any_value_t()});
    return entries_.back().value;
}

void any_map_t::set(any_value_t key, any_value_t value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
    } else {
        entries_.push_back({std::move(key), std::move(value)});
    }
}

auto operator==(const any_map_t& a, const any_map_t& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& entry : a) {
        auto* other = b.find(entry.key);
        if (!other || !(*other == entry.value)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// any_value_t
// =============================================================================

namespace {

struct integer_view_t {
    bool negative;
    std::uint64_t magnitude;
};

auto integer_view(const any_value_t::variant_t& v) -> std::optional<integer_view_t> {
    return std::visit([](const auto& x) -> std::optional<integer_view_t> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char32_t>) {
            if constexpr (std::is_signed_v<T>) {
                if (x < 0) {
                    return integer_view_t{true, std::uint64_t(0) - static_cast<std::uint64_t>(x)};
                }
            }
            return integer_view_t{false, static_cast<std::uint64_t>(x)};
        } else {
            return std::nullopt;
        }
    }, v);
}

} // namespace

auto any_value_t::is_integer() const -> bool {
    return integer_view(value_).has_value();
}

auto any_value_t::is_floating() const -> bool {
    return holds<float>() || holds<double>() || holds<long double>();
}

void any_value_t::throw_kind_mismatch(const char* expected) const {
    throw type_error_t(std::string("expected ") + expected + ", found " + kind_name());
}

auto any_value_t::as_bool() const -> bool {
    return get<bool>();
}

auto any_value_t::as_int64() const -> std::int64_t {
    auto view = integer_view(value_);
    if (!view) {
        if (is_char()) {
            return static_cast<std::int64_t>(get<char32_t>());
        }
        throw_kind_mismatch("integer");
    }
    if (view->negative) {
        return static_cast<std::int64_t>(std::uint64_t(0) - view->magnitude);
    }
    if (view->magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw type_error_t("cannot fit integer " + std::to_string(view->magnitude) + " into a signed 64-bit integer");
    }
    return static_cast<std::int64_t>(view->magnitude);
}

auto any_value_t::as_uint64() const -> std::uint64_t {
    auto view = integer_view(value_);
    if (!view) {
        if (is_char()) {
            return static_cast<std::uint64_t>(get<char32_t>());
        }
        throw_kind_mismatch("integer");
    }
    if (view->negative) {
        throw type_error_t("cannot fit negative integer into an unsigned integer");
    }
    return view->magnitude;
}

auto any_value_t::as_double() const -> double {
    return static_cast<double>(as_long_double());
}

auto any_value_t::as_long_double() const -> long double {
    if (auto view = integer_view(value_)) {
        auto x = static_cast<long double>(view->magnitude);
        return view->negative ? -x : x;
    }
    if (auto* f = std::get_if<float>(&value_)) return *f;
    if (auto* d = std::get_if<double>(&value_)) return *d;
    if (auto* r = std::get_if<long double>(&value_)) return *r;
    throw_kind_mismatch("number");
}

auto any_value_t::as_string() const -> const std::string& {
    return get<std::string>();
}

auto any_value_t::as_seq() const -> const any_seq_t& {
    return get<any_seq_t>();
}

auto any_value_t::as_seq() -> any_seq_t& {
    if (auto* p = std::get_if<any_seq_t>(&value_)) {
        return *p;
    }
    throw_kind_mismatch("sequence");
}

auto any_value_t::as_map() const -> const any_map_t& {
    return get<any_map_t>();
}

auto any_value_t::as_map() -> any_map_t& {
    if (auto* p = std::get_if<any_map_t>(&value_)) {
        return *p;
    }
    throw_kind_mismatch("map");
}

auto any_value_t::kind_name() const -> const char* {
    return std::visit([](const auto& x) -> const char* {
        return kind_for<std::decay_t<decltype(x)>>();
    }, value_);
}

auto operator==(const any_value_t& a, const any_value_t& b) -> bool {
    if (a.is_number() && b.is_number()) {
        auto ia = integer_view(a.value_);
        auto ib = integer_view(b.value_);
        if (ia && ib) {
            return ia->negative == ib->negative && ia->magnitude == ib->magnitude;
        }
        return a.as_long_double() == b.as_long_double();
    }
    return a.value_ == b.value_;
}

// =============================================================================
// any_serializer_t
// =============================================================================

namespace {

class any_optional_writer_t : public serializer_t::optional_t {
public:
    explicit any_optional_writer_t(any_value_t& target) : target_(target), slot_(target) {}

    auto write_some() -> serializer_t& override { return slot_; }
    void write_none() override { target_ = any_value_t(); }
    void end() override {}

private:
    any_value_t& target_;
    any_serializer_t slot_;
};

class any_seq_writer_t : public serializer_t::seq_t {
public:
    explicit any_seq_writer_t(any_value_t& target) : target_(target) {}

    auto write_element() -> serializer_t& override {
        items_.emplace_back();
        slot_ = std::make_unique<any_serializer_t>(items_.back());
        return *slot_;
    }

    void end() override {
        slot_.reset();
        target_ = any_value_t(std::move(items_));
    }

private:
    any_value_t& target_;
    any_seq_t items_;
    std::unique_ptr<any_serializer_t> slot_;
};

class any_map_writer_t : public serializer_t::map_t, public serializer_t::struct_t {
public:
    explicit any_map_writer_t(any_value_t& target) : target_(target) {}

    auto write_key() -> serializer_t& override {
        commit();
        pending_ = true;
        slot_ = std::make_unique<any_serializer_t>(key_);
        return *slot_;
    }

    auto write_value() -> serializer_t& override {
        slot_ = std::make_unique<any_serializer_t>(value_);
        return *slot_;
    }

    auto write_field(std::string_view name) -> serializer_t& override {
        commit();
        pending_ = true;
        key_ = any_value_t(name);
        return write_value();
    }

    void end() override {
        commit();
        slot_.reset();
        target_ = any_value_t(std::move(map_));
    }

private:
    void commit() {
        if (pending_) {
            map_.set(std::move(key_), std::move(value_));
            key_ = any_value_t();
            value_ = any_value_t();
            pending_ = false;
        }
    }

    any_value_t& target_;
    any_map_t map_;
    any_value_t key_;
    any_value_t value_;
    bool pending_ = false;
    std::unique_ptr<any_serializer_t> slot_;
};

} // namespace

void any_serializer_t::write_bool(bool value) {
    target_ = value;
}

void any_serializer_t::write_signed(std::int64_t value, int width) {
    switch (width) {
        case 1: target_ = static_cast<std::int8_t>(value); break;
        case 2: target_ = static_cast<std::int16_t>(value); break;
        case 4: target_ = static_cast<std::int32_t>(value); break;
        default: target_ = value; break;
    }
}

void any_serializer_t::write_unsigned(std::uint64_t value, int width) {
    switch (width) {
        case 1: target_ = static_cast<std::uint8_t>(value); break;
        case 2: target_ = static_cast<std::uint16_t>(value); break;
        case 4: target_ = static_cast<std::uint32_t>(value); break;
        default: target_ = value; break;
    }
}

void any_serializer_t::write_float(double value, int width) {
    if (width == 4) {
        target_ = static_cast<float>(value);
    } else {
        target_ = value;
    }
}

void any_serializer_t::write_real(long double value) {
    target_ = value;
}

void any_serializer_t::write_char(char32_t value) {
    target_ = value;
}

void any_serializer_t::write_string(std::string_view value) {
    target_ = any_value_t(value);
}

void any_serializer_t::write_raw(std::string_view value) {
    target_ = any_value_t(value);
}

void any_serializer_t::write_enum(std::string_view name, std::uint64_t) {
    target_ = any_value_t(name);
}

void any_serializer_t::write_null() {
    target_ = any_value_t();
}

auto any_serializer_t::start_optional() -> std::unique_ptr<optional_t> {
    return std::make_unique<any_optional_writer_t>(target_);
}

auto any_serializer_t::start_seq(std::optional<std::size_t>) -> std::unique_ptr<seq_t> {
    return std::make_unique<any_seq_writer_t>(target_);
}

auto any_serializer_t::start_tuple(std::size_t) -> std::unique_ptr<seq_t> {
    return std::make_unique<any_seq_writer_t>(target_);
}

auto any_serializer_t::start_map(std::optional<std::size_t>) -> std::unique_ptr<map_t> {
    return std::make_unique<any_map_writer_t>(target_);
}

auto any_serializer_t::start_struct(std::string_view) -> std::unique_ptr<struct_t> {
    return std::make_unique<any_map_writer_t>(target_);
}

// =============================================================================
// any_deserializer_t
// =============================================================================

namespace {

class any_seq_reader_t : public deserializer_t::seq_access_t {
public:
    explicit any_seq_reader_t(const any_seq_t* items) : items_(items) {}

    auto size_hint() const -> std::optional<std::size_t> override {
        return items_ ? items_->size() : 0;
    }

    auto read_element() -> deserializer_t* override {
        if (!items_ || index_ == items_->size()) {
            return nullptr;
        }
        current_ = std::make_unique<any_deserializer_t>((*items_)[index_++]);
        return current_.get();
    }

    void end() override {}

private:
    const any_seq_t* items_;
    std::size_t index_ = 0;
    std::unique_ptr<any_deserializer_t> current_;
};

class any_map_reader_t : public deserializer_t::map_access_t {
public:
    explicit any_map_reader_t(const any_map_t* map) : map_(map) {}

    auto read_key(any_value_t& key) -> bool override {
        if (!map_ || index_ == map_->size()) {
            return false;
        }
        key = (map_->begin() + index_)->key;
        return true;
    }

    auto read_value() -> deserializer_t& override {
        current_ = std::make_unique<any_deserializer_t>((map_->begin() + index_++)->value);
        return *current_;
    }

    void ignore_value() override {
        ++index_;
    }

    void end() override {}

private:
    const any_map_t* map_;
    std::size_t index_ = 0;
    std::unique_ptr<any_deserializer_t> current_;
};

} // namespace

auto any_deserializer_t::read_bool() -> bool {
    return value_.as_bool();
}

auto any_deserializer_t::read_signed(int width) -> std::int64_t {
    auto value = value_.as_int64();
    if (value < signed_min(width) || value > signed_max(width)) {
        throw type_error_t("cannot fit integer " + std::to_string(value) + " into " + std::to_string(width) + " bytes");
    }
    return value;
}

auto any_deserializer_t::read_unsigned(int width) -> std::uint64_t {
    auto value = value_.as_uint64();
    if (value > unsigned_max(width)) {
        throw type_error_t("cannot fit integer " + std::to_string(value) + " into " + std::to_string(width) + " bytes");
    }
    return value;
}

auto any_deserializer_t::read_float(int) -> double {
    return value_.as_double();
}

auto any_deserializer_t::read_real() -> long double {
    return value_.as_long_double();
}

auto any_deserializer_t::read_char() -> char32_t {
    if (value_.is_char()) {
        return value_.get<char32_t>();
    }
    if (value_.is_string()) {
        return single_code_point(value_.as_string());
    }
    return static_cast<char32_t>(value_.as_uint64());
}

auto any_deserializer_t::read_string() -> std::string {
    return value_.as_string();
}

auto any_deserializer_t::read_enum() -> any_value_t {
    if (!value_.is_string() && !value_.is_integer()) {
        throw type_error_t(std::string("expected enum name or ordinal, found ") + value_.kind_name());
    }
    return value_;
}

auto any_deserializer_t::read_seq() -> std::unique_ptr<seq_access_t> {
    if (value_.is_null()) {
        return std::make_unique<any_seq_reader_t>(nullptr);
    }
    return std::make_unique<any_seq_reader_t>(&value_.as_seq());
}

auto any_deserializer_t::read_tuple(std::size_t) -> std::unique_ptr<seq_access_t> {
    return std::make_unique<any_seq_reader_t>(&std::as_const(value_).as_seq());
}

auto any_deserializer_t::read_map() -> std::unique_ptr<map_access_t> {
    if (value_.is_null()) {
        return std::make_unique<any_map_reader_t>(nullptr);
    }
    return std::make_unique<any_map_reader_t>(&std::as_const(value_).as_map());
}

auto any_deserializer_t::read_struct(std::string_view) -> std::unique_ptr<map_access_t> {
    if (value_.is_null()) {
        return nullptr;
    }
    return std::make_unique<any_map_reader_t>(&std::as_const(value_).as_map());
}

} // namespace serde
