// typetag.cpp - tagged writes and the replaying map access

#include "serde/typetag.hpp"

namespace serde {
namespace typetag {
namespace detail {

namespace {

// =============================================================================
// Replay of entries read ahead of an internal tag
// =============================================================================

class replay_access_t : public deserializer_t::map_access_t {
public:
    replay_access_t(std::vector<any_map_t::entry_t> entries, deserializer_t::map_access_t& live)
        : entries_(std::move(entries))
        , live_(live) {}

    auto read_key(any_value_t& key) -> bool override {
        if (next_ < entries_.size()) {
            auto& entry = entries_[next_++];
            key = entry.key;
            current_ = std::make_unique<any_deserializer_t>(std::move(entry.value));
            return true;
        }
        current_.reset();
        return live_.read_key(key);
    }

    auto read_value() -> deserializer_t& override {
        if (current_) {
            return *current_;
        }
        return live_.read_value();
    }

    void ignore_value() override {
        if (!current_) {
            live_.ignore_value();
        }
    }

    void end() override {
        live_.end();
    }

private:
    std::vector<any_map_t::entry_t> entries_;
    deserializer_t::map_access_t& live_;
    std::unique_ptr<any_deserializer_t> current_;
    std::size_t next_ = 0;
};

class replay_deserializer_t : public deserializer_t {
public:
    replay_deserializer_t(std::vector<any_map_t::entry_t> entries, deserializer_t::map_access_t& live)
        : entries_(std::move(entries))
        , live_(live) {}

    auto read_map() -> std::unique_ptr<map_access_t> override {
        return open();
    }

    auto read_struct(std::string_view) -> std::unique_ptr<map_access_t> override {
        return open();
    }

    auto name() const -> std::string override { return "typetag replay"; }

private:
    auto open() -> std::unique_ptr<map_access_t> {
        if (opened_) {
            throw typetag_error_t("tagged map was already read");
        }
        opened_ = true;
        return std::make_unique<replay_access_t>(std::move(entries_), live_);
    }

    std::vector<any_map_t::entry_t> entries_;
    deserializer_t::map_access_t& live_;
    bool opened_ = false;
};

} // namespace

// =============================================================================
// Tagged writes
// =============================================================================

void serialize_tagged(serializer_t& ser, const base_t& value, const format_t& format) {
    auto name = value.typetag_name();

    switch (format.placement) {
        case placement_t::internal: {
            auto s = ser.start_struct(name);
            s->write_field(format.tag_key).write_string(name);
            value.typetag_serialize(*s);
            s->end();
            break;
        }
        case placement_t::external: {
            auto outer = ser.start_struct(name);
            auto inner = outer->write_field(name).start_struct(name);
            value.typetag_serialize(*inner);
            inner->end();
            outer->end();
            break;
        }
        case placement_t::adjacent: {
            auto outer = ser.start_struct(name);
            outer->write_field(format.tag_key).write_string(name);
            auto inner = outer->write_field(format.value_key).start_struct(name);
            value.typetag_serialize(*inner);
            inner->end();
            outer->end();
            break;
        }
        case placement_t::tuple: {
            auto seq = ser.start_tuple(2);
            seq->write_element().write_string(name);
            auto inner = seq->write_element().start_struct(name);
            value.typetag_serialize(*inner);
            inner->end();
            seq->end();
            break;
        }
    }
}

auto replay(std::vector<any_map_t::entry_t> entries, deserializer_t::map_access_t& live)
    -> std::unique_ptr<deserializer_t> {
    return std::make_unique<replay_deserializer_t>(std::move(entries), live);
}

} // namespace detail
} // namespace typetag
} // namespace serde
