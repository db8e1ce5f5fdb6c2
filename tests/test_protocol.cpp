#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
#include "serde/serde.hpp"

using namespace serde;

// =============================================================================
// Test structures
// =============================================================================

enum class color_t : std::uint8_t { red = 1, green = 2, blue = 4 };

inline const char* to_string(color_t c) {
    switch (c) {
        case color_t::red: return "red";
        case color_t::green: return "green";
        case color_t::blue: return "blue";
    }
    return "unknown";
}

inline color_t from_string(std::type_identity<color_t>, const std::string& s) {
    if (s == "red") return color_t::red;
    if (s == "green") return color_t::green;
    if (s == "blue") return color_t::blue;
    throw std::runtime_error("invalid color_t: " + s);
}

inline auto enum_values(std::type_identity<color_t>) {
    return std::array{color_t::red, color_t::green, color_t::blue};
}

struct server_t {
    static constexpr const char* type_name = "server_t";

    std::string host;
    int port = 0;
    std::optional<int> timeout;
    color_t color = color_t::red;
    std::string user;
    std::vector<std::string> tags;
    std::string cache;
    std::string extra = "{\"a\":[1,2]}";

    auto fields() const {
        return std::make_tuple(
            field("host", host),
            field("port", port),
            field("timeout", timeout),
            field("color", color).optional(),
            field("user", user).rename("user", "username").alias("login"),
            field("tags", tags).optional(),
            field("cache", cache).skip(),
            field("extra", extra).raw()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("host", host),
            field("port", port),
            field("timeout", timeout),
            field("color", color).optional(),
            field("user", user).rename("user", "username").alias("login"),
            field("tags", tags).optional(),
            field("cache", cache).skip(),
            field("extra", extra).raw()
        );
    }
};

struct strict_t {
    static constexpr const char* type_name = "strict_t";
    static constexpr bool deny_unknown_fields = true;

    int a = 0;

    auto fields() const { return std::make_tuple(field("a", a)); }
    auto fields() { return std::make_tuple(field("a", a)); }
};

struct endpoint_t {
    std::string host;
    int port = 0;

    auto fields() const { return std::make_tuple(field("host", host), field("port", port)); }
    auto fields() { return std::make_tuple(field("host", host), field("port", port)); }
};

// State kept in kelvin, exchanged in celsius through accessors
class thermostat_t {
public:
    static constexpr const char* type_name = "thermostat_t";

    auto celsius() const -> double { return kelvin_ - 273.0; }
    void set_celsius(double c) { kelvin_ = c + 273.0; }
    auto kelvin() const -> double { return kelvin_; }
    auto label() const -> std::string { return "t" + std::to_string(static_cast<int>(kelvin_)); }

    auto fields() const {
        return std::make_tuple(
            field("celsius", [this] { return celsius(); }),
            field("label", [this] { return label(); })
        );
    }

    auto fields() {
        return std::make_tuple(
            field("celsius", [this] { return celsius(); }, [this](double c) { set_celsius(c); }),
            field("label", [this] { return label(); })
        );
    }

private:
    double kelvin_ = 273.0;
};

struct nested_t {
    static constexpr const char* type_name = "nested_t";

    std::string name;
    std::list<endpoint_t> servers;
    std::map<int, std::string> ports;
    std::unordered_map<std::string, double> weights;
    std::pair<int, std::string> pair;
    std::tuple<bool, char32_t, long double> tuple;
    std::array<std::int16_t, 3> triple = {0, 0, 0};

    auto fields() const {
        return std::make_tuple(
            field("name", name),
            field("servers", servers),
            field("ports", ports),
            field("weights", weights),
            field("pair", pair),
            field("tuple", tuple),
            field("triple", triple)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("name", name),
            field("servers", servers),
            field("ports", ports),
            field("weights", weights),
            field("pair", pair),
            field("tuple", tuple),
            field("triple", triple)
        );
    }
};

template <typename Error, typename F>
auto throws(F&& f) -> bool {
    try {
        f();
    } catch (const Error&) {
        return true;
    }
    return false;
}

// =============================================================================
// Record walker
// =============================================================================

void test_field_options_on_write() {
    std::cout << "Testing field options on write... ";

    auto s = server_t();
    s.host = "example.org";
    s.port = 8080;
    s.color = color_t::blue;
    s.user = "ana";
    s.cache = "never written";

    auto text = to_json(s);
    assert(text == "{\"host\":\"example.org\",\"port\":8080,\"timeout\":null,\"color\":\"blue\","
                   "\"user\":\"ana\",\"tags\":[],\"extra\":{\"a\":[1,2]}}");

    std::cout << "PASSED\n";
}

void test_field_options_on_read() {
    std::cout << "Testing rename, alias, optional and raw on read... ";

    auto s = parse_json<server_t>(
        "{\"host\": \"h\", \"port\": 1, \"username\": \"bob\", \"extra\": {\"ignored\": true}}");
    assert(s.host == "h");
    assert(s.port == 1);
    assert(!s.timeout);
    assert(s.user == "bob");
    assert(s.color == color_t::red);
    assert(s.extra == "{\"a\":[1,2]}");

    auto t = parse_json<server_t>("{\"login\": \"eve\", \"host\": \"h\", \"port\": 2, \"timeout\": 30}");
    assert(t.user == "eve");
    assert(t.timeout == 30);

    std::cout << "PASSED\n";
}

void test_schema_errors() {
    std::cout << "Testing missing, duplicate and unknown fields... ";

    try {
        parse_json<server_t>("{\"host\": \"h\", \"username\": \"u\"}");
        assert(false);
    } catch (const missing_field_error_t& e) {
        assert(e.field_name() == "port");
        assert(e.type_name() == "server_t");
        assert(std::string(e.what()) == "missing field 'port' of type 'server_t'");
    }

    assert(throws<duplicate_field_error_t>([] {
        parse_json<server_t>("{\"host\": \"a\", \"host\": \"b\", \"port\": 1, \"username\": \"u\"}");
    }));

    // An optional field may repeat; the last value wins
    auto s = parse_json<server_t>("{\"host\": \"a\", \"port\": 1, \"username\": \"u\", \"tags\": [\"x\"], \"tags\": [\"y\"]}");
    assert(s.tags == std::vector<std::string>{"y"});

    // The write name is not accepted on read once renamed
    try {
        parse_json<server_t>("{\"host\": \"a\", \"port\": 1, \"user\": \"u\"}");
        assert(false);
    } catch (const missing_field_error_t& e) {
        assert(e.field_name() == "username");
    }

    assert(throws<unknown_field_error_t>([] { parse_json<strict_t>("{\"a\": 1, \"b\": 2}"); }));
    assert(parse_json<strict_t>("{\"a\": 5}").a == 5);

    // Skipped fields are unknown on read
    assert(throws<unknown_field_error_t>([] { parse_json<strict_t>("{\"a\": 1, \"cache\": 2}"); }));

    std::cout << "PASSED\n";
}

void test_unknown_fields_are_logged() {
    std::cout << "Testing unknown fields go to the log... ";

    auto ss = std::ostringstream();
    set_log_stream(&ss);

    auto s = parse_json<server_t>("{\"host\": \"h\", \"port\": 1, \"username\": \"u\", \"zzz\": {\"deep\": [1, {}]}}");
    set_log_stream(nullptr);

    assert(s.port == 1);
    assert(ss.str() == "skipping unknown field 'zzz' of server_t\n");

    std::cout << "PASSED\n";
}

void test_positional_keys() {
    std::cout << "Testing integer keys match field positions... ";

    auto value = any_value_t(any_map_t{{0, "h"}, {1, 99}, {4, "pos"}});
    auto s = server_t();
    from_any(value, s);

    assert(s.host == "h");
    assert(s.port == 99);
    assert(s.user == "pos");

    std::cout << "PASSED\n";
}

void test_accessor_fields() {
    std::cout << "Testing getter and setter fields... ";

    auto t = thermostat_t();
    t.set_celsius(20.0);
    assert(to_json(t) == "{\"celsius\":20,\"label\":\"t293\"}");

    auto loaded = parse_json<thermostat_t>("{\"celsius\": 7.0, \"label\": \"ignored\"}");
    assert(loaded.kelvin() == 280.0);

    // A read-only field is not required on read
    assert(parse_json<thermostat_t>("{\"celsius\": 0}").kelvin() == 273.0);
    assert(throws<missing_field_error_t>([] { parse_json<thermostat_t>("{}"); }));

    auto round = parse_yaml<thermostat_t>(to_yaml(t));
    assert(round.celsius() == 20.0);

    set(t, "celsius", "5");
    assert(t.kelvin() == 278.0);
    assert(throws<serde::error_t>([&t] { set(t, "label", "x"); }));

    std::cout << "PASSED\n";
}

void test_null_record() {
    std::cout << "Testing null leaves a record untouched... ";

    auto s = server_t();
    s.port = 7;
    from_json(s, "null");
    assert(s.port == 7);

    std::cout << "PASSED\n";
}

// =============================================================================
// Enums
// =============================================================================

void test_enums() {
    std::cout << "Testing enums by name and ordinal... ";

    assert(to_json(color_t::green) == "\"green\"");
    assert(parse_json<color_t>("\"blue\"") == color_t::blue);
    assert(parse_json<color_t>("2") == color_t::blue);
    assert(parse_json<color_t>("0") == color_t::red);

    assert(throws<type_error_t>([] { parse_json<color_t>("3"); }));
    assert(throws<type_error_t>([] { parse_json<color_t>("4"); }));
    assert(throws<type_error_t>([] { to_json(static_cast<color_t>(3)); }));
    assert(throws<std::runtime_error>([] { parse_json<color_t>("\"purple\""); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Containers
// =============================================================================

void test_nested_round_trip() {
    std::cout << "Testing nested containers round trip... ";

    auto n = nested_t();
    n.name = "cluster";
    n.servers.push_back(endpoint_t());
    n.servers.back().host = "a";
    n.servers.back().port = 1;
    n.ports = {{80, "http"}, {443, "https"}};
    n.weights = {{"a", 0.5}};
    n.pair = {3, "three"};
    n.tuple = {true, U'é', 2.5L};
    n.triple = {-1, 0, 32767};

    auto text = to_json(n);
    auto loaded = parse_json<nested_t>(text);

    assert(loaded.name == "cluster");
    assert(loaded.servers.size() == 1);
    assert(loaded.servers.front().host == "a");
    assert(loaded.servers.front().port == 1);
    assert(loaded.ports == n.ports);
    assert(loaded.weights == n.weights);
    assert(loaded.pair == n.pair);
    assert(loaded.tuple == n.tuple);
    assert(loaded.triple == n.triple);
    assert(text.find("\"ports\":{\"80\":\"http\",\"443\":\"https\"}") != std::string::npos);

    std::cout << "PASSED\n";
}

void test_bool_and_float_keys() {
    std::cout << "Testing boolean and floating map keys... ";

    auto flags = std::map<bool, int>{{false, 0}, {true, 1}};
    assert(to_json(flags) == "{\"false\":0,\"true\":1}");
    assert((parse_json<std::map<bool, int>>(to_json(flags)) == flags));
    assert((parse_yaml<std::map<bool, int>>(to_yaml(flags)) == flags));
    assert((parse_yaml<std::map<bool, int>>("yes: 3\n").at(true) == 3));

    auto scale = std::map<double, std::string>{{-0.25, "low"}, {1.5, "high"}};
    assert((parse_json<std::map<double, std::string>>(to_json(scale)) == scale));
    assert((parse_yaml<std::map<double, std::string>>(to_yaml(scale)) == scale));

    auto infinite = parse_yaml<std::map<float, int>>(".inf: 1\n-.inf: 2\n");
    assert(infinite.at(std::numeric_limits<float>::infinity()) == 1);
    assert(infinite.begin()->second == 2);

    assert(throws<type_error_t>([] { parse_json<std::map<bool, int>>("{\"maybe\": 1}"); }));
    assert(throws<type_error_t>([] { parse_json<std::map<double, int>>("{\"1.5x\": 1}"); }));

    std::cout << "PASSED\n";
}

void test_tuple_length() {
    std::cout << "Testing fixed-length tuples reject short input... ";

    assert(throws<type_error_t>([] { parse_json<std::array<int, 3>>("[1, 2]"); }));
    assert(throws<type_error_t>([] { parse_json<std::map<int, int>>("{\"x\": 1}"); }));

    std::cout << "PASSED\n";
}

void test_ignore() {
    std::cout << "Testing ignore_t skips one value... ";

    auto value = std::tuple<ignore_t, int>();
    from_json(value, "[{\"a\": [1, \"]\"]}, 5]");
    assert(std::get<1>(value) == 5);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Record Walker ===\n\n";

    test_field_options_on_write();
    test_field_options_on_read();
    test_schema_errors();
    test_unknown_fields_are_logged();
    test_positional_keys();
    test_accessor_fields();
    test_null_record();

    std::cout << "\n=== Enums ===\n\n";

    test_enums();

    std::cout << "\n=== Containers ===\n\n";

    test_nested_round_trip();
    test_bool_and_float_keys();
    test_tuple_length();
    test_ignore();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
