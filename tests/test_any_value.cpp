#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "serde/any_value.hpp"
#include "serde/error.hpp"
#include "serde/protocol.hpp"

using namespace serde;

// =============================================================================
// Test structures
// =============================================================================

struct point_t {
    int x = 0;
    int y = 0;
    std::optional<std::string> label;

    auto fields() const {
        return std::make_tuple(
            field("x", x),
            field("y", y),
            field("label", label)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("x", x),
            field("y", y),
            field("label", label)
        );
    }
};

// =============================================================================
// Tests
// =============================================================================

void test_kinds() {
    std::cout << "Testing value kinds... ";

    assert(any_value_t().is_null());
    assert(any_value_t(nullptr).is_null());
    assert(any_value_t(true).is_bool());
    assert(any_value_t(std::int8_t(3)).holds<std::int8_t>());
    assert(any_value_t(std::uint16_t(3)).holds<std::uint16_t>());
    assert(any_value_t(42).is_integer());
    assert(any_value_t(1.5f).holds<float>());
    assert(any_value_t(1.5).is_floating());
    assert(any_value_t(U'x').is_char());
    assert(any_value_t("abc").is_string());
    assert(any_value_t(any_seq_t{1, 2}).is_seq());
    assert(any_value_t(any_map_t{{"a", 1}}).is_map());
    assert(std::string(any_value_t(any_seq_t{}).kind_name()) == "sequence");

    std::cout << "PASSED\n";
}

void test_numeric_equality() {
    std::cout << "Testing equality across numeric widths... ";

    assert(any_value_t(std::int8_t(12)) == any_value_t(std::int64_t(12)));
    assert(any_value_t(std::uint32_t(7)) == any_value_t(std::int16_t(7)));
    assert(any_value_t(12) == any_value_t(12.0));
    assert(!(any_value_t(-1) == any_value_t(std::uint64_t(18446744073709551615ull))));
    assert(!(any_value_t(1) == any_value_t(true)));
    assert(!(any_value_t("1") == any_value_t(1)));

    std::cout << "PASSED\n";
}

void test_conversions() {
    std::cout << "Testing converting access... ";

    assert(any_value_t(std::int8_t(-5)).as_int64() == -5);
    assert(any_value_t(std::uint64_t(9)).as_int64() == 9);
    assert(any_value_t(std::int32_t(9)).as_double() == 9.0);

    auto threw = false;
    try {
        any_value_t(-1).as_uint64();
    } catch (const type_error_t&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        any_value_t("abc").get<bool>();
    } catch (const type_error_t& e) {
        threw = std::string(e.what()) == "expected bool, found string";
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_map_order_and_lookup() {
    std::cout << "Testing any_map_t order and lookup... ";

    auto map = any_map_t();
    map.set("b", 2);
    map.set("a", 1);
    map.set("b", 3);

    assert(map.size() == 2);
    assert(map.begin()->key == any_value_t("b"));
    assert(map.at("b") == any_value_t(3));
    assert(map.contains("a"));
    assert(!map.contains("c"));
    assert(map.find(any_value_t(1)) == nullptr);

    map["c"] = true;
    assert(map.size() == 3);

    auto other = any_map_t{{"c", true}, {"a", 1}, {"b", 3}};
    assert(map == other);

    auto threw = false;
    try {
        map.at("zz");
    } catch (const serde::error_t&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_to_any() {
    std::cout << "Testing to_any on records and containers... ";

    auto p = point_t{3, -4, std::string("origin")};
    auto value = to_any(p);

    assert(value.is_map());
    assert(value.as_map().at("x") == any_value_t(3));
    assert(value.as_map().at("y") == any_value_t(-4));
    assert(value.as_map().at("label") == any_value_t("origin"));

    auto numbers = std::map<std::string, std::vector<int>>{{"odd", {1, 3}}, {"even", {2}}};
    auto any = to_any(numbers);
    assert(any.as_map().at("odd") == any_value_t(any_seq_t{1, 3}));

    std::cout << "PASSED\n";
}

void test_from_any() {
    std::cout << "Testing from_any on records... ";

    auto value = any_value_t(any_map_t{
        {"x", 10},
        {"y", std::int8_t(20)},
        {"label", nullptr},
    });
    auto p = point_t();
    from_any(value, p);

    assert(p.x == 10);
    assert(p.y == 20);
    assert(!p.label);

    auto narrow = std::int8_t(0);
    auto threw = false;
    try {
        from_any(any_value_t(300), narrow);
    } catch (const type_error_t&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_round_trip_through_any() {
    std::cout << "Testing round trip through any_value_t... ";

    auto original = std::vector<point_t>{{1, 2, std::nullopt}, {3, 4, std::string("b")}};
    auto loaded = std::vector<point_t>();
    from_any(to_any(original), loaded);

    assert(loaded.size() == 2);
    assert(loaded[0].x == 1 && loaded[0].y == 2 && !loaded[0].label);
    assert(loaded[1].x == 3 && loaded[1].label == std::string("b"));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== any_value_t ===\n\n";

    test_kinds();
    test_numeric_equality();
    test_conversions();
    test_map_order_and_lookup();

    std::cout << "\n=== any_value_t codec ===\n\n";

    test_to_any();
    test_from_any();
    test_round_trip_through_any();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
