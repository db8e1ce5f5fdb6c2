#include <cassert>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "serde/serde.hpp"

using namespace serde;

// =============================================================================
// Test structures
// =============================================================================

struct limits_t {
    int connections = 0;
    double rate = 0.0;

    auto fields() const {
        return std::make_tuple(
            field("connections", connections),
            field("rate", rate)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("connections", connections),
            field("rate", rate)
        );
    }
};

struct service_t {
    static constexpr const char* type_name = "service_t";

    std::string host;
    int port = 0;
    std::vector<std::string> tags;
    std::map<std::string, int> weights;
    std::string note;
    std::optional<limits_t> limits;
    std::pair<int, std::string> pair;

    auto fields() const {
        return std::make_tuple(
            field("host", host),
            field("port", port),
            field("tags", tags),
            field("weights", weights),
            field("note", note),
            field("limits", limits),
            field("pair", pair).optional()
        );
    }

    auto fields() {
        return std::make_tuple(
            field("host", host),
            field("port", port),
            field("tags", tags),
            field("weights", weights),
            field("note", note),
            field("limits", limits),
            field("pair", pair).optional()
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

auto read_any_yaml(std::string_view text) -> any_value_t {
    auto reader = yaml_reader_t(text);
    auto value = reader.read_any();
    reader.finish();
    return value;
}

// =============================================================================
// Scalars
// =============================================================================

void test_booleans() {
    std::cout << "Testing booleans... ";

    assert(parse_yaml<bool>("true"));
    assert(parse_yaml<bool>("trUe"));
    assert(parse_yaml<bool>("yes"));
    assert(parse_yaml<bool>("Yes"));
    assert(!parse_yaml<bool>("false"));
    assert(!parse_yaml<bool>("no"));
    assert(throws<type_error_t>([] { parse_yaml<bool>("z"); }));

    std::cout << "PASSED\n";
}

void test_integers() {
    std::cout << "Testing integers... ";

    assert(parse_yaml<int>("42") == 42);
    assert(parse_yaml<int>("+5") == 5);
    assert(parse_yaml<int>("0x1F") == 31);
    assert(parse_yaml<int>("0o17") == 15);
    assert(parse_yaml<int>("-0x10") == -16);
    assert(parse_yaml<std::uint64_t>("18446744073709551615") == 18446744073709551615ull);

    assert(throws<type_error_t>([] { parse_yaml<std::int8_t>("200"); }));
    assert(throws<type_error_t>([] { parse_yaml<unsigned>("-1"); }));
    assert(throws<type_error_t>([] { parse_yaml<int>("1.5"); }));
    assert(throws<type_error_t>([] { parse_yaml<std::uint64_t>("18446744073709551616"); }));
    assert(throws<unexpected_end_t>([] { parse_yaml<int>(""); }));

    std::cout << "PASSED\n";
}

void test_floats() {
    std::cout << "Testing floats... ";

    assert(parse_yaml<double>("1.5") == 1.5);
    assert(parse_yaml<double>("1e3") == 1000.0);
    assert(parse_yaml<double>("+1.5") == 1.5);
    assert(parse_yaml<double>(".inf") == std::numeric_limits<double>::infinity());
    assert(parse_yaml<double>("-.inf") == -std::numeric_limits<double>::infinity());
    assert(parse_yaml<float>(".Inf") == std::numeric_limits<float>::infinity());
    assert(std::isnan(parse_yaml<double>(".nan")));
    assert(throws<type_error_t>([] { parse_yaml<double>("inf"); }));
    assert(throws<type_error_t>([] { parse_yaml<double>("nan"); }));

    assert(to_yaml(1.5) == "1.5");
    assert(to_yaml(std::numeric_limits<double>::infinity()) == ".inf");
    assert(to_yaml(-std::numeric_limits<double>::infinity()) == "-.inf");
    assert(to_yaml(std::numeric_limits<double>::quiet_NaN()) == ".nan");

    std::cout << "PASSED\n";
}

void test_plain_and_quoted_strings() {
    std::cout << "Testing plain and quoted strings... ";

    assert(parse_yaml<std::string>("hello world") == "hello world");
    assert(parse_yaml<std::string>("a # zz") == "a");
    assert(parse_yaml<std::string>("abc #") == "abc");
    assert(parse_yaml<std::string>("abc#") == "abc#");
    assert(parse_yaml<std::string>("a:b") == "a:b");
    assert(parse_yaml<std::string>("\"a\\tb\\u00e9\"") == "a\tb\xc3\xa9");
    assert(parse_yaml<std::string>("'no \\n escapes'") == "no \\n escapes");
    assert(parse_yaml<std::string>("\"\"").empty());
    assert(parse_yaml<char32_t>("'x'") == U'x');

    std::cout << "PASSED\n";
}

void test_block_scalars() {
    std::cout << "Testing block scalars and chomping... ";

    assert(parse_yaml<std::string>("|\n  a\n  b\n  \n") == "a\nb\n");
    assert(parse_yaml<std::string>("|-\n  a\n  b\n  \n") == "a\nb");
    assert(parse_yaml<std::string>("|+\n  a\n  b\n  \n") == "a\nb\n\n");
    assert(parse_yaml<std::string>(">\n  a\n  b\n") == "a b\n");
    assert(parse_yaml<std::string>(">\n  a\n\n  b\n") == "a\nb\n");
    assert(parse_yaml<std::string>(">-\n  a\n    indented\n  b\n") == "a\n  indented\nb");
    assert(parse_yaml<std::string>("|2\n   a\n") == " a\n");
    assert(parse_yaml<std::string>("| # comment\n  text\n") == "text\n");

    auto m = parse_yaml<std::map<std::string, std::string>>("a: |\n  x\n  y\nb: z\n");
    assert(m.at("a") == "x\ny\n");
    assert(m.at("b") == "z");

    std::cout << "PASSED\n";
}

void test_block_scalar_blank_lines() {
    std::cout << "Testing whitespace-only lines in block scalars... ";

    // Spaces past the indentation are content, fewer are an empty line
    assert(parse_yaml<std::string>("|-\n  a\n   \n  b\n") == "a\n \nb");
    assert(parse_yaml<std::string>("|\n  a\n    \n") == "a\n  \n");
    assert(parse_yaml<std::string>("|-\n  a\n \n  b\n") == "a\n\nb");
    assert(parse_yaml<std::string>("|-\n  a\n   ") == "a\n ");

    auto samples = std::vector<std::string>{"a\n ", "a\n \nb", "a\n  \n", "x\n\n  \ny\n\n", "p\n\tq\n"};

    for (const auto& text : samples) {
        assert(parse_yaml<std::string>(to_yaml(text)) == text);

        auto list = std::vector<std::string>{text, "end"};
        assert(parse_yaml<std::vector<std::string>>(to_yaml(list)) == list);

        auto map = std::map<std::string, std::string>{{"k", text}, {"z", "end"}};
        assert((parse_yaml<std::map<std::string, std::string>>(to_yaml(map)) == map));
    }

    std::cout << "PASSED\n";
}

void test_tags() {
    std::cout << "Testing tags... ";

    auto verbatim = yaml_reader_t("!<abc%20def>");
    assert(verbatim.read_tag() == "abc def");

    auto secondary = yaml_reader_t("!!str");
    assert(secondary.read_tag() == "tag:yaml.org,2002:str");

    auto options = yaml_options_t();
    options.tag_handles["!e!"] = "tag:example.com,2000:app/";
    auto named = yaml_reader_t("!e!tag%21", options);
    assert(named.read_tag() == "tag:example.com,2000:app/tag!");

    auto unknown = yaml_reader_t("!x!foo");
    assert(throws<syntax_error_t>([&] { unknown.read_tag(); }));

    auto local = yaml_reader_t("!local");
    assert(local.read_tag() == "local");

    auto bare = yaml_reader_t("! a");
    assert(bare.read_tag() == "!");

    // Tags on nodes are read and ignored
    assert(parse_yaml<int>("!!int 5") == 5);
    assert(parse_yaml<std::string>("%TAG !e! tag:e.com:\n--- !e!x hello\n...\n") == "hello");
    assert(parse_yaml<std::vector<int>>("!!seq [1, 2]") == (std::vector<int>{1, 2}));

    std::cout << "PASSED\n";
}

// =============================================================================
// Collections
// =============================================================================

void test_block_collections() {
    std::cout << "Testing block collections... ";

    assert(parse_yaml<std::vector<int>>("- 1\n- 2\n- 3\n") == (std::vector<int>{1, 2, 3}));

    auto nested = parse_yaml<std::vector<std::vector<int>>>("- - 1\n  - 2\n- []\n-\n  - 3\n");
    assert(nested == (std::vector<std::vector<int>>{{1, 2}, {}, {3}}));

    auto m = parse_yaml<std::map<std::string, std::vector<int>>>(
        "# leading comment\n"
        "odd:\n"
        "- 1\n"
        "- 3\n"
        "even:\n"
        "  - 2   # trailing comment\n");
    assert(m.at("odd") == (std::vector<int>{1, 3}));
    assert(m.at("even") == (std::vector<int>{2}));

    std::cout << "PASSED\n";
}

void test_document_markers() {
    std::cout << "Testing document markers after block collections... ";

    auto map = parse_yaml<any_value_t>("a: 1\n...\n");
    assert(map.as_map().size() == 1);
    assert(map.as_map().at("a").as_int64() == 1);

    assert(parse_yaml<std::vector<int>>("- 1\n- 2\n...\n") == (std::vector<int>{1, 2}));

    auto nested = parse_yaml<std::map<std::string, std::map<std::string, int>>>("---\nouter:\n  inner: 1\n...");
    assert(nested.at("outer").at("inner") == 1);

    auto items = parse_yaml<std::map<std::string, std::vector<int>>>("xs:\n- 1\n- 2\n...\n# done\n");
    assert(items.at("xs").size() == 2);

    // A key may start with dots; only a marker at column 0 ends the mapping
    assert((parse_yaml<std::map<std::string, int>>("a: 1\n...b: 2\n").at("...b") == 2));

    // A second document is not read
    assert(throws<syntax_error_t>([] { parse_yaml<std::map<std::string, int>>("a: 1\n---\nb: 2\n"); }));

    std::cout << "PASSED\n";
}

void test_example_config() {
    std::cout << "Testing the config-reader sample document... ";

    auto file = std::ifstream(SERDE_SOURCE_DIR "/examples/config-reader/config.yaml");
    assert(file);

    auto config = any_value_t();
    from_yaml(config, file);
    const auto& root = config.as_map();

    assert(root.at("title").as_string() == "Blast wave");
    assert(root.at("description").as_string() ==
        "Spherical blast wave in a periodic box,\ndriven by a single shell source.\n");
    assert(root.at("max_iter").as_int64() == 10000);
    assert(root.at("mesh").as_map().at("resolution").as_seq().size() == 3);
    assert(root.at("mesh").as_map().at("boundary_hi").as_map().at("value").as_double() == 0.5);
    assert(root.at("physics").as_map().at("diffusion_coeffs").as_seq()[1].as_double() == 0.002);

    const auto& sources = root.at("sources").as_seq();
    assert(sources.size() == 2);
    assert(sources[0].as_map().at("kind").as_string() == "shell");
    assert(sources[1].as_map().at("amplitude").as_double() == 2.0);

    assert(root.at("output").as_map().at("timeseries").as_map().at("total_energy").as_double() == 0.01);

    std::cout << "PASSED\n";
}

void test_flow_collections() {
    std::cout << "Testing flow collections... ";

    assert(parse_yaml<std::vector<std::string>>("[a, b c, 'd,e']") ==
        (std::vector<std::string>{"a", "b c", "d,e"}));

    auto m = parse_yaml<std::map<std::string, int>>("{a: 1, b: 2,}");
    assert(m.size() == 2);
    assert(m.at("b") == 2);

    auto mixed = parse_yaml<std::map<std::string, std::vector<int>>>("{x: [1, 2], y: []}");
    assert(mixed.at("x").size() == 2);
    assert(mixed.at("y").empty());

    std::cout << "PASSED\n";
}

void test_read_any() {
    std::cout << "Testing read_any... ";

    auto value = read_any_yaml(
        "a: 1\n"
        "b: [x, 2.5]\n"
        "c:\n"
        "  - true\n"
        "  - ~\n"
        "d: \"12\"\n"
        "e: 1.0\n");

    auto expected = any_value_t(any_map_t{
        {"a", 1},
        {"b", any_seq_t{"x", 2.5}},
        {"c", any_seq_t{true, nullptr}},
        {"d", "12"},
        {"e", 1.0},
    });
    assert(value == expected);
    assert(value.as_map().at("a").holds<std::int8_t>());
    assert(value.as_map().at("e").holds<double>());

    assert(read_any_yaml("40000").holds<std::int32_t>());
    assert(read_any_yaml("18446744073709551615").holds<std::uint64_t>());
    assert(read_any_yaml("null").is_null());
    assert(read_any_yaml("").is_null());

    std::cout << "PASSED\n";
}

void test_errors() {
    std::cout << "Testing error reporting... ";

    assert(throws<syntax_error_t>([] { parse_yaml<std::map<std::string, int>>("a: 1\n  b: 2\n"); }));
    assert(throws<syntax_error_t>([] { parse_yaml<std::vector<int>>("- 1\n - 2\n"); }));
    assert(throws<type_error_t>([] { parse_yaml<std::vector<int>>("a: 1"); }));
    assert(throws<type_error_t>([] { parse_yaml<std::map<std::string, int>>("- 1"); }));
    assert(throws<syntax_error_t>([] { parse_yaml<int>("1\n2"); }));
    assert(throws<unexpected_end_t>([] { parse_yaml<std::string>("'open"); }));

    try {
        parse_yaml<std::map<std::string, int>>("a: 1\nb: x\n");
        assert(false);
    } catch (const type_error_t& e) {
        assert(std::string(e.what()).find("line 2") != std::string::npos);
    }

    std::cout << "PASSED\n";
}

// =============================================================================
// Writer
// =============================================================================

void test_write_scalars() {
    std::cout << "Testing scalar output... ";

    assert(to_yaml(std::string("plain text")) == "plain text");
    assert(to_yaml(std::string()) == "\"\"");
    assert(to_yaml(std::string("true")) == "\"true\"");
    assert(to_yaml(std::string("12")) == "\"12\"");
    assert(to_yaml(std::string("a: b")) == "\"a: b\"");
    assert(to_yaml(std::string("- x")) == "\"- x\"");
    assert(to_yaml(std::string("tab\there")) == "\"tab\\there\"");
    assert(to_yaml(U'x') == "'x'");
    assert(to_yaml(U'\'') == "\"'\"");
    assert(to_yaml(std::optional<int>()) == "null");

    std::cout << "PASSED\n";
}

void test_write_record() {
    std::cout << "Testing record output... ";

    auto s = service_t();
    s.host = "localhost";
    s.port = 8080;
    s.tags = {"a", "b"};
    s.note = "line1\nline2\n";
    s.pair = {1, "one"};

    auto text = to_yaml(s);
    assert(text ==
        "host: localhost\n"
        "port: 8080\n"
        "tags:\n"
        "  - a\n"
        "  - b\n"
        "weights: {}\n"
        "note: |\n"
        "  line1\n"
        "  line2\n"
        "limits: null\n"
        "pair: [1, one]");

    auto loaded = parse_yaml<service_t>(text);
    assert(loaded.host == "localhost");
    assert(loaded.port == 8080);
    assert(loaded.tags == s.tags);
    assert(loaded.weights.empty());
    assert(loaded.note == s.note);
    assert(!loaded.limits);
    assert(loaded.pair == s.pair);

    std::cout << "PASSED\n";
}

void test_write_nested() {
    std::cout << "Testing nested output round trips... ";

    auto nested = std::vector<std::vector<int>>{{1, 2}, {}, {3}};
    auto text = to_yaml(nested);
    assert(text == "- - 1\n  - 2\n- []\n- - 3");
    assert(parse_yaml<std::vector<std::vector<int>>>(text) == nested);

    auto services = std::vector<service_t>(2);
    services[0].host = "a";
    services[0].limits = limits_t{10, 0.5};
    services[0].weights = {{"x", 1}, {"y", 2}};
    services[1].host = "b";
    services[1].note = "first\n  second";

    auto loaded = parse_yaml<std::vector<service_t>>(to_yaml(services));
    assert(loaded.size() == 2);
    assert(loaded[0].limits && loaded[0].limits->connections == 10);
    assert(loaded[0].limits->rate == 0.5);
    assert(loaded[0].weights == services[0].weights);
    assert(loaded[1].host == "b");
    assert(loaded[1].note == "first\n  second");

    auto keyed = std::map<int, std::string>{{80, "http"}, {443, "https"}};
    assert(to_yaml(keyed) == "80: http\n443: https");
    assert((parse_yaml<std::map<int, std::string>>(to_yaml(keyed)) == keyed));

    auto strings = std::vector<std::string>{"", " lead", "multi\nline", "#hash"};
    assert(parse_yaml<std::vector<std::string>>(to_yaml(strings)) == strings);

    std::cout << "PASSED\n";
}

void test_non_scalar_keys() {
    std::cout << "Testing non-scalar keys are rejected... ";

    auto m = std::map<std::vector<int>, int>{{{1}, 2}};
    assert(throws<type_error_t>([&] { to_yaml(m); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Field setter
// =============================================================================

void test_set() {
    std::cout << "Testing set by path... ";

    auto s = service_t();
    s.limits = limits_t();

    set(s, "host", "example.org");
    set(s, "port", "0x50");
    set(s, "tags", "[x, y]");
    set(s, "limits.rate", "2.5");
    set(s, "note", "'quoted # text'");

    assert(s.host == "example.org");
    assert(s.port == 80);
    assert(s.tags == (std::vector<std::string>{"x", "y"}));
    assert(s.limits->rate == 2.5);
    assert(s.note == "quoted # text");

    assert(throws<serde::error_t>([&] { set(s, "missing", "1"); }));
    assert(throws<type_error_t>([&] { set(s, "port", "eighty"); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== YAML Scalars ===\n\n";

    test_booleans();
    test_integers();
    test_floats();
    test_plain_and_quoted_strings();
    test_block_scalars();
    test_block_scalar_blank_lines();
    test_tags();

    std::cout << "\n=== YAML Collections ===\n\n";

    test_block_collections();
    test_flow_collections();
    test_document_markers();
    test_example_config();
    test_read_any();
    test_errors();

    std::cout << "\n=== YAML Writer ===\n\n";

    test_write_scalars();
    test_write_record();
    test_write_nested();
    test_non_scalar_keys();

    std::cout << "\n=== Field Setter ===\n\n";

    test_set();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
