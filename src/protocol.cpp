// protocol.cpp - map key parsing for the generic protocol

#include "serde/protocol.hpp"
#include <cctype>
#include <limits>

namespace serde::detail {

namespace {

auto lower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

// The JSON key writer spells booleans true/false; YAML also allows yes/no
auto parse_bool_key(const std::string& text) -> bool {
    auto word = lower(text);

    if (word == "true" || word == "yes") {
        return true;
    }
    if (word == "false" || word == "no") {
        return false;
    }
    throw type_error_t("expected boolean map key, found '" + text + "'");
}

// Decimal text, or one of the non-finite spellings of either format
auto parse_float_key(const std::string& text) -> long double {
    auto word = lower(text);

    if (word == ".inf" || word == "+.inf" || word == "+inf" || word == "+infinity") {
        return std::numeric_limits<long double>::infinity();
    }
    if (word == "-.inf") {
        return -std::numeric_limits<long double>::infinity();
    }
    if (word == ".nan") {
        return std::numeric_limits<long double>::quiet_NaN();
    }
    auto result = 0.0L;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);

    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        throw type_error_t("expected number map key, found '" + text + "'");
    }
    return result;
}

} // namespace serde::detail
