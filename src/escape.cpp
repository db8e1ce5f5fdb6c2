// escape.cpp - backslash escapes, UTF-8 and floating point text

#include "serde/escape.hpp"
#include "serde/error.hpp"
#include "serde/read_buffer.hpp"
#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace serde {

// =============================================================================
// Backslash escapes
// =============================================================================

void backslash_escape(std::string_view text, std::string& out) {
    static const char* hex = "0123456789ABCDEF";

    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if (u < 0x20 || u == 0x7F) {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0xF];
                } else {
                    out += c;
                }
            }
        }
    }
}

auto backslash_escape(std::string_view text) -> std::string {
    auto out = std::string();
    backslash_escape(text, out);
    return out;
}

namespace {

auto read_hex4(read_buffer_t& buffer) -> char32_t {
    char32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        auto c = buffer.get();
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<char32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<char32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<char32_t>(c - 'A' + 10);
        } else {
            buffer.fail("expected hex digit in unicode escape");
        }
    }
    return value;
}

} // namespace

auto read_escaped(read_buffer_t& buffer, char terminator) -> std::string {
    auto out = std::string();

    while (true) {
        auto c = buffer.get();

        if (c == terminator) {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        switch (auto e = buffer.get()) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case '0':  out += '\0'; break;
            case 'u': {
                auto cp = read_hex4(buffer);
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    buffer.expect("\\u");
                    auto low = read_hex4(buffer);
                    if (low < 0xDC00 || low > 0xDFFF) {
                        buffer.fail("invalid low surrogate in unicode escape");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    buffer.fail("unpaired low surrogate in unicode escape");
                }
                append_utf8(out, cp);
                break;
            }
            default:
                buffer.fail(std::string("invalid escape sequence '\\") + e + "'");
        }
    }
}

// =============================================================================
// UTF-8
// =============================================================================

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        throw type_error_t("code point out of range: " + std::to_string(static_cast<std::uint32_t>(cp)));
    }
}

auto decode_utf8(std::string_view text, std::size_t& pos) -> char32_t {
    if (pos >= text.size()) {
        throw type_error_t("expected a code point, found end of string");
    }
    auto lead = static_cast<unsigned char>(text[pos]);
    auto length = std::size_t(0);
    auto cp = char32_t(0);

    if (lead < 0x80) {
        length = 1;
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        throw type_error_t("invalid UTF-8 lead byte");
    }
    if (pos + length > text.size()) {
        throw type_error_t("truncated UTF-8 sequence");
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            throw type_error_t("invalid UTF-8 continuation byte");
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    pos += length;
    return cp;
}

auto single_code_point(std::string_view text) -> char32_t {
    auto pos = std::size_t(0);
    auto cp = decode_utf8(text, pos);
    if (pos != text.size()) {
        throw type_error_t("expected a single character, found '" + std::string(text) + "'");
    }
    return cp;
}

// =============================================================================
// Floating point text
// =============================================================================

namespace {

template <typename T>
auto format_shortest(T value) -> std::string {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        throw error_t("could not format floating point value");
    }
    return std::string(buffer, end);
}

template <typename T>
auto parse_token(std::string_view token, T& value) -> bool {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return false;
    }
    auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    return ec == std::errc() && end == token.data() + token.size();
}

} // namespace

auto format_float(double value, int width) -> std::string {
    if (width == 4) {
        return format_shortest(static_cast<float>(value));
    }
    return format_shortest(value);
}

auto format_real(long double value) -> std::string {
    return format_shortest(value);
}

auto parse_float(std::string_view token, double& value) -> bool {
    return parse_token(token, value);
}

auto parse_real(std::string_view token, long double& value) -> bool {
    return parse_token(token, value);
}

} // namespace serde
