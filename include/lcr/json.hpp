#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <cstring>


namespace lcr {
namespace json {

// ---------------------------------------------------------------------------
// Raw buffer writers
// ---------------------------------------------------------------------------
//
// All writers append at `out` and return the number of bytes written.
// PRECONDITION: the caller reserved enough room (see the *_max_size helpers).
// None of them allocate, throw or null-terminate.
// ---------------------------------------------------------------------------

// Worst case escaped size of a string body (every byte as \u00XX or \ufffd)
[[nodiscard]]
inline constexpr std::size_t escaped_max_size(std::string_view s) noexcept {
    return s.size() * 6;
}

// Copy a literal without its terminating '\0'
template <std::size_t N>
inline std::size_t write_literal(char* out, const char (&lit)[N]) noexcept {
    std::memcpy(out, lit, N - 1);
    return N - 1;
}

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if ill-formed.
// Overlong forms, surrogates and code points above U+10FFFF are ill-formed.
[[nodiscard]]
inline std::size_t utf8_sequence_length(std::string_view s, std::size_t i) noexcept {
    const auto at = [&](std::size_t k) noexcept {
        return static_cast<unsigned char>(s[i + k]);
    };
    const auto tail = [&](std::size_t k) noexcept {
        return (at(k) & 0xC0) == 0x80;
    };
    const unsigned char lead = at(0);
    const std::size_t left = s.size() - i;

    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return (left >= 2 && tail(1)) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (left < 3 || !tail(1) || !tail(2)) {
            return 0;
        }
        if (lead == 0xE0 && at(1) < 0xA0) return 0;   // overlong
        if (lead == 0xED && at(1) > 0x9F) return 0;   // surrogate
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (left < 4 || !tail(1) || !tail(2) || !tail(3)) {
            return 0;
        }
        if (lead == 0xF0 && at(1) < 0x90) return 0;   // overlong
        if (lead == 0xF4 && at(1) > 0x8F) return 0;   // > U+10FFFF
        return 4;
    }
    return 0;
}

// Escape a string body (quotes are NOT written).
// Output is always valid UTF-8: every byte of an ill-formed sequence is
// written as \ufffd.
inline std::size_t write_escaped(char* out, std::string_view s) noexcept {
    static constexpr char hex[] = "0123456789abcdef";
    std::size_t pos = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c >= 0x80) {
            const std::size_t n = utf8_sequence_length(s, i);
            if (n == 0) {
                pos += write_literal(out + pos, "\\ufffd");
                ++i;
            }
            else {
                std::memcpy(out + pos, s.data() + i, n);
                pos += n;
                i += n;
            }
            continue;
        }
        switch (c) {
            case '"':  out[pos++] = '\\'; out[pos++] = '"';  break;
            case '\\': out[pos++] = '\\'; out[pos++] = '\\'; break;
            case '\b': out[pos++] = '\\'; out[pos++] = 'b';  break;
            case '\f': out[pos++] = '\\'; out[pos++] = 'f';  break;
            case '\n': out[pos++] = '\\'; out[pos++] = 'n';  break;
            case '\r': out[pos++] = '\\'; out[pos++] = 'r';  break;
            case '\t': out[pos++] = '\\'; out[pos++] = 't';  break;
            default:
                if (c < 0x20) {
                    out[pos++] = '\\';
                    out[pos++] = 'u';
                    out[pos++] = '0';
                    out[pos++] = '0';
                    out[pos++] = hex[c >> 4];
                    out[pos++] = hex[c & 0x0F];
                }
                else {
                    out[pos++] = static_cast<char>(c);
                }
                break;
        }
        ++i;
    }
    return pos;
}

// Quoted, escaped string
inline std::size_t write_string(char* out, std::string_view s) noexcept {
    std::size_t pos = 0;
    out[pos++] = '"';
    pos += write_escaped(out + pos, s);
    out[pos++] = '"';
    return pos;
}

inline std::size_t write_bool(char* out, bool v) noexcept {
    return v ? write_literal(out, "true") : write_literal(out, "false");
}

inline std::size_t write_null(char* out) noexcept {
    return write_literal(out, "null");
}

// Fast integer → text formatter (at most 20 digits)
inline std::size_t append(char* out, std::uint64_t value) noexcept {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    const std::size_t n = static_cast<std::size_t>(buf + sizeof(buf) - p);
    std::memcpy(out, p, n);
    return n;
}

// Allocating variant (logging / tests)
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    out.append(buf, append(buf, value));
}

// Allocating escape helper
inline std::string escape(std::string_view s) {
    std::string out(escaped_max_size(s), '\0');
    out.resize(write_escaped(out.data(), s));
    return out;
}

} // namespace json
} // namespace lcr
