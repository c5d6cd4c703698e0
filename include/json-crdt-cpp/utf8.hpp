/// @file utf8.hpp
/// @brief UTF-8 helpers: code point counting, offsets, validation.
///
/// String nodes count items in Unicode code points; string insert
/// operations cost their UTF-16 length on the clock.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace json_crdt_cpp::utf8 {

/// Check if a byte starts a code point (is not a continuation byte).
constexpr auto is_lead(char c) noexcept -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
}

/// Number of code points in a valid UTF-8 string.
inline auto length(std::string_view s) noexcept -> std::size_t {
    auto n = std::size_t{0};
    for (auto c : s) {
        if (is_lead(c)) ++n;
    }
    return n;
}

/// Number of UTF-16 code units the string occupies.
inline auto utf16_length(std::string_view s) noexcept -> std::size_t {
    auto n = std::size_t{0};
    for (auto c : s) {
        auto b = static_cast<unsigned char>(c);
        if (!is_lead(c)) continue;
        n += (b >= 0xF0) ? 2 : 1;  // 4-byte sequences need a surrogate pair
    }
    return n;
}

/// Byte offset of the code point at index `cp` (or s.size() past the end).
inline auto offset(std::string_view s, std::size_t cp) noexcept -> std::size_t {
    auto seen = std::size_t{0};
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (!is_lead(s[i])) continue;
        if (seen == cp) return i;
        ++seen;
    }
    return s.size();
}

/// Validate UTF-8: well-formed sequences, no overlongs, no surrogates.
inline auto is_valid(std::string_view s) noexcept -> bool {
    std::size_t i = 0;
    while (i < s.size()) {
        auto b0 = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (b0 < 0x80) { ++i; continue; }
        if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
        else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
        else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
        else return false;
        if (i + len > s.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto b = static_cast<unsigned char>(s[i + k]);
            if ((b & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (b & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

/// Decode a valid UTF-8 string into code points.
inline auto to_code_points(std::string_view s) -> std::u32string {
    auto out = std::u32string{};
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        auto b0 = static_cast<unsigned char>(s[i]);
        std::size_t len = b0 < 0x80 ? 1 : (b0 & 0xE0) == 0xC0 ? 2 : (b0 & 0xF0) == 0xE0 ? 3 : 4;
        std::uint32_t cp = len == 1 ? b0 : len == 2 ? (b0 & 0x1F) : len == 3 ? (b0 & 0x0F) : (b0 & 0x07);
        for (std::size_t k = 1; k < len && i + k < s.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
        }
        out.push_back(static_cast<char32_t>(cp));
        i += len;
    }
    return out;
}

/// Encode code points as UTF-8.
inline auto from_code_points(std::u32string_view cps) -> std::string {
    auto out = std::string{};
    out.reserve(cps.size());
    for (auto c : cps) {
        auto cp = static_cast<std::uint32_t>(c);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

}  // namespace json_crdt_cpp::utf8
