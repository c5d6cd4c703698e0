#pragma once

// Base64 (RFC 4648, padded) for binary payloads inside the JSON codecs.
// Internal header — not installed.

#include <json-crdt-cpp/value.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace json_crdt_cpp::encoding {

inline auto base64_encode(const Bytes& data) -> std::string {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(table[b0 >> 2]);
        result.push_back(table[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? table[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? table[b2 & 0x3F] : '=');
    }
    return result;
}

// Returns nullopt on a length that is not a multiple of 4, a character
// outside the alphabet, or misplaced padding.
inline auto base64_decode(std::string_view encoded) -> std::optional<Bytes> {
    static const auto decode_table = []() {
        std::array<int, 256> t{};
        t.fill(-1);
        constexpr std::string_view chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (std::size_t i = 0; i < chars.size(); ++i) {
            t[static_cast<unsigned char>(chars[i])] = static_cast<int>(i);
        }
        return t;
    }();
    if (encoded.size() % 4 != 0) return std::nullopt;
    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = i + 4 == encoded.size();
        const bool pad2 = encoded[i + 2] == '=';
        const bool pad3 = encoded[i + 3] == '=';
        if ((pad2 || pad3) && !last) return std::nullopt;
        if (pad2 && !pad3) return std::nullopt;
        auto a = decode_table[static_cast<unsigned char>(encoded[i])];
        auto b = decode_table[static_cast<unsigned char>(encoded[i + 1])];
        auto c = pad2 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 2])];
        auto d = pad3 ? 0 : decode_table[static_cast<unsigned char>(encoded[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) return std::nullopt;
        result.push_back(std::byte(static_cast<unsigned char>((a << 2) | (b >> 4))));
        if (!pad2) result.push_back(std::byte(static_cast<unsigned char>(((b & 0x0F) << 4) | (c >> 2))));
        if (!pad3) result.push_back(std::byte(static_cast<unsigned char>(((c & 0x03) << 6) | d)));
    }
    return result;
}

}  // namespace json_crdt_cpp::encoding
