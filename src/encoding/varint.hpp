#pragma once

// vu57 and b1vu56 variable-length integers.
// Used for lengths, spans, session ids and time deltas in every binary
// format of the library.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace json_crdt_cpp::encoding {

inline constexpr std::uint64_t vu57_max = (std::uint64_t{1} << 57) - 1;
inline constexpr std::uint64_t b1vu56_max = (std::uint64_t{1} << 56) - 1;

// -- vu57 ---------------------------------------------------------------------
//
// Up to seven bytes of 7 bits each, low bits first, continuation in the top
// bit; an eighth byte, if reached, carries 8 bits and has no continuation.

// Encode a value of at most 57 bits, appending bytes to output.
inline void encode_vu57(std::uint64_t value, std::vector<std::byte>& output) {
    for (int i = 0; i < 7; ++i) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value == 0) {
            output.push_back(byte);
            return;
        }
        output.push_back(byte | std::byte{0x80});  // more bytes follow
    }
    output.push_back(static_cast<std::byte>(value & 0xFF));
}

// Encode a value of at most 57 bits, returning the bytes.
inline auto encode_vu57(std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_vu57(value, result);
    return result;
}

// Result of a decode operation: decoded value + number of bytes consumed.
struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode a vu57 value from a byte span.
// Returns nullopt if the input is truncated.
inline auto decode_vu57(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < 7; ++i) {
        if (i >= input.size()) return std::nullopt;  // truncated input
        auto byte = static_cast<std::uint64_t>(input[i]);
        value |= (byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }
    if (input.size() < 8) return std::nullopt;
    value |= static_cast<std::uint64_t>(input[7]) << 49;
    return DecodeResult{.value = value, .bytes_read = 8};
}

// -- b1vu56 -------------------------------------------------------------------
//
// First byte: flag in bit 7, continuation in bit 6, low 6 value bits.
// Then up to six bytes of 7 bits with continuation, then a final byte
// carrying 8 bits.

// Encode a flag and a value of at most 56 bits, appending bytes to output.
inline void encode_b1vu56(bool flag, std::uint64_t value, std::vector<std::byte>& output) {
    auto first = static_cast<std::uint8_t>((flag ? 0x80 : 0x00) | (value & 0x3F));
    value >>= 6;
    if (value == 0) {
        output.push_back(static_cast<std::byte>(first));
        return;
    }
    output.push_back(static_cast<std::byte>(first | 0x40));
    for (int i = 0; i < 6; ++i) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value == 0) {
            output.push_back(byte);
            return;
        }
        output.push_back(byte | std::byte{0x80});
    }
    output.push_back(static_cast<std::byte>(value & 0xFF));
}

inline auto encode_b1vu56(bool flag, std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_b1vu56(flag, value, result);
    return result;
}

// Result of a b1vu56 decode: flag, value and bytes consumed.
struct FlaggedDecodeResult {
    bool flag;
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode a b1vu56 value from a byte span.
// Returns nullopt if the input is truncated.
inline auto decode_b1vu56(std::span<const std::byte> input) -> std::optional<FlaggedDecodeResult> {
    if (input.empty()) return std::nullopt;
    auto first = static_cast<std::uint64_t>(input[0]);
    const bool flag = (first & 0x80) != 0;
    auto value = first & 0x3F;
    if ((first & 0x40) == 0) {
        return FlaggedDecodeResult{.flag = flag, .value = value, .bytes_read = 1};
    }
    auto shift = 6u;
    for (std::size_t i = 1; i <= 6; ++i) {
        if (i >= input.size()) return std::nullopt;
        auto byte = static_cast<std::uint64_t>(input[i]);
        value |= (byte & 0x7F) << shift;
        shift += 7;
        if ((byte & 0x80) == 0) {
            return FlaggedDecodeResult{.flag = flag, .value = value, .bytes_read = i + 1};
        }
    }
    if (input.size() < 8) return std::nullopt;
    value |= static_cast<std::uint64_t>(input[7]) << 48;
    return FlaggedDecodeResult{.flag = flag, .value = value, .bytes_read = 8};
}

}  // namespace json_crdt_cpp::encoding
