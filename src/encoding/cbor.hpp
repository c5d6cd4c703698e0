#pragma once

// CBOR framing for constant payloads, object keys and patch metadata.
// Values are encoded and decoded by nlohmann::json; this header finds the
// extent of a single item inside a longer buffer and handles the CBOR
// `undefined` simple value, which nlohmann::json does not model.
// Internal header — not installed.

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace json_crdt_cpp::encoding {

inline constexpr std::byte cbor_undefined{0xF7};

namespace detail {

// Read the argument of a CBOR header starting at `pos`. Advances `pos`.
inline auto read_cbor_argument(std::span<const std::byte> input, std::size_t& pos,
                               std::uint8_t info) -> std::optional<std::uint64_t> {
    if (info < 24) return info;
    std::size_t n = 0;
    switch (info) {
        case 24: n = 1; break;
        case 25: n = 2; break;
        case 26: n = 4; break;
        case 27: n = 8; break;
        default: return std::nullopt;
    }
    if (pos + n > input.size()) return std::nullopt;
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < n; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(input[pos + i]);
    }
    pos += n;
    return value;
}

inline auto skip_cbor_item(std::span<const std::byte> input, std::size_t& pos, int depth) -> bool {
    if (depth > 256 || pos >= input.size()) return false;
    const auto initial = static_cast<std::uint8_t>(input[pos++]);
    const auto major = static_cast<std::uint8_t>(initial >> 5);
    const auto info = static_cast<std::uint8_t>(initial & 0x1F);

    if (info == 31) {
        // Indefinite length: strings, arrays and maps run until a break byte.
        if (major < 2 || major > 5) return false;
        while (true) {
            if (pos >= input.size()) return false;
            if (input[pos] == std::byte{0xFF}) {
                ++pos;
                return true;
            }
            if (major == 2 || major == 3) {
                const auto chunk = static_cast<std::uint8_t>(input[pos]);
                if ((chunk >> 5) != major || (chunk & 0x1F) == 31) return false;
            }
            if (!skip_cbor_item(input, pos, depth + 1)) return false;
            if (major == 5 && !skip_cbor_item(input, pos, depth + 1)) return false;
        }
    }

    auto arg = read_cbor_argument(input, pos, info);
    if (!arg) return false;

    switch (major) {
        case 0:
        case 1:
            return true;
        case 2:
        case 3:
            if (*arg > input.size() - pos) return false;
            pos += static_cast<std::size_t>(*arg);
            return true;
        case 4:
            for (std::uint64_t i = 0; i < *arg; ++i) {
                if (!skip_cbor_item(input, pos, depth + 1)) return false;
            }
            return true;
        case 5:
            for (std::uint64_t i = 0; i < *arg; ++i) {
                if (!skip_cbor_item(input, pos, depth + 1)) return false;
                if (!skip_cbor_item(input, pos, depth + 1)) return false;
            }
            return true;
        case 6:
            return skip_cbor_item(input, pos, depth + 1);
        default:
            // Simple values and floats carry no payload beyond the argument.
            return true;
    }
}

}  // namespace detail

// Size in bytes of the CBOR item at the start of `input`, or nullopt if it
// is malformed or truncated.
inline auto cbor_item_size(std::span<const std::byte> input) -> std::optional<std::size_t> {
    auto pos = std::size_t{0};
    if (!detail::skip_cbor_item(input, pos, 0)) return std::nullopt;
    return pos;
}

// One decoded CBOR item. An empty `value` is the undefined simple value.
struct CborDecodeResult {
    std::optional<nlohmann::json> value;
    std::size_t bytes_read;
};

// Decode the CBOR item at the start of `input`.
// Returns nullopt if the item is malformed, truncated or not representable.
inline auto decode_cbor(std::span<const std::byte> input) -> std::optional<CborDecodeResult> {
    if (input.empty()) return std::nullopt;
    if (input[0] == cbor_undefined) {
        return CborDecodeResult{.value = std::nullopt, .bytes_read = 1};
    }
    auto size = cbor_item_size(input);
    if (!size) return std::nullopt;
    const auto* first = reinterpret_cast<const std::uint8_t*>(input.data());
    auto value = nlohmann::json::from_cbor(first, first + *size, true, false,
                                           nlohmann::json::cbor_tag_handler_t::ignore);
    if (value.is_discarded()) return std::nullopt;
    return CborDecodeResult{.value = std::move(value), .bytes_read = *size};
}

// Append the CBOR encoding of `value`.
inline void encode_cbor(const nlohmann::json& value, std::vector<std::byte>& output) {
    const auto bytes = nlohmann::json::to_cbor(value);
    for (auto b : bytes) output.push_back(static_cast<std::byte>(b));
}

// Append the CBOR undefined simple value.
inline void encode_cbor_undefined(std::vector<std::byte>& output) {
    output.push_back(cbor_undefined);
}

}  // namespace json_crdt_cpp::encoding
