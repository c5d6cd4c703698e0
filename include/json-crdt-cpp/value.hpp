/// @file value.hpp
/// @brief Constant payloads: Undefined, ConValue, Bytes, and the visitor helper.

#pragma once

#include <json-crdt-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <variant>
#include <vector>

namespace json_crdt_cpp {

/// The "undefined" constant. Written to an object key, it deletes the key.
struct Undefined {
    auto operator<=>(const Undefined&) const = default;
    auto operator==(const Undefined&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// The payload of a constant node.
///
/// Alternatives: Undefined, any nlohmann::json value, or a reference to
/// another node by its Timestamp.
using ConValue = std::variant<Undefined, nlohmann::json, Timestamp>;

/// Check if a ConValue is the undefined marker.
inline auto is_undefined(const ConValue& v) -> bool {
    return std::holds_alternative<Undefined>(v);
}

/// Convert Bytes to the binary representation nlohmann::json uses.
inline auto to_json_binary(const Bytes& bytes) -> nlohmann::json {
    auto raw = nlohmann::json::binary_t::container_type{};
    raw.reserve(bytes.size());
    for (auto b : bytes) raw.push_back(static_cast<std::uint8_t>(b));
    return nlohmann::json::binary(std::move(raw));
}

/// Extract Bytes from a binary nlohmann::json value.
inline auto from_json_binary(const nlohmann::json& j) -> Bytes {
    auto result = Bytes{};
    const auto& raw = j.get_binary();
    result.reserve(raw.size());
    for (auto b : raw) result.push_back(static_cast<std::byte>(b));
    return result;
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const NewStr& op) { ... },
///     [](const auto&) { ... },
/// }, op);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace json_crdt_cpp
