/// @file codec.hpp
/// @brief Patch wire codecs: verbose JSON, compact JSON, compact CBOR and
/// the binary format, plus the PatchBlob wrapper.
///
/// Every decoder rebuilds the op list through a PatchBuilder started at the
/// patch id, so decoded op ids are always contiguous. Decoders throw Error
/// on malformed input.

#pragma once

#include <json-crdt-cpp/patch.hpp>
#include <json-crdt-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace json_crdt_cpp::codec {

/// Self-describing JSON: `{"id": ..., "meta": ..., "ops": [{"op": "ins_str", ...}]}`.
///
/// Ids of the server session are written as plain numbers, all others as
/// `[sid, time]`.
namespace verbose {
auto encode(const Patch& patch) -> nlohmann::json;

/// @throws Error (invalid_patch) if the value does not have the verbose shape.
auto decode(const nlohmann::json& data) -> Patch;
}  // namespace verbose

/// Positional JSON: `[[id, meta?], [opcode, ...], ...]`.
///
/// Ids in the patch's own session are written as their time only.
namespace compact {
auto encode(const Patch& patch) -> nlohmann::json;

/// @throws Error (invalid_patch) if the value does not have the compact shape.
auto decode(const nlohmann::json& data) -> Patch;
}  // namespace compact

/// The compact form serialized as CBOR.
namespace compact_binary {
auto encode(const Patch& patch) -> Bytes;

/// @throws Error (invalid_cbor, trailing_bytes, invalid_patch).
auto decode(std::span<const std::byte> data) -> Patch;
}  // namespace compact_binary

/// The native byte format: varint header, CBOR metadata, one octet
/// `opcode << 3 | length` per op followed by its operands.
namespace binary {
auto encode(const Patch& patch) -> Bytes;

/// @throws Error (overflow, unknown_opcode, invalid_cbor, invalid_utf8,
///         trailing_bytes).
auto decode(std::span<const std::byte> data) -> Patch;
}  // namespace binary

}  // namespace json_crdt_cpp::codec

namespace json_crdt_cpp {

/// A binary patch as received from the wire.
///
/// Bytes that decode cleanly are available as a Patch. Bytes that do not
/// are still accepted and carried as an opaque payload, so a relay can
/// store and forward patches written by newer peers. The one exception is
/// a payload that starts like a JSON object (`{`) and is not valid CBOR,
/// which is rejected.
class PatchBlob {
public:
    /// @throws Error (invalid_cbor) for a structurally invalid payload
    ///         starting with `{`.
    static auto from_binary(std::span<const std::byte> data) -> PatchBlob;

    static auto from_patch(const Patch& patch) -> PatchBlob;

    /// The decoded patch, or nullopt for an opaque payload.
    auto patch() const -> const std::optional<Patch>& { return patch_; }

    auto is_opaque() const -> bool { return !patch_.has_value(); }

    /// The bytes as received (or as encoded, for from_patch).
    auto bytes() const -> const Bytes& { return bytes_; }

private:
    PatchBlob(Bytes bytes, std::optional<Patch> patch)
        : bytes_{std::move(bytes)}, patch_{std::move(patch)} {}

    Bytes bytes_;
    std::optional<Patch> patch_;
};

}  // namespace json_crdt_cpp
