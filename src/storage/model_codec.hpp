#pragma once

// Binary document format.
//
// Logical clock:
//   u32 big-endian size of the root region
//   root region: 0x00 for an undefined root, otherwise one node
//   clock table
//
// Server clock:
//   0x80, vu57 time, then the root region. Ids are vu57 times of
//   session::server; time 0 is origin.
//
// Node: id, then octet `major << 5 | minor` (minor 31: vu57 length follows).
// Internal header — not installed.

#include "../model_state.hpp"

#include <json-crdt-cpp/value.hpp>

#include <cstddef>
#include <memory>
#include <span>

namespace json_crdt_cpp::storage {

auto encode_model(const detail::ModelState& state) -> Bytes;

/// @throws Error (invalid_model, invalid_clock_table, invalid_cbor,
///         invalid_utf8, trailing_bytes) on malformed input.
auto decode_model(std::span<const std::byte> data) -> std::unique_ptr<detail::ModelState>;

}  // namespace json_crdt_cpp::storage
