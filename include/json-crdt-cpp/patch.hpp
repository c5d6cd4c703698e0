/// @file patch.hpp
/// @brief Patch: an ordered, replayable log of operations.

#pragma once

#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace json_crdt_cpp {

/// An ordered sequence of operations, plus optional opaque metadata.
///
/// Consecutive ops of one session have contiguous ids: op i + 1 starts
/// where op i's span ends. A patch is identified by the id of its first op.
struct Patch {
    std::vector<Op> ops;                   ///< Operations in application order.
    std::optional<nlohmann::json> meta{};  ///< Opaque user metadata.

    /// Id of the first op, or nullopt for an empty patch.
    auto get_id() const -> std::optional<Timestamp>;

    /// Total clock ticks consumed, measured from the first op to the end
    /// of the last.
    auto span() const -> std::uint64_t;

    /// First time after the patch, or 0 for an empty patch.
    auto next_time() const -> std::uint64_t;

    /// Copy of this patch with every id passed through `fn`.
    auto rewrite_time(const std::function<Timestamp(Timestamp)>& fn) const -> Patch;

    /// Move the patch's own session ids so that it starts at `new_time`.
    ///
    /// Only ids of the patch's session at or after `transform_after`
    /// (default: the patch start) shift; references to earlier state are
    /// kept. Used when a server assigns the final position of a patch.
    auto rebase(std::uint64_t new_time,
                std::optional<std::uint64_t> transform_after = std::nullopt) const -> Patch;

    auto operator==(const Patch&) const -> bool = default;
};

/// Multi-line human readable form: a header `Patch <id>!<span>` followed
/// by one indented line per op.
auto to_string(const Patch& patch) -> std::string;

}  // namespace json_crdt_cpp
