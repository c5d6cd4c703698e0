/// @file diff.hpp
/// @brief JsonCrdtDiff: compute the patch that turns a model's view into
/// a target JSON value.

#pragma once

#include <json-crdt-cpp/model.hpp>
#include <json-crdt-cpp/patch.hpp>
#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace json_crdt_cpp {

/// Computes a patch that, applied to the model, makes its view equal `dst`.
///
/// The walk follows the live node graph so that unchanged subtrees keep
/// their ids. Per node, in order:
///   - strings and binary blobs: one insert for the changed middle plus
///     one delete, found by common prefix and suffix;
///   - arrays: in-place register writes when only register slots changed,
///     then in-place recursion when only same-kind containers changed,
///     then element inserts and deletes;
///   - vectors: per-index writes;
///   - objects: changed keys recurse, removed keys are written undefined;
///   - anything else is replaced through its parent.
///
/// Ids are allocated from the model's clock; apply the result to the same
/// model (or a replica at the same state).
///
/// @code
/// auto patch = JsonCrdtDiff{model}.diff({{"a", 1}, {"b", 2}});
/// if (patch) model.apply_patch(*patch);
/// @endcode
class JsonCrdtDiff {
public:
    explicit JsonCrdtDiff(const Model& model);

    /// The patch reaching `dst`, or nullopt if the view already equals it.
    auto diff(const nlohmann::json& dst) -> std::optional<Patch>;

    /// Like diff(), but only the keys present in the object `dst` are
    /// changed; other keys of the current root object are kept. A
    /// non-object `dst` is diffed as a whole.
    auto diff_dst_keys(const nlohmann::json& dst) -> std::optional<Patch>;

private:
    auto diff_node(Timestamp id, const nlohmann::json& dst) -> bool;
    auto diff_val(Timestamp id, const ValNode& node, const nlohmann::json& dst) -> bool;
    auto diff_str(Timestamp id, const StrNode& node, const nlohmann::json& dst) -> bool;
    auto diff_bin(Timestamp id, const BinNode& node, const nlohmann::json& dst) -> bool;
    auto diff_arr(Timestamp id, const ArrNode& node, const nlohmann::json& dst) -> bool;
    auto diff_vec(Timestamp id, const VecNode& node, const nlohmann::json& dst) -> bool;
    auto diff_obj(Timestamp id, const ObjNode& node, const nlohmann::json& dst) -> bool;

    /// Check if node `id` can be diffed in place towards `dst`.
    auto same_shape(Timestamp id, const nlohmann::json& dst) const -> bool;

    /// Emit a fresh node for an array element; scalars get a register.
    auto array_element(const nlohmann::json& value) -> Timestamp;

    const Model& model_;
    PatchBuilder builder_;
    std::set<Timestamp> path_;
};

}  // namespace json_crdt_cpp
