/// @file nodes.hpp
/// @brief The CRDT node model: constant, register, map, vector and the
/// three RGA-backed sequence nodes.

#pragma once

#include <json-crdt-cpp/rga.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace json_crdt_cpp {

/// The seven node kinds. Values match the major type of the binary
/// document format.
enum class NodeKind : std::uint8_t {
    con = 0,  ///< Immutable constant.
    val = 1,  ///< Last-write-wins register.
    obj = 2,  ///< Last-write-wins map.
    vec = 3,  ///< Last-write-wins vector.
    str = 4,  ///< RGA of characters.
    bin = 5,  ///< RGA of bytes.
    arr = 6,  ///< RGA of node references.
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::con: return "con";
        case NodeKind::val: return "val";
        case NodeKind::obj: return "obj";
        case NodeKind::vec: return "vec";
        case NodeKind::str: return "str";
        case NodeKind::bin: return "bin";
        case NodeKind::arr: return "arr";
    }
    return "unknown";
}

/// An immutable constant: a JSON value, undefined, or a node reference.
struct ConNode {
    Timestamp id;
    ConValue value{Undefined{}};

    auto operator==(const ConNode&) const -> bool = default;
};

/// A single-child last-write-wins register.
struct ValNode {
    Timestamp id;
    Timestamp value{origin};  ///< Current child; origin until first written.

    /// Point the register at `child` if it is newer than the current one.
    auto set(Timestamp child) -> bool;

    auto operator==(const ValNode&) const -> bool = default;
};

/// A map from string keys to child ids, last-write-wins per key.
///
/// Entries keep first-insertion order. A key whose winning child is an
/// undefined constant is absent from the view.
struct ObjNode {
    Timestamp id;
    std::vector<std::pair<std::string, Timestamp>> entries;

    /// Write `child` under `key` if it is newer than the current child.
    auto put(const std::string& key, Timestamp child) -> bool;

    auto get(std::string_view key) const -> std::optional<Timestamp>;

    auto operator==(const ObjNode&) const -> bool = default;
};

/// A sparse fixed-index vector of child ids, last-write-wins per index.
struct VecNode {
    Timestamp id;
    std::vector<std::optional<Timestamp>> elements;

    /// Write `child` at `index` if it is newer than the current child.
    auto put(std::uint64_t index, Timestamp child) -> bool;

    auto get(std::size_t index) const -> std::optional<Timestamp>;

    auto operator==(const VecNode&) const -> bool = default;
};

/// Shared behaviour of the RGA-backed nodes.
///
/// Strings count items in code points; the clock span of an ins_str is its
/// UTF-16 length (see op_span).
///
/// An anchor equal to the node's own id means "insert at the head".
template <typename T>
struct SequenceNode {
    Timestamp id;
    Rga<T> rga;

    auto ins(Timestamp after, Timestamp item_id, T data) -> bool {
        auto span = ChunkTraits<T>::length(data);
        auto anchor = (after == id) ? origin : after;
        return rga.insert(anchor, item_id, span, std::move(data));
    }

    void del(std::span<const Timespan> spans) { rga.del(spans); }

    auto size() const -> std::uint64_t { return rga.size(); }
    auto find(std::uint64_t pos) const -> std::optional<Timestamp> { return rga.find(pos); }
    auto find_interval(std::uint64_t pos, std::uint64_t len) const -> std::vector<Timespan> {
        return rga.find_interval(pos, len);
    }
    auto get_by_id(Timestamp item) const -> std::optional<std::size_t> { return rga.find_by_id(item); }

    auto operator==(const SequenceNode&) const -> bool = default;
};

/// A string: RGA of UTF-8 character runs.
struct StrNode : SequenceNode<std::string> {
    /// The live text.
    auto view() const -> std::string;
};

/// A binary blob: RGA of byte runs.
struct BinNode : SequenceNode<Bytes> {
    /// The live bytes.
    auto view() const -> Bytes;
};

/// An array: RGA of child ids.
struct ArrNode : SequenceNode<std::vector<Timestamp>> {
    /// Replace the child held by item `ref` with `child` if it is newer.
    auto upd(Timestamp ref, Timestamp child) -> bool;

    /// Child id held at live position `pos`.
    auto find_data_at(std::uint64_t pos) const -> std::optional<Timestamp>;

    /// Child id held by item `ref`, if that item is live.
    auto get_data_ts(Timestamp ref) const -> std::optional<Timestamp>;

    /// Child ids of all live items, in document order.
    auto values() const -> std::vector<Timestamp>;
};

/// Any node in the document graph.
using Node = std::variant<ConNode, ValNode, ObjNode, VecNode, StrNode, BinNode, ArrNode>;

/// The id a node was created with.
auto node_id(const Node& node) -> Timestamp;

auto node_kind(const Node& node) -> NodeKind;

/// Ids of the nodes this node currently points at (winning entries only).
auto child_ids(const Node& node) -> std::vector<Timestamp>;

/// The document root: a last-write-wins register that starts out undefined.
struct RootNode {
    Timestamp value{origin};

    auto set(Timestamp child) -> bool;

    auto operator==(const RootNode&) const -> bool = default;
};

}  // namespace json_crdt_cpp
