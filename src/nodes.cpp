#include <json-crdt-cpp/nodes.hpp>

#include <algorithm>

namespace json_crdt_cpp {

auto ValNode::set(Timestamp child) -> bool {
    if (child <= value) return false;
    value = child;
    return true;
}

auto RootNode::set(Timestamp child) -> bool {
    if (child <= value) return false;
    value = child;
    return true;
}

// -- ObjNode ------------------------------------------------------------------

auto ObjNode::put(const std::string& key, Timestamp child) -> bool {
    auto it = std::ranges::find(entries, key, &std::pair<std::string, Timestamp>::first);
    if (it == entries.end()) {
        entries.emplace_back(key, child);
        return true;
    }
    if (child <= it->second) return false;
    it->second = child;
    return true;
}

auto ObjNode::get(std::string_view key) const -> std::optional<Timestamp> {
    for (const auto& [k, v] : entries) {
        if (k == key) return v;
    }
    return std::nullopt;
}

// -- VecNode ------------------------------------------------------------------

auto VecNode::put(std::uint64_t index, Timestamp child) -> bool {
    if (index >= elements.size()) elements.resize(static_cast<std::size_t>(index) + 1);
    auto& slot = elements[static_cast<std::size_t>(index)];
    if (slot && child <= *slot) return false;
    slot = child;
    return true;
}

auto VecNode::get(std::size_t index) const -> std::optional<Timestamp> {
    if (index >= elements.size()) return std::nullopt;
    return elements[index];
}

// -- Sequence nodes -----------------------------------------------------------

auto StrNode::view() const -> std::string {
    auto result = std::string{};
    for (const auto& c : rga.iter_live()) result += *c.data;
    return result;
}

auto BinNode::view() const -> Bytes {
    auto result = Bytes{};
    for (const auto& c : rga.iter_live()) {
        result.insert(result.end(), c.data->begin(), c.data->end());
    }
    return result;
}

auto ArrNode::upd(Timestamp ref, Timestamp child) -> bool {
    auto loc = rga.locate(ref);
    if (!loc) return false;
    auto& chunk = rga.at(loc->first);
    if (chunk.deleted || !chunk.data) return false;
    auto& slot = (*chunk.data)[static_cast<std::size_t>(loc->second)];
    if (child <= slot) return false;
    slot = child;
    return true;
}

auto ArrNode::find_data_at(std::uint64_t pos) const -> std::optional<Timestamp> {
    for (const auto& c : rga.iter_live()) {
        if (pos < c.span) return (*c.data)[static_cast<std::size_t>(pos)];
        pos -= c.span;
    }
    return std::nullopt;
}

auto ArrNode::get_data_ts(Timestamp ref) const -> std::optional<Timestamp> {
    auto loc = rga.locate(ref);
    if (!loc) return std::nullopt;
    const auto& chunk = rga.at(loc->first);
    if (chunk.deleted || !chunk.data) return std::nullopt;
    return (*chunk.data)[static_cast<std::size_t>(loc->second)];
}

auto ArrNode::values() const -> std::vector<Timestamp> {
    auto result = std::vector<Timestamp>{};
    for (const auto& c : rga.iter_live()) {
        result.insert(result.end(), c.data->begin(), c.data->end());
    }
    return result;
}

// -- Node helpers -------------------------------------------------------------

auto node_id(const Node& node) -> Timestamp {
    return std::visit([](const auto& n) { return n.id; }, node);
}

auto node_kind(const Node& node) -> NodeKind {
    return static_cast<NodeKind>(node.index());
}

auto child_ids(const Node& node) -> std::vector<Timestamp> {
    return std::visit(overload{
        [](const ConNode&) { return std::vector<Timestamp>{}; },
        [](const ValNode& n) {
            return n.value == origin ? std::vector<Timestamp>{} : std::vector<Timestamp>{n.value};
        },
        [](const ObjNode& n) {
            auto ids = std::vector<Timestamp>{};
            for (const auto& [k, v] : n.entries) ids.push_back(v);
            return ids;
        },
        [](const VecNode& n) {
            auto ids = std::vector<Timestamp>{};
            for (const auto& slot : n.elements) {
                if (slot) ids.push_back(*slot);
            }
            return ids;
        },
        [](const StrNode&) { return std::vector<Timestamp>{}; },
        [](const BinNode&) { return std::vector<Timestamp>{}; },
        [](const ArrNode& n) { return n.values(); },
    }, node);
}

}  // namespace json_crdt_cpp
