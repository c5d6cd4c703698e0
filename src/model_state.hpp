#pragma once

// Internal header — not installed. Implementation detail of Model.

#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/logging.hpp>
#include <json-crdt-cpp/nodes.hpp>
#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <utility>
#include <variant>

namespace json_crdt_cpp::detail {

// The complete internal state of a Model: the clock, the flat node index
// and the root register. Every cross-node reference is a Timestamp key
// into `index`.
struct ModelState {
    Clock clock;
    std::map<Timestamp, Node> index;
    RootNode root;

    explicit ModelState(Clock c) : clock{std::move(c)} {}

    auto get(Timestamp id) -> Node* {
        auto it = index.find(id);
        return it != index.end() ? &it->second : nullptr;
    }

    auto get(Timestamp id) const -> const Node* {
        auto it = index.find(id);
        return it != index.end() ? &it->second : nullptr;
    }

    template <typename T>
    auto get_as(Timestamp id) -> T* {
        auto* node = get(id);
        return node ? std::get_if<T>(node) : nullptr;
    }

    template <typename T>
    auto get_as(Timestamp id) const -> const T* {
        const auto* node = get(id);
        return node ? std::get_if<T>(node) : nullptr;
    }

    auto sid() const -> std::uint64_t {
        return std::visit([](const auto& c) { return c.sid(); }, clock);
    }

    auto time() const -> std::uint64_t {
        return std::visit([](const auto& c) { return c.time(); }, clock);
    }

    void observe(Timestamp id, std::uint64_t span) {
        std::visit([&](auto& c) { c.observe(id, span); }, clock);
    }

    // -- Apply ----------------------------------------------------------------

    // Apply one op. Ops against missing or mismatched nodes are skipped;
    // re-applying an op already seen changes nothing.
    void apply(const Op& op) {
        std::visit(overload{
            [&](const NewCon& o) { create(o.id, ConNode{.id = o.id, .value = o.value}); },
            [&](const NewVal& o) { create(o.id, ValNode{.id = o.id}); },
            [&](const NewObj& o) { create(o.id, ObjNode{.id = o.id, .entries = {}}); },
            [&](const NewVec& o) { create(o.id, VecNode{.id = o.id, .elements = {}}); },
            [&](const NewStr& o) { create(o.id, StrNode{{.id = o.id, .rga = {}}}); },
            [&](const NewBin& o) { create(o.id, BinNode{{.id = o.id, .rga = {}}}); },
            [&](const NewArr& o) { create(o.id, ArrNode{{.id = o.id, .rga = {}}}); },
            [&](const InsVal& o) {
                if (o.obj == origin) {
                    root.set(o.val);
                    return;
                }
                if (auto* node = target<ValNode>(op, o.obj)) node->set(o.val);
            },
            [&](const InsObj& o) {
                if (auto* node = target<ObjNode>(op, o.obj)) {
                    for (const auto& [key, child] : o.data) node->put(key, child);
                }
            },
            [&](const InsVec& o) {
                if (auto* node = target<VecNode>(op, o.obj)) {
                    for (const auto& [idx, child] : o.data) node->put(idx, child);
                }
            },
            [&](const InsStr& o) {
                if (auto* node = target<StrNode>(op, o.obj)) node->ins(o.after, o.id, o.data);
            },
            [&](const InsBin& o) {
                if (auto* node = target<BinNode>(op, o.obj)) node->ins(o.after, o.id, o.data);
            },
            [&](const InsArr& o) {
                if (auto* node = target<ArrNode>(op, o.obj)) node->ins(o.after, o.id, o.data);
            },
            [&](const UpdArr& o) {
                if (auto* node = target<ArrNode>(op, o.obj)) node->upd(o.ref, o.val);
            },
            [&](const Del& o) {
                auto* node = get(o.obj);
                if (!node) {
                    skip(op, "target not found");
                    return;
                }
                std::visit(overload{
                    [&](StrNode& n) { n.del(o.what); },
                    [&](BinNode& n) { n.del(o.what); },
                    [&](ArrNode& n) { n.del(o.what); },
                    [&](auto&) { skip(op, "target is not a sequence"); },
                }, *node);
            },
            [](const Nop&) {},
        }, op);
        observe(op_id(op), op_span(op));
    }

    // -- View -----------------------------------------------------------------

    auto view() const -> nlohmann::json {
        if (root.value == origin) return nullptr;
        auto path = std::set<Timestamp>{};
        return view(root.value, path);
    }

    auto view(Timestamp id) const -> nlohmann::json {
        auto path = std::set<Timestamp>{};
        return view(id, path);
    }

    // Check if `id` names a node that reads as undefined.
    auto is_undefined_node(Timestamp id) const -> bool {
        const auto* con = get_as<ConNode>(id);
        return !get(id) || (con && is_undefined(con->value));
    }

private:
    template <typename N>
    void create(Timestamp id, N node) {
        if (id == origin || index.contains(id)) return;
        index.emplace(id, Node{std::move(node)});
    }

    template <typename N>
    auto target(const Op& op, Timestamp id) -> N* {
        auto* node = get(id);
        if (!node) {
            skip(op, "target not found");
            return nullptr;
        }
        auto* typed = std::get_if<N>(node);
        if (!typed) skip(op, "target is a " + std::string{to_string_view(node_kind(*node))});
        return typed;
    }

    static void skip(const Op& op, const std::string& reason) {
        logger()->debug("skipping {}: {}", to_string(op), reason);
    }

    // `path` holds the ids on the way down; a node reached again through
    // its own subtree views as null.
    auto view(Timestamp id, std::set<Timestamp>& path) const -> nlohmann::json {
        const auto* node = get(id);
        if (!node || path.contains(id)) return nullptr;
        path.insert(id);
        auto result = std::visit(overload{
            [&](const ConNode& n) -> nlohmann::json {
                return std::visit(overload{
                    [](const Undefined&) -> nlohmann::json { return nullptr; },
                    [](const nlohmann::json& j) -> nlohmann::json { return j; },
                    [](const Timestamp& ref) -> nlohmann::json {
                        return nlohmann::json::array({ref.sid, ref.time});
                    },
                }, n.value);
            },
            [&](const ValNode& n) -> nlohmann::json {
                return view(n.value, path);
            },
            [&](const ObjNode& n) -> nlohmann::json {
                auto obj = nlohmann::json::object();
                for (const auto& [key, child] : n.entries) {
                    if (is_undefined_node(child)) continue;
                    obj[key] = view(child, path);
                }
                return obj;
            },
            [&](const VecNode& n) -> nlohmann::json {
                auto arr = nlohmann::json::array();
                for (const auto& slot : n.elements) {
                    arr.push_back(slot ? view(*slot, path) : nlohmann::json(nullptr));
                }
                return arr;
            },
            [](const StrNode& n) -> nlohmann::json { return n.view(); },
            [](const BinNode& n) -> nlohmann::json { return to_json_binary(n.view()); },
            [&](const ArrNode& n) -> nlohmann::json {
                auto arr = nlohmann::json::array();
                for (auto child : n.values()) arr.push_back(view(child, path));
                return arr;
            },
        }, *node);
        path.erase(id);
        return result;
    }
};

}  // namespace json_crdt_cpp::detail
