#include <json-crdt-cpp/diff.hpp>
#include <json-crdt-cpp/logging.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include <string>

namespace json_crdt_cpp {

using nlohmann::json;

namespace {

// Common prefix and suffix of two sequences, and the length of the old
// middle that has to go.
struct Window {
    std::size_t lcp;
    std::size_t lcs;
    std::size_t del;
};

template <typename Eq>
auto find_window(std::size_t old_len, std::size_t new_len, Eq&& eq) -> Window {
    auto lcp = std::size_t{0};
    while (lcp < old_len && lcp < new_len && eq(lcp, lcp)) ++lcp;
    auto lcs = std::size_t{0};
    while (lcs < old_len - lcp && lcs < new_len - lcp && eq(old_len - 1 - lcs, new_len - 1 - lcs)) {
        ++lcs;
    }
    return Window{.lcp = lcp, .lcs = lcs, .del = old_len - lcp - lcs};
}

// Slot the inserted middle goes after. When the middle replaces deleted
// slots it is anchored on the last of them.
auto insert_anchor(const std::vector<Timestamp>& slots, Timestamp container,
                   const Window& w) -> Timestamp {
    if (w.del > 0) return slots[w.lcp + w.del - 1];
    if (w.lcp > 0) return slots[w.lcp - 1];
    return container;
}

// Merge the ids of `count` slots from `first` into contiguous runs.
auto coalesce(const std::vector<Timestamp>& slots, std::size_t first, std::size_t count)
    -> std::vector<Timespan> {
    auto spans = std::vector<Timespan>{};
    for (std::size_t i = first; i < first + count; ++i) {
        const auto slot = slots[i];
        if (!spans.empty()) {
            auto& last = spans.back();
            if (last.sid == slot.sid && last.time + last.span == slot.time) {
                ++last.span;
                continue;
            }
        }
        spans.push_back(tss(slot.sid, slot.time, 1));
    }
    return spans;
}

auto is_scalar(const json& value) -> bool {
    return value.is_primitive() && !value.is_string() && !value.is_binary();
}

}  // anonymous namespace

JsonCrdtDiff::JsonCrdtDiff(const Model& model)
    : model_{model}, builder_{model.builder()} {}

auto JsonCrdtDiff::diff(const json& dst) -> std::optional<Patch> {
    builder_ = model_.builder();
    path_.clear();
    const auto root = model_.root();
    if (model_.node(root)) {
        if (!diff_node(root, dst)) {
            logger()->debug("diff: replacing document root {}", to_string(root));
            builder_.root(builder_.json(dst));
        }
    } else if (!dst.is_null()) {
        builder_.root(builder_.json(dst));
    }
    auto patch = builder_.flush();
    if (patch.ops.empty()) return std::nullopt;
    return patch;
}

auto JsonCrdtDiff::diff_dst_keys(const json& dst) -> std::optional<Patch> {
    if (!dst.is_object()) return diff(dst);
    auto merged = model_.view();
    if (!merged.is_object()) merged = json::object();
    for (const auto& [key, value] : dst.items()) merged[key] = value;
    return diff(merged);
}

// Returns false if the node cannot be turned into `dst` in place; the
// caller then replaces it. A node already on the path down (a reference
// cycle) is always replaced.
auto JsonCrdtDiff::diff_node(Timestamp id, const json& dst) -> bool {
    const auto* node = model_.node(id);
    if (!node || path_.contains(id)) return false;
    if (model_.view(id) == dst) return true;
    path_.insert(id);
    const auto done = std::visit(overload{
        [](const ConNode&) { return false; },
        [&](const ValNode& n) { return diff_val(id, n, dst); },
        [&](const ObjNode& n) { return diff_obj(id, n, dst); },
        [&](const VecNode& n) { return diff_vec(id, n, dst); },
        [&](const StrNode& n) { return diff_str(id, n, dst); },
        [&](const BinNode& n) { return diff_bin(id, n, dst); },
        [&](const ArrNode& n) { return diff_arr(id, n, dst); },
    }, *node);
    path_.erase(id);
    return done;
}

auto JsonCrdtDiff::diff_val(Timestamp id, const ValNode& node, const json& dst) -> bool {
    if (diff_node(node.value, dst)) return true;
    builder_.set_val(id, builder_.json(dst));
    return true;
}

auto JsonCrdtDiff::diff_str(Timestamp id, const StrNode& node, const json& dst) -> bool {
    if (!dst.is_string()) return false;
    const auto slots = node.rga.live_ids();
    const auto old = utf8::to_code_points(node.view());
    const auto now = utf8::to_code_points(dst.get_ref<const std::string&>());
    if (old.size() != slots.size()) return false;

    const auto w = find_window(old.size(), now.size(),
                               [&](std::size_t i, std::size_t j) { return old[i] == now[j]; });
    const auto ins = now.substr(w.lcp, now.size() - w.lcp - w.lcs);
    if (!ins.empty()) {
        builder_.ins_str(id, insert_anchor(slots, id, w), utf8::from_code_points(ins));
    }
    if (w.del > 0) builder_.del(id, coalesce(slots, w.lcp, w.del));
    return true;
}

auto JsonCrdtDiff::diff_bin(Timestamp id, const BinNode& node, const json& dst) -> bool {
    if (!dst.is_binary()) return false;
    const auto slots = node.rga.live_ids();
    const auto old = node.view();
    const auto now = from_json_binary(dst);
    if (old.size() != slots.size()) return false;

    const auto w = find_window(old.size(), now.size(),
                               [&](std::size_t i, std::size_t j) { return old[i] == now[j]; });
    if (w.lcp + w.lcs < now.size()) {
        auto ins = Bytes(now.begin() + static_cast<std::ptrdiff_t>(w.lcp),
                         now.end() - static_cast<std::ptrdiff_t>(w.lcs));
        builder_.ins_bin(id, insert_anchor(slots, id, w), std::move(ins));
    }
    if (w.del > 0) builder_.del(id, coalesce(slots, w.lcp, w.del));
    return true;
}

auto JsonCrdtDiff::diff_arr(Timestamp id, const ArrNode& node, const json& dst) -> bool {
    if (!dst.is_array()) return false;
    const auto values = node.values();
    const auto slots = node.rga.live_ids();
    auto old = std::vector<json>{};
    old.reserve(values.size());
    for (auto child : values) old.push_back(model_.view(child));

    if (old.size() == dst.size()) {
        auto changed = std::vector<std::size_t>{};
        for (std::size_t i = 0; i < old.size(); ++i) {
            if (old[i] != dst[i]) changed.push_back(i);
        }
        auto all_registers = true;
        auto all_same_shape = true;
        for (auto i : changed) {
            const auto* child = model_.node(values[i]);
            if (!child || !std::holds_alternative<ValNode>(*child)) all_registers = false;
            if (!same_shape(values[i], dst[i])) all_same_shape = false;
        }
        // Register slots are written in place, then same-kind containers
        // are recursed into; either keeps every element id.
        if (all_registers || all_same_shape) {
            for (auto i : changed) diff_node(values[i], dst[i]);
            return true;
        }
    }

    const auto w = find_window(old.size(), dst.size(),
                               [&](std::size_t i, std::size_t j) { return old[i] == dst[j]; });
    auto children = std::vector<Timestamp>{};
    for (std::size_t j = w.lcp; j < dst.size() - w.lcs; ++j) children.push_back(array_element(dst[j]));
    if (!children.empty()) builder_.ins_arr(id, insert_anchor(slots, id, w), std::move(children));
    if (w.del > 0) builder_.del(id, coalesce(slots, w.lcp, w.del));
    return true;
}

auto JsonCrdtDiff::diff_vec(Timestamp id, const VecNode& node, const json& dst) -> bool {
    if (!dst.is_array() || dst.size() < node.elements.size() || dst.size() > 256) return false;
    auto pairs = std::vector<std::pair<std::uint8_t, Timestamp>>{};
    for (std::size_t i = 0; i < dst.size(); ++i) {
        const auto slot = node.get(i);
        if (slot && model_.node(*slot)) {
            if (diff_node(*slot, dst[i])) continue;
        } else if (dst[i].is_null()) {
            continue;
        }
        pairs.emplace_back(static_cast<std::uint8_t>(i), builder_.json(dst[i]));
    }
    if (!pairs.empty()) builder_.ins_vec(id, std::move(pairs));
    return true;
}

auto JsonCrdtDiff::diff_obj(Timestamp id, const ObjNode& node, const json& dst) -> bool {
    if (!dst.is_object()) return false;
    const auto src = model_.view(id);
    auto pairs = std::vector<std::pair<std::string, Timestamp>>{};
    for (const auto& [key, value] : src.items()) {
        if (!dst.contains(key)) pairs.emplace_back(key, builder_.con_undef());
    }
    for (const auto& [key, value] : dst.items()) {
        if (auto it = src.find(key); it != src.end()) {
            if (*it == value) continue;
            if (auto child = node.get(key); child && diff_node(*child, value)) continue;
        }
        pairs.emplace_back(key, builder_.json(value));
    }
    if (!pairs.empty()) builder_.ins_obj(id, std::move(pairs));
    return true;
}

auto JsonCrdtDiff::same_shape(Timestamp id, const json& dst) const -> bool {
    const auto* node = model_.node(id);
    if (!node) return false;
    return std::visit(overload{
        [](const ConNode&) { return false; },
        [](const ValNode&) { return true; },
        [&](const ObjNode&) { return dst.is_object(); },
        [&](const VecNode& n) {
            return dst.is_array() && dst.size() >= n.elements.size() && dst.size() <= 256;
        },
        [&](const StrNode&) { return dst.is_string(); },
        [&](const BinNode&) { return dst.is_binary(); },
        [&](const ArrNode&) { return dst.is_array(); },
    }, *node);
}

auto JsonCrdtDiff::array_element(const json& value) -> Timestamp {
    if (!is_scalar(value)) return builder_.json(value);
    auto reg = builder_.val();
    builder_.set_val(reg, builder_.con_val(value));
    return reg;
}

}  // namespace json_crdt_cpp
