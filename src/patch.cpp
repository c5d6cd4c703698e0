#include <json-crdt-cpp/patch.hpp>

namespace json_crdt_cpp {

auto Patch::get_id() const -> std::optional<Timestamp> {
    if (ops.empty()) return std::nullopt;
    return op_id(ops.front());
}

auto Patch::span() const -> std::uint64_t {
    if (ops.empty()) return 0;
    const auto first = op_id(ops.front());
    const auto last = op_id(ops.back());
    return last.time - first.time + op_span(ops.back());
}

auto Patch::next_time() const -> std::uint64_t {
    if (ops.empty()) return 0;
    const auto last = op_id(ops.back());
    return last.time + op_span(ops.back());
}

auto Patch::rewrite_time(const std::function<Timestamp(Timestamp)>& fn) const -> Patch {
    auto rewrite_span = [&](const Timespan& s) {
        auto start = fn(s.start());
        return tss(start.sid, start.time, s.span);
    };

    auto result = Patch{.ops = {}, .meta = meta};
    result.ops.reserve(ops.size());
    for (const auto& op : ops) {
        result.ops.push_back(std::visit(overload{
            [&](const NewCon& o) -> Op {
                auto value = o.value;
                if (auto* ref = std::get_if<Timestamp>(&value)) *ref = fn(*ref);
                return NewCon{.id = fn(o.id), .value = std::move(value)};
            },
            [&](const NewVal& o) -> Op { return NewVal{.id = fn(o.id)}; },
            [&](const NewObj& o) -> Op { return NewObj{.id = fn(o.id)}; },
            [&](const NewVec& o) -> Op { return NewVec{.id = fn(o.id)}; },
            [&](const NewStr& o) -> Op { return NewStr{.id = fn(o.id)}; },
            [&](const NewBin& o) -> Op { return NewBin{.id = fn(o.id)}; },
            [&](const NewArr& o) -> Op { return NewArr{.id = fn(o.id)}; },
            [&](const InsVal& o) -> Op {
                return InsVal{.id = fn(o.id), .obj = fn(o.obj), .val = fn(o.val)};
            },
            [&](const InsObj& o) -> Op {
                auto data = o.data;
                for (auto& [key, id] : data) id = fn(id);
                return InsObj{.id = fn(o.id), .obj = fn(o.obj), .data = std::move(data)};
            },
            [&](const InsVec& o) -> Op {
                auto data = o.data;
                for (auto& [idx, id] : data) id = fn(id);
                return InsVec{.id = fn(o.id), .obj = fn(o.obj), .data = std::move(data)};
            },
            [&](const InsStr& o) -> Op {
                return InsStr{.id = fn(o.id), .obj = fn(o.obj), .after = fn(o.after), .data = o.data};
            },
            [&](const InsBin& o) -> Op {
                return InsBin{.id = fn(o.id), .obj = fn(o.obj), .after = fn(o.after), .data = o.data};
            },
            [&](const InsArr& o) -> Op {
                auto data = o.data;
                for (auto& id : data) id = fn(id);
                return InsArr{.id = fn(o.id), .obj = fn(o.obj), .after = fn(o.after),
                              .data = std::move(data)};
            },
            [&](const UpdArr& o) -> Op {
                return UpdArr{.id = fn(o.id), .obj = fn(o.obj), .ref = fn(o.ref), .val = fn(o.val)};
            },
            [&](const Del& o) -> Op {
                auto what = std::vector<Timespan>{};
                what.reserve(o.what.size());
                for (const auto& s : o.what) what.push_back(rewrite_span(s));
                return Del{.id = fn(o.id), .obj = fn(o.obj), .what = std::move(what)};
            },
            [&](const Nop& o) -> Op { return Nop{.id = fn(o.id), .len = o.len}; },
        }, op));
    }
    return result;
}

auto Patch::rebase(std::uint64_t new_time, std::optional<std::uint64_t> transform_after) const
    -> Patch {
    auto id = get_id();
    if (!id || id->time == new_time) return *this;
    const auto sid = id->sid;
    const auto horizon = transform_after.value_or(id->time);
    // Unsigned wrap-around gives the right result for a negative shift.
    const auto delta = new_time - id->time;
    return rewrite_time([=](Timestamp ts) {
        if (ts.sid != sid || ts.time < horizon) return ts;
        return Timestamp{sid, ts.time + delta};
    });
}

auto to_string(const Patch& patch) -> std::string {
    auto id = patch.get_id();
    auto out = std::string{"Patch "};
    out += id ? to_string(tss(id->sid, id->time, patch.span())) : std::string{"(empty)"};
    for (std::size_t i = 0; i < patch.ops.size(); ++i) {
        out += (i + 1 == patch.ops.size()) ? "\n└─ " : "\n├─ ";
        out += to_string(patch.ops[i]);
    }
    return out;
}

}  // namespace json_crdt_cpp
