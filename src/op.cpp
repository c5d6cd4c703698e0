#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include <array>

namespace json_crdt_cpp {

namespace {

// Indexed by Op::index().
constexpr auto op_codes = std::array<OpCode, std::variant_size_v<Op>>{
    OpCode::new_con, OpCode::new_val, OpCode::new_obj, OpCode::new_vec,
    OpCode::new_str, OpCode::new_bin, OpCode::new_arr, OpCode::ins_val,
    OpCode::ins_obj, OpCode::ins_vec, OpCode::ins_str, OpCode::ins_bin,
    OpCode::ins_arr, OpCode::upd_arr, OpCode::del,     OpCode::nop,
};

auto con_to_string(const ConValue& value) -> std::string {
    return std::visit(overload{
        [](Undefined) -> std::string { return "undefined"; },
        [](const nlohmann::json& j) -> std::string {
            return j.is_binary() ? "<binary>" : j.dump();
        },
        [](Timestamp ref) -> std::string { return "ref " + to_string(ref); },
    }, value);
}

}  // anonymous namespace

auto op_code_from_name(std::string_view name) -> std::optional<OpCode> {
    for (auto code : op_codes) {
        if (to_string_view(code) == name) return code;
    }
    return std::nullopt;
}

auto op_code_from_number(std::uint64_t n) -> std::optional<OpCode> {
    for (auto code : op_codes) {
        if (static_cast<std::uint64_t>(code) == n) return code;
    }
    return std::nullopt;
}

auto op_id(const Op& op) -> Timestamp {
    return std::visit([](const auto& o) { return o.id; }, op);
}

// Clock ticks an op consumes. InsStr text is charged its UTF-16 length;
// this is the authoritative measure for id allocation and patch spans.
// A StrNode numbers the inserted code points consecutively from the op id,
// so text with astral characters leaves the last ticks of the span unused.
// Positions inside a string are always code points.
auto op_span(const Op& op) -> std::uint64_t {
    return std::visit(overload{
        [](const InsStr& o) -> std::uint64_t { return utf8::utf16_length(o.data); },
        [](const InsBin& o) -> std::uint64_t { return o.data.size(); },
        [](const InsArr& o) -> std::uint64_t { return o.data.size(); },
        [](const Nop& o) -> std::uint64_t { return o.len; },
        [](const auto&) -> std::uint64_t { return 1; },
    }, op);
}

auto op_code(const Op& op) -> OpCode {
    return op_codes[op.index()];
}

auto to_string(const Op& op) -> std::string {
    auto out = std::string{to_string_view(op_code(op))};
    out += " " + to_string(tss(op_id(op).sid, op_id(op).time, op_span(op)));
    std::visit(overload{
        [&](const NewCon& o) { out += " " + con_to_string(o.value); },
        [&](const InsVal& o) {
            out += " obj=" + to_string(o.obj) + " val=" + to_string(o.val);
        },
        [&](const InsObj& o) {
            out += " obj=" + to_string(o.obj);
            for (const auto& [key, id] : o.data) {
                out += " " + nlohmann::json(key).dump() + ":" + to_string(id);
            }
        },
        [&](const InsVec& o) {
            out += " obj=" + to_string(o.obj);
            for (const auto& [idx, id] : o.data) {
                out += " " + std::to_string(idx) + ":" + to_string(id);
            }
        },
        [&](const InsStr& o) {
            out += " obj=" + to_string(o.obj) + " after=" + to_string(o.after) + " " +
                   nlohmann::json(o.data).dump();
        },
        [&](const InsBin& o) {
            out += " obj=" + to_string(o.obj) + " after=" + to_string(o.after) + " " +
                   std::to_string(o.data.size()) + " bytes";
        },
        [&](const InsArr& o) {
            out += " obj=" + to_string(o.obj) + " after=" + to_string(o.after);
            for (auto id : o.data) out += " " + to_string(id);
        },
        [&](const UpdArr& o) {
            out += " obj=" + to_string(o.obj) + " ref=" + to_string(o.ref) +
                   " val=" + to_string(o.val);
        },
        [&](const Del& o) {
            out += " obj=" + to_string(o.obj);
            for (const auto& span : o.what) out += " " + to_string(span);
        },
        [](const auto&) {},
    }, op);
    return out;
}

}  // namespace json_crdt_cpp
