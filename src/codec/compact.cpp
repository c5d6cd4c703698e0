#include <json-crdt-cpp/codec.hpp>

#include "../encoding/base64.hpp"
#include "json_ids.hpp"

#include <string>

namespace json_crdt_cpp::codec::compact {

using nlohmann::json;
using namespace json_crdt_cpp::codec::detail;

namespace {

auto encode_op(const Op& op, std::uint64_t sid) -> json {
    auto out = json::array({static_cast<std::uint8_t>(op_code(op))});
    auto id = [&](Timestamp ts) { return encode_relative(ts, sid); };
    std::visit(overload{
        [&](const NewCon& o) {
            std::visit(overload{
                [](const Undefined&) {},
                [&](const json& j) { out.push_back(j); },
                [&](const Timestamp& ref) {
                    out.push_back(id(ref));
                    out.push_back(true);
                },
            }, o.value);
        },
        [&](const InsVal& o) {
            out.push_back(id(o.obj));
            out.push_back(id(o.val));
        },
        [&](const InsObj& o) {
            out.push_back(id(o.obj));
            auto pairs = json::array();
            for (const auto& [key, child] : o.data) pairs.push_back(json::array({key, id(child)}));
            out.push_back(std::move(pairs));
        },
        [&](const InsVec& o) {
            out.push_back(id(o.obj));
            auto pairs = json::array();
            for (const auto& [idx, child] : o.data) pairs.push_back(json::array({idx, id(child)}));
            out.push_back(std::move(pairs));
        },
        [&](const InsStr& o) {
            out.push_back(id(o.obj));
            out.push_back(id(o.after));
            out.push_back(o.data);
        },
        [&](const InsBin& o) {
            out.push_back(id(o.obj));
            out.push_back(id(o.after));
            out.push_back(encoding::base64_encode(o.data));
        },
        [&](const InsArr& o) {
            out.push_back(id(o.obj));
            out.push_back(id(o.after));
            auto values = json::array();
            for (auto child : o.data) values.push_back(id(child));
            out.push_back(std::move(values));
        },
        [&](const UpdArr& o) {
            out.push_back(id(o.obj));
            out.push_back(id(o.ref));
            out.push_back(id(o.val));
        },
        [&](const Del& o) {
            out.push_back(id(o.obj));
            auto what = json::array();
            for (const auto& s : o.what) {
                if (s.sid == sid) {
                    what.push_back(json::array({s.time, s.span}));
                } else {
                    what.push_back(json::array({s.sid, s.time, s.span}));
                }
            }
            out.push_back(std::move(what));
        },
        [&](const Nop& o) {
            if (o.len != 1) out.push_back(o.len);
        },
        [](const auto&) {},
    }, op);
    return out;
}

auto decode_span(const json& j, std::uint64_t sid) -> Timespan {
    if (j.is_array() && j.size() == 2) {
        return tss(sid, as_uint(j[0], "time"), as_uint(j[1], "span"));
    }
    if (j.is_array() && j.size() == 3) {
        return tss(as_uint(j[0], "sid"), as_uint(j[1], "time"), as_uint(j[2], "span"));
    }
    invalid_patch("invalid timespan " + j.dump());
}

void decode_op(PatchBuilder& builder, const json& op, std::uint64_t sid) {
    if (!op.is_array() || op.empty()) invalid_patch("operation must be a non-empty array");
    const auto number = as_uint(op[0], "opcode");
    auto code = op_code_from_number(number);
    if (!code) throw Error{ErrorKind::unknown_opcode, "unknown opcode " + std::to_string(number)};

    auto arg = [&](std::size_t i) -> const json& {
        if (i >= op.size()) {
            invalid_patch(std::string{to_string_view(*code)} + " is missing operand " + std::to_string(i));
        }
        return op[i];
    };
    auto id_at = [&](std::size_t i) { return decode_relative(arg(i), sid); };

    switch (*code) {
        case OpCode::new_con:
            if (op.size() == 1) {
                builder.con_undef();
            } else if (op.size() >= 3 && op[2].is_boolean() && op[2].get<bool>()) {
                builder.con_ref(id_at(1));
            } else {
                builder.con_val(op[1]);
            }
            break;
        case OpCode::new_val: builder.val(); break;
        case OpCode::new_obj: builder.obj(); break;
        case OpCode::new_vec: builder.vec(); break;
        case OpCode::new_str: builder.str_node(); break;
        case OpCode::new_bin: builder.bin_node(); break;
        case OpCode::new_arr: builder.arr(); break;
        case OpCode::ins_val: builder.set_val(id_at(1), id_at(2)); break;
        case OpCode::ins_obj: {
            auto data = std::vector<std::pair<std::string, Timestamp>>{};
            for (const auto& pair : as_array(arg(2), "ins_obj entries")) {
                if (!pair.is_array() || pair.size() != 2) invalid_patch("ins_obj entry must be [key, id]");
                data.emplace_back(as_string(pair[0], "ins_obj key"), decode_relative(pair[1], sid));
            }
            builder.ins_obj(id_at(1), std::move(data));
            break;
        }
        case OpCode::ins_vec: {
            auto data = std::vector<std::pair<std::uint8_t, Timestamp>>{};
            for (const auto& pair : as_array(arg(2), "ins_vec entries")) {
                if (!pair.is_array() || pair.size() != 2) invalid_patch("ins_vec entry must be [index, id]");
                auto idx = as_uint(pair[0], "ins_vec index");
                if (idx > 255) invalid_patch("ins_vec index out of range");
                data.emplace_back(static_cast<std::uint8_t>(idx), decode_relative(pair[1], sid));
            }
            builder.ins_vec(id_at(1), std::move(data));
            break;
        }
        case OpCode::ins_str:
            builder.ins_str(id_at(1), id_at(2), as_text(arg(3), "ins_str data"));
            break;
        case OpCode::ins_bin: {
            auto bytes = encoding::base64_decode(as_string(arg(3), "ins_bin data"));
            if (!bytes) invalid_patch("ins_bin data is not base64");
            builder.ins_bin(id_at(1), id_at(2), std::move(*bytes));
            break;
        }
        case OpCode::ins_arr: {
            auto data = std::vector<Timestamp>{};
            for (const auto& child : as_array(arg(3), "ins_arr elements")) {
                data.push_back(decode_relative(child, sid));
            }
            builder.ins_arr(id_at(1), id_at(2), std::move(data));
            break;
        }
        case OpCode::upd_arr:
            builder.upd_arr(id_at(1), id_at(2), id_at(3));
            break;
        case OpCode::del: {
            auto what = std::vector<Timespan>{};
            for (const auto& s : as_array(arg(2), "del spans")) what.push_back(decode_span(s, sid));
            builder.del(id_at(1), std::move(what));
            break;
        }
        case OpCode::nop:
            builder.nop(op.size() > 1 ? as_uint(op[1], "nop len") : 1);
            break;
    }
}

}  // anonymous namespace

auto encode(const Patch& patch) -> json {
    const auto id = header_id(patch);
    auto header = json::array({encode_absolute(id)});
    if (patch.meta) header.push_back(*patch.meta);
    auto out = json::array();
    out.push_back(std::move(header));
    for (const auto& op : patch.ops) out.push_back(encode_op(op, id.sid));
    return out;
}

auto decode(const json& data) -> Patch {
    if (!data.is_array() || data.empty()) invalid_patch("patch must be a non-empty array");
    const auto& header = data[0];
    if (!header.is_array() || header.empty()) invalid_patch("patch header must be [id, meta?]");
    const auto id = decode_absolute(header[0]);
    auto meta = header.size() > 1 ? std::optional<json>{header[1]} : std::nullopt;
    auto builder = make_builder(id, std::move(meta));
    for (std::size_t i = 1; i < data.size(); ++i) decode_op(builder, data[i], id.sid);
    return builder.flush();
}

}  // namespace json_crdt_cpp::codec::compact
