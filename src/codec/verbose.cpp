#include <json-crdt-cpp/codec.hpp>

#include "../encoding/base64.hpp"
#include "json_ids.hpp"

#include <string>

namespace json_crdt_cpp::codec::verbose {

using nlohmann::json;
using namespace json_crdt_cpp::codec::detail;

namespace {

auto encode_op(const Op& op) -> json {
    auto out = json::object();
    out["op"] = std::string{to_string_view(op_code(op))};
    std::visit(overload{
        [&](const NewCon& o) {
            std::visit(overload{
                [](const Undefined&) {},
                [&](const json& j) { out["value"] = j; },
                [&](const Timestamp& ref) {
                    out["value"] = encode_absolute(ref);
                    out["timestamp"] = true;
                },
            }, o.value);
        },
        [&](const InsVal& o) {
            out["obj"] = encode_absolute(o.obj);
            out["value"] = encode_absolute(o.val);
        },
        [&](const InsObj& o) {
            out["obj"] = encode_absolute(o.obj);
            auto pairs = json::array();
            for (const auto& [key, id] : o.data) pairs.push_back(json::array({key, encode_absolute(id)}));
            out["value"] = std::move(pairs);
        },
        [&](const InsVec& o) {
            out["obj"] = encode_absolute(o.obj);
            auto pairs = json::array();
            for (const auto& [idx, id] : o.data) pairs.push_back(json::array({idx, encode_absolute(id)}));
            out["value"] = std::move(pairs);
        },
        [&](const InsStr& o) {
            out["obj"] = encode_absolute(o.obj);
            out["after"] = encode_absolute(o.after);
            out["value"] = o.data;
        },
        [&](const InsBin& o) {
            out["obj"] = encode_absolute(o.obj);
            out["after"] = encode_absolute(o.after);
            out["value"] = encoding::base64_encode(o.data);
        },
        [&](const InsArr& o) {
            out["obj"] = encode_absolute(o.obj);
            out["after"] = encode_absolute(o.after);
            auto values = json::array();
            for (auto id : o.data) values.push_back(encode_absolute(id));
            out["values"] = std::move(values);
        },
        [&](const UpdArr& o) {
            out["obj"] = encode_absolute(o.obj);
            out["ref"] = encode_absolute(o.ref);
            out["value"] = encode_absolute(o.val);
        },
        [&](const Del& o) {
            out["obj"] = encode_absolute(o.obj);
            auto what = json::array();
            for (const auto& s : o.what) what.push_back(json::array({s.sid, s.time, s.span}));
            out["what"] = std::move(what);
        },
        [&](const Nop& o) { out["len"] = o.len; },
        [](const auto&) {},
    }, op);
    return out;
}

auto field(const json& op, const char* key) -> const json& {
    auto it = op.find(key);
    if (it == op.end()) invalid_patch(std::string{"missing field \""} + key + "\"");
    return *it;
}

void decode_op(PatchBuilder& builder, const json& op) {
    if (!op.is_object()) invalid_patch("operation must be an object");
    const auto& name = as_string(field(op, "op"), "op");
    auto code = op_code_from_name(name);
    if (!code) throw Error{ErrorKind::unknown_opcode, "unknown operation \"" + name + "\""};

    auto id_of = [&](const char* key) { return decode_absolute(field(op, key)); };

    switch (*code) {
        case OpCode::new_con: {
            auto it = op.find("value");
            if (it == op.end()) {
                builder.con_undef();
            } else if (auto ts = op.find("timestamp"); ts != op.end() && ts->is_boolean() && ts->get<bool>()) {
                builder.con_ref(decode_absolute(*it));
            } else {
                builder.con_val(*it);
            }
            break;
        }
        case OpCode::new_val: builder.val(); break;
        case OpCode::new_obj: builder.obj(); break;
        case OpCode::new_vec: builder.vec(); break;
        case OpCode::new_str: builder.str_node(); break;
        case OpCode::new_bin: builder.bin_node(); break;
        case OpCode::new_arr: builder.arr(); break;
        case OpCode::ins_val: builder.set_val(id_of("obj"), id_of("value")); break;
        case OpCode::ins_obj: {
            auto data = std::vector<std::pair<std::string, Timestamp>>{};
            for (const auto& pair : as_array(field(op, "value"), "ins_obj value")) {
                if (!pair.is_array() || pair.size() != 2) invalid_patch("ins_obj entry must be [key, id]");
                data.emplace_back(as_string(pair[0], "ins_obj key"), decode_absolute(pair[1]));
            }
            builder.ins_obj(id_of("obj"), std::move(data));
            break;
        }
        case OpCode::ins_vec: {
            auto data = std::vector<std::pair<std::uint8_t, Timestamp>>{};
            for (const auto& pair : as_array(field(op, "value"), "ins_vec value")) {
                if (!pair.is_array() || pair.size() != 2) invalid_patch("ins_vec entry must be [index, id]");
                auto idx = as_uint(pair[0], "ins_vec index");
                if (idx > 255) invalid_patch("ins_vec index out of range");
                data.emplace_back(static_cast<std::uint8_t>(idx), decode_absolute(pair[1]));
            }
            builder.ins_vec(id_of("obj"), std::move(data));
            break;
        }
        case OpCode::ins_str:
            builder.ins_str(id_of("obj"), id_of("after"), as_text(field(op, "value"), "ins_str value"));
            break;
        case OpCode::ins_bin: {
            auto bytes = encoding::base64_decode(as_string(field(op, "value"), "ins_bin value"));
            if (!bytes) invalid_patch("ins_bin value is not base64");
            builder.ins_bin(id_of("obj"), id_of("after"), std::move(*bytes));
            break;
        }
        case OpCode::ins_arr: {
            auto data = std::vector<Timestamp>{};
            for (const auto& id : as_array(field(op, "values"), "ins_arr values")) {
                data.push_back(decode_absolute(id));
            }
            builder.ins_arr(id_of("obj"), id_of("after"), std::move(data));
            break;
        }
        case OpCode::upd_arr:
            builder.upd_arr(id_of("obj"), id_of("ref"), id_of("value"));
            break;
        case OpCode::del: {
            auto what = std::vector<Timespan>{};
            for (const auto& s : as_array(field(op, "what"), "del what")) {
                if (!s.is_array() || s.size() != 3) invalid_patch("del span must be [sid, time, span]");
                what.push_back(tss(as_uint(s[0], "sid"), as_uint(s[1], "time"), as_uint(s[2], "span")));
            }
            builder.del(id_of("obj"), std::move(what));
            break;
        }
        case OpCode::nop: {
            auto it = op.find("len");
            builder.nop(it == op.end() ? 1 : as_uint(*it, "nop len"));
            break;
        }
    }
}

}  // anonymous namespace

auto encode(const Patch& patch) -> json {
    auto out = json::object();
    out["id"] = encode_absolute(header_id(patch));
    if (patch.meta) out["meta"] = *patch.meta;
    auto ops = json::array();
    for (const auto& op : patch.ops) ops.push_back(encode_op(op));
    out["ops"] = std::move(ops);
    return out;
}

auto decode(const json& data) -> Patch {
    if (!data.is_object()) invalid_patch("patch must be an object");
    auto meta = std::optional<json>{};
    if (auto it = data.find("meta"); it != data.end()) meta = *it;
    auto builder = make_builder(decode_absolute(field(data, "id")), std::move(meta));
    for (const auto& op : as_array(field(data, "ops"), "ops")) decode_op(builder, op);
    return builder.flush();
}

}  // namespace json_crdt_cpp::codec::verbose
