#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include <limits>

namespace json_crdt_cpp {

PatchBuilder::PatchBuilder(std::uint64_t sid, std::uint64_t time)
    : cursor_{sid, time} {}

auto PatchBuilder::next(std::uint64_t span) -> Timestamp {
    auto id = cursor_;
    if (cursor_.time > std::numeric_limits<std::uint64_t>::max() - span) {
        throw Error{ErrorKind::clock_overflow, "patch builder clock overflows u64"};
    }
    cursor_.time += span;
    return id;
}

void PatchBuilder::push(Op op) {
    const auto id = op_id(op);
    const auto span = op_span(op);
    if (id.sid == cursor_.sid && id.time >= cursor_.time) {
        cursor_.time = id.time;
        next(span);
    }
    patch_.ops.push_back(std::move(op));
}

// -- Creation -----------------------------------------------------------------

auto PatchBuilder::con_val(nlohmann::json value) -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewCon{.id = id, .value = std::move(value)});
    return id;
}

auto PatchBuilder::con_ref(Timestamp ref) -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewCon{.id = id, .value = ref});
    return id;
}

auto PatchBuilder::con_undef() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewCon{.id = id, .value = Undefined{}});
    return id;
}

auto PatchBuilder::val() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewVal{.id = id});
    return id;
}

auto PatchBuilder::obj() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewObj{.id = id});
    return id;
}

auto PatchBuilder::vec() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewVec{.id = id});
    return id;
}

auto PatchBuilder::str_node() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewStr{.id = id});
    return id;
}

auto PatchBuilder::bin_node() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewBin{.id = id});
    return id;
}

auto PatchBuilder::arr() -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(NewArr{.id = id});
    return id;
}

// -- Mutation -----------------------------------------------------------------

auto PatchBuilder::set_val(Timestamp obj, Timestamp val) -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(InsVal{.id = id, .obj = obj, .val = val});
    return id;
}

auto PatchBuilder::root(Timestamp val) -> Timestamp {
    return set_val(origin, val);
}

auto PatchBuilder::ins_obj(Timestamp obj, std::vector<std::pair<std::string, Timestamp>> data)
    -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(InsObj{.id = id, .obj = obj, .data = std::move(data)});
    return id;
}

auto PatchBuilder::ins_vec(Timestamp obj, std::vector<std::pair<std::uint8_t, Timestamp>> data)
    -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(InsVec{.id = id, .obj = obj, .data = std::move(data)});
    return id;
}

auto PatchBuilder::ins_str(Timestamp obj, Timestamp after, std::string data) -> Timestamp {
    auto id = next(utf8::utf16_length(data));
    patch_.ops.emplace_back(InsStr{.id = id, .obj = obj, .after = after, .data = std::move(data)});
    return id;
}

auto PatchBuilder::ins_bin(Timestamp obj, Timestamp after, Bytes data) -> Timestamp {
    auto id = next(data.size());
    patch_.ops.emplace_back(InsBin{.id = id, .obj = obj, .after = after, .data = std::move(data)});
    return id;
}

auto PatchBuilder::ins_arr(Timestamp obj, Timestamp after, std::vector<Timestamp> data)
    -> Timestamp {
    auto id = next(data.size());
    patch_.ops.emplace_back(InsArr{.id = id, .obj = obj, .after = after, .data = std::move(data)});
    return id;
}

auto PatchBuilder::upd_arr(Timestamp obj, Timestamp ref, Timestamp val) -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(UpdArr{.id = id, .obj = obj, .ref = ref, .val = val});
    return id;
}

auto PatchBuilder::del(Timestamp obj, std::vector<Timespan> what) -> Timestamp {
    auto id = next(1);
    patch_.ops.emplace_back(Del{.id = id, .obj = obj, .what = std::move(what)});
    return id;
}

auto PatchBuilder::nop(std::uint64_t len) -> Timestamp {
    auto id = next(len);
    patch_.ops.emplace_back(Nop{.id = id, .len = len});
    return id;
}

// -- Composite ----------------------------------------------------------------

auto PatchBuilder::json(const nlohmann::json& value) -> Timestamp {
    switch (value.type()) {
        case nlohmann::json::value_t::string: {
            auto id = str_node();
            const auto& s = value.get_ref<const std::string&>();
            if (!s.empty()) ins_str(id, id, s);
            return id;
        }
        case nlohmann::json::value_t::binary: {
            auto id = bin_node();
            auto bytes = from_json_binary(value);
            if (!bytes.empty()) ins_bin(id, id, std::move(bytes));
            return id;
        }
        case nlohmann::json::value_t::array: {
            auto id = arr();
            if (value.empty()) return id;
            auto children = std::vector<Timestamp>{};
            children.reserve(value.size());
            for (const auto& item : value) {
                if (item.is_primitive() && !item.is_string() && !item.is_binary()) {
                    auto reg = val();
                    set_val(reg, con_val(item));
                    children.push_back(reg);
                } else {
                    children.push_back(json(item));
                }
            }
            ins_arr(id, id, std::move(children));
            return id;
        }
        case nlohmann::json::value_t::object: {
            auto id = obj();
            if (value.empty()) return id;
            auto pairs = std::vector<std::pair<std::string, Timestamp>>{};
            pairs.reserve(value.size());
            for (const auto& [key, item] : value.items()) {
                pairs.emplace_back(key, json(item));
            }
            ins_obj(id, std::move(pairs));
            return id;
        }
        default:
            return con_val(value);
    }
}

void PatchBuilder::pad(std::uint64_t time) {
    if (time > cursor_.time) nop(time - cursor_.time);
}

auto PatchBuilder::flush() -> Patch {
    auto patch = std::move(patch_);
    patch_ = Patch{};
    return patch;
}

}  // namespace json_crdt_cpp
