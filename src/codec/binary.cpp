#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include "../storage/reader.hpp"
#include "../storage/writer.hpp"

#include <string>

namespace json_crdt_cpp::codec::binary {

namespace {

// Lengths 1..7 fit in the low three bits of the op octet; anything else is
// written as a zero there followed by a vu57.
constexpr std::uint64_t max_inline_length = 0b111;

class PatchWriter {
public:
    explicit PatchWriter(std::uint64_t sid) : sid_{sid} {}

    void write_op(const Op& op) {
        const auto code = op_code(op);
        std::visit(overload{
            [&](const NewCon& o) {
                std::visit(overload{
                    [&](const Undefined&) {
                        write_octet(code, 0);
                        w_.write_cbor_undefined();
                    },
                    [&](const nlohmann::json& j) {
                        write_octet(code, 0);
                        w_.write_cbor(j);
                    },
                    [&](const Timestamp& ref) {
                        write_octet(code, 1);
                        write_id(ref);
                    },
                }, o.value);
            },
            [&](const InsVal& o) {
                write_octet(code, 0);
                write_id(o.obj);
                write_id(o.val);
            },
            [&](const InsObj& o) {
                write_length(code, o.data.size());
                write_id(o.obj);
                for (const auto& [key, id] : o.data) {
                    w_.write_cbor(nlohmann::json(key));
                    write_id(id);
                }
            },
            [&](const InsVec& o) {
                write_length(code, o.data.size());
                write_id(o.obj);
                for (const auto& [idx, id] : o.data) {
                    w_.write_u8(idx);
                    write_id(id);
                }
            },
            [&](const InsStr& o) {
                write_length(code, o.data.size());
                write_id(o.obj);
                write_id(o.after);
                w_.write_utf8(o.data);
            },
            [&](const InsBin& o) {
                write_length(code, o.data.size());
                write_id(o.obj);
                write_id(o.after);
                w_.write_bytes(o.data);
            },
            [&](const InsArr& o) {
                write_length(code, o.data.size());
                write_id(o.obj);
                write_id(o.after);
                for (auto id : o.data) write_id(id);
            },
            [&](const UpdArr& o) {
                write_octet(code, 0);
                write_id(o.obj);
                write_id(o.ref);
                write_id(o.val);
            },
            [&](const Del& o) {
                write_length(code, o.what.size());
                write_id(o.obj);
                for (const auto& s : o.what) {
                    write_id(s.start());
                    w_.write_vu57(s.span);
                }
            },
            [&](const Nop& o) { write_length(code, o.len); },
            [&](const auto&) { write_octet(code, 0); },
        }, op);
    }

    auto writer() -> storage::Writer& { return w_; }

private:
    void write_octet(OpCode code, std::uint8_t low) {
        w_.write_u8(static_cast<std::uint8_t>((static_cast<std::uint8_t>(code) << 3) | low));
    }

    void write_length(OpCode code, std::uint64_t length) {
        if (length >= 1 && length <= max_inline_length) {
            write_octet(code, static_cast<std::uint8_t>(length));
            return;
        }
        write_octet(code, 0);
        w_.write_vu57(length);
    }

    // Ids of the patch session carry only their time.
    void write_id(Timestamp id) {
        if (id.sid == sid_) {
            w_.write_b1vu56(false, id.time);
        } else {
            w_.write_b1vu56(true, id.time);
            w_.write_vu57(id.sid);
        }
    }

    std::uint64_t sid_;
    storage::Writer w_;
};

class PatchReader {
public:
    explicit PatchReader(std::span<const std::byte> data) : r_{data} {}

    auto read() -> Patch {
        sid_ = require(r_.read_vu57());
        const auto time = require(r_.read_vu57());
        auto builder = PatchBuilder{sid_, time};
        if (auto meta = read_meta()) builder.set_meta(std::move(*meta));
        const auto count = require(r_.read_vu57());
        for (std::uint64_t i = 0; i < count; ++i) read_op(builder);
        if (!r_.at_end()) {
            throw Error{ErrorKind::trailing_bytes,
                        std::to_string(r_.remaining()) + " bytes after the last operation"};
        }
        return builder.flush();
    }

private:
    template <typename T>
    static auto require(std::optional<T> value) -> T {
        if (!value) throw Error{ErrorKind::overflow, "unexpected end of patch data"};
        return std::move(*value);
    }

    // Metadata travels as CBOR `undefined` or a one-element array.
    auto read_meta() -> std::optional<nlohmann::json> {
        auto item = r_.read_cbor();
        if (!item) throw Error{ErrorKind::invalid_cbor, "malformed patch metadata"};
        if (!item->value) return std::nullopt;
        auto& value = *item->value;
        if (value.is_array()) {
            if (value.empty()) return std::nullopt;
            return value[0];
        }
        return value;
    }

    auto read_id() -> Timestamp {
        const auto head = require(r_.read_b1vu56());
        if (!head.flag) return Timestamp{sid_, head.value};
        return Timestamp{require(r_.read_vu57()), head.value};
    }

    void read_op(PatchBuilder& builder) {
        const auto octet = require(r_.read_u8());
        const auto number = static_cast<std::uint8_t>(octet >> 3);
        const auto low = static_cast<std::uint64_t>(octet & max_inline_length);
        auto code = op_code_from_number(number);
        if (!code) throw Error{ErrorKind::unknown_opcode, "unknown opcode " + std::to_string(number)};
        auto length = [&] { return low != 0 ? low : require(r_.read_vu57()); };

        switch (*code) {
            case OpCode::new_con:
                if (low == 0) {
                    auto item = r_.read_cbor();
                    if (!item) throw Error{ErrorKind::invalid_cbor, "malformed constant value"};
                    if (item->value) {
                        builder.con_val(std::move(*item->value));
                    } else {
                        builder.con_undef();
                    }
                } else {
                    builder.con_ref(read_id());
                }
                break;
            case OpCode::new_val: builder.val(); break;
            case OpCode::new_obj: builder.obj(); break;
            case OpCode::new_vec: builder.vec(); break;
            case OpCode::new_str: builder.str_node(); break;
            case OpCode::new_bin: builder.bin_node(); break;
            case OpCode::new_arr: builder.arr(); break;
            case OpCode::ins_val: {
                auto obj = read_id();
                builder.set_val(obj, read_id());
                break;
            }
            case OpCode::ins_obj: {
                const auto n = length();
                auto obj = read_id();
                auto data = std::vector<std::pair<std::string, Timestamp>>{};
                for (std::uint64_t i = 0; i < n; ++i) {
                    auto key = r_.read_cbor();
                    if (!key || !key->value || !key->value->is_string()) {
                        throw Error{ErrorKind::invalid_cbor, "object key is not a CBOR string"};
                    }
                    data.emplace_back(key->value->get<std::string>(), read_id());
                }
                builder.ins_obj(obj, std::move(data));
                break;
            }
            case OpCode::ins_vec: {
                const auto n = length();
                auto obj = read_id();
                auto data = std::vector<std::pair<std::uint8_t, Timestamp>>{};
                for (std::uint64_t i = 0; i < n; ++i) {
                    auto idx = require(r_.read_u8());
                    data.emplace_back(idx, read_id());
                }
                builder.ins_vec(obj, std::move(data));
                break;
            }
            case OpCode::ins_str: {
                const auto n = length();
                auto obj = read_id();
                auto after = read_id();
                if (n > r_.remaining()) throw Error{ErrorKind::overflow, "unexpected end of patch data"};
                auto text = require(r_.read_utf8(static_cast<std::size_t>(n)));
                if (!utf8::is_valid(text)) throw Error{ErrorKind::invalid_utf8, "ins_str data is not UTF-8"};
                builder.ins_str(obj, after, std::move(text));
                break;
            }
            case OpCode::ins_bin: {
                const auto n = length();
                auto obj = read_id();
                auto after = read_id();
                if (n > r_.remaining()) throw Error{ErrorKind::overflow, "unexpected end of patch data"};
                auto bytes = require(r_.read_bytes(static_cast<std::size_t>(n)));
                builder.ins_bin(obj, after, Bytes(bytes.begin(), bytes.end()));
                break;
            }
            case OpCode::ins_arr: {
                const auto n = length();
                auto obj = read_id();
                auto after = read_id();
                auto data = std::vector<Timestamp>{};
                for (std::uint64_t i = 0; i < n; ++i) data.push_back(read_id());
                builder.ins_arr(obj, after, std::move(data));
                break;
            }
            case OpCode::upd_arr: {
                auto obj = read_id();
                auto ref = read_id();
                builder.upd_arr(obj, ref, read_id());
                break;
            }
            case OpCode::del: {
                const auto n = length();
                auto obj = read_id();
                auto what = std::vector<Timespan>{};
                for (std::uint64_t i = 0; i < n; ++i) {
                    auto start = read_id();
                    what.push_back(tss(start.sid, start.time, require(r_.read_vu57())));
                }
                builder.del(obj, std::move(what));
                break;
            }
            case OpCode::nop:
                builder.nop(length());
                break;
        }
    }

    storage::Reader r_;
    std::uint64_t sid_{0};
};

}  // anonymous namespace

auto encode(const Patch& patch) -> Bytes {
    const auto id = patch.get_id().value_or(origin);
    auto out = PatchWriter{id.sid};
    auto& w = out.writer();
    w.write_vu57(id.sid);
    w.write_vu57(id.time);
    if (patch.meta) {
        w.write_cbor(nlohmann::json::array({*patch.meta}));
    } else {
        w.write_cbor_undefined();
    }
    w.write_vu57(patch.ops.size());
    for (const auto& op : patch.ops) out.write_op(op);
    return w.take();
}

auto decode(std::span<const std::byte> data) -> Patch {
    return PatchReader{data}.read();
}

}  // namespace json_crdt_cpp::codec::binary
