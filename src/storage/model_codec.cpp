#include "model_codec.hpp"

#include "clock_table.hpp"
#include "reader.hpp"
#include "writer.hpp"

#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace json_crdt_cpp::storage {

namespace {

constexpr int max_depth = 512;
constexpr std::uint8_t server_marker = 0x80;
constexpr std::uint8_t minor_length_follows = 31;

template <typename T>
auto require(std::optional<T> value) -> T {
    if (!value) throw Error{ErrorKind::invalid_model, "unexpected end of document data"};
    return std::move(*value);
}

// -- Encoder ------------------------------------------------------------------

class ModelEncoder {
public:
    explicit ModelEncoder(const detail::ModelState& state) : state_{state} {
        if (const auto* cv = std::get_if<ClockVector>(&state.clock)) {
            table_ = ClockTable::from_clock(*cv);
        }
    }

    auto encode() -> Bytes {
        if (!table_) {
            w_.write_u8(server_marker);
            w_.write_vu57(state_.time());
            write_root();
            return w_.take();
        }
        if (state_.get(state_.root.value)) collect(state_.root.value);
        w_.write_u32_be(0);
        write_root();
        const auto root_size = w_.size() - 4;
        if (root_size > 0x7FFFFFFF) {
            throw Error{ErrorKind::encoding_error, "document too large for the binary format"};
        }
        w_.patch_u32_be(0, static_cast<std::uint32_t>(root_size));
        table_->encode(w_);
        return w_.take();
    }

private:
    auto reachable(Timestamp id) const -> bool {
        return state_.get(id) && !path_.contains(id);
    }

    // Pre-pass: every id written must be covered by a clock table entry.
    void collect(Timestamp id) {
        path_.insert(id);
        table_->observe(id, 1);
        auto child = [&](Timestamp c) {
            if (reachable(c)) {
                collect(c);
            } else {
                table_->observe(origin, 1);
            }
        };
        std::visit(overload{
            [&](const ConNode& n) {
                if (const auto* ref = std::get_if<Timestamp>(&n.value)) table_->observe(*ref, 1);
            },
            [&](const ValNode& n) { child(n.value); },
            [&](const ObjNode& n) {
                for (const auto& [key, c] : n.entries) {
                    if (reachable(c)) collect(c);
                }
            },
            [&](const VecNode& n) {
                for (const auto& slot : n.elements) {
                    if (slot && reachable(*slot)) collect(*slot);
                }
            },
            [&](const StrNode& n) {
                for (const auto& c : n.rga.iter()) table_->observe(c.id, c.span);
            },
            [&](const BinNode& n) {
                for (const auto& c : n.rga.iter()) table_->observe(c.id, c.span);
            },
            [&](const ArrNode& n) {
                for (const auto& c : n.rga.iter()) {
                    table_->observe(c.id, c.span);
                    if (!c.data) continue;
                    for (auto e : *c.data) child(e);
                }
            },
        }, *state_.get(id));
        path_.erase(id);
    }

    void write_root() {
        if (!state_.get(state_.root.value)) {
            w_.write_u8(0);
            return;
        }
        write_node(state_.root.value);
    }

    void write_id(Timestamp id) {
        if (table_) {
            table_->write_id(w_, id);
            return;
        }
        if (id == origin) {
            w_.write_vu57(0);
            return;
        }
        if (id.sid != session::server) {
            throw Error{ErrorKind::encoding_error,
                        "id " + to_string(id) + " does not belong to the server session"};
        }
        w_.write_vu57(id.time);
    }

    void write_header(NodeKind kind, std::uint64_t length) {
        const auto major = static_cast<std::uint8_t>(static_cast<std::uint8_t>(kind) << 5);
        if (length < minor_length_follows) {
            w_.write_u8(static_cast<std::uint8_t>(major | length));
            return;
        }
        w_.write_u8(static_cast<std::uint8_t>(major | minor_length_follows));
        w_.write_vu57(length);
    }

    // Stand-in for a child that is missing or would close a cycle.
    void write_missing() {
        write_id(origin);
        write_header(NodeKind::con, 0);
        w_.write_cbor_undefined();
    }

    void write_child(Timestamp id) {
        if (reachable(id)) {
            write_node(id);
        } else {
            write_missing();
        }
    }

    void write_node(Timestamp id) {
        path_.insert(id);
        write_id(id);
        std::visit(overload{
            [&](const ConNode& n) {
                std::visit(overload{
                    [&](const Undefined&) {
                        write_header(NodeKind::con, 0);
                        w_.write_cbor_undefined();
                    },
                    [&](const nlohmann::json& j) {
                        write_header(NodeKind::con, 0);
                        w_.write_cbor(j);
                    },
                    [&](const Timestamp& ref) {
                        write_header(NodeKind::con, 1);
                        write_id(ref);
                    },
                }, n.value);
            },
            [&](const ValNode& n) {
                write_header(NodeKind::val, 0);
                write_child(n.value);
            },
            [&](const ObjNode& n) {
                auto kept = std::vector<std::pair<std::string, Timestamp>>{};
                for (const auto& entry : n.entries) {
                    if (reachable(entry.second)) kept.push_back(entry);
                }
                write_header(NodeKind::obj, kept.size());
                for (const auto& [key, c] : kept) {
                    w_.write_cbor(nlohmann::json(key));
                    write_node(c);
                }
            },
            [&](const VecNode& n) {
                write_header(NodeKind::vec, n.elements.size());
                for (const auto& slot : n.elements) {
                    if (slot && reachable(*slot)) {
                        write_node(*slot);
                    } else {
                        w_.write_u8(0);
                    }
                }
            },
            [&](const StrNode& n) {
                write_header(NodeKind::str, n.rga.chunk_count());
                for (const auto& c : n.rga.iter()) {
                    write_id(c.id);
                    if (c.deleted) {
                        w_.write_cbor(nlohmann::json(c.span));
                    } else {
                        w_.write_cbor(nlohmann::json(*c.data));
                    }
                }
            },
            [&](const BinNode& n) {
                write_header(NodeKind::bin, n.rga.chunk_count());
                for (const auto& c : n.rga.iter()) {
                    write_id(c.id);
                    w_.write_b1vu56(c.deleted, c.span);
                    if (!c.deleted) w_.write_bytes(*c.data);
                }
            },
            [&](const ArrNode& n) {
                write_header(NodeKind::arr, n.rga.chunk_count());
                for (const auto& c : n.rga.iter()) {
                    write_id(c.id);
                    w_.write_b1vu56(c.deleted, c.span);
                    if (c.deleted) continue;
                    for (auto e : *c.data) write_child(e);
                }
            },
        }, *state_.get(id));
        path_.erase(id);
    }

    const detail::ModelState& state_;
    std::optional<ClockTable> table_;
    std::set<Timestamp> path_;
    Writer w_;
};

// -- Decoder ------------------------------------------------------------------

class ModelDecoder {
public:
    explicit ModelDecoder(std::span<const std::byte> data) : data_{data} {}

    auto decode() -> std::unique_ptr<detail::ModelState> {
        if (data_.empty()) throw Error{ErrorKind::invalid_model, "empty document data"};
        if ((static_cast<std::uint8_t>(data_[0]) & server_marker) != 0) {
            decode_server();
        } else {
            decode_logical();
        }
        observe_all();
        return std::move(state_);
    }

private:
    void decode_logical() {
        auto head = Reader{data_};
        const auto root_size = require(head.read_u32_be());
        if (root_size > head.remaining()) {
            throw Error{ErrorKind::invalid_model, "root region runs past the end of the document"};
        }
        auto tail = Reader{data_.subspan(4 + root_size)};
        table_ = ClockTable::decode(tail);
        if (!table_) throw Error{ErrorKind::invalid_clock_table, "missing or truncated clock table"};
        if (!tail.at_end()) {
            throw Error{ErrorKind::trailing_bytes, "data after the clock table"};
        }
        state_ = std::make_unique<detail::ModelState>(Clock{table_->to_clock()});
        auto r = Reader{data_.subspan(4, root_size)};
        read_root(r);
        if (!r.at_end()) throw Error{ErrorKind::trailing_bytes, "data after the root node"};
    }

    void decode_server() {
        auto r = Reader{data_};
        r.read_u8();
        const auto time = require(r.read_vu57());
        state_ = std::make_unique<detail::ModelState>(Clock{ServerClockVector{time}});
        read_root(r);
        if (!r.at_end()) throw Error{ErrorKind::trailing_bytes, "data after the root node"};
    }

    void read_root(Reader& r) {
        if (require(r.peek_u8()) == 0) {
            r.read_u8();
            return;
        }
        auto id = read_node(r, 0);
        if (id != origin) state_->root.set(id);
    }

    // Every decoded id must sort before the next locally allocated one.
    void observe_all() {
        for (const auto& [id, node] : state_->index) {
            state_->observe(id, 1);
            std::visit(overload{
                [&](const StrNode& n) { for (const auto& c : n.rga.iter()) state_->observe(c.id, c.span); },
                [&](const BinNode& n) { for (const auto& c : n.rga.iter()) state_->observe(c.id, c.span); },
                [&](const ArrNode& n) { for (const auto& c : n.rga.iter()) state_->observe(c.id, c.span); },
                [](const auto&) {},
            }, node);
        }
    }

    auto read_id(Reader& r) -> Timestamp {
        if (table_) {
            auto id = table_->read_id(r);
            if (!id) throw Error{ErrorKind::invalid_model, "id outside the clock table"};
            return *id;
        }
        const auto time = require(r.read_vu57());
        return time == 0 ? origin : Timestamp{session::server, time};
    }

    auto read_node(Reader& r, int depth) -> Timestamp {
        if (depth > max_depth) throw Error{ErrorKind::invalid_model, "document nested too deeply"};
        const auto id = read_id(r);
        const auto octet = require(r.read_u8());
        const auto major = static_cast<std::uint8_t>(octet >> 5);
        auto length = static_cast<std::uint64_t>(octet & 0x1F);
        if (length == minor_length_follows) length = require(r.read_vu57());

        switch (major) {
            case static_cast<std::uint8_t>(NodeKind::con): return read_con(r, id, length);
            case static_cast<std::uint8_t>(NodeKind::val): {
                auto child = read_node(r, depth + 1);
                insert(id, ValNode{.id = id, .value = child});
                return id;
            }
            case static_cast<std::uint8_t>(NodeKind::obj): {
                auto node = ObjNode{.id = id, .entries = {}};
                for (std::uint64_t i = 0; i < length; ++i) {
                    auto key = require(r.read_cbor());
                    if (!key.value || !key.value->is_string()) {
                        throw Error{ErrorKind::invalid_model, "object key is not a string"};
                    }
                    auto child = read_node(r, depth + 1);
                    if (child != origin) node.put(key.value->get<std::string>(), child);
                }
                insert(id, std::move(node));
                return id;
            }
            case static_cast<std::uint8_t>(NodeKind::vec): {
                auto node = VecNode{.id = id, .elements = {}};
                for (std::uint64_t i = 0; i < length; ++i) {
                    if (require(r.peek_u8()) == 0) {
                        r.read_u8();
                        node.elements.emplace_back(std::nullopt);
                        continue;
                    }
                    auto child = read_node(r, depth + 1);
                    node.elements.emplace_back(child == origin ? std::nullopt
                                                               : std::optional<Timestamp>{child});
                }
                insert(id, std::move(node));
                return id;
            }
            case static_cast<std::uint8_t>(NodeKind::str): return read_str(r, id, length);
            case static_cast<std::uint8_t>(NodeKind::bin): return read_bin(r, id, length);
            case static_cast<std::uint8_t>(NodeKind::arr): return read_arr(r, id, length, depth);
            default:
                throw Error{ErrorKind::invalid_model,
                            "unknown node type " + std::to_string(major)};
        }
    }

    auto read_con(Reader& r, Timestamp id, std::uint64_t minor) -> Timestamp {
        auto value = ConValue{Undefined{}};
        if (minor == 0) {
            auto cbor = r.read_cbor();
            if (!cbor) throw Error{ErrorKind::invalid_cbor, "malformed constant value"};
            if (cbor->value) value = std::move(*cbor->value);
        } else if (minor == 1) {
            value = read_id(r);
        } else {
            throw Error{ErrorKind::invalid_model, "unknown constant encoding"};
        }
        if (id == origin) return origin;
        insert(id, ConNode{.id = id, .value = std::move(value)});
        return id;
    }

    auto read_str(Reader& r, Timestamp id, std::uint64_t count) -> Timestamp {
        auto node = StrNode{{.id = id, .rga = {}}};
        for (std::uint64_t i = 0; i < count; ++i) {
            const auto chunk_id = read_id(r);
            auto cbor = r.read_cbor();
            if (!cbor || !cbor->value) throw Error{ErrorKind::invalid_cbor, "malformed string chunk"};
            auto& item = *cbor->value;
            if (item.is_string()) {
                auto text = item.get<std::string>();
                if (!utf8::is_valid(text)) throw Error{ErrorKind::invalid_utf8, "string chunk is not UTF-8"};
                const auto span = static_cast<std::uint64_t>(utf8::length(text));
                if (span == 0) throw Error{ErrorKind::invalid_model, "empty string chunk"};
                node.rga.push_chunk({.id = chunk_id, .span = span, .deleted = false, .data = std::move(text)});
            } else if (item.is_number_unsigned()) {
                const auto span = item.get<std::uint64_t>();
                if (span == 0) throw Error{ErrorKind::invalid_model, "empty string chunk"};
                node.rga.push_chunk({.id = chunk_id, .span = span, .deleted = true, .data = std::nullopt});
            } else {
                throw Error{ErrorKind::invalid_model, "string chunk is neither text nor a span"};
            }
        }
        insert(id, std::move(node));
        return id;
    }

    auto read_bin(Reader& r, Timestamp id, std::uint64_t count) -> Timestamp {
        auto node = BinNode{{.id = id, .rga = {}}};
        for (std::uint64_t i = 0; i < count; ++i) {
            const auto chunk_id = read_id(r);
            const auto head = require(r.read_b1vu56());
            if (head.value == 0) throw Error{ErrorKind::invalid_model, "empty binary chunk"};
            if (head.flag) {
                node.rga.push_chunk({.id = chunk_id, .span = head.value, .deleted = true, .data = std::nullopt});
                continue;
            }
            auto bytes = require(r.read_bytes(static_cast<std::size_t>(head.value)));
            node.rga.push_chunk({.id = chunk_id, .span = head.value, .deleted = false,
                                 .data = Bytes(bytes.begin(), bytes.end())});
        }
        insert(id, std::move(node));
        return id;
    }

    auto read_arr(Reader& r, Timestamp id, std::uint64_t count, int depth) -> Timestamp {
        auto node = ArrNode{{.id = id, .rga = {}}};
        for (std::uint64_t i = 0; i < count; ++i) {
            const auto chunk_id = read_id(r);
            const auto head = require(r.read_b1vu56());
            if (head.value == 0) throw Error{ErrorKind::invalid_model, "empty array chunk"};
            if (head.flag) {
                node.rga.push_chunk({.id = chunk_id, .span = head.value, .deleted = true, .data = std::nullopt});
                continue;
            }
            // Every element takes at least two bytes.
            if (head.value > r.remaining()) {
                throw Error{ErrorKind::invalid_model, "unexpected end of document data"};
            }
            auto children = std::vector<Timestamp>{};
            children.reserve(static_cast<std::size_t>(head.value));
            for (std::uint64_t k = 0; k < head.value; ++k) children.push_back(read_node(r, depth + 1));
            node.rga.push_chunk({.id = chunk_id, .span = head.value, .deleted = false,
                                 .data = std::move(children)});
        }
        insert(id, std::move(node));
        return id;
    }

    template <typename N>
    void insert(Timestamp id, N node) {
        state_->index.emplace(id, Node{std::move(node)});
    }

    std::span<const std::byte> data_;
    std::optional<ClockTable> table_;
    std::unique_ptr<detail::ModelState> state_;
};

}  // anonymous namespace

auto encode_model(const detail::ModelState& state) -> Bytes {
    return ModelEncoder{state}.encode();
}

auto decode_model(std::span<const std::byte> data) -> std::unique_ptr<detail::ModelState> {
    return ModelDecoder{data}.decode();
}

}  // namespace json_crdt_cpp::storage
