/// @file patch_builder.hpp
/// @brief PatchBuilder: allocates ids and emits a well-formed op log.

#pragma once

#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/patch.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace json_crdt_cpp {

/// Builds a Patch one operation at a time.
///
/// The builder keeps a cursor (sid, time). Every call allocates the next id
/// from the cursor, advances it by the op's span, appends the op and
/// returns the new id. flush() hands out the patch and starts a new one at
/// the current cursor.
///
/// @code
/// auto builder = PatchBuilder{sid, 1};
/// auto obj = builder.obj();
/// builder.ins_obj(obj, {{"title", builder.con_val("hello")}});
/// builder.root(obj);
/// auto patch = builder.flush();
/// @endcode
class PatchBuilder {
public:
    PatchBuilder(std::uint64_t sid, std::uint64_t time);

    /// The id the next op will get.
    auto cursor() const -> Timestamp { return cursor_; }

    // -- Creation -------------------------------------------------------------

    auto con_val(nlohmann::json value) -> Timestamp;
    auto con_ref(Timestamp ref) -> Timestamp;
    auto con_undef() -> Timestamp;
    auto val() -> Timestamp;
    auto obj() -> Timestamp;
    auto vec() -> Timestamp;
    auto str_node() -> Timestamp;
    auto bin_node() -> Timestamp;
    auto arr() -> Timestamp;

    // -- Mutation -------------------------------------------------------------

    /// Point register `obj` at `val`.
    auto set_val(Timestamp obj, Timestamp val) -> Timestamp;

    /// Point the document root at `val`.
    auto root(Timestamp val) -> Timestamp;

    auto ins_obj(Timestamp obj, std::vector<std::pair<std::string, Timestamp>> data) -> Timestamp;
    auto ins_vec(Timestamp obj, std::vector<std::pair<std::uint8_t, Timestamp>> data) -> Timestamp;
    auto ins_str(Timestamp obj, Timestamp after, std::string data) -> Timestamp;
    auto ins_bin(Timestamp obj, Timestamp after, Bytes data) -> Timestamp;
    auto ins_arr(Timestamp obj, Timestamp after, std::vector<Timestamp> data) -> Timestamp;
    auto upd_arr(Timestamp obj, Timestamp ref, Timestamp val) -> Timestamp;
    auto del(Timestamp obj, std::vector<Timespan> what) -> Timestamp;
    auto nop(std::uint64_t len) -> Timestamp;

    // -- Composite ------------------------------------------------------------

    /// Emit the ops that create `value` as a fresh node tree.
    ///
    /// Scalars become constants, strings/binary/arrays/objects become
    /// their CRDT node with contents inserted. Array scalars are wrapped
    /// in a register so they can later be replaced in place.
    auto json(const nlohmann::json& value) -> Timestamp;

    /// Emit a nop so the cursor reaches `time`, if it is behind.
    void pad(std::uint64_t time);

    /// Append an already-built op, advancing the cursor past it.
    void push(Op op);

    auto ops() const -> const std::vector<Op>& { return patch_.ops; }
    void set_meta(nlohmann::json meta) { patch_.meta = std::move(meta); }

    /// Return the accumulated patch and reset the op buffer.
    auto flush() -> Patch;

private:
    auto next(std::uint64_t span) -> Timestamp;

    Timestamp cursor_;
    Patch patch_;
};

}  // namespace json_crdt_cpp
