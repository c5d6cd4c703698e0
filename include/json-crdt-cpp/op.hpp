/// @file op.hpp
/// @brief The 16 operation kinds of a patch.

#pragma once

#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace json_crdt_cpp {

/// Operation codes, as written by the compact and binary codecs.
enum class OpCode : std::uint8_t {
    new_con = 0,
    new_val = 1,
    new_obj = 2,
    new_vec = 3,
    new_str = 4,
    new_bin = 5,
    new_arr = 6,
    ins_val = 9,
    ins_obj = 10,
    ins_vec = 11,
    ins_str = 12,
    ins_bin = 13,
    ins_arr = 14,
    upd_arr = 15,
    del = 16,
    nop = 17,
};

/// Convert an OpCode to the name the verbose codec uses.
constexpr auto to_string_view(OpCode code) noexcept -> std::string_view {
    switch (code) {
        case OpCode::new_con: return "new_con";
        case OpCode::new_val: return "new_val";
        case OpCode::new_obj: return "new_obj";
        case OpCode::new_vec: return "new_vec";
        case OpCode::new_str: return "new_str";
        case OpCode::new_bin: return "new_bin";
        case OpCode::new_arr: return "new_arr";
        case OpCode::ins_val: return "ins_val";
        case OpCode::ins_obj: return "ins_obj";
        case OpCode::ins_vec: return "ins_vec";
        case OpCode::ins_str: return "ins_str";
        case OpCode::ins_bin: return "ins_bin";
        case OpCode::ins_arr: return "ins_arr";
        case OpCode::upd_arr: return "upd_arr";
        case OpCode::del:     return "del";
        case OpCode::nop:     return "nop";
    }
    return "unknown";
}

/// Look up an OpCode by its verbose name.
auto op_code_from_name(std::string_view name) -> std::optional<OpCode>;

/// Map a raw opcode number to an OpCode, or nullopt for unassigned numbers.
auto op_code_from_number(std::uint64_t n) -> std::optional<OpCode>;

// -- Creation operations ------------------------------------------------------

/// Create a constant node.
struct NewCon {
    Timestamp id;
    ConValue value{Undefined{}};
    auto operator==(const NewCon&) const -> bool = default;
};

/// Create a last-write-wins register.
struct NewVal {
    Timestamp id;
    auto operator==(const NewVal&) const -> bool = default;
};

/// Create a map.
struct NewObj {
    Timestamp id;
    auto operator==(const NewObj&) const -> bool = default;
};

/// Create a vector.
struct NewVec {
    Timestamp id;
    auto operator==(const NewVec&) const -> bool = default;
};

/// Create a string.
struct NewStr {
    Timestamp id;
    auto operator==(const NewStr&) const -> bool = default;
};

/// Create a binary blob.
struct NewBin {
    Timestamp id;
    auto operator==(const NewBin&) const -> bool = default;
};

/// Create an array.
struct NewArr {
    Timestamp id;
    auto operator==(const NewArr&) const -> bool = default;
};

// -- Mutation operations ------------------------------------------------------

/// Point a register (or the root, when `obj` is origin) at `val`.
struct InsVal {
    Timestamp id;
    Timestamp obj;
    Timestamp val;
    auto operator==(const InsVal&) const -> bool = default;
};

/// Write keys of a map.
struct InsObj {
    Timestamp id;
    Timestamp obj;
    std::vector<std::pair<std::string, Timestamp>> data;
    auto operator==(const InsObj&) const -> bool = default;
};

/// Write indices of a vector.
struct InsVec {
    Timestamp id;
    Timestamp obj;
    std::vector<std::pair<std::uint8_t, Timestamp>> data;
    auto operator==(const InsVec&) const -> bool = default;
};

/// Insert text after item `after` of a string.
struct InsStr {
    Timestamp id;
    Timestamp obj;
    Timestamp after;
    std::string data;
    auto operator==(const InsStr&) const -> bool = default;
};

/// Insert bytes after item `after` of a binary blob.
struct InsBin {
    Timestamp id;
    Timestamp obj;
    Timestamp after;
    Bytes data;
    auto operator==(const InsBin&) const -> bool = default;
};

/// Insert node references after item `after` of an array.
struct InsArr {
    Timestamp id;
    Timestamp obj;
    Timestamp after;
    std::vector<Timestamp> data;
    auto operator==(const InsArr&) const -> bool = default;
};

/// Replace the node held by array item `ref`.
struct UpdArr {
    Timestamp id;
    Timestamp obj;
    Timestamp ref;
    Timestamp val;
    auto operator==(const UpdArr&) const -> bool = default;
};

/// Tombstone ranges of a sequence node.
struct Del {
    Timestamp id;
    Timestamp obj;
    std::vector<Timespan> what;
    auto operator==(const Del&) const -> bool = default;
};

/// Consume `len` clock ticks without effect.
struct Nop {
    Timestamp id;
    std::uint64_t len{1};
    auto operator==(const Nop&) const -> bool = default;
};

/// Any operation.
using Op = std::variant<
    NewCon, NewVal, NewObj, NewVec, NewStr, NewBin, NewArr,
    InsVal, InsObj, InsVec, InsStr, InsBin, InsArr, UpdArr, Del, Nop
>;

/// The id of an operation.
auto op_id(const Op& op) -> Timestamp;

/// Logical clock cost of an operation.
///
/// 1 for creation and register ops, the UTF-16 length for string inserts,
/// the element count for binary and array inserts, `len` for Nop.
auto op_span(const Op& op) -> std::uint64_t;

auto op_code(const Op& op) -> OpCode;

/// One-line human readable form, e.g. `ins_str 123.5!3 obj=123.1 after=123.1 "abc"`.
auto to_string(const Op& op) -> std::string;

}  // namespace json_crdt_cpp
