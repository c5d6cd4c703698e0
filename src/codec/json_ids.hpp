#pragma once

// Shared helpers of the verbose and compact JSON codecs: id encodings and
// shape checks.
// Internal header — not installed.

#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/utf8.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace json_crdt_cpp::codec::detail {

[[noreturn]] inline void invalid_patch(const std::string& what) {
    throw Error{ErrorKind::invalid_patch, what};
}

inline auto as_uint(const nlohmann::json& j, std::string_view what) -> std::uint64_t {
    if (!j.is_number_unsigned()) invalid_patch(std::string{what} + " must be an unsigned integer");
    return j.get<std::uint64_t>();
}

inline auto as_array(const nlohmann::json& j, std::string_view what) -> const nlohmann::json& {
    if (!j.is_array()) invalid_patch(std::string{what} + " must be an array");
    return j;
}

inline auto as_string(const nlohmann::json& j, std::string_view what) -> const std::string& {
    if (!j.is_string()) invalid_patch(std::string{what} + " must be a string");
    return j.get_ref<const std::string&>();
}

// A string that must also be valid UTF-8, such as ins_str text.
inline auto as_text(const nlohmann::json& j, std::string_view what) -> const std::string& {
    const auto& text = as_string(j, what);
    if (!utf8::is_valid(text)) throw Error{ErrorKind::invalid_utf8, std::string{what} + " is not UTF-8"};
    return text;
}

// -- Absolute ids: server session as a number, others as [sid, time] ----------

inline auto encode_absolute(Timestamp id) -> nlohmann::json {
    if (id.sid == session::server) return id.time;
    return nlohmann::json::array({id.sid, id.time});
}

inline auto decode_absolute(const nlohmann::json& j) -> Timestamp {
    if (j.is_number_unsigned()) return Timestamp{session::server, j.get<std::uint64_t>()};
    if (j.is_array() && j.size() == 2) return Timestamp{as_uint(j[0], "sid"), as_uint(j[1], "time")};
    invalid_patch("invalid id " + j.dump());
}

// -- Relative ids: patch session as a number, others as [sid, time] -----------

inline auto encode_relative(Timestamp id, std::uint64_t patch_sid) -> nlohmann::json {
    if (id.sid == patch_sid) return id.time;
    return nlohmann::json::array({id.sid, id.time});
}

inline auto decode_relative(const nlohmann::json& j, std::uint64_t patch_sid) -> Timestamp {
    if (j.is_number_unsigned()) return Timestamp{patch_sid, j.get<std::uint64_t>()};
    if (j.is_array() && j.size() == 2) return Timestamp{as_uint(j[0], "sid"), as_uint(j[1], "time")};
    invalid_patch("invalid id " + j.dump());
}

// The id a patch is written under. An empty patch is written at origin.
inline auto header_id(const Patch& patch) -> Timestamp {
    return patch.get_id().value_or(origin);
}

// A builder that re-creates ops from `start` on, plus the patch's meta.
inline auto make_builder(Timestamp start, std::optional<nlohmann::json> meta) -> PatchBuilder {
    auto builder = PatchBuilder{start.sid, start.time};
    if (meta) builder.set_meta(std::move(*meta));
    return builder;
}

}  // namespace json_crdt_cpp::codec::detail
