/// @file types.hpp
/// @brief Core identity types: Timestamp, Timespan and session constants.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace json_crdt_cpp {

/// Reserved session ids.
namespace session {
inline constexpr std::uint64_t system = 0;               ///< Origin and sentinels.
inline constexpr std::uint64_t server = 1;               ///< The shared server clock.
inline constexpr std::uint64_t max = (1ULL << 53) - 1;   ///< Largest usable session id.
}  // namespace session

/// Identifies a single operation or node: (session, logical time).
///
/// Timestamps are globally unique and totally ordered. Time is compared
/// first; ties between concurrent replicas are broken by session id, the
/// higher session winning.
struct Timestamp {
    std::uint64_t sid{0};   ///< Originating replica.
    std::uint64_t time{0};  ///< Logical clock value at allocation.

    constexpr Timestamp() = default;
    constexpr Timestamp(std::uint64_t s, std::uint64_t t) : sid{s}, time{t} {}

    constexpr auto operator<=>(const Timestamp& other) const -> std::strong_ordering {
        if (auto c = time <=> other.time; c != 0) return c;
        return sid <=> other.sid;
    }
    auto operator==(const Timestamp&) const -> bool = default;
};

/// The origin sentinel. Anchoring a sequence insert here means "at the head".
inline constexpr auto origin = Timestamp{session::system, 0};

/// A run of `span` consecutive timestamps of one session.
struct Timespan {
    std::uint64_t sid{0};
    std::uint64_t time{0};
    std::uint64_t span{1};

    auto operator==(const Timespan&) const -> bool = default;

    /// The first timestamp of the run.
    constexpr auto start() const -> Timestamp { return {sid, time}; }

    /// Check if `id` falls inside this run.
    constexpr auto contains(Timestamp id) const -> bool {
        return id.sid == sid && id.time >= time && id.time - time < span;
    }
};

inline constexpr auto ts(std::uint64_t sid, std::uint64_t time) -> Timestamp {
    return Timestamp{sid, time};
}

inline constexpr auto tss(std::uint64_t sid, std::uint64_t time, std::uint64_t span) -> Timespan {
    return Timespan{.sid = sid, .time = time, .span = span};
}

/// Three-way compare as an int: negative, zero or positive.
constexpr auto compare(Timestamp a, Timestamp b) noexcept -> int {
    auto c = a <=> b;
    if (c < 0) return -1;
    if (c > 0) return 1;
    return 0;
}

/// Format as "sid.time".
inline auto to_string(Timestamp id) -> std::string {
    return std::to_string(id.sid) + "." + std::to_string(id.time);
}

/// Format as "sid.time!span".
inline auto to_string(const Timespan& span) -> std::string {
    return std::to_string(span.sid) + "." + std::to_string(span.time) + "!" +
           std::to_string(span.span);
}

/// Draw a random session id in [65536, session::max].
auto random_session_id() -> std::uint64_t;

}  // namespace json_crdt_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<json_crdt_cpp::Timestamp> {
    auto operator()(const json_crdt_cpp::Timestamp& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.time);
        auto h2 = std::hash<std::uint64_t>{}(id.sid);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
