/// @file clock.hpp
/// @brief Logical clocks: per-session vector clock and the shared server clock.

#pragma once

#include <json-crdt-cpp/types.hpp>

#include <cstdint>
#include <map>
#include <variant>

namespace json_crdt_cpp {

/// A per-session logical clock that also tracks the highest time observed
/// from every foreign session.
///
/// `time()` is the next time the local session will allocate.
class ClockVector {
public:
    ClockVector(std::uint64_t sid, std::uint64_t time);

    auto sid() const -> std::uint64_t { return sid_; }
    auto time() const -> std::uint64_t { return time_; }

    /// The next timestamp to be allocated, without advancing.
    auto peek() const -> Timestamp { return Timestamp{sid_, time_}; }

    /// Return the current timestamp and advance the clock by `span`.
    /// @throws Error (clock_overflow) if the clock would wrap.
    auto next(std::uint64_t span = 1) -> Timestamp;

    /// Record that `span` ticks starting at `id` exist.
    ///
    /// Foreign high-water marks are only ever raised. The local time moves
    /// past the observed edge so later local ids sort after it.
    /// @throws Error (clock_overflow) if the edge does not fit in u64.
    void observe(Timestamp id, std::uint64_t span);

    /// Highest observed timestamp per foreign session.
    auto peers() const -> const std::map<std::uint64_t, Timestamp>& { return peers_; }

    /// Copy this clock under a new session id. The old local session
    /// becomes a peer of the copy.
    auto fork(std::uint64_t sid) const -> ClockVector;

    auto operator==(const ClockVector&) const -> bool = default;

private:
    std::uint64_t sid_;
    std::uint64_t time_;
    std::map<std::uint64_t, Timestamp> peers_;
};

/// A clock shared by all writers through a central server. Every id it
/// allocates belongs to `session::server`.
class ServerClockVector {
public:
    explicit ServerClockVector(std::uint64_t time);

    auto sid() const -> std::uint64_t { return session::server; }
    auto time() const -> std::uint64_t { return time_; }
    auto peek() const -> Timestamp { return Timestamp{session::server, time_}; }

    /// @throws Error (clock_overflow) if the clock would wrap.
    auto next(std::uint64_t span = 1) -> Timestamp;

    /// Raise the clock past `span` ticks starting at `id`.
    void observe(Timestamp id, std::uint64_t span);

    auto operator==(const ServerClockVector&) const -> bool = default;

private:
    std::uint64_t time_;
};

/// Either clock flavour, as held by a Model.
using Clock = std::variant<ClockVector, ServerClockVector>;

}  // namespace json_crdt_cpp
