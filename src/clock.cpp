#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/error.hpp>

#include <limits>
#include <random>

namespace json_crdt_cpp {

namespace {

// Last tick covered by `span` ticks starting at `time`.
auto checked_edge(std::uint64_t time, std::uint64_t span) -> std::uint64_t {
    if (span == 0) return time;
    if (time > std::numeric_limits<std::uint64_t>::max() - (span - 1)) {
        throw Error{ErrorKind::clock_overflow,
                    "clock edge overflows u64 at time " + std::to_string(time)};
    }
    return time + (span - 1);
}

auto checked_advance(std::uint64_t time, std::uint64_t span) -> std::uint64_t {
    if (time > std::numeric_limits<std::uint64_t>::max() - span) {
        throw Error{ErrorKind::clock_overflow,
                    "advancing clock by " + std::to_string(span) + " overflows u64"};
    }
    return time + span;
}

}  // anonymous namespace

auto random_session_id() -> std::uint64_t {
    static thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto dist = std::uniform_int_distribution<std::uint64_t>{65536, session::max};
    return dist(engine);
}

// -- ClockVector --------------------------------------------------------------

ClockVector::ClockVector(std::uint64_t sid, std::uint64_t time)
    : sid_{sid}, time_{time} {}

auto ClockVector::next(std::uint64_t span) -> Timestamp {
    auto id = Timestamp{sid_, time_};
    time_ = checked_advance(time_, span);
    return id;
}

void ClockVector::observe(Timestamp id, std::uint64_t span) {
    const auto edge = checked_edge(id.time, span);
    if (id.sid != sid_) {
        auto it = peers_.find(id.sid);
        if (it == peers_.end()) {
            peers_.emplace(id.sid, Timestamp{id.sid, edge});
        } else if (edge > it->second.time) {
            it->second.time = edge;
        }
    }
    if (edge >= time_) time_ = checked_advance(edge, 1);
}

auto ClockVector::fork(std::uint64_t sid) const -> ClockVector {
    auto copy = ClockVector{sid, time_};
    copy.peers_ = peers_;
    copy.peers_.erase(sid);
    if (time_ > 0 && sid != sid_) {
        copy.peers_[sid_] = Timestamp{sid_, time_ - 1};
    }
    return copy;
}

// -- ServerClockVector --------------------------------------------------------

ServerClockVector::ServerClockVector(std::uint64_t time) : time_{time} {}

auto ServerClockVector::next(std::uint64_t span) -> Timestamp {
    auto id = Timestamp{session::server, time_};
    time_ = checked_advance(time_, span);
    return id;
}

void ServerClockVector::observe(Timestamp id, std::uint64_t span) {
    const auto end = checked_advance(id.time, span);
    if (end > time_) time_ = end;
}

}  // namespace json_crdt_cpp
