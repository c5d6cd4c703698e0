#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/error.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace json_crdt_cpp;

// -- ClockVector --------------------------------------------------------------

TEST(ClockVector, next_returns_current_and_advances) {
    auto clock = ClockVector{100, 1};

    EXPECT_EQ(clock.next(), ts(100, 1));
    EXPECT_EQ(clock.next(5), ts(100, 2));
    EXPECT_EQ(clock.peek(), ts(100, 7));
    EXPECT_EQ(clock.time(), 7u);
}

TEST(ClockVector, observe_foreign_records_peer_and_moves_local_time) {
    auto clock = ClockVector{100, 1};
    clock.observe(ts(200, 10), 3);

    ASSERT_EQ(clock.peers().size(), 1u);
    EXPECT_EQ(clock.peers().at(200), ts(200, 12));
    EXPECT_EQ(clock.time(), 13u);
}

TEST(ClockVector, observe_never_lowers_peer_mark) {
    auto clock = ClockVector{100, 1};
    clock.observe(ts(200, 10), 1);
    clock.observe(ts(200, 4), 1);

    EXPECT_EQ(clock.peers().at(200), ts(200, 10));
}

TEST(ClockVector, observe_old_ids_keeps_time) {
    auto clock = ClockVector{100, 50};
    clock.observe(ts(200, 3), 2);

    EXPECT_EQ(clock.time(), 50u);
}

TEST(ClockVector, observe_own_session_is_not_a_peer) {
    auto clock = ClockVector{100, 1};
    clock.observe(ts(100, 5), 2);

    EXPECT_TRUE(clock.peers().empty());
    EXPECT_EQ(clock.time(), 7u);
}

TEST(ClockVector, fork_records_old_session_as_peer) {
    auto clock = ClockVector{100, 1};
    clock.next(9);
    clock.observe(ts(200, 3), 1);

    auto forked = clock.fork(300);

    EXPECT_EQ(forked.sid(), 300u);
    EXPECT_EQ(forked.time(), clock.time());
    EXPECT_EQ(forked.peers().at(100), ts(100, 9));
    EXPECT_EQ(forked.peers().at(200), ts(200, 3));
}

TEST(ClockVector, next_overflow_throws) {
    auto clock = ClockVector{100, std::numeric_limits<std::uint64_t>::max() - 1};
    try {
        clock.next(5);
        FAIL() << "expected clock_overflow";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::clock_overflow);
    }
}

TEST(ClockVector, observe_overflow_throws) {
    auto clock = ClockVector{100, 1};
    EXPECT_THROW(clock.observe(ts(200, std::numeric_limits<std::uint64_t>::max()), 2), Error);
}

// -- ServerClockVector --------------------------------------------------------

TEST(ServerClockVector, ids_belong_to_server_session) {
    auto clock = ServerClockVector{1};

    EXPECT_EQ(clock.sid(), session::server);
    EXPECT_EQ(clock.next(), ts(session::server, 1));
    EXPECT_EQ(clock.next(3), ts(session::server, 2));
    EXPECT_EQ(clock.time(), 5u);
}

TEST(ServerClockVector, observe_raises_time) {
    auto clock = ServerClockVector{1};
    clock.observe(ts(session::server, 10), 2);
    EXPECT_EQ(clock.time(), 12u);

    clock.observe(ts(session::server, 3), 1);
    EXPECT_EQ(clock.time(), 12u);
}
