#include <json-crdt-cpp/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace json_crdt_cpp;

// -- Session constants --------------------------------------------------------

TEST(Session, reserved_ids) {
    EXPECT_EQ(session::system, 0u);
    EXPECT_EQ(session::server, 1u);
    EXPECT_EQ(session::max, 9007199254740991u);
}

TEST(Session, random_session_id_is_in_user_range) {
    for (int i = 0; i < 1000; ++i) {
        const auto sid = random_session_id();
        EXPECT_GE(sid, 65536u);
        EXPECT_LE(sid, session::max);
    }
}

// -- Timestamp ----------------------------------------------------------------

TEST(Timestamp, default_constructed_is_origin) {
    EXPECT_EQ(Timestamp{}, origin);
    EXPECT_EQ(origin.sid, session::system);
    EXPECT_EQ(origin.time, 0u);
}

TEST(Timestamp, ordering_compares_time_first) {
    EXPECT_LT(ts(9, 1), ts(1, 2));
    EXPECT_GT(ts(1, 3), ts(9, 2));
}

TEST(Timestamp, ordering_breaks_ties_by_session) {
    EXPECT_LT(ts(1, 5), ts(2, 5));
    EXPECT_EQ(compare(ts(2, 5), ts(1, 5)), 1);
    EXPECT_EQ(compare(ts(1, 5), ts(2, 5)), -1);
    EXPECT_EQ(compare(ts(3, 5), ts(3, 5)), 0);
}

TEST(Timestamp, sort_is_total) {
    auto ids = std::vector<Timestamp>{ts(2, 3), ts(1, 3), ts(5, 1), ts(1, 10)};
    std::ranges::sort(ids);

    EXPECT_EQ(ids, (std::vector<Timestamp>{ts(5, 1), ts(1, 3), ts(2, 3), ts(1, 10)}));
}

TEST(Timestamp, to_string_format) {
    EXPECT_EQ(to_string(ts(123, 45)), "123.45");
}

TEST(Timestamp, hashable_in_unordered_set) {
    auto set = std::unordered_set<Timestamp>{};
    set.insert(ts(1, 1));
    set.insert(ts(1, 1));
    set.insert(ts(1, 2));

    EXPECT_EQ(set.size(), 2u);
}

// -- Timespan -----------------------------------------------------------------

TEST(Timespan, contains_covers_the_run) {
    const auto span = tss(7, 10, 3);

    EXPECT_FALSE(span.contains(ts(7, 9)));
    EXPECT_TRUE(span.contains(ts(7, 10)));
    EXPECT_TRUE(span.contains(ts(7, 12)));
    EXPECT_FALSE(span.contains(ts(7, 13)));
    EXPECT_FALSE(span.contains(ts(8, 11)));
}

TEST(Timespan, start_and_to_string) {
    const auto span = tss(7, 10, 3);

    EXPECT_EQ(span.start(), ts(7, 10));
    EXPECT_EQ(to_string(span), "7.10!3");
}
