#include <json-crdt-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace json_crdt_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::overflow),            "overflow");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_opcode),      "unknown_opcode");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_cbor),        "invalid_cbor");
    EXPECT_EQ(to_string_view(ErrorKind::trailing_bytes),      "trailing_bytes");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_utf8),        "invalid_utf8");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_clock_table), "invalid_clock_table");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_model),       "invalid_model");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_patch),       "invalid_patch");
    EXPECT_EQ(to_string_view(ErrorKind::clock_overflow),      "clock_overflow");
    EXPECT_EQ(to_string_view(ErrorKind::encoding_error),      "encoding_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::overflow, "bad bytes"};
    const auto e2 = Error{ErrorKind::overflow, "bad bytes"};
    const auto e3 = Error{ErrorKind::invalid_cbor, "bad bytes"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_patch, "foo"};
    const auto e2 = Error{ErrorKind::invalid_patch, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Error, kind_and_message_are_accessible) {
    const auto e = Error{ErrorKind::trailing_bytes, "3 bytes after the patch"};

    EXPECT_EQ(e.kind, ErrorKind::trailing_bytes);
    EXPECT_EQ(e.message, "3 bytes after the patch");
    EXPECT_STREQ(e.what(), "3 bytes after the patch");
}

TEST(Error, is_a_runtime_error) {
    try {
        throw Error{ErrorKind::invalid_model, "truncated"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "truncated");
        return;
    }
    FAIL() << "Error was not caught as std::runtime_error";
}
