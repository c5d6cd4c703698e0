#include <json-crdt-cpp/op.hpp>

#include <gtest/gtest.h>

using namespace json_crdt_cpp;

TEST(OpCode, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpCode::new_con), "new_con");
    EXPECT_EQ(to_string_view(OpCode::new_val), "new_val");
    EXPECT_EQ(to_string_view(OpCode::new_obj), "new_obj");
    EXPECT_EQ(to_string_view(OpCode::new_vec), "new_vec");
    EXPECT_EQ(to_string_view(OpCode::new_str), "new_str");
    EXPECT_EQ(to_string_view(OpCode::new_bin), "new_bin");
    EXPECT_EQ(to_string_view(OpCode::new_arr), "new_arr");
    EXPECT_EQ(to_string_view(OpCode::ins_val), "ins_val");
    EXPECT_EQ(to_string_view(OpCode::ins_obj), "ins_obj");
    EXPECT_EQ(to_string_view(OpCode::ins_vec), "ins_vec");
    EXPECT_EQ(to_string_view(OpCode::ins_str), "ins_str");
    EXPECT_EQ(to_string_view(OpCode::ins_bin), "ins_bin");
    EXPECT_EQ(to_string_view(OpCode::ins_arr), "ins_arr");
    EXPECT_EQ(to_string_view(OpCode::upd_arr), "upd_arr");
    EXPECT_EQ(to_string_view(OpCode::del),     "del");
    EXPECT_EQ(to_string_view(OpCode::nop),     "nop");
}

TEST(OpCode, numbers_match_the_wire_format) {
    EXPECT_EQ(static_cast<int>(OpCode::new_arr), 6);
    EXPECT_EQ(static_cast<int>(OpCode::ins_val), 9);
    EXPECT_EQ(static_cast<int>(OpCode::nop), 17);
}

TEST(OpCode, lookup_by_name_and_number) {
    EXPECT_EQ(op_code_from_name("ins_str"), std::optional<OpCode>{OpCode::ins_str});
    EXPECT_EQ(op_code_from_name("bogus"), std::nullopt);
    EXPECT_EQ(op_code_from_number(16), std::optional<OpCode>{OpCode::del});
    EXPECT_EQ(op_code_from_number(7), std::nullopt);
    EXPECT_EQ(op_code_from_number(8), std::nullopt);
    EXPECT_EQ(op_code_from_number(18), std::nullopt);
}

TEST(Op, id_and_code) {
    const auto op = Op{InsObj{.id = ts(5, 9), .obj = ts(5, 1), .data = {{"k", ts(5, 8)}}}};

    EXPECT_EQ(op_id(op), ts(5, 9));
    EXPECT_EQ(op_code(op), OpCode::ins_obj);
}

TEST(Op, span_of_creation_and_register_ops_is_one) {
    EXPECT_EQ(op_span(Op{NewStr{.id = ts(1, 1)}}), 1u);
    EXPECT_EQ(op_span(Op{InsVal{.id = ts(1, 2), .obj = ts(1, 1), .val = ts(1, 1)}}), 1u);
    EXPECT_EQ(op_span(Op{Del{.id = ts(1, 3), .obj = ts(1, 1), .what = {tss(1, 1, 9)}}}), 1u);
}

TEST(Op, span_of_inserts_counts_items) {
    EXPECT_EQ(op_span(Op{InsStr{.id = ts(1, 1), .obj = ts(1, 0), .after = ts(1, 0), .data = "A😀B"}}), 4u);
    EXPECT_EQ(op_span(Op{InsBin{.id = ts(1, 1), .obj = ts(1, 0), .after = ts(1, 0),
                               .data = Bytes(3, std::byte{0})}}), 3u);
    EXPECT_EQ(op_span(Op{InsArr{.id = ts(1, 1), .obj = ts(1, 0), .after = ts(1, 0),
                               .data = {ts(1, 1), ts(1, 2)}}}), 2u);
    EXPECT_EQ(op_span(Op{Nop{.id = ts(1, 1), .len = 7}}), 7u);
}

TEST(Op, equality_detects_different_payloads) {
    const auto a = Op{InsStr{.id = ts(1, 2), .obj = ts(1, 1), .after = ts(1, 1), .data = "ab"}};
    auto b = a;
    std::get<InsStr>(b).data = "ac";

    EXPECT_NE(a, b);
    EXPECT_EQ(a, (Op{InsStr{.id = ts(1, 2), .obj = ts(1, 1), .after = ts(1, 1), .data = "ab"}}));
}

TEST(Op, to_string_is_one_line) {
    const auto op = Op{InsStr{.id = ts(123, 5), .obj = ts(123, 1), .after = ts(123, 1), .data = "abc"}};

    EXPECT_EQ(to_string(op), "ins_str 123.5!3 obj=123.1 after=123.1 \"abc\"");
    EXPECT_EQ(to_string(Op{NewCon{.id = ts(1, 1), .value = Undefined{}}}), "new_con 1.1!1 undefined");
    EXPECT_EQ(to_string(Op{NewCon{.id = ts(1, 1), .value = ts(2, 3)}}), "new_con 1.1!1 ref 2.3");
}
