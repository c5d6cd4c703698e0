#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/patch_builder.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace json_crdt_cpp;

TEST(PatchBuilder, ids_are_contiguous) {
    auto b = PatchBuilder{5, 1};
    auto obj = b.obj();
    auto str = b.str_node();
    auto ins = b.ins_str(str, str, "hey");
    auto con = b.con_val(42);
    auto set = b.ins_obj(obj, {{"n", con}, {"s", str}});

    EXPECT_EQ(obj, ts(5, 1));
    EXPECT_EQ(str, ts(5, 2));
    EXPECT_EQ(ins, ts(5, 3));
    EXPECT_EQ(con, ts(5, 6));
    EXPECT_EQ(set, ts(5, 7));
    EXPECT_EQ(b.cursor(), ts(5, 8));
}

TEST(PatchBuilder, string_insert_advances_by_utf16_length) {
    auto b = PatchBuilder{5, 1};
    b.ins_str(ts(5, 0), ts(5, 0), "A😀B");
    EXPECT_EQ(b.cursor(), ts(5, 5));
}

TEST(PatchBuilder, root_writes_the_origin_register) {
    auto b = PatchBuilder{5, 1};
    auto con = b.con_val("x");
    b.root(con);
    const auto patch = b.flush();

    ASSERT_EQ(patch.ops.size(), 2u);
    const auto& op = std::get<InsVal>(patch.ops[1]);
    EXPECT_EQ(op.obj, origin);
    EXPECT_EQ(op.val, con);
}

TEST(PatchBuilder, con_variants) {
    auto b = PatchBuilder{5, 1};
    b.con_val(nullptr);
    b.con_undef();
    b.con_ref(ts(9, 9));
    const auto patch = b.flush();

    EXPECT_EQ(std::get<NewCon>(patch.ops[0]).value, ConValue{nlohmann::json(nullptr)});
    EXPECT_TRUE(is_undefined(std::get<NewCon>(patch.ops[1]).value));
    EXPECT_EQ(std::get<NewCon>(patch.ops[2]).value, ConValue{ts(9, 9)});
}

TEST(PatchBuilder, json_builds_node_tree) {
    auto b = PatchBuilder{5, 1};
    b.json({{"list", {1, "two"}}, {"name", "x"}});
    const auto patch = b.flush();

    // obj, arr, val, con(1), ins_val, str, ins_str, ins_arr, str, ins_str, ins_obj
    ASSERT_EQ(patch.ops.size(), 11u);
    EXPECT_EQ(op_code(patch.ops[0]), OpCode::new_obj);
    EXPECT_EQ(op_code(patch.ops[1]), OpCode::new_arr);
    EXPECT_EQ(op_code(patch.ops[2]), OpCode::new_val);
    EXPECT_EQ(op_code(patch.ops[4]), OpCode::ins_val);
    EXPECT_EQ(op_code(patch.ops[7]), OpCode::ins_arr);
    EXPECT_EQ(op_code(patch.ops.back()), OpCode::ins_obj);
}

TEST(PatchBuilder, json_of_empty_containers_emits_only_creation) {
    auto b = PatchBuilder{5, 1};
    b.json(nlohmann::json::object());
    b.json(nlohmann::json::array());
    b.json("");
    const auto patch = b.flush();

    ASSERT_EQ(patch.ops.size(), 3u);
    EXPECT_EQ(op_code(patch.ops[2]), OpCode::new_str);
}

TEST(PatchBuilder, pad_emits_nop_only_when_behind) {
    auto b = PatchBuilder{5, 1};
    b.pad(1);
    EXPECT_TRUE(b.ops().empty());

    b.pad(10);
    ASSERT_EQ(b.ops().size(), 1u);
    EXPECT_EQ(std::get<Nop>(b.ops()[0]).len, 9u);
    EXPECT_EQ(b.cursor(), ts(5, 10));
}

TEST(PatchBuilder, push_advances_past_own_ops) {
    auto b = PatchBuilder{5, 1};
    b.push(InsStr{.id = ts(5, 10), .obj = ts(5, 2), .after = ts(5, 2), .data = "abc"});
    EXPECT_EQ(b.cursor(), ts(5, 13));

    b.push(NewVal{.id = ts(6, 50)});
    EXPECT_EQ(b.cursor(), ts(5, 13));
    EXPECT_EQ(b.ops().size(), 2u);
}

TEST(PatchBuilder, flush_resets_ops_but_keeps_cursor) {
    auto b = PatchBuilder{5, 1};
    b.set_meta({{"k", 1}});
    b.val();
    auto first = b.flush();
    b.val();
    auto second = b.flush();

    EXPECT_TRUE(first.meta.has_value());
    EXPECT_FALSE(second.meta.has_value());
    EXPECT_EQ(second.get_id(), std::optional<Timestamp>{ts(5, 2)});
}

TEST(PatchBuilder, cursor_overflow_throws) {
    auto b = PatchBuilder{5, std::numeric_limits<std::uint64_t>::max()};
    try {
        b.nop(2);
        FAIL() << "expected clock_overflow";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind, ErrorKind::clock_overflow);
    }
}
