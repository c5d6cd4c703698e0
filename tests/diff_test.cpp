#include <json-crdt-cpp/diff.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace json_crdt_cpp;
using nlohmann::json;

namespace {

auto set_root(Model& doc, const json& value) -> Patch {
    return doc.edit([&](PatchBuilder& b) { b.root(b.json(value)); });
}

auto count_ops(const Patch& patch, OpCode code) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(patch.ops.begin(), patch.ops.end(),
                                                  [&](const Op& op) { return op_code(op) == code; }));
}

// Diff, apply, and return the patch for inspection.
auto diff_apply(Model& doc, const json& dst) -> Patch {
    auto patch = JsonCrdtDiff{doc}.diff(dst);
    EXPECT_TRUE(patch.has_value());
    if (!patch) return Patch{};
    doc.apply_patch(*patch);
    EXPECT_EQ(doc.view(), dst);
    return *patch;
}

}  // anonymous namespace

// -- Basics -------------------------------------------------------------------

TEST(JsonCrdtDiff, equal_view_yields_no_patch) {
    auto doc = Model{100};
    set_root(doc, {{"a", 1}, {"s", "text"}});
    EXPECT_EQ(JsonCrdtDiff{doc}.diff({{"a", 1}, {"s", "text"}}), std::nullopt);
}

TEST(JsonCrdtDiff, empty_model_against_null_yields_no_patch) {
    const auto doc = Model{100};
    EXPECT_EQ(JsonCrdtDiff{doc}.diff(nullptr), std::nullopt);
}

TEST(JsonCrdtDiff, empty_model_gets_a_root) {
    auto doc = Model{100};
    diff_apply(doc, {{"a", 1}});
}

TEST(JsonCrdtDiff, patch_ids_follow_the_model_clock) {
    auto doc = Model{100};
    set_root(doc, {{"a", 1}});
    const auto patch = *JsonCrdtDiff{doc}.diff({{"a", 2}});
    EXPECT_EQ(patch.get_id(), std::optional<Timestamp>{ts(100, doc.time())});
}

// -- Objects ------------------------------------------------------------------

TEST(JsonCrdtDiff, added_key_is_one_object_insert) {
    auto doc = Model{100};
    set_root(doc, {{"a", 1}});
    const auto patch = diff_apply(doc, {{"a", 1}, {"b", 2}});

    EXPECT_EQ(count_ops(patch, OpCode::ins_obj), 1u);
    EXPECT_EQ(count_ops(patch, OpCode::new_con), 1u);
    EXPECT_EQ(patch.ops.size(), 2u);
}

TEST(JsonCrdtDiff, removed_key_is_written_undefined) {
    auto doc = Model{100};
    set_root(doc, {{"a", 1}, {"b", 2}});
    const auto patch = diff_apply(doc, {{"a", 1}});

    ASSERT_EQ(patch.ops.size(), 2u);
    EXPECT_TRUE(is_undefined(std::get<NewCon>(patch.ops[0]).value));
}

TEST(JsonCrdtDiff, nested_change_keeps_outer_nodes) {
    auto doc = Model{100};
    set_root(doc, {{"o", {{"x", "ab"}, {"y", 1}}}});
    const auto root = doc.root();
    const auto patch = diff_apply(doc, {{"o", {{"x", "abc"}, {"y", 1}}}});

    EXPECT_EQ(doc.root(), root);
    ASSERT_EQ(patch.ops.size(), 1u);
    EXPECT_EQ(std::get<InsStr>(patch.ops[0]).data, "c");
}

TEST(JsonCrdtDiff, root_type_change_replaces_root) {
    auto doc = Model{100};
    set_root(doc, "hello");
    const auto old_root = doc.root();
    diff_apply(doc, 42);

    EXPECT_NE(doc.root(), old_root);
}

TEST(JsonCrdtDiff, self_referencing_register_is_replaced) {
    auto doc = Model{100};
    doc.edit([](PatchBuilder& b) {
        auto reg = b.val();
        b.set_val(reg, reg);
        b.root(reg);
    });
    const auto reg = doc.root();
    ASSERT_EQ(doc.view(), json(nullptr));

    const auto patch = diff_apply(doc, {{"a", 1}});

    EXPECT_EQ(doc.root(), reg);
    EXPECT_EQ(count_ops(patch, OpCode::ins_val), 1u);
    EXPECT_EQ(std::get<InsVal>(patch.ops.back()).obj, reg);
}

TEST(JsonCrdtDiff, object_containing_itself_gets_fresh_value) {
    auto doc = Model{100};
    doc.edit([](PatchBuilder& b) {
        auto obj = b.obj();
        b.ins_obj(obj, {{"self", obj}});
        b.root(obj);
    });
    ASSERT_EQ(doc.view(), json({{"self", nullptr}}));

    diff_apply(doc, {{"self", {{"a", 1}}}});
    diff_apply(doc, {{"self", {{"a", 2}}}});
}

TEST(JsonCrdtDiff, diff_dst_keys_keeps_other_keys) {
    auto doc = Model{100};
    set_root(doc, {{"a", 1}, {"b", 2}});

    const auto patch = JsonCrdtDiff{doc}.diff_dst_keys({{"b", 3}});
    ASSERT_TRUE(patch.has_value());
    doc.apply_patch(*patch);

    EXPECT_EQ(doc.view(), json({{"a", 1}, {"b", 3}}));
}

// -- Strings and binary -------------------------------------------------------

TEST(JsonCrdtDiff, string_insert_in_the_middle) {
    auto doc = Model{100};
    set_root(doc, "hello world");
    const auto patch = diff_apply(doc, "hello there world");

    ASSERT_EQ(patch.ops.size(), 1u);
    EXPECT_EQ(std::get<InsStr>(patch.ops[0]).data, "there ");
}

TEST(JsonCrdtDiff, string_replace_inserts_then_deletes) {
    auto doc = Model{100};
    set_root(doc, "hello");
    const auto patch = diff_apply(doc, "hallo");

    ASSERT_EQ(patch.ops.size(), 2u);
    EXPECT_EQ(op_code(patch.ops[0]), OpCode::ins_str);
    EXPECT_EQ(op_code(patch.ops[1]), OpCode::del);
}

TEST(JsonCrdtDiff, replacement_is_anchored_on_last_deleted_item) {
    auto doc = Model{100};
    set_root(doc, "abcde");
    const auto str = doc.root();
    const auto last_deleted = *std::get<StrNode>(*doc.node(str)).find(2);
    const auto patch = diff_apply(doc, "aXYde");

    ASSERT_EQ(patch.ops.size(), 2u);
    EXPECT_EQ(std::get<InsStr>(patch.ops[0]).after, last_deleted);
    EXPECT_EQ(std::get<Del>(patch.ops[1]).what, (std::vector<Timespan>{tss(100, 3, 2)}));
}

TEST(JsonCrdtDiff, string_deletion_coalesces_into_one_span) {
    auto doc = Model{100};
    set_root(doc, "abcdef");
    const auto patch = diff_apply(doc, "af");

    ASSERT_EQ(patch.ops.size(), 1u);
    EXPECT_EQ(std::get<Del>(patch.ops[0]).what.size(), 1u);
    EXPECT_EQ(std::get<Del>(patch.ops[0]).what[0].span, 4u);
}

TEST(JsonCrdtDiff, string_edits_work_on_code_points) {
    auto doc = Model{100};
    set_root(doc, "a😀b");
    diff_apply(doc, "a😁b");
    diff_apply(doc, "é");
}

TEST(JsonCrdtDiff, binary_edit) {
    auto doc = Model{100};
    set_root(doc, json::binary({1, 2, 3}));
    const auto patch = diff_apply(doc, json::binary({1, 9, 3}));

    EXPECT_EQ(count_ops(patch, OpCode::ins_bin), 1u);
    EXPECT_EQ(count_ops(patch, OpCode::del), 1u);
}

// -- Arrays and vectors -------------------------------------------------------

TEST(JsonCrdtDiff, array_element_removal) {
    auto doc = Model{100};
    set_root(doc, {1, 2, 3});
    const auto patch = diff_apply(doc, {1, 3});

    ASSERT_EQ(patch.ops.size(), 1u);
    EXPECT_EQ(op_code(patch.ops[0]), OpCode::del);
}

TEST(JsonCrdtDiff, array_scalar_change_writes_register_in_place) {
    auto doc = Model{100};
    set_root(doc, {1, 2, 3});
    const auto before = std::get<ArrNode>(*doc.node(doc.root())).values();
    const auto patch = diff_apply(doc, {1, 5, 3});

    EXPECT_EQ(count_ops(patch, OpCode::ins_arr), 0u);
    EXPECT_EQ(count_ops(patch, OpCode::ins_val), 1u);
    EXPECT_EQ(std::get<ArrNode>(*doc.node(doc.root())).values(), before);
}

TEST(JsonCrdtDiff, array_of_objects_is_diffed_in_place) {
    auto doc = Model{100};
    set_root(doc, json::array({{{"a", 1}}}));
    const auto patch = diff_apply(doc, json::array({{{"a", 2}}}));

    EXPECT_EQ(count_ops(patch, OpCode::ins_arr), 0u);
    EXPECT_EQ(count_ops(patch, OpCode::ins_obj), 1u);
}

TEST(JsonCrdtDiff, array_kind_change_replaces_element) {
    auto doc = Model{100};
    set_root(doc, json::array({"a", {{"k", 1}}}));
    const auto patch = diff_apply(doc, json::array({"a", 5}));

    EXPECT_EQ(count_ops(patch, OpCode::ins_arr), 1u);
    EXPECT_EQ(count_ops(patch, OpCode::del), 1u);
}

TEST(JsonCrdtDiff, array_insert_at_front_and_back) {
    auto doc = Model{100};
    set_root(doc, {2, 3});
    diff_apply(doc, {1, 2, 3});
    diff_apply(doc, {1, 2, 3, "four", {{"five", 5}}});
    diff_apply(doc, json::array());
}

TEST(JsonCrdtDiff, vector_fills_empty_slot) {
    auto doc = Model{100};
    doc.edit([](PatchBuilder& b) {
        auto v = b.vec();
        b.ins_vec(v, {{1, b.con_val("x")}});
        b.root(v);
    });
    const auto patch = diff_apply(doc, {1, "x"});

    EXPECT_EQ(count_ops(patch, OpCode::ins_vec), 1u);
    EXPECT_EQ(doc.node_count(), 3u);
}

// -- Replicas -----------------------------------------------------------------

TEST(JsonCrdtDiff, patch_applies_on_replica_at_same_state) {
    auto a = Model{100};
    auto b = Model{200};
    b.apply_patch(set_root(a, {{"list", {1, 2}}, {"text", "abc"}}));

    const auto patch = JsonCrdtDiff{a}.diff({{"list", {2, 1}}, {"text", "abXc"}, {"new", true}});
    ASSERT_TRUE(patch.has_value());
    a.apply_patch(*patch);
    b.apply_patch(*patch);

    EXPECT_EQ(a.view(), b.view());
    EXPECT_EQ(b.view(), json({{"list", {2, 1}}, {"text", "abXc"}, {"new", true}}));
}
