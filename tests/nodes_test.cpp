#include <json-crdt-cpp/nodes.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace json_crdt_cpp;

// -- Registers ----------------------------------------------------------------

TEST(ValNode, starts_at_origin_and_takes_newer_writes) {
    auto node = ValNode{.id = ts(1, 1)};
    EXPECT_EQ(node.value, origin);

    EXPECT_TRUE(node.set(ts(1, 3)));
    EXPECT_FALSE(node.set(ts(1, 2)));
    EXPECT_EQ(node.value, ts(1, 3));
}

TEST(ValNode, concurrent_writes_resolve_by_session) {
    auto a = ValNode{.id = ts(1, 1)};
    auto b = ValNode{.id = ts(1, 1)};
    a.set(ts(2, 5));
    a.set(ts(3, 5));
    b.set(ts(3, 5));
    b.set(ts(2, 5));

    EXPECT_EQ(a.value, ts(3, 5));
    EXPECT_EQ(a, b);
}

TEST(RootNode, last_write_wins) {
    auto root = RootNode{};
    EXPECT_TRUE(root.set(ts(1, 4)));
    EXPECT_FALSE(root.set(ts(1, 4)));
    EXPECT_EQ(root.value, ts(1, 4));
}

// -- Maps and vectors ---------------------------------------------------------

TEST(ObjNode, put_keeps_insertion_order) {
    auto node = ObjNode{.id = ts(1, 1), .entries = {}};
    node.put("b", ts(1, 2));
    node.put("a", ts(1, 3));

    ASSERT_EQ(node.entries.size(), 2u);
    EXPECT_EQ(node.entries[0].first, "b");
    EXPECT_EQ(node.get("a"), std::optional<Timestamp>{ts(1, 3)});
    EXPECT_EQ(node.get("missing"), std::nullopt);
}

TEST(ObjNode, put_older_child_is_ignored) {
    auto node = ObjNode{.id = ts(1, 1), .entries = {}};
    node.put("k", ts(1, 5));

    EXPECT_FALSE(node.put("k", ts(1, 4)));
    EXPECT_TRUE(node.put("k", ts(1, 6)));
    EXPECT_EQ(node.get("k"), std::optional<Timestamp>{ts(1, 6)});
}

TEST(VecNode, put_grows_sparse_slots) {
    auto node = VecNode{.id = ts(1, 1), .elements = {}};
    node.put(2, ts(1, 2));

    ASSERT_EQ(node.elements.size(), 3u);
    EXPECT_EQ(node.get(0), std::nullopt);
    EXPECT_EQ(node.get(2), std::optional<Timestamp>{ts(1, 2)});
    EXPECT_EQ(node.get(7), std::nullopt);
    EXPECT_FALSE(node.put(2, ts(1, 1)));
}

// -- Sequences ----------------------------------------------------------------

TEST(StrNode, anchor_on_own_id_inserts_at_head) {
    auto node = StrNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 2), "world");
    node.ins(ts(1, 1), ts(1, 7), "hello ");

    EXPECT_EQ(node.view(), "hello world");
    EXPECT_EQ(node.size(), 11u);
}

TEST(StrNode, delete_and_find_interval) {
    auto node = StrNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 2), "hello");
    const auto spans = node.find_interval(1, 3);
    node.del(spans);

    EXPECT_EQ(node.view(), "ho");
    EXPECT_EQ(node.find(1), std::optional<Timestamp>{ts(1, 6)});
}

TEST(BinNode, view_concatenates_live_bytes) {
    auto node = BinNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 2), Bytes{std::byte{0xAA}, std::byte{0xBB}});
    node.ins(ts(1, 3), ts(1, 4), Bytes{std::byte{0xCC}});

    EXPECT_EQ(node.view(), (Bytes{std::byte{0xAA}, std::byte{0xBB}, std::byte{0xCC}}));
}

TEST(ArrNode, values_and_lookup) {
    auto node = ArrNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 10), std::vector<Timestamp>{ts(1, 2), ts(1, 3)});

    EXPECT_EQ(node.values(), (std::vector<Timestamp>{ts(1, 2), ts(1, 3)}));
    EXPECT_EQ(node.find_data_at(1), std::optional<Timestamp>{ts(1, 3)});
    EXPECT_EQ(node.get_data_ts(ts(1, 11)), std::optional<Timestamp>{ts(1, 3)});
    EXPECT_EQ(node.get_data_ts(ts(1, 12)), std::nullopt);
}

TEST(ArrNode, upd_replaces_with_newer_child_only) {
    auto node = ArrNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 10), std::vector<Timestamp>{ts(1, 2), ts(1, 3)});

    EXPECT_TRUE(node.upd(ts(1, 11), ts(1, 20)));
    EXPECT_FALSE(node.upd(ts(1, 11), ts(1, 15)));
    EXPECT_EQ(node.values(), (std::vector<Timestamp>{ts(1, 2), ts(1, 20)}));
}

TEST(ArrNode, upd_on_deleted_item_is_noop) {
    auto node = ArrNode{{.id = ts(1, 1), .rga = {}}};
    node.ins(ts(1, 1), ts(1, 10), std::vector<Timestamp>{ts(1, 2)});
    const auto spans = std::vector<Timespan>{tss(1, 10, 1)};
    node.del(spans);

    EXPECT_FALSE(node.upd(ts(1, 10), ts(1, 20)));
    EXPECT_TRUE(node.values().empty());
}

// -- Node helpers -------------------------------------------------------------

TEST(Node, kind_id_and_children) {
    auto obj = Node{ObjNode{.id = ts(1, 1), .entries = {{"a", ts(1, 2)}, {"b", ts(1, 3)}}}};
    auto con = Node{ConNode{.id = ts(1, 2), .value = nlohmann::json(5)}};

    EXPECT_EQ(node_kind(obj), NodeKind::obj);
    EXPECT_EQ(node_kind(con), NodeKind::con);
    EXPECT_EQ(node_id(obj), ts(1, 1));
    EXPECT_EQ(child_ids(obj), (std::vector<Timestamp>{ts(1, 2), ts(1, 3)}));
    EXPECT_TRUE(child_ids(con).empty());
    EXPECT_EQ(to_string_view(NodeKind::arr), "arr");
}
