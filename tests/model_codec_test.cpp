#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/model.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>

using namespace json_crdt_cpp;
using nlohmann::json;

namespace {

auto set_root(Model& doc, const json& value) -> Patch {
    return doc.edit([&](PatchBuilder& b) { b.root(b.json(value)); });
}

auto bytes(std::initializer_list<int> values) -> Bytes {
    auto out = Bytes{};
    for (auto v : values) out.push_back(static_cast<std::byte>(v));
    return out;
}

auto error_kind(const std::function<void()>& fn) -> std::optional<ErrorKind> {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind;
    }
    return std::nullopt;
}

// A document touching every node kind, with tombstones in the string,
// the binary blob and the array.
auto rich_model() -> Model {
    auto doc = Model{100};
    set_root(doc, {{"text", "hello world"},
                   {"list", {1, "two", {{"deep", true}}}},
                   {"blob", json::binary({1, 2, 3, 4})},
                   {"n", nullptr}});
    doc.edit([&](PatchBuilder& b) {
        const auto& obj = std::get<ObjNode>(*doc.node(doc.root()));
        const auto text = *obj.get("text");
        const auto list = *obj.get("list");
        const auto blob = *obj.get("blob");
        b.del(text, std::get<StrNode>(*doc.node(text)).find_interval(1, 4));
        b.del(list, std::get<ArrNode>(*doc.node(list)).find_interval(0, 1));
        b.del(blob, std::get<BinNode>(*doc.node(blob)).find_interval(1, 2));

        auto v = b.vec();
        b.ins_vec(v, {{1, b.con_val("x")}, {3, b.con_ref(ts(5, 6))}});
        b.ins_obj(doc.root(), {{"vec", v}, {"reg", b.val()}, {"n", b.con_undef()}});
    });
    return doc;
}

}  // anonymous namespace

// -- Round trips --------------------------------------------------------------

TEST(ModelCodec, empty_model_round_trip) {
    const auto doc = Model{100};
    const auto data = doc.to_binary();
    const auto loaded = Model::from_binary(data);

    // root size 1, undefined root, one-entry clock table
    EXPECT_EQ(data, bytes({0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x64, 0x01}));
    EXPECT_EQ(loaded.sid(), 100u);
    EXPECT_EQ(loaded.time(), 1u);
    EXPECT_EQ(loaded.view(), json(nullptr));
    EXPECT_EQ(loaded.node_count(), 0u);
}

TEST(ModelCodec, logical_model_round_trip) {
    const auto doc = rich_model();
    const auto loaded = Model::from_binary(doc.to_binary());

    EXPECT_EQ(loaded.clock_kind(), ClockKind::logical);
    EXPECT_EQ(loaded.sid(), doc.sid());
    EXPECT_EQ(loaded.time(), doc.time());
    EXPECT_EQ(loaded.view(), doc.view());
    EXPECT_EQ(loaded.view(), json({{"text", "h world"},
                                   {"list", {"two", {{"deep", true}}}},
                                   {"blob", json::binary({1, 4})},
                                   {"vec", {nullptr, "x", nullptr, {5, 6}}},
                                   {"reg", nullptr}}));
}

TEST(ModelCodec, loaded_model_keeps_peer_clock) {
    auto doc = Model{100};
    auto remote = PatchBuilder{300, 40};
    remote.root(remote.json("abc"));
    doc.apply_patch(remote.flush());

    const auto loaded = Model::from_binary(doc.to_binary());
    const auto& clock = std::get<ClockVector>(loaded.clock());
    ASSERT_EQ(clock.peers().count(300), 1u);
    EXPECT_GE(clock.peers().at(300).time, 44u);
}

TEST(ModelCodec, tombstones_still_anchor_concurrent_inserts) {
    auto doc = Model{100};
    set_root(doc, "hello");
    const auto str = doc.root();
    const auto anchor = *std::get<StrNode>(*doc.node(str)).find(2);  // first "l"
    doc.edit([&](PatchBuilder& b) {
        b.del(str, std::get<StrNode>(*doc.node(str)).find_interval(1, 3));
    });

    auto loaded = Model::from_binary(doc.to_binary());

    auto remote = PatchBuilder{200, 50};
    remote.ins_str(str, anchor, "X");
    const auto patch = remote.flush();
    doc.apply_patch(patch);
    loaded.apply_patch(patch);

    EXPECT_EQ(doc.view(), json("hXo"));
    EXPECT_EQ(loaded.view(), doc.view());
}

TEST(ModelCodec, editing_after_load_does_not_reuse_ids) {
    auto doc = rich_model();
    auto loaded = Model::from_binary(doc.to_binary());

    const auto patch = loaded.edit([&](PatchBuilder& b) {
        b.ins_obj(loaded.root(), {{"added", b.con_val(1)}});
    });
    for (const auto& op : patch.ops) EXPECT_EQ(doc.node(op_id(op)), nullptr);

    doc.apply_patch(patch);
    EXPECT_EQ(doc.view(), loaded.view());
}

TEST(ModelCodec, server_model_round_trip) {
    auto doc = Model{ModelOptions{.sid = std::nullopt, .clock = ClockKind::server, .server_time = 1}};
    set_root(doc, {{"s", "abc"}, {"b", json::binary({9})}, {"l", {1, 2}}});
    const auto data = doc.to_binary();

    ASSERT_FALSE(data.empty());
    EXPECT_EQ(data[0], std::byte{0x80});

    const auto loaded = Model::from_binary(data);
    EXPECT_EQ(loaded.clock_kind(), ClockKind::server);
    EXPECT_EQ(loaded.time(), doc.time());
    EXPECT_EQ(loaded.view(), doc.view());
}

TEST(ModelCodec, large_objects_use_extended_length) {
    auto doc = Model{100};
    auto obj = json::object();
    for (int i = 0; i < 40; ++i) obj["k" + std::to_string(i)] = i;
    set_root(doc, obj);

    EXPECT_EQ(Model::from_binary(doc.to_binary()).view(), obj);
}

// -- Errors -------------------------------------------------------------------

TEST(ModelCodec, empty_input_is_invalid) {
    EXPECT_EQ(error_kind([] { Model::from_binary(Bytes{}); }), ErrorKind::invalid_model);
}

TEST(ModelCodec, truncated_input_is_invalid) {
    auto data = rich_model().to_binary();
    data.resize(3);
    EXPECT_EQ(error_kind([&] { Model::from_binary(data); }), ErrorKind::invalid_model);

    data = rich_model().to_binary();
    data.resize(10);
    EXPECT_EQ(error_kind([&] { Model::from_binary(data); }), ErrorKind::invalid_model);
}

TEST(ModelCodec, data_after_clock_table_is_rejected) {
    auto data = Model{100}.to_binary();
    data.push_back(std::byte{0x00});
    EXPECT_EQ(error_kind([&] { Model::from_binary(data); }), ErrorKind::trailing_bytes);
}

TEST(ModelCodec, missing_or_empty_clock_table_is_rejected) {
    EXPECT_EQ(error_kind([] { Model::from_binary(bytes({0x00, 0x00, 0x00, 0x01, 0x00})); }),
              ErrorKind::invalid_clock_table);
    EXPECT_EQ(error_kind([] { Model::from_binary(bytes({0x00, 0x00, 0x00, 0x01, 0x00, 0x00})); }),
              ErrorKind::invalid_clock_table);
}

TEST(ModelCodec, unknown_node_type_is_rejected) {
    // id 0x01 (table entry 0, one tick back), node octet with major 7
    EXPECT_EQ(error_kind([] {
                  Model::from_binary(bytes({0x00, 0x00, 0x00, 0x02, 0x01, 0xE0, 0x01, 0x64, 0x05}));
              }),
              ErrorKind::invalid_model);
}
