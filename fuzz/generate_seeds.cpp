// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself -- just a corpus generator.

#include <json-crdt-cpp/json-crdt.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace jc = json_crdt_cpp;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static auto sample_patch() -> jc::Patch {
    auto b = jc::PatchBuilder{123456, 1};
    auto str = b.str_node();
    b.ins_str(str, str, "hello");
    b.del(str, {jc::tss(123456, 3, 2)});
    b.root(b.json({{"list", {1, 2.5, nullptr}}, {"bin", nlohmann::json::binary({1, 2})}}));
    b.set_meta({{"seed", true}});
    return b.flush();
}

int main() {
    namespace fs = std::filesystem;
    for (const auto* sub : {"varint", "binary_patch", "compact_patch", "model_load"}) {
        fs::create_directories(std::string{"fuzz/corpus/"} + sub);
    }

    // Varints
    write_seed("fuzz/corpus/varint/seed_small.bin", jc::Bytes{std::byte{0x05}});
    write_seed("fuzz/corpus/varint/seed_long.bin",
               jc::Bytes(8, std::byte{0xFF}));

    // Patches
    const auto patch = sample_patch();
    write_seed("fuzz/corpus/binary_patch/seed_sample.bin", jc::codec::binary::encode(patch));
    write_seed("fuzz/corpus/binary_patch/seed_empty.bin", jc::codec::binary::encode(jc::Patch{}));
    write_seed("fuzz/corpus/compact_patch/seed_sample.bin", jc::codec::compact_binary::encode(patch));

    // Documents
    {
        auto doc = jc::Model{100};
        write_seed("fuzz/corpus/model_load/seed_empty.bin", doc.to_binary());
        doc.apply_patch(patch);
        write_seed("fuzz/corpus/model_load/seed_sample.bin", doc.to_binary());
    }
    {
        auto doc = jc::Model{jc::ModelOptions{.sid = std::nullopt, .clock = jc::ClockKind::server,
                                              .server_time = 1}};
        doc.edit([](jc::PatchBuilder& b) { b.root(b.json({{"text", "server"}})); });
        write_seed("fuzz/corpus/model_load/seed_server.bin", doc.to_binary());
    }
    return 0;
}
