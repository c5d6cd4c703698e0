// codec_demo -- one patch in every wire format
//
// Build: cmake --build build
// Run:   ./build/codec_demo

#include <json-crdt-cpp/json-crdt.hpp>

#include <cstdio>
#include <string>

namespace jc = json_crdt_cpp;

namespace {

auto hex(const jc::Bytes& bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto out = std::string{};
    for (auto b : bytes) {
        const auto v = static_cast<unsigned>(b);
        out += digits[v >> 4];
        out += digits[v & 0x0F];
        out += ' ';
    }
    return out;
}

}  // anonymous namespace

int main() {
    auto b = jc::PatchBuilder{123456, 1};
    auto str = b.str_node();
    b.ins_str(str, str, "héllo");
    b.root(b.json({{"text", "x"}, {"n", 1}}));
    b.set_meta({{"author", "demo"}});
    const auto patch = b.flush();

    std::printf("%s\n\n", jc::to_string(patch).c_str());

    std::printf("verbose:\n%s\n\n", jc::codec::verbose::encode(patch).dump(2).c_str());
    std::printf("compact:\n%s\n\n", jc::codec::compact::encode(patch).dump().c_str());

    const auto cbor = jc::codec::compact_binary::encode(patch);
    std::printf("compact CBOR (%zu bytes):\n%s\n\n", cbor.size(), hex(cbor).c_str());

    const auto binary = jc::codec::binary::encode(patch);
    std::printf("binary (%zu bytes):\n%s\n\n", binary.size(), hex(binary).c_str());

    // Every format decodes back to the same patch.
    const auto same = jc::codec::verbose::decode(jc::codec::verbose::encode(patch)) == patch
                      && jc::codec::compact::decode(jc::codec::compact::encode(patch)) == patch
                      && jc::codec::compact_binary::decode(cbor) == patch
                      && jc::codec::binary::decode(binary) == patch;
    std::printf("all formats round-trip: %s\n", same ? "yes" : "no");

    // Undecodable bytes survive as an opaque blob.
    auto garbage = binary;
    garbage.push_back(std::byte{0x38});
    const auto blob = jc::PatchBlob::from_binary(garbage);
    std::printf("garbage blob opaque: %s\n", blob.is_opaque() ? "yes" : "no");

    try {
        jc::codec::binary::decode(garbage);
    } catch (const jc::Error& e) {
        std::printf("decode error: %s\n", e.what());
    }
    return same ? 0 : 1;
}
