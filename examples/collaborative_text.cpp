// collaborative_text -- two replicas edit the same string concurrently
//
// Alice and Bob start from a shared document, type at the same time and
// exchange patches. Both converge on the same text regardless of the
// order patches arrive in.
//
// Build: cmake --build build
// Run:   ./build/collaborative_text

#include <json-crdt-cpp/json-crdt.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace jc = json_crdt_cpp;

namespace {

// Insert `text` at code point `pos` of the root string.
auto type_at(jc::Model& doc, std::uint64_t pos, const std::string& text) -> jc::Patch {
    return doc.edit([&](jc::PatchBuilder& b) {
        const auto str = doc.root();
        const auto& node = std::get<jc::StrNode>(*doc.node(str));
        const auto after = pos == 0 ? str : *node.find(pos - 1);
        b.ins_str(str, after, text);
    });
}

// Delete `len` code points from `pos` of the root string.
auto erase(jc::Model& doc, std::uint64_t pos, std::uint64_t len) -> jc::Patch {
    return doc.edit([&](jc::PatchBuilder& b) {
        const auto str = doc.root();
        b.del(str, std::get<jc::StrNode>(*doc.node(str)).find_interval(pos, len));
    });
}

}  // anonymous namespace

int main() {
    jc::set_log_level(spdlog::level::info);

    auto alice = jc::Model{};
    alice.edit([](jc::PatchBuilder& b) { b.root(b.json("Hello world")); });

    auto bob = alice.fork();
    std::printf("alice sid=%llu, bob sid=%llu\n",
                static_cast<unsigned long long>(alice.sid()),
                static_cast<unsigned long long>(bob.sid()));

    // -- Concurrent edits -----------------------------------------------------
    const auto a1 = type_at(alice, 5, ",");
    const auto a2 = type_at(alice, 12, "!");
    const auto b1 = erase(bob, 0, 5);
    const auto b2 = type_at(bob, 0, "Goodbye");

    std::printf("alice before merge: %s\n", alice.view().dump().c_str());
    std::printf("bob   before merge: %s\n", bob.view().dump().c_str());

    // -- Exchange patches in different orders ---------------------------------
    bob.apply_patch(a2);
    bob.apply_patch(a1);
    alice.apply_patch(b1);
    alice.apply_patch(b2);

    std::printf("alice after merge:  %s\n", alice.view().dump().c_str());
    std::printf("bob   after merge:  %s\n", bob.view().dump().c_str());
    std::printf("converged: %s\n", alice.view() == bob.view() ? "yes" : "no");

    // -- Patches travel as bytes ----------------------------------------------
    const auto wire = jc::codec::binary::encode(a1);
    std::printf("patch %s is %zu bytes on the wire\n",
                jc::to_string(*a1.get_id()).c_str(), wire.size());

    return alice.view() == bob.view() ? 0 : 1;
}
