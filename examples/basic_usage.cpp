// basic_usage -- demonstrates the core json-crdt-cpp API
//
// Builds a document from plain JSON, edits it through the PatchBuilder,
// replicates it to a second model and saves/loads the binary format.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <json-crdt-cpp/json-crdt.hpp>

#include <cstdio>
#include <string>

namespace jc = json_crdt_cpp;

int main() {
    auto doc = jc::Model{};

    // -- Build a whole tree from a JSON value ---------------------------------
    auto create = doc.edit([](jc::PatchBuilder& b) {
        b.root(b.json({
            {"title", "Shopping List"},
            {"items", {"Milk", "Eggs"}},
            {"done", false},
        }));
    });
    std::printf("created:  %s\n", doc.view().dump().c_str());
    std::printf("patch:    %zu ops, id %s\n", create.ops.size(),
                jc::to_string(*create.get_id()).c_str());

    // -- Edit individual nodes ------------------------------------------------
    doc.edit([&](jc::PatchBuilder& b) {
        const auto& root = std::get<jc::ObjNode>(*doc.node(doc.root()));
        const auto items = *root.get("items");
        const auto& list = std::get<jc::ArrNode>(*doc.node(items));

        b.ins_arr(items, *list.find(list.size() - 1), {b.json("Bread")});
        b.ins_obj(doc.root(), {{"done", b.con_val(true)}});
    });
    std::printf("edited:   %s\n", doc.view().dump().c_str());

    // -- Replicate: another model applies the same patches --------------------
    auto replica = jc::Model{};
    replica.apply_patch(create);
    std::printf("replica:  %s\n", replica.view().dump().c_str());

    // -- Save and load --------------------------------------------------------
    const auto bytes = doc.to_binary();
    const auto loaded = jc::Model::from_binary(bytes);
    std::printf("saved %zu bytes, loaded: %s\n", bytes.size(), loaded.view().dump().c_str());

    return 0;
}
