// diff_demo -- turn plain JSON edits into CRDT patches
//
// An application that only knows the "before" and "after" JSON of a
// document can still produce minimal patches with JsonCrdtDiff.
//
// Build: cmake --build build
// Run:   ./build/diff_demo

#include <json-crdt-cpp/json-crdt.hpp>

#include <cstdio>

namespace jc = json_crdt_cpp;
using nlohmann::json;

namespace {

void step(jc::Model& doc, const json& target) {
    auto patch = jc::JsonCrdtDiff{doc}.diff(target);
    if (!patch) {
        std::printf("no change\n\n");
        return;
    }
    std::printf("%s", jc::to_string(*patch).c_str());
    doc.apply_patch(*patch);
    std::printf("=> %s\n\n", doc.view().dump().c_str());
}

}  // anonymous namespace

int main() {
    auto doc = jc::Model{1000};

    step(doc, {{"title", "Draft"}, {"tags", {"a", "b"}}, {"body", "Hello"}});
    step(doc, {{"title", "Draft"}, {"tags", {"a", "b"}}, {"body", "Hello, world"}});
    step(doc, {{"title", "Final"}, {"tags", {"b"}}, {"body", "Hello, world"}});
    step(doc, {{"title", "Final"}, {"tags", {"b"}}, {"body", "Hello, world"}});

    auto partial = jc::JsonCrdtDiff{doc}.diff_dst_keys({{"published", true}});
    if (partial) doc.apply_patch(*partial);
    std::printf("after diff_dst_keys: %s\n", doc.view().dump().c_str());
    return 0;
}
