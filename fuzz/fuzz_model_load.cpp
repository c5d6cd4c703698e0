// Fuzz target for Model::from_binary() -- exercises the document decoder.
// Any document that loads is saved again, viewed and edited.

#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/model.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace json_crdt_cpp;
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    try {
        auto doc = Model::from_binary(span);
        auto saved = doc.to_binary();
        auto view = doc.view();
        doc.edit([](PatchBuilder& b) { b.root(b.con_val(1)); });
        (void)saved;
        (void)view;
    } catch (const Error&) {
        // Malformed input is expected.
    }
    return 0;
}
