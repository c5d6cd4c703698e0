// Fuzz target for the binary patch codec and PatchBlob.
// Any patch that decodes must encode and decode to the same patch.

#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace json_crdt_cpp;
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    try {
        const auto patch = codec::binary::decode(span);
        if (codec::binary::decode(codec::binary::encode(patch)) != patch) std::abort();
    } catch (const Error&) {
        // Malformed input is expected.
    }

    try {
        auto blob = PatchBlob::from_binary(span);
        (void)blob;
    } catch (const Error&) {
        // Only payloads that look like JSON text are rejected.
    }
    return 0;
}
