// Fuzz target for the compact CBOR codec, and through it the compact JSON
// decoder. Decoded patches are re-encoded in the verbose form as well.

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
        const auto patch = codec::compact_binary::decode(span);
        if (codec::verbose::decode(codec::verbose::encode(patch)) != patch) std::abort();
    } catch (const Error&) {
        // Malformed input is expected.
    }
    return 0;
}
