#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/logging.hpp>

namespace json_crdt_cpp {

namespace {

constexpr std::byte json_object_start{0x7B};  // '{'

}  // anonymous namespace

auto PatchBlob::from_binary(std::span<const std::byte> data) -> PatchBlob {
    auto bytes = Bytes(data.begin(), data.end());
    try {
        auto patch = codec::binary::decode(data);
        return PatchBlob{std::move(bytes), std::move(patch)};
    } catch (const Error& e) {
        if (e.kind == ErrorKind::invalid_cbor && !data.empty() && data[0] == json_object_start) {
            throw;
        }
        logger()->debug("keeping {} byte patch as opaque payload: {} ({})",
                        data.size(), e.message, to_string_view(e.kind));
        return PatchBlob{std::move(bytes), std::nullopt};
    }
}

auto PatchBlob::from_patch(const Patch& patch) -> PatchBlob {
    return PatchBlob{codec::binary::encode(patch), patch};
}

}  // namespace json_crdt_cpp
