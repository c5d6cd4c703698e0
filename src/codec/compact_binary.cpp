#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/error.hpp>

#include "../encoding/cbor.hpp"

namespace json_crdt_cpp::codec::compact_binary {

auto encode(const Patch& patch) -> Bytes {
    auto out = Bytes{};
    encoding::encode_cbor(compact::encode(patch), out);
    return out;
}

auto decode(std::span<const std::byte> data) -> Patch {
    auto result = encoding::decode_cbor(data);
    if (!result) throw Error{ErrorKind::invalid_cbor, "patch is not a valid CBOR item"};
    if (result->bytes_read != data.size()) {
        throw Error{ErrorKind::trailing_bytes,
                    std::to_string(data.size() - result->bytes_read) + " bytes after the patch"};
    }
    if (!result->value) throw Error{ErrorKind::invalid_patch, "patch is undefined"};
    return compact::decode(*result->value);
}

}  // namespace json_crdt_cpp::codec::compact_binary
