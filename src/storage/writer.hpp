#pragma once

// Byte stream writer for the binary patch and document formats.
// Internal header — not installed.

#include <json-crdt-cpp/error.hpp>
#include "../encoding/cbor.hpp"
#include "../encoding/varint.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace json_crdt_cpp::storage {

class Writer {
public:
    void write_byte(std::byte b) {
        data_.push_back(b);
    }

    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_utf8(std::string_view s) {
        for (auto c : s) data_.push_back(static_cast<std::byte>(c));
    }

    void write_u32_be(std::uint32_t v) {
        write_u8(static_cast<std::uint8_t>(v >> 24));
        write_u8(static_cast<std::uint8_t>(v >> 16));
        write_u8(static_cast<std::uint8_t>(v >> 8));
        write_u8(static_cast<std::uint8_t>(v));
    }

    // Overwrite four bytes at `pos` with a big-endian u32.
    void patch_u32_be(std::size_t pos, std::uint32_t v) {
        data_[pos] = static_cast<std::byte>(v >> 24);
        data_[pos + 1] = static_cast<std::byte>(v >> 16);
        data_[pos + 2] = static_cast<std::byte>(v >> 8);
        data_[pos + 3] = static_cast<std::byte>(v);
    }

    void write_vu57(std::uint64_t value) {
        if (value > encoding::vu57_max) {
            throw Error{ErrorKind::encoding_error,
                        "value " + std::to_string(value) + " does not fit in vu57"};
        }
        encoding::encode_vu57(value, data_);
    }

    void write_b1vu56(bool flag, std::uint64_t value) {
        if (value > encoding::b1vu56_max) {
            throw Error{ErrorKind::encoding_error,
                        "value " + std::to_string(value) + " does not fit in b1vu56"};
        }
        encoding::encode_b1vu56(flag, value, data_);
    }

    void write_cbor(const nlohmann::json& value) {
        encoding::encode_cbor(value, data_);
    }

    void write_cbor_undefined() {
        encoding::encode_cbor_undefined(data_);
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace json_crdt_cpp::storage
