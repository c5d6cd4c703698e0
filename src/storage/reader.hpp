#pragma once

// Byte stream reader for the binary patch and document formats.
// Every read returns nullopt on truncated or malformed input and leaves
// the position where it was.
// Internal header — not installed.

#include "../encoding/cbor.hpp"
#include "../encoding/varint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace json_crdt_cpp::storage {

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto peek_u8() const -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_]);
    }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_utf8(std::size_t n) -> std::optional<std::string> {
        auto bytes = read_bytes(n);
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_u32_be() -> std::optional<std::uint32_t> {
        auto bytes = read_bytes(4);
        if (!bytes) return std::nullopt;
        auto value = std::uint32_t{0};
        for (auto b : *bytes) value = (value << 8) | static_cast<std::uint32_t>(b);
        return value;
    }

    auto read_vu57() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_vu57(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_b1vu56() -> std::optional<encoding::FlaggedDecodeResult> {
        auto result = encoding::decode_b1vu56(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result;
    }

    auto read_cbor() -> std::optional<encoding::CborDecodeResult> {
        auto result = encoding::decode_cbor(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace json_crdt_cpp::storage
