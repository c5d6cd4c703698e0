/// @file error.hpp
/// @brief Error types for the json-crdt-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace json_crdt_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    overflow,             ///< A varint ran past its maximum length or the input ended.
    unknown_opcode,       ///< An operation code outside the known set.
    invalid_cbor,         ///< A CBOR item could not be decoded.
    trailing_bytes,       ///< Input continued after a complete value.
    invalid_utf8,         ///< A string payload was not valid UTF-8.
    invalid_clock_table,  ///< The clock table of a document is missing or malformed.
    invalid_model,        ///< The document data is malformed or corrupt.
    invalid_patch,        ///< A JSON patch encoding has the wrong shape.
    clock_overflow,       ///< A logical clock would wrap around.
    encoding_error,       ///< A value cannot be represented in the target format.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::overflow:            return "overflow";
        case ErrorKind::unknown_opcode:      return "unknown_opcode";
        case ErrorKind::invalid_cbor:        return "invalid_cbor";
        case ErrorKind::trailing_bytes:      return "trailing_bytes";
        case ErrorKind::invalid_utf8:        return "invalid_utf8";
        case ErrorKind::invalid_clock_table: return "invalid_clock_table";
        case ErrorKind::invalid_model:       return "invalid_model";
        case ErrorKind::invalid_patch:       return "invalid_patch";
        case ErrorKind::clock_overflow:      return "clock_overflow";
        case ErrorKind::encoding_error:      return "encoding_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Thrown by the codecs and the clocks; `what()` returns the message.
class Error : public std::runtime_error {
public:
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : std::runtime_error{msg}, kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool {
        return kind == other.kind && message == other.message;
    }
};

}  // namespace json_crdt_cpp
