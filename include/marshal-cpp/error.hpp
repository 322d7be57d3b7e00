/// @file error.hpp
/// @brief Error types for the marshal-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace marshal_cpp {

/// Categories of errors that can occur while decoding or encoding.
enum class ErrorKind : std::uint8_t {
    incompatible_version,  ///< The two-byte header is not Marshal 4.8.
    unexpected_end,        ///< A read ran past the end of the buffer.
    trailing_data,         ///< Bytes remain after the top-level value.
    bad_reference,         ///< A symbol or object link points at no entry.
    unknown_tag,           ///< The tag byte is not part of the format.
    schema_mismatch,       ///< A record does not match its declared schema.
    grid_shape_mismatch,   ///< A Table blob disagrees with its dimensions.
    malformed,             ///< A count, length or wrapper is structurally invalid.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::incompatible_version: return "incompatible_version";
        case ErrorKind::unexpected_end:       return "unexpected_end";
        case ErrorKind::trailing_data:        return "trailing_data";
        case ErrorKind::bad_reference:        return "bad_reference";
        case ErrorKind::unknown_tag:          return "unknown_tag";
        case ErrorKind::schema_mismatch:      return "schema_mismatch";
        case ErrorKind::grid_shape_mismatch:  return "grid_shape_mismatch";
        case ErrorKind::malformed:            return "malformed";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every decode/encode entry point.
///
/// The whole call is aborted: no partially decoded document or
/// partially written buffer is ever handed back to the caller.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace marshal_cpp
