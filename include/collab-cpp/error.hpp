/// @file error.hpp
/// @brief Error types for the collab-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace collab_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    access_denied,      ///< The caller lacks the role or session membership required.
    not_found,          ///< A document, session or annotation id is unknown.
    no_active_session,  ///< An operation requires an active session and there is none.
    decoding_error,     ///< A wire message could not be decoded.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::access_denied:     return "access_denied";
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::no_active_session: return "no_active_session";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::invalid_operation: return "invalid_operation";
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

/// Exception thrown for caller mistakes that must not take the process down.
///
/// Thrown by DocumentStore::create_shared_document() when no session is
/// active, and by the JSON decoders on malformed input. Catch it, inspect
/// error().kind, and carry on: the service that threw is left unchanged.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace collab_cpp
