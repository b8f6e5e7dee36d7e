#pragma once

#include <optional>
#include <string>
#include <variant>

namespace cadbridge {

/**
 * Closed set of error kinds shared by both sides of the bridge.
 * The wire tag (see type_tag) is the contract, not the enum value.
 */
enum class ErrorKind {
    InvalidUserInput,
    BadRequest,
    ExecutionError,
    ServerError,
    InternalServerError,
    ConnectionError,
    TimeoutError,
    ResponseParseError,
    RequestError,
    UnknownError
};

struct Error {
    ErrorKind kind = ErrorKind::UnknownError;
    std::string message;
    std::string action; // set for ExecutionError
};

template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
bool is_error(const Result<T>& result) {
    return std::holds_alternative<Error>(result);
}

template <typename T>
const Error& get_error(const Result<T>& result) {
    return std::get<Error>(result);
}

template <typename T>
const T& get_value(const Result<T>& result) {
    return std::get<T>(result);
}

template <typename T>
T& get_value(Result<T>& result) {
    return std::get<T>(result);
}

/// Stable machine-readable tag sent as error.type on the wire.
const char* type_tag(ErrorKind kind);

/// HTTP status the server answers with for a given kind.
unsigned http_status_for(ErrorKind kind);

Error make_invalid_input(std::string message);
Error make_bad_request(std::string message);
Error make_execution_error(const std::string& action, const std::string& message);
Error make_internal_error(std::string message);
Error make_error(ErrorKind kind, std::string message);

std::string to_string(const Error& error);

} // namespace cadbridge
