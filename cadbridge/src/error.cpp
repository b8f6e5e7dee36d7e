#include "error.hpp"

#include <array>
#include <utility>

namespace cadbridge {

namespace {

struct KindTag {
    ErrorKind kind;
    const char* tag;
};

constexpr std::array<KindTag, 10> kKindTags = {{
    {ErrorKind::InvalidUserInput, "InvalidUserInput"},
    {ErrorKind::BadRequest, "BadRequest"},
    {ErrorKind::ExecutionError, "FusionExecutionError"},
    {ErrorKind::ServerError, "ServerError"},
    {ErrorKind::InternalServerError, "InternalServerError"},
    {ErrorKind::ConnectionError, "FusionServerConnectionError"},
    {ErrorKind::TimeoutError, "FusionServerTimeoutError"},
    {ErrorKind::ResponseParseError, "FusionServerResponseError"},
    {ErrorKind::RequestError, "FusionServerRequestError"},
    {ErrorKind::UnknownError, "UnknownError"},
}};

} // namespace

const char* type_tag(ErrorKind kind) {
    for (const auto& entry : kKindTags) {
        if (entry.kind == kind) {
            return entry.tag;
        }
    }
    return "UnknownError";
}

unsigned http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidUserInput:
        case ErrorKind::BadRequest:
            return 400;
        default:
            return 500;
    }
}

Error make_invalid_input(std::string message) {
    return Error{ErrorKind::InvalidUserInput, std::move(message), ""};
}

Error make_bad_request(std::string message) {
    return Error{ErrorKind::BadRequest, std::move(message), ""};
}

Error make_execution_error(const std::string& action, const std::string& message) {
    return Error{ErrorKind::ExecutionError, "Error executing action '" + action + "': " + message, action};
}

Error make_internal_error(std::string message) {
    return Error{ErrorKind::InternalServerError, std::move(message), ""};
}

Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message), ""};
}

std::string to_string(const Error& error) {
    return std::string("[") + type_tag(error.kind) + "] " + error.message;
}

} // namespace cadbridge
