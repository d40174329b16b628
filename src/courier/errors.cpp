#include "errors.hpp"

namespace courier {

namespace {

struct CodeName {
    StatusCode code;
    const char* name;
};

const CodeName kCodeNames[] = {
    {StatusCode::NotFound, "NOT_FOUND"},
    {StatusCode::AlreadyExists, "ALREADY_EXISTS"},
    {StatusCode::InvalidArgument, "INVALID_ARGUMENT"},
    {StatusCode::DeadlineExceeded, "DEADLINE_EXCEEDED"},
    {StatusCode::Unavailable, "UNAVAILABLE"},
    {StatusCode::ResourceExhausted, "RESOURCE_EXHAUSTED"},
    {StatusCode::PermissionDenied, "PERMISSION_DENIED"},
    {StatusCode::FailedPrecondition, "FAILED_PRECONDITION"},
    {StatusCode::Cancelled, "CANCELLED"},
    {StatusCode::Internal, "INTERNAL"},
};

} // namespace

PubSubError::PubSubError(StatusCode code, const std::string& message)
    : std::runtime_error(std::string(status_code_name(code)) + ": " + message)
    , code_(code)
    , detail_(message) {
}

const char* status_code_name(StatusCode code) {
    for (const auto& entry : kCodeNames) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

StatusCode status_code_from_name(const std::string& name) {
    for (const auto& entry : kCodeNames) {
        if (name == entry.name) {
            return entry.code;
        }
    }
    throw PubSubError(StatusCode::InvalidArgument, "unknown status code '" + name + "'");
}

bool is_retryable(StatusCode code) {
    return code == StatusCode::DeadlineExceeded || code == StatusCode::Unavailable;
}

} // namespace courier
