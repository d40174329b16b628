#pragma once

#include <stdexcept>
#include <string>

namespace courier {

enum class StatusCode {
    NotFound,
    AlreadyExists,
    InvalidArgument,
    DeadlineExceeded,
    Unavailable,
    ResourceExhausted,
    PermissionDenied,
    FailedPrecondition,
    Cancelled,
    Internal
};

/**
 * Error raised by every remote or flow-controlled operation.
 */
class PubSubError : public std::runtime_error {
public:
    PubSubError(StatusCode code, const std::string& message);

    StatusCode code() const { return code_; }

    // Message without the status code prefix.
    const std::string& detail() const { return detail_; }

private:
    StatusCode code_;
    std::string detail_;
};

const char* status_code_name(StatusCode code);

// Throws InvalidArgument for an unknown name.
StatusCode status_code_from_name(const std::string& name);

// Transient transport conditions worth another attempt.
bool is_retryable(StatusCode code);

} // namespace courier
