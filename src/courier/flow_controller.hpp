#pragma once

#include "logging.hpp"
#include "types.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace courier {

enum class FlowControlOutcome {
    Admitted,
    // Only reported under LimitExceededBehavior::Ignore.
    AdmittedOverLimit
};

/**
 * Ledger of outstanding elements and bytes with optional limits.
 *
 * reserve() follows the configured LimitExceededBehavior when either limit
 * would be exceeded: Block waits for release(), Ignore admits and records the
 * actual usage, ThrowException raises PubSubError(ResourceExhausted).
 * Thread-safe.
 */
class FlowController {
public:
    explicit FlowController(const FlowControlSettings& settings);

    FlowControlOutcome reserve(std::int64_t elements, std::int64_t bytes);

    // Throws std::logic_error when releasing more than is outstanding.
    void release(std::int64_t elements, std::int64_t bytes);

    // Wakes every blocked reserve() with PubSubError(Cancelled); later
    // reserve() calls fail the same way.
    void interrupt();

    std::int64_t outstanding_elements() const;
    std::int64_t outstanding_bytes() const;

    const FlowControlSettings& settings() const { return settings_; }

private:
    bool fits(std::int64_t elements, std::int64_t bytes) const;

    FlowControlSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::int64_t outstanding_elements_ = 0;
    std::int64_t outstanding_bytes_ = 0;
    bool interrupted_ = false;

    LoggerPtr logger_;
};

} // namespace courier
