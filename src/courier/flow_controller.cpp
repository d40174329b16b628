#include "flow_controller.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace courier {

namespace {

// A request larger than the limit fits once nothing else is outstanding.
bool fits_limit(const boost::optional<std::int64_t>& limit, std::int64_t outstanding, std::int64_t requested) {
    if (!limit || requested == 0) {
        return true;
    }
    return outstanding + requested <= *limit || outstanding == 0;
}

bool within_limit(const boost::optional<std::int64_t>& limit, std::int64_t outstanding, std::int64_t requested) {
    return !limit || outstanding + requested <= *limit;
}

} // namespace

FlowController::FlowController(const FlowControlSettings& settings)
    : settings_(settings)
    , logger_(get_logger("courier.flow")) {
}

FlowControlOutcome FlowController::reserve(std::int64_t elements, std::int64_t bytes) {
    if (elements < 0 || bytes < 0) {
        throw std::invalid_argument("flow control reservation must not be negative");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (interrupted_) {
        throw PubSubError(StatusCode::Cancelled, "flow controller interrupted");
    }

    auto outcome = FlowControlOutcome::Admitted;
    switch (settings_.limit_exceeded_behavior) {
    case LimitExceededBehavior::Block:
        released_.wait(lock, [&] { return interrupted_ || fits(elements, bytes); });
        if (interrupted_) {
            throw PubSubError(StatusCode::Cancelled, "flow controller interrupted");
        }
        break;

    case LimitExceededBehavior::ThrowException:
        if (!within_limit(settings_.max_outstanding_element_count, outstanding_elements_, elements) ||
            !within_limit(settings_.max_outstanding_request_bytes, outstanding_bytes_, bytes)) {
            throw PubSubError(StatusCode::ResourceExhausted,
                              "flow control limit reached (" + std::to_string(outstanding_elements_) +
                                  " elements, " + std::to_string(outstanding_bytes_) + " bytes outstanding)");
        }
        break;

    case LimitExceededBehavior::Ignore:
        if (!within_limit(settings_.max_outstanding_element_count, outstanding_elements_, elements) ||
            !within_limit(settings_.max_outstanding_request_bytes, outstanding_bytes_, bytes)) {
            outcome = FlowControlOutcome::AdmittedOverLimit;
            logger_->debug("admitting {} elements / {} bytes over the flow control limit", elements, bytes);
        }
        break;
    }

    outstanding_elements_ += elements;
    outstanding_bytes_ += bytes;
    return outcome;
}

void FlowController::release(std::int64_t elements, std::int64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (elements < 0 || bytes < 0 || elements > outstanding_elements_ || bytes > outstanding_bytes_) {
            throw std::logic_error("flow control release of " + std::to_string(elements) + " elements / " +
                                   std::to_string(bytes) + " bytes exceeds outstanding " +
                                   std::to_string(outstanding_elements_) + " / " +
                                   std::to_string(outstanding_bytes_));
        }
        outstanding_elements_ -= elements;
        outstanding_bytes_ -= bytes;
    }
    released_.notify_all();
}

void FlowController::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    released_.notify_all();
}

std::int64_t FlowController::outstanding_elements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_elements_;
}

std::int64_t FlowController::outstanding_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_bytes_;
}

bool FlowController::fits(std::int64_t elements, std::int64_t bytes) const {
    return fits_limit(settings_.max_outstanding_element_count, outstanding_elements_, elements) &&
           fits_limit(settings_.max_outstanding_request_bytes, outstanding_bytes_, bytes);
}

} // namespace courier
