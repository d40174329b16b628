#include "retry.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace courier {

namespace {

// Upper bound of an uncapped delay or timeout: one day.
const double kUncappedLimitMs = 24.0 * 60 * 60 * 1000;

std::chrono::milliseconds grow(std::chrono::milliseconds initial, double multiplier, int steps,
                               std::chrono::milliseconds cap) {
    double value = static_cast<double>(initial.count());
    const double limit = cap.count() > 0 ? static_cast<double>(cap.count()) : kUncappedLimitMs;
    for (int i = 0; i < steps && value < limit; ++i) {
        value *= multiplier;
    }
    value = std::min(value, limit);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(value)));
}

} // namespace

std::chrono::milliseconds RetrySchedule::retry_delay(int retry) const {
    return grow(settings_.initial_retry_delay, settings_.retry_delay_multiplier, std::max(0, retry - 1),
                settings_.max_retry_delay);
}

std::chrono::milliseconds RetrySchedule::rpc_timeout(int attempt) const {
    if (settings_.initial_rpc_timeout.count() == 0) {
        return settings_.max_rpc_timeout;
    }
    return grow(settings_.initial_rpc_timeout, settings_.rpc_timeout_multiplier, std::max(0, attempt - 1),
                settings_.max_rpc_timeout);
}

RetryPolicy::RetryPolicy(const RetrySettings& settings)
    : RetryPolicy(settings,
                  [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); },
                  [] { return Clock::now(); }) {
}

RetryPolicy::RetryPolicy(const RetrySettings& settings, Sleeper sleeper, Now now)
    : RetryPolicy(settings, std::move(sleeper), std::move(now), [] { return false; }) {
}

RetryPolicy::RetryPolicy(const RetrySettings& settings, Sleeper sleeper, Now now, Cancelled cancelled)
    : schedule_(settings)
    , sleeper_(std::move(sleeper))
    , now_(std::move(now))
    , cancelled_(std::move(cancelled))
    , random_(std::random_device{}())
    , logger_(get_logger("courier.retry")) {
}

std::chrono::milliseconds RetryPolicy::attempt_timeout(int attempt, Clock::time_point start) const {
    auto timeout = schedule_.rpc_timeout(attempt);
    const auto total = schedule_.settings().total_timeout;
    if (total.count() == 0) {
        return timeout;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - start);
    auto remaining = std::max(std::chrono::milliseconds(1), total - elapsed);
    return timeout.count() == 0 ? remaining : std::min(timeout, remaining);
}

void RetryPolicy::next_delay_or_rethrow(const std::string& operation, const PubSubError& error, int attempt,
                                        Clock::time_point start) {
    const auto& settings = schedule_.settings();

    if (!is_retryable(error.code())) {
        throw error;
    }
    if (settings.max_attempts > 0 && attempt >= settings.max_attempts) {
        logger_->error("{} failed after {} attempts: {}", operation, attempt, error.what());
        throw error;
    }

    auto delay = schedule_.retry_delay(attempt);
    if (settings.jittered) {
        delay = jitter(delay);
    }

    if (settings.total_timeout.count() > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - start);
        if (elapsed + delay >= settings.total_timeout) {
            logger_->error("{} timed out after {} attempts ({} ms): {}", operation, attempt, elapsed.count(),
                           error.what());
            throw error;
        }
    }

    auto throw_if_cancelled = [&] {
        if (cancelled_()) {
            throw PubSubError(StatusCode::Cancelled, operation + " cancelled after " + std::to_string(attempt) +
                                                         " attempts: " + error.detail());
        }
    };

    throw_if_cancelled();
    logger_->warn("{} attempt {} failed, retrying in {} ms: {}", operation, attempt, delay.count(), error.what());
    sleeper_(delay);
    throw_if_cancelled();
}

std::chrono::milliseconds RetryPolicy::jitter(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        return delay;
    }
    std::lock_guard<std::mutex> lock(random_mutex_);
    std::uniform_int_distribution<std::int64_t> distribution(0, delay.count());
    return std::chrono::milliseconds(distribution(random_));
}

} // namespace courier
