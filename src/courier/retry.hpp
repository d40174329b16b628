#pragma once

#include "errors.hpp"
#include "logging.hpp"
#include "types.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace courier {

/**
 * Delay and RPC timeout for a given attempt, derived from RetrySettings.
 * Attempts and retries are counted from 1.
 */
class RetrySchedule {
public:
    explicit RetrySchedule(const RetrySettings& settings) : settings_(settings) {}

    // Un-jittered delay before retry number `retry`.
    std::chrono::milliseconds retry_delay(int retry) const;

    // RPC timeout of attempt number `attempt`; zero means the call's default.
    std::chrono::milliseconds rpc_timeout(int attempt) const;

    const RetrySettings& settings() const { return settings_; }

private:
    RetrySettings settings_;
};

/**
 * Runs a remote call under a RetrySchedule. The call receives the RPC timeout
 * of the current attempt. Only retryable PubSubErrors are retried; everything
 * else propagates from the first attempt.
 *
 * An owner that must stop an unbounded retry sequence passes a `Cancelled`
 * predicate: it is checked around every backoff, and once it holds the run
 * fails with PubSubError(Cancelled) instead of issuing another attempt.
 */
class RetryPolicy {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Now = std::function<Clock::time_point()>;
    using Cancelled = std::function<bool()>;

    explicit RetryPolicy(const RetrySettings& settings);
    RetryPolicy(const RetrySettings& settings, Sleeper sleeper, Now now);
    RetryPolicy(const RetrySettings& settings, Sleeper sleeper, Now now, Cancelled cancelled);

    template <typename Call>
    auto run(const std::string& operation, Call&& call) -> decltype(call(std::chrono::milliseconds{})) {
        const auto start = now_();
        for (int attempt = 1;; ++attempt) {
            try {
                return call(attempt_timeout(attempt, start));
            } catch (const PubSubError& e) {
                next_delay_or_rethrow(operation, e, attempt, start);
            }
        }
    }

    const RetrySchedule& schedule() const { return schedule_; }

private:
    std::chrono::milliseconds attempt_timeout(int attempt, Clock::time_point start) const;

    // Sleeps before the next attempt, or rethrows the current error.
    void next_delay_or_rethrow(const std::string& operation, const PubSubError& error, int attempt,
                               Clock::time_point start);

    std::chrono::milliseconds jitter(std::chrono::milliseconds delay);

    RetrySchedule schedule_;
    Sleeper sleeper_;
    Now now_;
    Cancelled cancelled_;
    std::mutex random_mutex_;
    std::mt19937_64 random_;
    LoggerPtr logger_;
};

} // namespace courier
