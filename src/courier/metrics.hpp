#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace courier {

/**
 * Thread-safe delivery statistics of a subscriber.
 *
 * Ack latency is the time from handing a message to the callback until it was
 * acknowledged. Only the most recent window of latencies is kept, in a ring.
 */
class Metrics {
public:
    struct Stats {
        std::chrono::nanoseconds ack_p50{0};
        std::chrono::nanoseconds ack_p90{0};
        std::chrono::nanoseconds ack_p99{0};
        std::uint64_t messages_received = 0;
        std::uint64_t messages_acked = 0;
        std::uint64_t messages_nacked = 0;
        std::uint64_t leases_expired = 0;
        std::uint64_t callback_failures = 0;
        // Acks since the previous get_stats() call, per second.
        double acks_per_second = 0.0;
        std::size_t outstanding = 0;
    };

    explicit Metrics(std::size_t window = 1024);

    void record_received() { received_.fetch_add(1, std::memory_order_relaxed); }

    void record_ack(std::chrono::nanoseconds latency);

    void record_nack() { nacked_.fetch_add(1, std::memory_order_relaxed); }

    void record_lease_expired() { expired_.fetch_add(1, std::memory_order_relaxed); }

    void record_callback_failure() { failures_.fetch_add(1, std::memory_order_relaxed); }

    void update_outstanding(std::size_t outstanding) { outstanding_.store(outstanding, std::memory_order_relaxed); }

    Stats get_stats();

    void reset();

private:
    // Nearest-rank percentile over an ascending vector.
    static std::chrono::nanoseconds nearest_rank(const std::vector<std::int64_t>& ascending, int percent);

    const std::size_t window_;

    std::mutex latency_mutex_;
    std::vector<std::int64_t> latency_ring_;
    std::size_t ring_next_ = 0;
    std::chrono::steady_clock::time_point rate_since_;
    std::uint64_t acked_at_rate_since_ = 0;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> acked_{0};
    std::atomic<std::uint64_t> nacked_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::size_t> outstanding_{0};
};

namespace metrics_utils {
    std::string format_stats(const Metrics::Stats& stats);
    std::string format_duration(std::chrono::nanoseconds duration);
}

} // namespace courier
