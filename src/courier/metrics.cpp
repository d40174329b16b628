#include "metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace courier {

Metrics::Metrics(std::size_t window)
    : window_(std::max<std::size_t>(window, 1))
    , rate_since_(std::chrono::steady_clock::now()) {
    latency_ring_.reserve(window_);
}

void Metrics::record_ack(std::chrono::nanoseconds latency) {
    acked_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(latency_mutex_);
    if (latency_ring_.size() < window_) {
        latency_ring_.push_back(latency.count());
    } else {
        latency_ring_[ring_next_] = latency.count();
    }
    ring_next_ = (ring_next_ + 1) % window_;
}

Metrics::Stats Metrics::get_stats() {
    Stats stats;
    stats.messages_received = received_.load();
    stats.messages_acked = acked_.load();
    stats.messages_nacked = nacked_.load();
    stats.leases_expired = expired_.load();
    stats.callback_failures = failures_.load();
    stats.outstanding = outstanding_.load();

    std::vector<std::int64_t> ascending;
    {
        std::lock_guard<std::mutex> lock(latency_mutex_);
        ascending = latency_ring_;

        const auto now = std::chrono::steady_clock::now();
        const std::chrono::duration<double> window = now - rate_since_;
        if (window.count() > 0.0) {
            stats.acks_per_second = (stats.messages_acked - acked_at_rate_since_) / window.count();
        }
        rate_since_ = now;
        acked_at_rate_since_ = stats.messages_acked;
    }

    std::sort(ascending.begin(), ascending.end());
    stats.ack_p50 = nearest_rank(ascending, 50);
    stats.ack_p90 = nearest_rank(ascending, 90);
    stats.ack_p99 = nearest_rank(ascending, 99);
    return stats;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(latency_mutex_);
    latency_ring_.clear();
    ring_next_ = 0;
    rate_since_ = std::chrono::steady_clock::now();
    acked_at_rate_since_ = 0;

    received_.store(0);
    acked_.store(0);
    nacked_.store(0);
    expired_.store(0);
    failures_.store(0);
}

std::chrono::nanoseconds Metrics::nearest_rank(const std::vector<std::int64_t>& ascending, int percent) {
    if (ascending.empty()) {
        return std::chrono::nanoseconds(0);
    }
    // rank = ceil(percent / 100 * n), 1-based
    const std::size_t rank = (static_cast<std::size_t>(percent) * ascending.size() + 99) / 100;
    return std::chrono::nanoseconds(ascending[std::max<std::size_t>(rank, 1) - 1]);
}

namespace metrics_utils {

std::string format_stats(const Metrics::Stats& stats) {
    std::ostringstream out;
    out << "ack p50=" << format_duration(stats.ack_p50)
        << " p90=" << format_duration(stats.ack_p90)
        << " p99=" << format_duration(stats.ack_p99)
        << " acks/sec=" << std::fixed << std::setprecision(1) << stats.acks_per_second
        << " received=" << stats.messages_received
        << " acked=" << stats.messages_acked
        << " nacked=" << stats.messages_nacked
        << " expired=" << stats.leases_expired
        << " failed=" << stats.callback_failures
        << " outstanding=" << stats.outstanding;
    return out.str();
}

std::string format_duration(std::chrono::nanoseconds duration) {
    static const struct {
        std::int64_t scale;
        const char* unit;
    } units[] = {{1000000000, "s"}, {1000000, "ms"}, {1000, "us"}};

    const auto ns = duration.count();
    for (const auto& u : units) {
        if (ns >= u.scale) {
            return std::to_string(ns / u.scale) + u.unit;
        }
    }
    return std::to_string(ns) + "ns";
}

} // namespace metrics_utils
} // namespace courier
