#include "courier/metrics.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace courier;

using testing::HasSubstr;

class TestMetrics : public testing::Test {
protected:
    Metrics metrics_;
};

// MARK: - Tests:

TEST_F(TestMetrics, counters_and_percentiles) {
    for (int i = 1; i <= 100; ++i) {
        metrics_.record_received();
        metrics_.record_ack(std::chrono::microseconds(i));
    }
    metrics_.record_nack();
    metrics_.record_lease_expired();
    metrics_.record_callback_failure();
    metrics_.update_outstanding(7);

    auto stats = metrics_.get_stats();

    EXPECT_EQ(stats.messages_received, 100u);
    EXPECT_EQ(stats.messages_acked, 100u);
    EXPECT_EQ(stats.messages_nacked, 1u);
    EXPECT_EQ(stats.leases_expired, 1u);
    EXPECT_EQ(stats.callback_failures, 1u);
    EXPECT_EQ(stats.outstanding, 7u);
    EXPECT_EQ(stats.ack_p50, std::chrono::microseconds(50));
    EXPECT_EQ(stats.ack_p90, std::chrono::microseconds(90));
    EXPECT_EQ(stats.ack_p99, std::chrono::microseconds(99));
}

TEST_F(TestMetrics, reset_clears_counters) {
    metrics_.record_received();
    metrics_.record_ack(std::chrono::milliseconds(1));
    metrics_.reset();

    auto stats = metrics_.get_stats();
    EXPECT_EQ(stats.messages_received, 0u);
    EXPECT_EQ(stats.messages_acked, 0u);
    EXPECT_EQ(stats.ack_p50.count(), 0);
}

TEST(TestMetricsWindow, keeps_only_latest_latencies) {
    Metrics metrics(4);
    for (int i = 1; i <= 8; ++i) {
        metrics.record_ack(std::chrono::milliseconds(i));
    }

    auto stats = metrics.get_stats();
    EXPECT_EQ(stats.messages_acked, 8u);
    EXPECT_EQ(stats.ack_p50, std::chrono::milliseconds(6));
    EXPECT_EQ(stats.ack_p99, std::chrono::milliseconds(8));
}

TEST_F(TestMetrics, formatting) {
    EXPECT_EQ(metrics_utils::format_duration(std::chrono::nanoseconds(999)), "999ns");
    EXPECT_EQ(metrics_utils::format_duration(std::chrono::microseconds(15)), "15us");
    EXPECT_EQ(metrics_utils::format_duration(std::chrono::milliseconds(3)), "3ms");
    EXPECT_EQ(metrics_utils::format_duration(std::chrono::seconds(2)), "2s");

    metrics_.record_received();
    EXPECT_THAT(metrics_utils::format_stats(metrics_.get_stats()), HasSubstr("received=1"));
}

} // namespace
