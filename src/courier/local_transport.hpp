#pragma once

#include "transport.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>

namespace courier {

/**
 * LocalTransport keeps topics and subscriptions in memory and behaves like a
 * single service instance:
 * - every subscription attached to a topic receives its own copy of each message,
 * - a pulled message is leased until acknowledged or its ack deadline passes,
 * - an expired or nacked lease is redelivered with a new ack id and an
 *   incremented delivery attempt,
 * - ack ids that are unknown or already resolved are ignored.
 *
 * Used by the emulator process and by tests.
 */
class LocalTransport : public Transport {
public:
    using Clock = std::chrono::steady_clock;

    LocalTransport() = default;

    std::vector<std::string> send(const std::string& topic, const std::vector<Message>& messages,
                                  std::chrono::milliseconds timeout) override;

    std::vector<ReceivedMessage> pull(const std::string& subscription, int max_messages,
                                      std::chrono::milliseconds timeout) override;

    void acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                     std::chrono::milliseconds timeout) override;

    void negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                              std::chrono::milliseconds timeout) override;

    void modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                             std::chrono::milliseconds deadline, std::chrono::milliseconds timeout) override;

    TopicInfo create_topic(const std::string& topic, std::chrono::milliseconds timeout) override;

    void delete_topic(const std::string& topic, std::chrono::milliseconds timeout) override;

    boost::optional<TopicInfo> get_topic(const std::string& topic, std::chrono::milliseconds timeout) override;

    std::vector<TopicInfo> list_topics(const std::string& project, std::chrono::milliseconds timeout) override;

    SubscriptionInfo create_subscription(const SubscriptionInfo& subscription,
                                         std::chrono::milliseconds timeout) override;

    void delete_subscription(const std::string& subscription, std::chrono::milliseconds timeout) override;

    boost::optional<SubscriptionInfo> get_subscription(const std::string& subscription,
                                                       std::chrono::milliseconds timeout) override;

    std::vector<SubscriptionInfo> list_subscriptions(const std::string& project,
                                                     std::chrono::milliseconds timeout) override;

    // Messages waiting for delivery, not counting leased ones.
    std::size_t pending_count(const std::string& subscription) const;

    std::size_t leased_count(const std::string& subscription) const;

private:
    struct Pending {
        Message message;
        int delivery_attempt;
    };

    struct Lease {
        Pending pending;
        Clock::time_point deadline;
    };

    struct SubscriptionState {
        SubscriptionInfo info;
        std::deque<Pending> backlog;
        std::map<std::string, Lease> leases;
    };

    SubscriptionState& subscription_locked(const std::string& subscription);
    const SubscriptionState& subscription_locked(const std::string& subscription) const;

    void expire_leases_locked(SubscriptionState& state, Clock::time_point now);

    mutable std::mutex mutex_;
    std::condition_variable arrivals_;
    std::map<std::string, TopicInfo> topics_;
    std::map<std::string, SubscriptionState> subscriptions_;
    std::uint64_t next_message_id_ = 1;
    std::uint64_t next_ack_id_ = 1;
};

} // namespace courier
