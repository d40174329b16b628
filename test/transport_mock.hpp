#pragma once

#include "courier/transport.hpp"

#include <boost/optional.hpp>
#include <gmock/gmock.h>
#include <chrono>
#include <ostream>
#include <thread>

namespace courier {

// gmock printers, found through argument-dependent lookup. Without the
// optional overload gtest would pick boost's unusable operator<<.
inline void PrintTo(const TopicInfo& topic, std::ostream* os) {
    *os << "TopicInfo{" << topic.name << "}";
}

inline void PrintTo(const SubscriptionInfo& subscription, std::ostream* os) {
    *os << "SubscriptionInfo{" << subscription.name << ", " << subscription.topic << ", "
        << subscription.ack_deadline.count() << "ms}";
}

template <typename T>
void PrintTo(const boost::optional<T>& value, std::ostream* os) {
    if (value) {
        *os << testing::PrintToString(*value);
    } else {
        *os << "none";
    }
}

namespace test {

class MockTransport : public Transport {
public:
    MOCK_METHOD(std::vector<std::string>, send,
                (const std::string& topic, const std::vector<Message>& messages, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(std::vector<ReceivedMessage>, pull,
                (const std::string& subscription, int max_messages, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, acknowledge,
                (const std::string& subscription, const std::vector<std::string>& ack_ids,
                 std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(void, negative_acknowledge,
                (const std::string& subscription, const std::vector<std::string>& ack_ids,
                 std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(void, modify_ack_deadline,
                (const std::string& subscription, const std::vector<std::string>& ack_ids,
                 std::chrono::milliseconds deadline, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(TopicInfo, create_topic, (const std::string& topic, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, delete_topic, (const std::string& topic, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(boost::optional<TopicInfo>, get_topic, (const std::string& topic, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(std::vector<TopicInfo>, list_topics, (const std::string& project, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(SubscriptionInfo, create_subscription,
                (const SubscriptionInfo& subscription, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, delete_subscription, (const std::string& subscription, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(boost::optional<SubscriptionInfo>, get_subscription,
                (const std::string& subscription, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(std::vector<SubscriptionInfo>, list_subscriptions,
                (const std::string& project, std::chrono::milliseconds timeout), (override));
};

// Zero-delay retries bounded by attempt count, for tests that exercise
// failure paths.
inline RetrySettings fast_retry(int max_attempts) {
    RetrySettings retry;
    retry.max_attempts = max_attempts;
    retry.jittered = false;
    return retry;
}

inline ReceivedMessage received(const std::string& ack_id, const std::string& data, int attempt = 1) {
    ReceivedMessage message;
    message.ack_id = ack_id;
    message.message = Message(data);
    message.message.message_id = "id-" + ack_id;
    message.delivery_attempt = attempt;
    return message;
}

// Polls `condition` until it holds or `timeout` passes.
template <typename Condition>
bool eventually(Condition condition, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto give_up = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= give_up) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace test
} // namespace courier
