#include "courier/errors.hpp"
#include "courier/local_transport.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <thread>

namespace {

using namespace courier;

const char* const kTopic = "projects/p/topics/t";
const char* const kSubscription = "projects/p/subscriptions/s";
const std::chrono::milliseconds kNow(0);

class TestLocalTransport : public testing::Test {
protected:
    void SetUp() override {
        transport_.create_topic(kTopic, kNow);
        subscribe(kSubscription, std::chrono::seconds(10));
    }

    void subscribe(const std::string& name, std::chrono::milliseconds ack_deadline) {
        SubscriptionInfo info;
        info.name = name;
        info.topic = kTopic;
        info.ack_deadline = ack_deadline;
        transport_.create_subscription(info, kNow);
    }

    static StatusCode code_of(const std::function<void()>& call) {
        try {
            call();
        } catch (const PubSubError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected PubSubError";
        return StatusCode::Internal;
    }

    LocalTransport transport_;
};

// MARK: - Tests:

TEST_F(TestLocalTransport, every_subscription_gets_a_copy) {
    subscribe("projects/p/subscriptions/second", std::chrono::seconds(10));

    auto ids = transport_.send(kTopic, {Message("a"), Message("b")}, kNow);

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_NE(ids[0], ids[1]);
    EXPECT_EQ(transport_.pending_count(kSubscription), 2u);
    EXPECT_EQ(transport_.pending_count("projects/p/subscriptions/second"), 2u);
}

TEST_F(TestLocalTransport, pulled_messages_carry_service_fields) {
    transport_.send(kTopic, {Message("a", Headers{{"k", "v"}}, "key")}, kNow);

    auto pulled = transport_.pull(kSubscription, 10, kNow);

    ASSERT_EQ(pulled.size(), 1u);
    EXPECT_EQ(pulled[0].message.data, "a");
    EXPECT_EQ(pulled[0].message.headers.at("k"), "v");
    EXPECT_EQ(pulled[0].message.ordering_key, "key");
    EXPECT_FALSE(pulled[0].message.message_id.empty());
    EXPECT_NE(pulled[0].message.publish_time, std::chrono::system_clock::time_point{});
    EXPECT_EQ(pulled[0].delivery_attempt, 1);
}

TEST_F(TestLocalTransport, pull_respects_max_and_order) {
    transport_.send(kTopic, {Message("1"), Message("2"), Message("3")}, kNow);

    auto first = transport_.pull(kSubscription, 2, kNow);
    auto second = transport_.pull(kSubscription, 2, kNow);

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].message.data, "1");
    EXPECT_EQ(first[1].message.data, "2");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].message.data, "3");
}

TEST_F(TestLocalTransport, pull_waits_for_arrivals) {
    std::thread sender([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        transport_.send(kTopic, {Message("late")}, kNow);
    });

    auto pulled = transport_.pull(kSubscription, 1, std::chrono::seconds(5));
    sender.join();

    ASSERT_EQ(pulled.size(), 1u);
    EXPECT_EQ(pulled[0].message.data, "late");
}

TEST_F(TestLocalTransport, expired_lease_is_redelivered) {
    subscribe("projects/p/subscriptions/short", std::chrono::milliseconds(30));
    transport_.send(kTopic, {Message("x")}, kNow);

    auto first = transport_.pull("projects/p/subscriptions/short", 1, kNow);
    auto second = transport_.pull("projects/p/subscriptions/short", 1, std::chrono::seconds(5));

    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].delivery_attempt, 2);
    EXPECT_NE(second[0].ack_id, first[0].ack_id);
    EXPECT_EQ(second[0].message.message_id, first[0].message.message_id);
}

TEST_F(TestLocalTransport, ack_removes_lease_and_unknown_ids_are_ignored) {
    transport_.send(kTopic, {Message("x")}, kNow);
    auto pulled = transport_.pull(kSubscription, 1, kNow);

    transport_.acknowledge(kSubscription, {pulled[0].ack_id, "ack-unknown"}, kNow);
    transport_.acknowledge(kSubscription, {pulled[0].ack_id}, kNow);

    EXPECT_EQ(transport_.leased_count(kSubscription), 0u);
    EXPECT_EQ(transport_.pending_count(kSubscription), 0u);
}

TEST_F(TestLocalTransport, nack_puts_message_first_in_line) {
    transport_.send(kTopic, {Message("first"), Message("second")}, kNow);
    auto pulled = transport_.pull(kSubscription, 1, kNow);

    transport_.negative_acknowledge(kSubscription, {pulled[0].ack_id}, kNow);
    auto again = transport_.pull(kSubscription, 1, kNow);

    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].message.data, "first");
    EXPECT_EQ(again[0].delivery_attempt, 2);
}

TEST_F(TestLocalTransport, resource_errors) {
    EXPECT_EQ(code_of([this] { transport_.create_topic(kTopic, kNow); }), StatusCode::AlreadyExists);
    EXPECT_EQ(code_of([this] { transport_.send("projects/p/topics/none", {Message("x")}, kNow); }),
              StatusCode::NotFound);
    EXPECT_EQ(code_of([this] { transport_.pull("projects/p/subscriptions/none", 1, kNow); }), StatusCode::NotFound);
    EXPECT_EQ(code_of([this] { transport_.pull(kSubscription, 0, kNow); }), StatusCode::InvalidArgument);
    EXPECT_EQ(code_of([this] { subscribe(kSubscription, std::chrono::seconds(1)); }), StatusCode::AlreadyExists);
    EXPECT_EQ(code_of([this] { transport_.delete_subscription("projects/p/subscriptions/none", kNow); }),
              StatusCode::NotFound);
}

TEST_F(TestLocalTransport, listing_filters_by_project) {
    transport_.create_topic("projects/other/topics/t", kNow);

    auto topics = transport_.list_topics("projects/p", kNow);
    ASSERT_EQ(topics.size(), 1u);
    EXPECT_EQ(topics[0].name, kTopic);

    auto subscriptions = transport_.list_subscriptions("projects/p", kNow);
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions[0].topic, kTopic);

    EXPECT_TRUE(transport_.get_topic(kTopic, kNow));
    transport_.delete_topic(kTopic, kNow);
    EXPECT_FALSE(transport_.get_topic(kTopic, kNow));
}

} // namespace
