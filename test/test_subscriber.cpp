#include "courier/errors.hpp"
#include "courier/local_transport.hpp"
#include "courier/subscriber.hpp"
#include "transport_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace courier;
using namespace courier::test;

using testing::_;
using testing::NiceMock;
using testing::Return;

const char* const kTopic = "projects/p/topics/t";
const char* const kSubscription = "projects/p/subscriptions/s";

class TestSubscriber : public testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<LocalTransport>();
        transport_->create_topic(kTopic, std::chrono::milliseconds(0));

        subscription_.name = kSubscription;
        subscription_.topic = kTopic;
        subscription_.ack_deadline = std::chrono::milliseconds(400);
        transport_->create_subscription(subscription_, std::chrono::milliseconds(0));

        settings_.role.executor_threads = 2;
        settings_.parallel_pull_count = 1;
        settings_.pull_wait = std::chrono::milliseconds(20);
    }

    void send(const std::vector<std::string>& payloads) {
        std::vector<Message> messages;
        for (const auto& payload : payloads) {
            messages.push_back(Message(payload));
        }
        transport_->send(kTopic, messages, std::chrono::milliseconds(0));
    }

    std::shared_ptr<LocalTransport> transport_;
    SubscriptionInfo subscription_;
    SubscriberSettings settings_;
};

// MARK: - Tests:

TEST_F(TestSubscriber, acknowledged_messages_are_consumed) {
    std::mutex mutex;
    std::set<std::string> seen;
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(message->message().data);
        }
        message->ack();
    });

    subscriber.start();
    send({"a", "b", "c"});

    EXPECT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 3;
    }));
    EXPECT_TRUE(eventually([&] { return subscriber.outstanding() == 0; }));
    subscriber.stop();

    EXPECT_EQ(transport_->pending_count(kSubscription), 0u);
    EXPECT_EQ(transport_->leased_count(kSubscription), 0u);
    auto stats = subscriber.get_metrics();
    EXPECT_EQ(stats.messages_received, 3u);
    EXPECT_EQ(stats.messages_acked, 3u);
}

TEST_F(TestSubscriber, callback_exception_nacks_for_redelivery) {
    std::atomic<int> attempts{0};
    std::atomic<int> last_attempt{0};
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        last_attempt.store(message->delivery_attempt());
        if (++attempts == 1) {
            throw std::runtime_error("not yet");
        }
        message->ack();
    });

    subscriber.start();
    send({"retry-me"});

    EXPECT_TRUE(eventually([&] { return attempts.load() >= 2; }));
    EXPECT_TRUE(eventually([&] { return subscriber.outstanding() == 0; }));
    subscriber.stop();

    EXPECT_EQ(last_attempt.load(), 2);
    auto stats = subscriber.get_metrics();
    EXPECT_EQ(stats.callback_failures, 1u);
    EXPECT_EQ(stats.messages_nacked, 1u);
}

TEST_F(TestSubscriber, stop_returns_unresolved_messages) {
    std::mutex mutex;
    std::vector<AcknowledgeableMessagePtr> held;
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        std::lock_guard<std::mutex> lock(mutex);
        held.push_back(message);
    });

    subscriber.start();
    send({"x", "y"});
    EXPECT_TRUE(eventually([&] { return subscriber.outstanding() == 2; }));

    subscriber.stop();

    EXPECT_FALSE(subscriber.is_running());
    EXPECT_EQ(subscriber.outstanding(), 0u);
    EXPECT_EQ(transport_->pending_count(kSubscription), 2u);
    EXPECT_EQ(transport_->leased_count(kSubscription), 0u);
}

TEST_F(TestSubscriber, start_twice_is_rejected) {
    Subscriber subscriber(subscription_, transport_, settings_, [](const AcknowledgeableMessagePtr&) {});
    subscriber.start();

    try {
        subscriber.start();
        FAIL() << "expected PubSubError";
    } catch (const PubSubError& e) {
        EXPECT_EQ(e.code(), StatusCode::FailedPrecondition);
    }
    subscriber.stop();

    // a stopped subscriber may be started again
    subscriber.start();
    EXPECT_TRUE(subscriber.is_running());
    subscriber.stop();
}

TEST_F(TestSubscriber, leases_are_extended_while_held) {
    settings_.max_ack_extension_period = std::chrono::seconds(10);

    std::atomic<int> deliveries{0};
    std::mutex mutex;
    std::vector<AcknowledgeableMessagePtr> held;
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        ++deliveries;
        std::lock_guard<std::mutex> lock(mutex);
        held.push_back(message);
    });

    subscriber.start();
    send({"long-running"});
    EXPECT_TRUE(eventually([&] { return deliveries.load() == 1; }));

    // three ack deadlines without redelivery
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(deliveries.load(), 1);
    EXPECT_EQ(transport_->leased_count(kSubscription), 1u);

    {
        std::lock_guard<std::mutex> lock(mutex);
        held.front()->ack();
    }
    subscriber.stop();
    EXPECT_EQ(transport_->leased_count(kSubscription), 0u);
}

TEST_F(TestSubscriber, non_retryable_pull_error_stops_worker) {
    auto transport = std::make_shared<NiceMock<MockTransport>>();
    EXPECT_CALL(*transport, pull(kSubscription, _, _))
        .Times(1)
        .WillOnce(testing::Throw(PubSubError(StatusCode::NotFound, "gone")));

    Subscriber subscriber(subscription_, transport, settings_, [](const AcknowledgeableMessagePtr&) {});
    subscriber.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    subscriber.stop();
}

TEST_F(TestSubscriber, stop_interrupts_unbounded_pull_retries) {
    // default retry settings: no attempt limit, no total timeout, no delay
    ASSERT_EQ(settings_.role.retry.max_attempts, 0);
    ASSERT_EQ(settings_.role.retry.total_timeout.count(), 0);

    std::atomic<int> pulls{0};
    auto transport = std::make_shared<NiceMock<MockTransport>>();
    ON_CALL(*transport, pull(kSubscription, _, _))
        .WillByDefault(testing::Invoke([&](const std::string&, int, std::chrono::milliseconds)
                                           -> std::vector<ReceivedMessage> {
            ++pulls;
            throw PubSubError(StatusCode::Unavailable, "service down");
        }));

    Subscriber subscriber(subscription_, transport, settings_, [](const AcknowledgeableMessagePtr&) {});
    subscriber.start();
    EXPECT_TRUE(eventually([&] { return pulls.load() >= 3; }));

    auto stopped = std::async(std::launch::async, [&] { subscriber.stop(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(subscriber.state(), Subscriber::State::Stopped);

    const int pulls_at_stop = pulls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(pulls.load(), pulls_at_stop);
}

TEST_F(TestSubscriber, pulls_are_bounded_by_outstanding_element_limit) {
    settings_.role.flow_control.max_outstanding_element_count = 2;
    settings_.role.flow_control.limit_exceeded_behavior = LimitExceededBehavior::Block;
    settings_.max_ack_extension_period = std::chrono::seconds(10);

    std::mutex mutex;
    std::vector<AcknowledgeableMessagePtr> held;
    std::atomic<std::size_t> most_held{0};
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        std::lock_guard<std::mutex> lock(mutex);
        held.push_back(message);
        most_held.store(std::max(most_held.load(), held.size()));
    });

    subscriber.start();
    send({"m1", "m2", "m3", "m4", "m5"});

    EXPECT_TRUE(eventually([&] { return subscriber.outstanding() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(subscriber.outstanding(), 2u);
    EXPECT_EQ(most_held.load(), 2u);
    EXPECT_LE(transport_->leased_count(kSubscription), 2u);

    // acking the held messages frees room for the rest
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& message : held) {
            message->ack();
        }
        held.clear();
    }
    EXPECT_TRUE(eventually([&] { return subscriber.get_metrics().messages_received == 4; }));
    EXPECT_LE(most_held.load(), 2u);

    subscriber.stop();
}

TEST_F(TestSubscriber, lease_without_extension_is_redelivered) {
    settings_.max_ack_extension_period = std::chrono::milliseconds(0);
    subscription_.ack_deadline = std::chrono::milliseconds(100);
    transport_->delete_subscription(kSubscription, std::chrono::milliseconds(0));
    transport_->create_subscription(subscription_, std::chrono::milliseconds(0));

    std::mutex mutex;
    std::vector<AcknowledgeableMessagePtr> held;
    Subscriber subscriber(subscription_, transport_, settings_, [&](const AcknowledgeableMessagePtr& message) {
        std::lock_guard<std::mutex> lock(mutex);
        held.push_back(message);
    });

    subscriber.start();
    send({"slow"});

    EXPECT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return held.size() >= 2;
    }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_GE(held.size(), 2u);
        EXPECT_EQ(held[0]->message().message_id, held[1]->message().message_id);
        EXPECT_EQ(held[1]->delivery_attempt(), 2);
    }
    EXPECT_TRUE(eventually([&] { return subscriber.get_metrics().leases_expired >= 1; }));

    subscriber.stop();
}

} // namespace
