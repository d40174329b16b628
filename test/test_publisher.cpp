#include "courier/errors.hpp"
#include "courier/publisher.hpp"
#include "transport_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace {

using namespace courier;
using namespace courier::test;

using testing::_;
using testing::ElementsAre;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;

const char* const kTopic = "projects/p/topics/t";

class TestPublisher : public testing::Test {
protected:
    void SetUp() override {
        ON_CALL(transport_, send(_, _, _))
            .WillByDefault(Invoke([this](const std::string&, const std::vector<Message>& messages,
                                         std::chrono::milliseconds) {
                std::lock_guard<std::mutex> lock(mutex_);
                std::vector<std::string> batch;
                std::vector<std::string> ids;
                for (const auto& message : messages) {
                    batch.push_back(message.data);
                    ids.push_back("id-" + message.data);
                }
                batches_.push_back(batch);
                return ids;
            }));
    }

    std::unique_ptr<Publisher> make_publisher(const PublisherSettings& settings) {
        return std::unique_ptr<Publisher>(new Publisher(kTopic, transport_, settings, pool_));
    }

    static PublisherSettings batching(boost::optional<std::int64_t> count,
                                      boost::optional<std::chrono::milliseconds> delay = boost::none) {
        PublisherSettings settings;
        settings.role.retry.max_attempts = 1;
        settings.batching.enabled = true;
        settings.batching.element_count_threshold = count;
        settings.batching.delay_threshold = delay;
        return settings;
    }

    std::vector<std::vector<std::string>> batches() {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches_;
    }

    NiceMock<MockTransport> transport_;
    boost::asio::thread_pool pool_{2};

    std::mutex mutex_;
    std::vector<std::vector<std::string>> batches_;
};

// MARK: - Tests:

TEST_F(TestPublisher, count_threshold_splits_batches) {
    auto publisher = make_publisher(batching(3));

    std::vector<std::future<std::string>> results;
    for (const char* data : {"M1", "M2", "M3", "M4", "M5"}) {
        results.push_back(publisher->publish(Message(data)));
    }

    EXPECT_EQ(results[0].get(), "id-M1");
    EXPECT_EQ(results[2].get(), "id-M3");
    EXPECT_EQ(publisher->pending_count(), 2u);

    publisher->flush();
    EXPECT_EQ(results[4].get(), "id-M5");

    EXPECT_THAT(batches(), ElementsAre(ElementsAre("M1", "M2", "M3"), ElementsAre("M4", "M5")));
}

TEST_F(TestPublisher, shutdown_force_flushes) {
    auto publisher = make_publisher(batching(100));

    auto first = publisher->publish(Message("a"));
    auto second = publisher->publish(Message("b"));
    publisher->shutdown();

    EXPECT_EQ(first.get(), "id-a");
    EXPECT_EQ(second.get(), "id-b");
    EXPECT_THAT(batches(), ElementsAre(ElementsAre("a", "b")));
}

TEST_F(TestPublisher, publish_after_shutdown_fails_future) {
    auto publisher = make_publisher(batching(100));
    publisher->shutdown();

    auto result = publisher->publish(Message("late"));
    try {
        result.get();
        FAIL() << "expected PubSubError";
    } catch (const PubSubError& e) {
        EXPECT_EQ(e.code(), StatusCode::FailedPrecondition);
    }
}

TEST_F(TestPublisher, delay_threshold_flushes_open_batch) {
    auto publisher = make_publisher(batching(100, std::chrono::milliseconds(20)));

    auto result = publisher->publish(Message("slow"));

    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), "id-slow");
}

TEST_F(TestPublisher, disabled_batching_sends_each_message) {
    PublisherSettings settings;
    settings.batching.element_count_threshold = 100;
    auto publisher = make_publisher(settings);

    auto first = publisher->publish(Message("x"));
    first.get();
    auto second = publisher->publish(Message("y"));
    second.get();

    EXPECT_THAT(batches(), ElementsAre(ElementsAre("x"), ElementsAre("y")));
}

TEST_F(TestPublisher, batch_failure_reaches_every_future) {
    EXPECT_CALL(transport_, send(_, _, _))
        .WillOnce(Invoke([](const std::string&, const std::vector<Message>&, std::chrono::milliseconds)
                             -> std::vector<std::string> {
            throw PubSubError(StatusCode::PermissionDenied, "no");
        }));

    auto publisher = make_publisher(batching(2));
    auto first = publisher->publish(Message("a"));
    auto second = publisher->publish(Message("b"));

    for (auto* result : {&first, &second}) {
        try {
            result->get();
            FAIL() << "expected PubSubError";
        } catch (const PubSubError& e) {
            EXPECT_EQ(e.code(), StatusCode::PermissionDenied);
        }
    }
}

TEST_F(TestPublisher, transient_failure_is_retried) {
    auto settings = batching(1);
    settings.role.retry = fast_retry(3);

    int calls = 0;
    EXPECT_CALL(transport_, send(kTopic, _, _))
        .Times(2)
        .WillRepeatedly(Invoke([&calls](const std::string&, const std::vector<Message>&, std::chrono::milliseconds)
                                   -> std::vector<std::string> {
            if (++calls == 1) {
                throw PubSubError(StatusCode::Unavailable, "blip");
            }
            return {"id-1"};
        }));

    auto publisher = make_publisher(settings);
    EXPECT_EQ(publisher->publish(Message("a")).get(), "id-1");
}

TEST_F(TestPublisher, throwing_flow_control_fails_future) {
    auto settings = batching(10);
    settings.role.flow_control.max_outstanding_element_count = 1;
    settings.role.flow_control.limit_exceeded_behavior = LimitExceededBehavior::ThrowException;
    auto publisher = make_publisher(settings);

    auto admitted = publisher->publish(Message("a"));
    auto rejected = publisher->publish(Message("b"));

    try {
        rejected.get();
        FAIL() << "expected PubSubError";
    } catch (const PubSubError& e) {
        EXPECT_EQ(e.code(), StatusCode::ResourceExhausted);
    }

    publisher->flush();
    EXPECT_EQ(admitted.get(), "id-a");
}

} // namespace
