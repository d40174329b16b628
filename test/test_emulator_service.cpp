#include "courier/emulator_service.hpp"
#include "courier/errors.hpp"
#include "courier/local_transport.hpp"
#include "courier/remote_transport.hpp"
#include "transport_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <stdexcept>

namespace {

using namespace courier;
using namespace courier::test;

using testing::_;
using testing::ElementsAre;
using testing::NiceMock;

const std::chrono::milliseconds kNow(0);

// Hands requests straight to an EmulatorService.
class LoopbackExchange : public FrameExchange {
public:
    explicit LoopbackExchange(EmulatorService& service) : service_(service) {}

    wire::Frames exchange(const wire::Frames& request, std::chrono::milliseconds) override {
        return service_.handle(request);
    }

private:
    EmulatorService& service_;
};

// Replies with canned frames.
class ScriptedExchange : public FrameExchange {
public:
    explicit ScriptedExchange(wire::Frames reply) : reply_(std::move(reply)) {}

    wire::Frames exchange(const wire::Frames&, std::chrono::milliseconds) override { return reply_; }

private:
    wire::Frames reply_;
};

class TestEmulatorService : public testing::Test {
protected:
    void SetUp() override {
        service_.reset(new EmulatorService(backend_));
        remote_.reset(new RemoteTransport(std::unique_ptr<FrameExchange>(new LoopbackExchange(*service_))));
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

    LocalTransport backend_;
    std::unique_ptr<EmulatorService> service_;
    std::unique_ptr<RemoteTransport> remote_;
};

// MARK: - Tests:

TEST_F(TestEmulatorService, remote_calls_reach_the_backend) {
    remote_->create_topic("projects/p/topics/t", kNow);
    SubscriptionInfo info;
    info.name = "projects/p/subscriptions/s";
    info.topic = "projects/p/topics/t";
    info.ack_deadline = std::chrono::seconds(20);
    EXPECT_EQ(remote_->create_subscription(info, kNow).ack_deadline.count(), 20000);

    Message message(std::string("payload\0with nul", 16), Headers{{"a", "1"}, {"b", ""}}, "key");
    auto ids = remote_->send("projects/p/topics/t", {message, Message("")}, kNow);
    ASSERT_EQ(ids.size(), 2u);

    auto pulled = remote_->pull("projects/p/subscriptions/s", 10, kNow);
    ASSERT_EQ(pulled.size(), 2u);
    EXPECT_EQ(pulled[0].message.data, message.data);
    EXPECT_EQ(pulled[0].message.headers, message.headers);
    EXPECT_EQ(pulled[0].message.ordering_key, "key");
    EXPECT_EQ(pulled[0].message.message_id, ids[0]);
    EXPECT_EQ(pulled[1].message.data, "");

    remote_->modify_ack_deadline(info.name, {pulled[0].ack_id}, std::chrono::seconds(60), kNow);
    remote_->negative_acknowledge(info.name, {pulled[1].ack_id}, kNow);
    remote_->acknowledge(info.name, {pulled[0].ack_id}, kNow);
    EXPECT_EQ(backend_.leased_count(info.name), 0u);
    EXPECT_EQ(backend_.pending_count(info.name), 1u);

    EXPECT_TRUE(remote_->get_topic("projects/p/topics/t", kNow));
    EXPECT_FALSE(remote_->get_topic("projects/p/topics/none", kNow));
    EXPECT_EQ(remote_->get_subscription(info.name, kNow)->topic, info.topic);
    EXPECT_EQ(remote_->list_topics("projects/p", kNow).size(), 1u);
    EXPECT_EQ(remote_->list_subscriptions("projects/p", kNow).size(), 1u);

    remote_->delete_subscription(info.name, kNow);
    remote_->delete_topic("projects/p/topics/t", kNow);
    EXPECT_TRUE(remote_->list_topics("projects/p", kNow).empty());
}

TEST_F(TestEmulatorService, remote_errors_keep_their_code) {
    EXPECT_EQ(code_of([this] { remote_->delete_topic("projects/p/topics/none", kNow); }), StatusCode::NotFound);

    remote_->create_topic("projects/p/topics/t", kNow);
    try {
        remote_->create_topic("projects/p/topics/t", kNow);
        FAIL() << "expected PubSubError";
    } catch (const PubSubError& e) {
        EXPECT_EQ(e.code(), StatusCode::AlreadyExists);
        EXPECT_EQ(e.detail(), "topic 'projects/p/topics/t' already exists");
    }
}

TEST_F(TestEmulatorService, malformed_requests_are_invalid_arguments) {
    auto reply = service_->handle({"7", "pull", "0"});
    EXPECT_THAT(reply, ElementsAre("7", "INVALID_ARGUMENT", _));

    reply = service_->handle({"8", "explode", "0"});
    EXPECT_THAT(reply, ElementsAre("8", "INVALID_ARGUMENT", "unknown operation 'explode'"));

    reply = service_->handle({"9", "list_topics", "soon", "projects/p"});
    EXPECT_THAT(reply, ElementsAre("9", "INVALID_ARGUMENT", _));

    reply = service_->handle({"10", "get_topic", "0", "projects/p/topics/a", "extra"});
    EXPECT_THAT(reply, ElementsAre("10", "INVALID_ARGUMENT", _));
}

TEST_F(TestEmulatorService, backend_exceptions_become_internal) {
    NiceMock<MockTransport> backend;
    ON_CALL(backend, list_topics(_, _)).WillByDefault(testing::Throw(std::runtime_error("disk on fire")));
    EmulatorService service(backend);

    auto reply = service.handle({"1", "list_topics", "0", "projects/p"});

    EXPECT_THAT(reply, ElementsAre("1", "INTERNAL", "disk on fire"));
}

TEST_F(TestEmulatorService, client_rejects_foreign_and_unknown_replies) {
    RemoteTransport foreign(std::unique_ptr<FrameExchange>(new ScriptedExchange({"999", "OK", ""})));
    EXPECT_EQ(code_of([&] { foreign.delete_topic("projects/p/topics/t", kNow); }), StatusCode::Internal);

    RemoteTransport unknown(std::unique_ptr<FrameExchange>(new ScriptedExchange({"1", "TEAPOT", "short"})));
    EXPECT_EQ(code_of([&] { unknown.delete_topic("projects/p/topics/t", kNow); }), StatusCode::Internal);

    RemoteTransport truncated(std::unique_ptr<FrameExchange>(new ScriptedExchange({"1", "OK", "", "3"})));
    EXPECT_EQ(code_of([&] { truncated.send("projects/p/topics/t", {Message("x")}, kNow); }), StatusCode::Internal);
}

} // namespace
