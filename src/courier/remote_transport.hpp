#pragma once

#include "transport.hpp"
#include "wire_protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace courier {

/**
 * Carries one request and waits for its reply. A reply that does not arrive in
 * time raises PubSubError(DeadlineExceeded); a broken connection raises
 * PubSubError(Unavailable).
 */
class FrameExchange {
public:
    virtual ~FrameExchange() = default;

    virtual wire::Frames exchange(const wire::Frames& request, std::chrono::milliseconds timeout) = 0;
};

/**
 * Transport that encodes every call as a wire request and rethrows remote
 * failures with their original status code.
 */
class RemoteTransport : public Transport {
public:
    explicit RemoteTransport(std::unique_ptr<FrameExchange> exchange);

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

private:
    // Sends [id, operation, timeout, arguments...]; returns a reader positioned
    // at the results of a successful reply.
    wire::FrameReader call(const char* operation, wire::FrameWriter& arguments, std::chrono::milliseconds timeout);

    std::unique_ptr<FrameExchange> exchange_;
    std::atomic<std::uint64_t> next_request_id_{1};
};

} // namespace courier
