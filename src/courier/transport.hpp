#pragma once

#include "types.hpp"

#include <boost/optional.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace courier {

/**
 * Transport is the RPC surface of the messaging service. All names are fully
 * qualified. Failures are reported as PubSubError. A zero timeout means the
 * transport's default deadline; for pull() it means "return what is available
 * now".
 *
 * Implementations must be safe for concurrent use.
 */
class Transport {
public:
    virtual ~Transport() = default;

    // Returns the service-assigned message ids in the order of `messages`.
    virtual std::vector<std::string> send(const std::string& topic, const std::vector<Message>& messages,
                                          std::chrono::milliseconds timeout) = 0;

    virtual std::vector<ReceivedMessage> pull(const std::string& subscription, int max_messages,
                                              std::chrono::milliseconds timeout) = 0;

    virtual void acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                             std::chrono::milliseconds timeout) = 0;

    virtual void negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                      std::chrono::milliseconds timeout) = 0;

    virtual void modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                     std::chrono::milliseconds deadline, std::chrono::milliseconds timeout) = 0;

    virtual TopicInfo create_topic(const std::string& topic, std::chrono::milliseconds timeout) = 0;

    virtual void delete_topic(const std::string& topic, std::chrono::milliseconds timeout) = 0;

    virtual boost::optional<TopicInfo> get_topic(const std::string& topic, std::chrono::milliseconds timeout) = 0;

    // `project` is "projects/{id}".
    virtual std::vector<TopicInfo> list_topics(const std::string& project, std::chrono::milliseconds timeout) = 0;

    virtual SubscriptionInfo create_subscription(const SubscriptionInfo& subscription,
                                                 std::chrono::milliseconds timeout) = 0;

    virtual void delete_subscription(const std::string& subscription, std::chrono::milliseconds timeout) = 0;

    virtual boost::optional<SubscriptionInfo> get_subscription(const std::string& subscription,
                                                               std::chrono::milliseconds timeout) = 0;

    virtual std::vector<SubscriptionInfo> list_subscriptions(const std::string& project,
                                                             std::chrono::milliseconds timeout) = 0;
};

} // namespace courier
