#pragma once

#include "acknowledgeable_message.hpp"
#include "admin.hpp"
#include "converter.hpp"
#include "logging.hpp"
#include "publisher.hpp"
#include "puller.hpp"
#include "resource_cache.hpp"
#include "subscriber.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace courier {

struct ConvertedMessage {
    Payload payload;
    AcknowledgeableMessagePtr original;
};

using ConvertedMessageReceiver = std::function<void(const ConvertedMessage&)>;

/**
 * Operations is the single entry point of the client.
 *
 * - Publishers are cached per topic and share one executor
 *   (publisher.executorThreads)
 * - Subscription handles are cached per subscription; a handle is only cached
 *   once the subscription was found at the service
 * - Topic and subscription names may be short (qualified with projectId) or
 *   fully qualified
 *
 * publish() reports every failure through the returned future. The pull and
 * admin calls throw PubSubError.
 */
class Operations {
public:
    Operations(const ClientConfig& config, std::shared_ptr<Transport> transport,
               std::shared_ptr<Transport> pull_transport = nullptr);
    ~Operations();

    Operations(const Operations&) = delete;
    Operations& operator=(const Operations&) = delete;

    std::future<std::string> publish(const std::string& topic, const Payload& payload,
                                     const Headers& headers = Headers{});

    std::future<std::string> publish(const std::string& topic, Message message);

    // Returns a started subscriber; stop it, or let shutdown() stop it.
    std::shared_ptr<Subscriber> subscribe(const std::string& subscription, MessageReceiver receiver);

    std::shared_ptr<Subscriber> subscribe_and_convert(const std::string& subscription, PayloadType type,
                                                      ConvertedMessageReceiver receiver);

    std::vector<AcknowledgeableMessagePtr> pull(const std::string& subscription, int max_messages);

    boost::optional<Message> pull_next(const std::string& subscription);

    std::vector<Message> pull_and_ack(const std::string& subscription, int max_messages);

    std::vector<ConvertedMessage> pull_and_convert(const std::string& subscription, int max_messages,
                                                   PayloadType type);

    void ack(const std::vector<AcknowledgeableMessagePtr>& messages);

    void nack(const std::vector<AcknowledgeableMessagePtr>& messages);

    void modify_ack_deadline(const std::vector<AcknowledgeableMessagePtr>& messages,
                             std::chrono::milliseconds deadline);

    // The cached publisher of a topic; throws NotFound when the topic is missing.
    std::shared_ptr<Publisher> publisher(const std::string& topic);

    Admin& admin() { return admin_; }

    const MessageConverter& converter() const { return converter_; }

    const ClientConfig& config() const { return config_; }

    // Force-flushes every publisher and stops every subscriber.
    void shutdown();

    // Subscribers tracked for shutdown. Released ones are pruned by the next
    // subscribe().
    std::size_t subscriber_count();

private:
    void throw_if_shut_down();

    std::shared_ptr<Publisher> create_publisher(const std::string& topic);

    std::shared_ptr<SubscriptionInfo> create_subscription_handle(const std::string& subscription);

    std::string qualified_subscription(const std::string& subscription);

    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<Transport> pull_transport_;
    MessageConverter converter_;

    boost::asio::thread_pool publisher_pool_;
    RetryPolicy topic_retry_;
    RetryPolicy subscription_retry_;
    ResourceCache<Publisher> publishers_;
    ResourceCache<SubscriptionInfo> subscriptions_;
    std::shared_ptr<Puller> puller_;
    Admin admin_;

    std::mutex subscribers_mutex_;
    std::vector<std::weak_ptr<Subscriber>> subscribers_;
    bool shutdown_ = false;

    LoggerPtr logger_;
};

} // namespace courier
