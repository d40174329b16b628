#include "operations.hpp"
#include "errors.hpp"
#include "resource_names.hpp"

#include <algorithm>

namespace courier {

namespace {

template <typename T>
std::future<T> failed_future(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(error);
    return promise.get_future();
}

} // namespace

Operations::Operations(const ClientConfig& config, std::shared_ptr<Transport> transport,
                       std::shared_ptr<Transport> pull_transport)
    : config_(config)
    , transport_(std::move(transport))
    , pull_transport_(pull_transport ? std::move(pull_transport) : transport_)
    , converter_(make_converter(config.converter))
    , publisher_pool_(static_cast<std::size_t>(config.publisher.role.executor_threads))
    , topic_retry_(config.publisher.role.retry)
    , subscription_retry_(config.subscriber.role.retry)
    , publishers_([this](const std::string& topic) { return create_publisher(topic); })
    , subscriptions_([this](const std::string& subscription) { return create_subscription_handle(subscription); })
    , puller_(std::make_shared<Puller>(pull_transport_, config.subscriber.role.retry))
    , admin_(config.project_id, transport_, config.publisher.role.retry, config.subscriber.role.retry)
    , logger_(get_logger("courier.operations")) {
    admin_.on_topic_deleted([this](const std::string& topic) { publishers_.invalidate(topic); });
    admin_.on_subscription_deleted([this](const std::string& subscription) { subscriptions_.invalidate(subscription); });
}

Operations::~Operations() {
    shutdown();
}

std::future<std::string> Operations::publish(const std::string& topic, const Payload& payload,
                                             const Headers& headers) {
    Message message;
    try {
        message = converter_.to_wire_format(payload, headers);
    } catch (const PubSubError&) {
        return failed_future<std::string>(std::current_exception());
    }
    return publish(topic, std::move(message));
}

std::future<std::string> Operations::publish(const std::string& topic, Message message) {
    std::shared_ptr<Publisher> handle;
    try {
        handle = publisher(topic);
    } catch (const PubSubError&) {
        return failed_future<std::string>(std::current_exception());
    }
    return handle->publish(std::move(message));
}

std::shared_ptr<Subscriber> Operations::subscribe(const std::string& subscription, MessageReceiver receiver) {
    auto handle = subscriptions_.get_or_create(qualified_subscription(subscription));

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (shutdown_) {
        throw PubSubError(StatusCode::FailedPrecondition, "operations are shut down");
    }

    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const std::weak_ptr<Subscriber>& weak) { return weak.expired(); }),
                       subscribers_.end());

    auto subscriber = std::make_shared<Subscriber>(*handle, pull_transport_, config_.subscriber, std::move(receiver));
    subscriber->start();
    subscribers_.push_back(subscriber);
    return subscriber;
}

std::shared_ptr<Subscriber> Operations::subscribe_and_convert(const std::string& subscription, PayloadType type,
                                                              ConvertedMessageReceiver receiver) {
    auto converter = converter_;
    return subscribe(subscription, [converter, type, receiver](const AcknowledgeableMessagePtr& message) {
        receiver(ConvertedMessage{converter.from_wire_format(message->message(), type), message});
    });
}

std::vector<AcknowledgeableMessagePtr> Operations::pull(const std::string& subscription, int max_messages) {
    return puller_->pull(qualified_subscription(subscription), max_messages);
}

boost::optional<Message> Operations::pull_next(const std::string& subscription) {
    return puller_->pull_next(qualified_subscription(subscription));
}

std::vector<Message> Operations::pull_and_ack(const std::string& subscription, int max_messages) {
    return puller_->pull_and_ack(qualified_subscription(subscription), max_messages);
}

std::vector<ConvertedMessage> Operations::pull_and_convert(const std::string& subscription, int max_messages,
                                                           PayloadType type) {
    auto pulled = pull(subscription, max_messages);

    std::vector<ConvertedMessage> converted;
    converted.reserve(pulled.size());
    for (const auto& message : pulled) {
        converted.push_back(ConvertedMessage{converter_.from_wire_format(message->message(), type), message});
    }
    return converted;
}

void Operations::ack(const std::vector<AcknowledgeableMessagePtr>& messages) {
    puller_->ack(messages);
}

void Operations::nack(const std::vector<AcknowledgeableMessagePtr>& messages) {
    puller_->nack(messages);
}

void Operations::modify_ack_deadline(const std::vector<AcknowledgeableMessagePtr>& messages,
                                     std::chrono::milliseconds deadline) {
    puller_->modify_ack_deadline(messages, deadline);
}

std::shared_ptr<Publisher> Operations::publisher(const std::string& topic) {
    throw_if_shut_down();
    return publishers_.get_or_create(qualify_topic(config_.project_id, topic));
}

void Operations::throw_if_shut_down() {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (shutdown_) {
        throw PubSubError(StatusCode::FailedPrecondition, "operations are shut down");
    }
}

std::size_t Operations::subscriber_count() {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

void Operations::shutdown() {
    std::vector<std::weak_ptr<Subscriber>> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        subscribers.swap(subscribers_);
    }

    for (auto& publisher : publishers_.clear()) {
        publisher->shutdown();
    }
    for (auto& weak : subscribers) {
        if (auto subscriber = weak.lock()) {
            subscriber->stop();
        }
    }
    publisher_pool_.join();
    subscriptions_.clear();

    logger_->info("operations shut down");
}

// The cache entry exists before this runs, so a publisher created here is
// either collected by shutdown()'s clear() or sees the shutdown flag.
std::shared_ptr<Publisher> Operations::create_publisher(const std::string& topic) {
    throw_if_shut_down();

    auto found = topic_retry_.run("get topic " + topic, [&](std::chrono::milliseconds timeout) {
        return transport_->get_topic(topic, timeout);
    });
    if (!found) {
        throw PubSubError(StatusCode::NotFound, "topic '" + topic + "' does not exist");
    }

    logger_->debug("creating publisher for {}", topic);
    return std::make_shared<Publisher>(topic, *transport_, config_.publisher, publisher_pool_);
}

std::shared_ptr<SubscriptionInfo> Operations::create_subscription_handle(const std::string& subscription) {
    auto found = subscription_retry_.run("get subscription " + subscription, [&](std::chrono::milliseconds timeout) {
        return pull_transport_->get_subscription(subscription, timeout);
    });
    if (!found) {
        throw PubSubError(StatusCode::NotFound, "subscription '" + subscription + "' does not exist");
    }
    return std::make_shared<SubscriptionInfo>(*found);
}

std::string Operations::qualified_subscription(const std::string& subscription) {
    return subscriptions_.get_or_create(qualify_subscription(config_.project_id, subscription))->name;
}

} // namespace courier
