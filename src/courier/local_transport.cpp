#include "local_transport.hpp"
#include "errors.hpp"

#include <algorithm>

namespace courier {

namespace {

bool has_prefix(const std::string& name, const std::string& prefix) {
    return name.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<std::string> LocalTransport::send(const std::string& topic, const std::vector<Message>& messages,
                                              std::chrono::milliseconds) {
    std::vector<std::string> ids;
    ids.reserve(messages.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (topics_.find(topic) == topics_.end()) {
            throw PubSubError(StatusCode::NotFound, "topic '" + topic + "' does not exist");
        }

        const auto now = std::chrono::system_clock::now();
        for (const auto& outbound : messages) {
            Message stored = outbound;
            stored.message_id = std::to_string(next_message_id_++);
            stored.publish_time = now;
            ids.push_back(stored.message_id);

            for (auto& entry : subscriptions_) {
                if (entry.second.info.topic == topic) {
                    entry.second.backlog.push_back(Pending{stored, 1});
                }
            }
        }
    }
    arrivals_.notify_all();
    return ids;
}

std::vector<ReceivedMessage> LocalTransport::pull(const std::string& subscription, int max_messages,
                                                  std::chrono::milliseconds timeout) {
    if (max_messages <= 0) {
        throw PubSubError(StatusCode::InvalidArgument, "max_messages must be positive");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    const auto give_up = Clock::now() + timeout;

    while (true) {
        auto& state = subscription_locked(subscription);
        auto now = Clock::now();
        expire_leases_locked(state, now);

        if (!state.backlog.empty() || now >= give_up) {
            break;
        }

        auto wake = give_up;
        for (const auto& lease : state.leases) {
            wake = std::min(wake, lease.second.deadline);
        }
        arrivals_.wait_until(lock, wake);
    }

    auto& state = subscription_locked(subscription);
    std::vector<ReceivedMessage> received;
    const auto deadline = Clock::now() + state.info.ack_deadline;
    while (!state.backlog.empty() && static_cast<int>(received.size()) < max_messages) {
        auto pending = std::move(state.backlog.front());
        state.backlog.pop_front();

        ReceivedMessage message;
        message.ack_id = "ack-" + std::to_string(next_ack_id_++);
        message.message = pending.message;
        message.delivery_attempt = pending.delivery_attempt;

        state.leases.emplace(message.ack_id, Lease{std::move(pending), deadline});
        received.push_back(std::move(message));
    }
    return received;
}

void LocalTransport::acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                 std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = subscription_locked(subscription);
    for (const auto& ack_id : ack_ids) {
        state.leases.erase(ack_id);
    }
}

void LocalTransport::negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                          std::chrono::milliseconds timeout) {
    modify_ack_deadline(subscription, ack_ids, std::chrono::milliseconds(0), timeout);
}

void LocalTransport::modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                         std::chrono::milliseconds deadline, std::chrono::milliseconds) {
    if (deadline.count() < 0) {
        throw PubSubError(StatusCode::InvalidArgument, "ack deadline must not be negative");
    }

    bool redelivered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = subscription_locked(subscription);
        const auto now = Clock::now();
        for (const auto& ack_id : ack_ids) {
            auto it = state.leases.find(ack_id);
            if (it == state.leases.end()) {
                continue;
            }
            if (deadline.count() == 0) {
                auto pending = std::move(it->second.pending);
                pending.delivery_attempt++;
                state.backlog.push_front(std::move(pending));
                state.leases.erase(it);
                redelivered = true;
            } else {
                it->second.deadline = now + deadline;
            }
        }
    }
    if (redelivered) {
        arrivals_.notify_all();
    }
}

TopicInfo LocalTransport::create_topic(const std::string& topic, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    TopicInfo info{topic};
    if (!topics_.emplace(topic, info).second) {
        throw PubSubError(StatusCode::AlreadyExists, "topic '" + topic + "' already exists");
    }
    return info;
}

void LocalTransport::delete_topic(const std::string& topic, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (topics_.erase(topic) == 0) {
        throw PubSubError(StatusCode::NotFound, "topic '" + topic + "' does not exist");
    }
}

boost::optional<TopicInfo> LocalTransport::get_topic(const std::string& topic, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return boost::none;
    }
    return it->second;
}

std::vector<TopicInfo> LocalTransport::list_topics(const std::string& project, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TopicInfo> topics;
    for (const auto& entry : topics_) {
        if (has_prefix(entry.first, project + "/")) {
            topics.push_back(entry.second);
        }
    }
    return topics;
}

SubscriptionInfo LocalTransport::create_subscription(const SubscriptionInfo& subscription,
                                                     std::chrono::milliseconds) {
    if (subscription.ack_deadline.count() <= 0) {
        throw PubSubError(StatusCode::InvalidArgument, "ack deadline must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (topics_.find(subscription.topic) == topics_.end()) {
        throw PubSubError(StatusCode::NotFound, "topic '" + subscription.topic + "' does not exist");
    }
    SubscriptionState state;
    state.info = subscription;
    if (!subscriptions_.emplace(subscription.name, std::move(state)).second) {
        throw PubSubError(StatusCode::AlreadyExists, "subscription '" + subscription.name + "' already exists");
    }
    return subscription;
}

void LocalTransport::delete_subscription(const std::string& subscription, std::chrono::milliseconds) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscriptions_.erase(subscription) == 0) {
            throw PubSubError(StatusCode::NotFound, "subscription '" + subscription + "' does not exist");
        }
    }
    arrivals_.notify_all();
}

boost::optional<SubscriptionInfo> LocalTransport::get_subscription(const std::string& subscription,
                                                                   std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(subscription);
    if (it == subscriptions_.end()) {
        return boost::none;
    }
    return it->second.info;
}

std::vector<SubscriptionInfo> LocalTransport::list_subscriptions(const std::string& project,
                                                                 std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SubscriptionInfo> subscriptions;
    for (const auto& entry : subscriptions_) {
        if (has_prefix(entry.first, project + "/")) {
            subscriptions.push_back(entry.second.info);
        }
    }
    return subscriptions;
}

std::size_t LocalTransport::pending_count(const std::string& subscription) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscription_locked(subscription).backlog.size();
}

std::size_t LocalTransport::leased_count(const std::string& subscription) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscription_locked(subscription).leases.size();
}

LocalTransport::SubscriptionState& LocalTransport::subscription_locked(const std::string& subscription) {
    auto it = subscriptions_.find(subscription);
    if (it == subscriptions_.end()) {
        throw PubSubError(StatusCode::NotFound, "subscription '" + subscription + "' does not exist");
    }
    return it->second;
}

const LocalTransport::SubscriptionState& LocalTransport::subscription_locked(const std::string& subscription) const {
    auto it = subscriptions_.find(subscription);
    if (it == subscriptions_.end()) {
        throw PubSubError(StatusCode::NotFound, "subscription '" + subscription + "' does not exist");
    }
    return it->second;
}

void LocalTransport::expire_leases_locked(SubscriptionState& state, Clock::time_point now) {
    for (auto it = state.leases.begin(); it != state.leases.end();) {
        if (it->second.deadline <= now) {
            auto pending = std::move(it->second.pending);
            pending.delivery_attempt++;
            state.backlog.push_back(std::move(pending));
            it = state.leases.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace courier
