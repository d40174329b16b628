#include "puller.hpp"
#include "errors.hpp"

#include <map>

namespace courier {

Puller::Puller(std::shared_ptr<Transport> transport, const RetrySettings& retry)
    : transport_(std::move(transport))
    , retry_(retry)
    , logger_(get_logger("courier.puller")) {
}

std::vector<AcknowledgeableMessagePtr> Puller::pull(const std::string& subscription, int max_messages) {
    if (max_messages <= 0) {
        throw PubSubError(StatusCode::InvalidArgument, "max_messages must be positive");
    }

    auto received = retry_.run("pull from " + subscription, [&](std::chrono::milliseconds timeout) {
        return transport_->pull(subscription, max_messages, timeout);
    });

    auto self = shared_from_this();
    std::vector<AcknowledgeableMessagePtr> messages;
    messages.reserve(received.size());
    for (auto& message : received) {
        messages.push_back(std::make_shared<AcknowledgeableMessage>(subscription, std::move(message), self));
    }
    return messages;
}

std::vector<Message> Puller::pull_and_ack(const std::string& subscription, int max_messages) {
    auto pulled = pull(subscription, max_messages);

    std::vector<Message> messages;
    messages.reserve(pulled.size());
    for (const auto& message : pulled) {
        messages.push_back(message->message());
    }

    try {
        acknowledge_all(pulled);
    } catch (const PubSubError& e) {
        logger_->error("acknowledging {} pulled messages on {} failed: {}", pulled.size(), subscription, e.what());
    }
    return messages;
}

boost::optional<Message> Puller::pull_next(const std::string& subscription) {
    auto pulled = pull(subscription, 1);
    if (pulled.empty()) {
        return boost::none;
    }

    const auto& message = pulled.front();
    try {
        message->ack();
    } catch (const PubSubError& e) {
        logger_->error("acknowledging message {} on {} failed: {}", message->message().message_id, subscription,
                       e.what());
    }
    return message->message();
}

void Puller::ack(const std::vector<AcknowledgeableMessagePtr>& messages) {
    acknowledge_all(messages);
}

void Puller::nack(const std::vector<AcknowledgeableMessagePtr>& messages) {
    negative_acknowledge_all(messages);
}

void Puller::modify_ack_deadline(const std::vector<AcknowledgeableMessagePtr>& messages,
                                 std::chrono::milliseconds deadline) {
    if (deadline.count() == 0) {
        nack(messages);
        return;
    }

    std::map<Acknowledger*, std::vector<std::string>> by_acknowledger;
    for (const auto& message : messages) {
        if (message->subscription() != messages.front()->subscription()) {
            throw PubSubError(StatusCode::InvalidArgument, "deadline batch mixes subscriptions");
        }
        if (message->state() == AcknowledgeableMessage::State::Delivered) {
            by_acknowledger[message->acknowledger().get()].push_back(message->ack_id());
        }
    }
    for (const auto& entry : by_acknowledger) {
        entry.first->modify_ack_deadline(messages.front()->subscription(), entry.second, deadline);
    }
}

void Puller::acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) {
    retry_.run("acknowledge on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->acknowledge(subscription, ack_ids, timeout);
    });
}

void Puller::negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) {
    retry_.run("nack on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->negative_acknowledge(subscription, ack_ids, timeout);
    });
}

void Puller::modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                 std::chrono::milliseconds deadline) {
    retry_.run("modify ack deadline on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->modify_ack_deadline(subscription, ack_ids, deadline, timeout);
    });
}

} // namespace courier
