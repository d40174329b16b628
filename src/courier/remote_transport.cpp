#include "remote_transport.hpp"
#include "errors.hpp"

namespace courier {

RemoteTransport::RemoteTransport(std::unique_ptr<FrameExchange> exchange)
    : exchange_(std::move(exchange)) {
}

std::vector<std::string> RemoteTransport::send(const std::string& topic, const std::vector<Message>& messages,
                                               std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(topic).add_int(static_cast<std::int64_t>(messages.size()));
    for (const auto& message : messages) {
        arguments.add_message(message);
    }
    return call(wire::op::kSend, arguments, timeout).next_strings();
}

std::vector<ReceivedMessage> RemoteTransport::pull(const std::string& subscription, int max_messages,
                                                   std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription).add_int(max_messages);
    auto results = call(wire::op::kPull, arguments, timeout);

    auto count = results.next_int();
    std::vector<ReceivedMessage> messages;
    for (std::int64_t i = 0; i < count; ++i) {
        messages.push_back(results.next_received());
    }
    return messages;
}

void RemoteTransport::acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                  std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription).add_strings(ack_ids);
    call(wire::op::kAcknowledge, arguments, timeout);
}

void RemoteTransport::negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                           std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription).add_strings(ack_ids);
    call(wire::op::kNegativeAcknowledge, arguments, timeout);
}

void RemoteTransport::modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                          std::chrono::milliseconds deadline, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription).add_strings(ack_ids).add_int(deadline.count());
    call(wire::op::kModifyAckDeadline, arguments, timeout);
}

TopicInfo RemoteTransport::create_topic(const std::string& topic, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(topic);
    return TopicInfo{call(wire::op::kCreateTopic, arguments, timeout).next()};
}

void RemoteTransport::delete_topic(const std::string& topic, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(topic);
    call(wire::op::kDeleteTopic, arguments, timeout);
}

boost::optional<TopicInfo> RemoteTransport::get_topic(const std::string& topic, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(topic);
    auto results = call(wire::op::kGetTopic, arguments, timeout);
    if (results.next_int() == 0) {
        return boost::none;
    }
    return TopicInfo{results.next()};
}

std::vector<TopicInfo> RemoteTransport::list_topics(const std::string& project, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(project);
    std::vector<TopicInfo> topics;
    for (auto& name : call(wire::op::kListTopics, arguments, timeout).next_strings()) {
        topics.push_back(TopicInfo{std::move(name)});
    }
    return topics;
}

SubscriptionInfo RemoteTransport::create_subscription(const SubscriptionInfo& subscription,
                                                      std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add_subscription(subscription);
    return call(wire::op::kCreateSubscription, arguments, timeout).next_subscription();
}

void RemoteTransport::delete_subscription(const std::string& subscription, std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription);
    call(wire::op::kDeleteSubscription, arguments, timeout);
}

boost::optional<SubscriptionInfo> RemoteTransport::get_subscription(const std::string& subscription,
                                                                    std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(subscription);
    auto results = call(wire::op::kGetSubscription, arguments, timeout);
    if (results.next_int() == 0) {
        return boost::none;
    }
    return results.next_subscription();
}

std::vector<SubscriptionInfo> RemoteTransport::list_subscriptions(const std::string& project,
                                                                  std::chrono::milliseconds timeout) {
    wire::FrameWriter arguments;
    arguments.add(project);
    auto results = call(wire::op::kListSubscriptions, arguments, timeout);

    auto count = results.next_int();
    std::vector<SubscriptionInfo> subscriptions;
    for (std::int64_t i = 0; i < count; ++i) {
        subscriptions.push_back(results.next_subscription());
    }
    return subscriptions;
}

wire::FrameReader RemoteTransport::call(const char* operation, wire::FrameWriter& arguments,
                                        std::chrono::milliseconds timeout) {
    const auto request_id = std::to_string(next_request_id_.fetch_add(1));

    wire::Frames request{request_id, operation, std::to_string(timeout.count())};
    for (auto& frame : arguments.take()) {
        request.push_back(std::move(frame));
    }

    wire::FrameReader reply(exchange_->exchange(request, timeout), StatusCode::Internal);
    if (reply.next() != request_id) {
        throw PubSubError(StatusCode::Internal, std::string("reply to ") + operation + " carries a foreign request id");
    }

    auto status = reply.next();
    auto detail = reply.next();
    if (status != wire::kStatusOk) {
        StatusCode code = StatusCode::Internal;
        try {
            code = status_code_from_name(status);
        } catch (const PubSubError&) {
            detail = "unknown status " + status + ": " + detail;
        }
        throw PubSubError(code, detail);
    }
    return reply;
}

} // namespace courier
