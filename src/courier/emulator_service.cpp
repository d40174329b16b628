#include "emulator_service.hpp"
#include "errors.hpp"

#include <cstring>

namespace courier {

namespace {

wire::Frames error_reply(const std::string& request_id, StatusCode code, const std::string& detail) {
    return wire::FrameWriter().add(request_id).add(status_code_name(code)).add(detail).take();
}

} // namespace

EmulatorService::EmulatorService(Transport& backend)
    : backend_(backend)
    , logger_(get_logger("courier.emulator")) {
}

wire::Frames EmulatorService::handle(const wire::Frames& request) {
    const std::string request_id = request.empty() ? std::string() : request.front();

    try {
        wire::FrameReader reader(request, StatusCode::InvalidArgument);
        reader.next();
        auto operation = reader.next();
        auto timeout = std::chrono::milliseconds(reader.next_int());

        wire::FrameWriter reply;
        reply.add(request_id).add(wire::kStatusOk).add("");
        dispatch(operation, reader, timeout, reply);
        if (!reader.done()) {
            throw PubSubError(StatusCode::InvalidArgument, "trailing frames after " + operation + " request");
        }
        return reply.take();
    } catch (const PubSubError& e) {
        logger_->debug("request {} failed: {}", request_id, e.what());
        return error_reply(request_id, e.code(), e.detail());
    } catch (const std::exception& e) {
        logger_->error("request {} failed unexpectedly: {}", request_id, e.what());
        return error_reply(request_id, StatusCode::Internal, e.what());
    }
}

void EmulatorService::dispatch(const std::string& operation, wire::FrameReader& arguments,
                               std::chrono::milliseconds timeout, wire::FrameWriter& results) {
    const char* op = operation.c_str();

    if (std::strcmp(op, wire::op::kSend) == 0) {
        auto topic = arguments.next();
        auto count = arguments.next_int();
        if (count < 0) {
            throw PubSubError(StatusCode::InvalidArgument, "negative message count");
        }
        std::vector<Message> messages;
        for (std::int64_t i = 0; i < count; ++i) {
            messages.push_back(arguments.next_message());
        }
        results.add_strings(backend_.send(topic, messages, timeout));
    } else if (std::strcmp(op, wire::op::kPull) == 0) {
        auto subscription = arguments.next();
        auto max_messages = static_cast<int>(arguments.next_int());
        auto messages = backend_.pull(subscription, max_messages, timeout);
        results.add_int(static_cast<std::int64_t>(messages.size()));
        for (const auto& message : messages) {
            results.add_received(message);
        }
    } else if (std::strcmp(op, wire::op::kAcknowledge) == 0) {
        auto subscription = arguments.next();
        backend_.acknowledge(subscription, arguments.next_strings(), timeout);
    } else if (std::strcmp(op, wire::op::kNegativeAcknowledge) == 0) {
        auto subscription = arguments.next();
        backend_.negative_acknowledge(subscription, arguments.next_strings(), timeout);
    } else if (std::strcmp(op, wire::op::kModifyAckDeadline) == 0) {
        auto subscription = arguments.next();
        auto ack_ids = arguments.next_strings();
        auto deadline = std::chrono::milliseconds(arguments.next_int());
        backend_.modify_ack_deadline(subscription, ack_ids, deadline, timeout);
    } else if (std::strcmp(op, wire::op::kCreateTopic) == 0) {
        results.add(backend_.create_topic(arguments.next(), timeout).name);
    } else if (std::strcmp(op, wire::op::kDeleteTopic) == 0) {
        backend_.delete_topic(arguments.next(), timeout);
    } else if (std::strcmp(op, wire::op::kGetTopic) == 0) {
        auto topic = backend_.get_topic(arguments.next(), timeout);
        results.add_int(topic ? 1 : 0);
        if (topic) {
            results.add(topic->name);
        }
    } else if (std::strcmp(op, wire::op::kListTopics) == 0) {
        std::vector<std::string> names;
        for (const auto& topic : backend_.list_topics(arguments.next(), timeout)) {
            names.push_back(topic.name);
        }
        results.add_strings(names);
    } else if (std::strcmp(op, wire::op::kCreateSubscription) == 0) {
        results.add_subscription(backend_.create_subscription(arguments.next_subscription(), timeout));
    } else if (std::strcmp(op, wire::op::kDeleteSubscription) == 0) {
        backend_.delete_subscription(arguments.next(), timeout);
    } else if (std::strcmp(op, wire::op::kGetSubscription) == 0) {
        auto subscription = backend_.get_subscription(arguments.next(), timeout);
        results.add_int(subscription ? 1 : 0);
        if (subscription) {
            results.add_subscription(*subscription);
        }
    } else if (std::strcmp(op, wire::op::kListSubscriptions) == 0) {
        auto subscriptions = backend_.list_subscriptions(arguments.next(), timeout);
        results.add_int(static_cast<std::int64_t>(subscriptions.size()));
        for (const auto& subscription : subscriptions) {
            results.add_subscription(subscription);
        }
    } else {
        throw PubSubError(StatusCode::InvalidArgument, "unknown operation '" + operation + "'");
    }
}

} // namespace courier
