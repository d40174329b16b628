#include "wire_protocol.hpp"

#include <cerrno>
#include <cstdlib>

namespace courier {
namespace wire {

const char* const kStatusOk = "OK";

namespace op {
const char* const kSend = "send";
const char* const kPull = "pull";
const char* const kAcknowledge = "acknowledge";
const char* const kNegativeAcknowledge = "negative_acknowledge";
const char* const kModifyAckDeadline = "modify_ack_deadline";
const char* const kCreateTopic = "create_topic";
const char* const kDeleteTopic = "delete_topic";
const char* const kGetTopic = "get_topic";
const char* const kListTopics = "list_topics";
const char* const kCreateSubscription = "create_subscription";
const char* const kDeleteSubscription = "delete_subscription";
const char* const kGetSubscription = "get_subscription";
const char* const kListSubscriptions = "list_subscriptions";
} // namespace op

FrameWriter& FrameWriter::add(std::string frame) {
    frames_.push_back(std::move(frame));
    return *this;
}

FrameWriter& FrameWriter::add_int(std::int64_t value) {
    return add(std::to_string(value));
}

FrameWriter& FrameWriter::add_strings(const std::vector<std::string>& values) {
    add_int(static_cast<std::int64_t>(values.size()));
    for (const auto& value : values) {
        add(value);
    }
    return *this;
}

FrameWriter& FrameWriter::add_message(const Message& message) {
    auto publish_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        message.publish_time.time_since_epoch()).count();

    add(message.data);
    add(message.ordering_key);
    add(message.message_id);
    add_int(publish_ms);
    add_int(static_cast<std::int64_t>(message.headers.size()));
    for (const auto& header : message.headers) {
        add(header.first);
        add(header.second);
    }
    return *this;
}

FrameWriter& FrameWriter::add_received(const ReceivedMessage& message) {
    add(message.ack_id);
    add_int(message.delivery_attempt);
    return add_message(message.message);
}

FrameWriter& FrameWriter::add_subscription(const SubscriptionInfo& subscription) {
    add(subscription.name);
    add(subscription.topic);
    return add_int(subscription.ack_deadline.count());
}

Frames FrameWriter::take() {
    Frames frames;
    frames.swap(frames_);
    return frames;
}

FrameReader::FrameReader(Frames frames, StatusCode malformed_code)
    : frames_(std::move(frames))
    , malformed_code_(malformed_code) {
}

std::string FrameReader::next() {
    if (pos_ >= frames_.size()) {
        throw PubSubError(malformed_code_, "truncated frame sequence at frame " + std::to_string(pos_));
    }
    return std::move(frames_[pos_++]);
}

std::int64_t FrameReader::next_int() {
    auto text = next();
    if (text.empty()) {
        throw PubSubError(malformed_code_, "empty integer frame at " + std::to_string(pos_ - 1));
    }
    errno = 0;
    char* end = nullptr;
    auto value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        throw PubSubError(malformed_code_, "malformed integer frame '" + text + "'");
    }
    return static_cast<std::int64_t>(value);
}

std::vector<std::string> FrameReader::next_strings() {
    auto count = next_int();
    if (count < 0 || static_cast<std::size_t>(count) > frames_.size() - pos_) {
        throw PubSubError(malformed_code_, "bad element count " + std::to_string(count));
    }
    std::vector<std::string> values;
    values.reserve(static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        values.push_back(next());
    }
    return values;
}

Message FrameReader::next_message() {
    Message message;
    message.data = next();
    message.ordering_key = next();
    message.message_id = next();
    message.publish_time = std::chrono::system_clock::time_point(std::chrono::milliseconds(next_int()));

    auto header_count = next_int();
    if (header_count < 0 || static_cast<std::size_t>(header_count) * 2 > frames_.size() - pos_) {
        throw PubSubError(malformed_code_, "bad header count " + std::to_string(header_count));
    }
    for (std::int64_t i = 0; i < header_count; ++i) {
        auto key = next();
        message.headers[key] = next();
    }
    return message;
}

ReceivedMessage FrameReader::next_received() {
    ReceivedMessage message;
    message.ack_id = next();
    message.delivery_attempt = static_cast<int>(next_int());
    message.message = next_message();
    return message;
}

SubscriptionInfo FrameReader::next_subscription() {
    SubscriptionInfo subscription;
    subscription.name = next();
    subscription.topic = next();
    subscription.ack_deadline = std::chrono::milliseconds(next_int());
    return subscription;
}

} // namespace wire
} // namespace courier
