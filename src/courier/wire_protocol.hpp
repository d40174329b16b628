#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace courier {
namespace wire {

/**
 * Multipart framing between RemoteTransport and the emulator.
 *
 * request: [request_id, operation, timeout_ms, arguments...]
 * reply:   [request_id, status, detail, results...]
 *
 * status is "OK" or a status code name (see status_code_name()). Integers are
 * decimal text. A message is [data, ordering_key, message_id, publish_time_ms,
 * header_count, key, value, ...].
 */
using Frames = std::vector<std::string>;

extern const char* const kStatusOk;

namespace op {
extern const char* const kSend;
extern const char* const kPull;
extern const char* const kAcknowledge;
extern const char* const kNegativeAcknowledge;
extern const char* const kModifyAckDeadline;
extern const char* const kCreateTopic;
extern const char* const kDeleteTopic;
extern const char* const kGetTopic;
extern const char* const kListTopics;
extern const char* const kCreateSubscription;
extern const char* const kDeleteSubscription;
extern const char* const kGetSubscription;
extern const char* const kListSubscriptions;
} // namespace op

class FrameWriter {
public:
    FrameWriter& add(std::string frame);
    FrameWriter& add_int(std::int64_t value);
    FrameWriter& add_strings(const std::vector<std::string>& values);
    FrameWriter& add_message(const Message& message);
    FrameWriter& add_received(const ReceivedMessage& message);
    FrameWriter& add_subscription(const SubscriptionInfo& subscription);

    Frames take();

private:
    Frames frames_;
};

// Reading past the end or a malformed integer throws PubSubError with the
// code given at construction.
class FrameReader {
public:
    FrameReader(Frames frames, StatusCode malformed_code);

    std::string next();
    std::int64_t next_int();
    std::vector<std::string> next_strings();
    Message next_message();
    ReceivedMessage next_received();
    SubscriptionInfo next_subscription();

    bool done() const { return pos_ == frames_.size(); }

private:
    Frames frames_;
    std::size_t pos_ = 0;
    StatusCode malformed_code_;
};

} // namespace wire
} // namespace courier
