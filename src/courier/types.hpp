#pragma once

#include <boost/optional.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace courier {

using Headers = std::map<std::string, std::string>;

/**
 * Wire envelope: opaque payload bytes plus string headers.
 * message_id and publish_time are assigned by the service and are empty on
 * outbound messages.
 */
struct Message {
    std::string data;
    Headers headers;
    std::string ordering_key;
    std::string message_id;
    std::chrono::system_clock::time_point publish_time{};

    Message() = default;

    explicit Message(std::string data, Headers headers = Headers{}, std::string ordering_key = std::string{})
        : data(std::move(data)), headers(std::move(headers)), ordering_key(std::move(ordering_key)) {}

    std::size_t byte_size() const {
        std::size_t size = data.size() + ordering_key.size();
        for (const auto& header : headers) {
            size += header.first.size() + header.second.size();
        }
        return size;
    }
};

struct ReceivedMessage {
    std::string ack_id;
    Message message;
    int delivery_attempt = 1;
};

struct TopicInfo {
    std::string name;
};

struct SubscriptionInfo {
    std::string name;
    std::string topic;
    std::chrono::milliseconds ack_deadline{std::chrono::seconds(10)};
};

struct RetrySettings {
    std::chrono::milliseconds total_timeout{0};
    std::chrono::milliseconds initial_retry_delay{0};
    double retry_delay_multiplier = 1.0;
    std::chrono::milliseconds max_retry_delay{0};
    int max_attempts = 0;
    bool jittered = true;
    std::chrono::milliseconds initial_rpc_timeout{0};
    double rpc_timeout_multiplier = 1.0;
    std::chrono::milliseconds max_rpc_timeout{0};
};

enum class LimitExceededBehavior {
    Block,
    Ignore,
    ThrowException
};

struct FlowControlSettings {
    boost::optional<std::int64_t> max_outstanding_element_count;
    boost::optional<std::int64_t> max_outstanding_request_bytes;
    LimitExceededBehavior limit_exceeded_behavior = LimitExceededBehavior::Block;
};

struct BatchingSettings {
    boost::optional<std::int64_t> element_count_threshold;
    boost::optional<std::int64_t> request_byte_threshold;
    boost::optional<std::chrono::milliseconds> delay_threshold;
    bool enabled = false;
};

/**
 * Settings shared by the publisher and subscriber roles. ClientConfig holds
 * one instance per role.
 */
struct RoleSettings {
    int executor_threads = 4;
    RetrySettings retry;
    FlowControlSettings flow_control;
};

struct PublisherSettings {
    RoleSettings role;
    BatchingSettings batching;
};

struct SubscriberSettings {
    RoleSettings role;
    int parallel_pull_count = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    int max_messages_per_pull = 100;
    std::chrono::milliseconds max_ack_extension_period{0};
    std::chrono::milliseconds pull_wait{200};
};

struct ClientConfig {
    std::string project_id;
    std::string endpoint = "tcp://127.0.0.1:8085";
    std::string pull_endpoint;
    std::string converter = "default";
    std::string log_level = "info";

    PublisherSettings publisher;
    SubscriberSettings subscriber;
};

} // namespace courier
