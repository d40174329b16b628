#include "config.hpp"
#include "errors.hpp"

#include <cmath>

namespace courier {

namespace {

[[noreturn]] void invalid(const std::string& key, const std::string& reason) {
    throw PubSubError(StatusCode::InvalidArgument, "config '" + key + "': " + reason);
}

template <typename T>
T read_scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        invalid(key, e.what());
    }
}

std::chrono::milliseconds read_seconds(const YAML::Node& node, const std::string& key) {
    auto seconds = read_scalar<double>(node, key);
    if (seconds < 0 || !std::isfinite(seconds)) {
        invalid(key, "must be a non-negative number of seconds");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

double read_multiplier(const YAML::Node& node, const std::string& key) {
    auto value = read_scalar<double>(node, key);
    if (value < 1.0) {
        invalid(key, "must be at least 1.0");
    }
    return value;
}

int read_count(const YAML::Node& node, const std::string& key, int minimum) {
    auto value = read_scalar<int>(node, key);
    if (value < minimum) {
        invalid(key, "must be at least " + std::to_string(minimum));
    }
    return value;
}

boost::optional<std::int64_t> read_limit(const YAML::Node& node, const std::string& key) {
    if (!node || node.IsNull()) {
        return boost::none;
    }
    auto value = read_scalar<std::int64_t>(node, key);
    if (value <= 0) {
        invalid(key, "must be positive");
    }
    return value;
}

RetrySettings load_retry(const YAML::Node& node, const std::string& prefix) {
    RetrySettings retry;
    if (!node) {
        return retry;
    }

    if (node["totalTimeoutSeconds"]) {
        retry.total_timeout = read_seconds(node["totalTimeoutSeconds"], prefix + ".totalTimeoutSeconds");
    }
    if (node["initialRetryDelaySeconds"]) {
        retry.initial_retry_delay = read_seconds(node["initialRetryDelaySeconds"], prefix + ".initialRetryDelaySeconds");
    }
    if (node["retryDelayMultiplier"]) {
        retry.retry_delay_multiplier = read_multiplier(node["retryDelayMultiplier"], prefix + ".retryDelayMultiplier");
    }
    if (node["maxRetryDelaySeconds"]) {
        retry.max_retry_delay = read_seconds(node["maxRetryDelaySeconds"], prefix + ".maxRetryDelaySeconds");
    }
    if (node["maxAttempts"]) {
        retry.max_attempts = read_count(node["maxAttempts"], prefix + ".maxAttempts", 0);
    }
    if (node["jittered"]) {
        retry.jittered = read_scalar<bool>(node["jittered"], prefix + ".jittered");
    }
    if (node["initialRpcTimeoutSeconds"]) {
        retry.initial_rpc_timeout = read_seconds(node["initialRpcTimeoutSeconds"], prefix + ".initialRpcTimeoutSeconds");
    }
    if (node["rpcTimeoutMultiplier"]) {
        retry.rpc_timeout_multiplier = read_multiplier(node["rpcTimeoutMultiplier"], prefix + ".rpcTimeoutMultiplier");
    }
    if (node["maxRpcTimeoutSeconds"]) {
        retry.max_rpc_timeout = read_seconds(node["maxRpcTimeoutSeconds"], prefix + ".maxRpcTimeoutSeconds");
    }
    return retry;
}

FlowControlSettings load_flow_control(const YAML::Node& node, const std::string& prefix) {
    FlowControlSettings flow;
    if (!node) {
        return flow;
    }

    flow.max_outstanding_element_count =
        read_limit(node["maxOutstandingElementCount"], prefix + ".maxOutstandingElementCount");
    flow.max_outstanding_request_bytes =
        read_limit(node["maxOutstandingRequestBytes"], prefix + ".maxOutstandingRequestBytes");
    if (node["limitExceededBehavior"]) {
        auto name = read_scalar<std::string>(node["limitExceededBehavior"], prefix + ".limitExceededBehavior");
        try {
            flow.limit_exceeded_behavior = parse_limit_exceeded_behavior(name);
        } catch (const PubSubError& e) {
            invalid(prefix + ".limitExceededBehavior", e.detail());
        }
    }
    return flow;
}

RoleSettings load_role(const YAML::Node& node, const std::string& prefix) {
    RoleSettings role;
    if (!node) {
        return role;
    }

    if (node["executorThreads"]) {
        role.executor_threads = read_count(node["executorThreads"], prefix + ".executorThreads", 1);
    }
    role.retry = load_retry(node["retry"], prefix + ".retry");
    role.flow_control = load_flow_control(node["flowControl"], prefix + ".flowControl");
    return role;
}

BatchingSettings load_batching(const YAML::Node& node) {
    BatchingSettings batching;
    if (!node) {
        return batching;
    }

    batching.element_count_threshold =
        read_limit(node["elementCountThreshold"], "publisher.batching.elementCountThreshold");
    batching.request_byte_threshold =
        read_limit(node["requestByteThreshold"], "publisher.batching.requestByteThreshold");
    if (node["delayThresholdSeconds"] && !node["delayThresholdSeconds"].IsNull()) {
        batching.delay_threshold =
            read_seconds(node["delayThresholdSeconds"], "publisher.batching.delayThresholdSeconds");
    }
    if (node["enabled"]) {
        batching.enabled = read_scalar<bool>(node["enabled"], "publisher.batching.enabled");
    }
    return batching;
}

} // namespace

ClientConfig load_config(const YAML::Node& root) {
    ClientConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        invalid("<root>", "expected a mapping");
    }

    if (root["projectId"]) {
        config.project_id = read_scalar<std::string>(root["projectId"], "projectId");
    }
    if (root["endpoint"]) {
        config.endpoint = read_scalar<std::string>(root["endpoint"], "endpoint");
    }
    if (root["converter"]) {
        config.converter = read_scalar<std::string>(root["converter"], "converter");
    }
    if (root["logging"] && root["logging"]["level"]) {
        config.log_level = read_scalar<std::string>(root["logging"]["level"], "logging.level");
    }

    const auto publisher = root["publisher"];
    config.publisher.role = load_role(publisher, "publisher");
    if (publisher) {
        config.publisher.batching = load_batching(publisher["batching"]);
    }

    const auto subscriber = root["subscriber"];
    config.subscriber.role = load_role(subscriber, "subscriber");
    if (subscriber) {
        if (subscriber["parallelPullCount"]) {
            config.subscriber.parallel_pull_count =
                read_count(subscriber["parallelPullCount"], "subscriber.parallelPullCount", 1);
        }
        if (subscriber["maxAckExtensionPeriod"]) {
            config.subscriber.max_ack_extension_period =
                read_seconds(subscriber["maxAckExtensionPeriod"], "subscriber.maxAckExtensionPeriod");
        }
        if (subscriber["maxMessagesPerPull"]) {
            config.subscriber.max_messages_per_pull =
                read_count(subscriber["maxMessagesPerPull"], "subscriber.maxMessagesPerPull", 1);
        }
        if (subscriber["pullEndpoint"]) {
            config.pull_endpoint = read_scalar<std::string>(subscriber["pullEndpoint"], "subscriber.pullEndpoint");
        }
    }

    return config;
}

ClientConfig load_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw PubSubError(StatusCode::InvalidArgument, "cannot load config '" + path + "': " + e.what());
    }
    return load_config(root);
}

LimitExceededBehavior parse_limit_exceeded_behavior(const std::string& name) {
    if (name == "Block") return LimitExceededBehavior::Block;
    if (name == "Ignore") return LimitExceededBehavior::Ignore;
    if (name == "ThrowException") return LimitExceededBehavior::ThrowException;
    throw PubSubError(StatusCode::InvalidArgument, "unknown limit exceeded behavior '" + name + "'");
}

const char* limit_exceeded_behavior_name(LimitExceededBehavior behavior) {
    switch (behavior) {
    case LimitExceededBehavior::Block:          return "Block";
    case LimitExceededBehavior::Ignore:         return "Ignore";
    case LimitExceededBehavior::ThrowException: return "ThrowException";
    }
    return "Block";
}

} // namespace courier
