#include "admin.hpp"
#include "errors.hpp"
#include "resource_names.hpp"

namespace courier {

Admin::Admin(std::string project_id, std::shared_ptr<Transport> transport, const RetrySettings& topic_retry,
             const RetrySettings& subscription_retry)
    : project_id_(std::move(project_id))
    , transport_(std::move(transport))
    , topic_retry_(topic_retry)
    , subscription_retry_(subscription_retry)
    , logger_(get_logger("courier.admin")) {
}

TopicInfo Admin::create_topic(const std::string& topic) {
    const auto name = qualify_topic(project_id_, topic);
    auto info = topic_retry_.run("create topic " + name, [&](std::chrono::milliseconds timeout) {
        return transport_->create_topic(name, timeout);
    });
    logger_->info("created topic {}", name);
    return info;
}

void Admin::delete_topic(const std::string& topic) {
    const auto name = qualify_topic(project_id_, topic);
    topic_retry_.run("delete topic " + name, [&](std::chrono::milliseconds timeout) {
        transport_->delete_topic(name, timeout);
    });
    logger_->info("deleted topic {}", name);
    if (topic_deleted_) {
        topic_deleted_(name);
    }
}

boost::optional<TopicInfo> Admin::get_topic(const std::string& topic) {
    const auto name = qualify_topic(project_id_, topic);
    return topic_retry_.run("get topic " + name, [&](std::chrono::milliseconds timeout) {
        return transport_->get_topic(name, timeout);
    });
}

std::vector<TopicInfo> Admin::list_topics() {
    const auto parent = project();
    return topic_retry_.run("list topics of " + parent, [&](std::chrono::milliseconds timeout) {
        return transport_->list_topics(parent, timeout);
    });
}

SubscriptionInfo Admin::create_subscription(const std::string& subscription, const std::string& topic,
                                            std::chrono::milliseconds ack_deadline) {
    SubscriptionInfo info;
    info.name = qualify_subscription(project_id_, subscription);
    info.topic = qualify_topic(project_id_, topic);
    info.ack_deadline = ack_deadline;

    auto created = subscription_retry_.run("create subscription " + info.name, [&](std::chrono::milliseconds timeout) {
        return transport_->create_subscription(info, timeout);
    });
    logger_->info("created subscription {} on {}", info.name, info.topic);
    return created;
}

void Admin::delete_subscription(const std::string& subscription) {
    const auto name = qualify_subscription(project_id_, subscription);
    subscription_retry_.run("delete subscription " + name, [&](std::chrono::milliseconds timeout) {
        transport_->delete_subscription(name, timeout);
    });
    logger_->info("deleted subscription {}", name);
    if (subscription_deleted_) {
        subscription_deleted_(name);
    }
}

boost::optional<SubscriptionInfo> Admin::get_subscription(const std::string& subscription) {
    const auto name = qualify_subscription(project_id_, subscription);
    return subscription_retry_.run("get subscription " + name, [&](std::chrono::milliseconds timeout) {
        return transport_->get_subscription(name, timeout);
    });
}

std::vector<SubscriptionInfo> Admin::list_subscriptions() {
    const auto parent = project();
    return subscription_retry_.run("list subscriptions of " + parent, [&](std::chrono::milliseconds timeout) {
        return transport_->list_subscriptions(parent, timeout);
    });
}

std::string Admin::project() const {
    if (project_id_.empty()) {
        throw PubSubError(StatusCode::InvalidArgument, "no project configured");
    }
    return "projects/" + project_id_;
}

} // namespace courier
