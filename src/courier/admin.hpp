#pragma once

#include "logging.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <boost/optional.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace courier {

/**
 * Topic and subscription lifecycle. Short names are qualified with the
 * project; topic calls use the publisher retry settings, subscription calls
 * the subscriber ones.
 */
class Admin {
public:
    // Called with the qualified name after a successful delete.
    using DeleteListener = std::function<void(const std::string&)>;

    Admin(std::string project_id, std::shared_ptr<Transport> transport, const RetrySettings& topic_retry,
          const RetrySettings& subscription_retry);

    TopicInfo create_topic(const std::string& topic);

    void delete_topic(const std::string& topic);

    boost::optional<TopicInfo> get_topic(const std::string& topic);

    std::vector<TopicInfo> list_topics();

    SubscriptionInfo create_subscription(const std::string& subscription, const std::string& topic,
                                         std::chrono::milliseconds ack_deadline = std::chrono::seconds(10));

    void delete_subscription(const std::string& subscription);

    boost::optional<SubscriptionInfo> get_subscription(const std::string& subscription);

    std::vector<SubscriptionInfo> list_subscriptions();

    void on_topic_deleted(DeleteListener listener) { topic_deleted_ = std::move(listener); }

    void on_subscription_deleted(DeleteListener listener) { subscription_deleted_ = std::move(listener); }

    const std::string& project_id() const { return project_id_; }

private:
    std::string project() const;

    std::string project_id_;
    std::shared_ptr<Transport> transport_;
    RetryPolicy topic_retry_;
    RetryPolicy subscription_retry_;
    DeleteListener topic_deleted_;
    DeleteListener subscription_deleted_;
    LoggerPtr logger_;
};

} // namespace courier
