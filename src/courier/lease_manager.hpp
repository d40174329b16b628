#pragma once

#include "acknowledgeable_message.hpp"
#include "flow_controller.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace courier {

/**
 * LeaseManager tracks the messages a Subscriber has received but not yet
 * resolved. It owns the subscriber's flow-control ledger: capacity reserved by
 * a pull worker is released when the lease ends (ack, nack, expiry or drop).
 *
 * Messages handed to callbacks keep the manager alive, so they can be resolved
 * after the subscriber stopped.
 */
class LeaseManager : public Acknowledger {
public:
    using Clock = std::chrono::steady_clock;

    LeaseManager(std::shared_ptr<Transport> transport, const SubscriptionInfo& subscription,
                 const SubscriberSettings& settings, std::shared_ptr<Metrics> metrics);

    // Starts a lease; capacity for it must already be reserved.
    void add(const std::string& ack_id, std::int64_t bytes);

    void acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) override;

    void negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) override;

    void modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                             std::chrono::milliseconds deadline) override;

    /**
     * Extends leases due within half an ack deadline while they are younger than
     * the max extension period. Leases past that period, or past their deadline
     * when extension is disabled, are dropped and left to the service for
     * redelivery.
     */
    void maintain(Clock::time_point now);

    // Nacks and drops every remaining lease.
    void nack_all();

    std::size_t outstanding() const;

    FlowController& flow() { return flow_; }

private:
    struct Lease {
        std::int64_t bytes;
        Clock::time_point received;
        Clock::time_point deadline;
    };

    // Removes the leases and releases their capacity; returns the removed ones.
    std::vector<Lease> forget(const std::vector<std::string>& ack_ids);

    std::shared_ptr<Transport> transport_;
    SubscriptionInfo subscription_;
    SubscriberSettings settings_;
    std::shared_ptr<Metrics> metrics_;

    RetryPolicy retry_;
    FlowController flow_;

    mutable std::mutex mutex_;
    std::map<std::string, Lease> leases_;

    LoggerPtr logger_;
};

} // namespace courier
