#include "lease_manager.hpp"
#include "errors.hpp"

namespace courier {

LeaseManager::LeaseManager(std::shared_ptr<Transport> transport, const SubscriptionInfo& subscription,
                           const SubscriberSettings& settings, std::shared_ptr<Metrics> metrics)
    : transport_(std::move(transport))
    , subscription_(subscription)
    , settings_(settings)
    , metrics_(std::move(metrics))
    , retry_(settings.role.retry)
    , flow_(settings.role.flow_control)
    , logger_(get_logger("courier.subscriber")) {
}

void LeaseManager::add(const std::string& ack_id, std::int64_t bytes) {
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    leases_[ack_id] = Lease{bytes, now, now + subscription_.ack_deadline};
}

void LeaseManager::acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) {
    retry_.run("acknowledge on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->acknowledge(subscription, ack_ids, timeout);
    });

    const auto now = Clock::now();
    for (const auto& lease : forget(ack_ids)) {
        metrics_->record_ack(now - lease.received);
    }
}

void LeaseManager::negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) {
    retry_.run("nack on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->negative_acknowledge(subscription, ack_ids, timeout);
    });

    for (std::size_t i = forget(ack_ids).size(); i > 0; --i) {
        metrics_->record_nack();
    }
}

void LeaseManager::modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                       std::chrono::milliseconds deadline) {
    if (deadline.count() == 0) {
        negative_acknowledge(subscription, ack_ids);
        return;
    }

    retry_.run("modify ack deadline on " + subscription, [&](std::chrono::milliseconds timeout) {
        transport_->modify_ack_deadline(subscription, ack_ids, deadline, timeout);
    });

    const auto extended = Clock::now() + deadline;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ack_id : ack_ids) {
        auto it = leases_.find(ack_id);
        if (it != leases_.end()) {
            it->second.deadline = extended;
        }
    }
}

void LeaseManager::maintain(Clock::time_point now) {
    const auto ack_deadline = subscription_.ack_deadline;
    const auto max_extension = settings_.max_ack_extension_period;

    std::vector<std::string> extend;
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : leases_) {
            auto& lease = entry.second;
            if (max_extension.count() == 0) {
                if (lease.deadline <= now) {
                    expired.push_back(entry.first);
                }
            } else if (now - lease.received >= max_extension) {
                expired.push_back(entry.first);
            } else if (lease.deadline - now <= ack_deadline / 2) {
                extend.push_back(entry.first);
                lease.deadline = now + ack_deadline;
            }
        }
    }

    if (!expired.empty()) {
        auto dropped = forget(expired);
        for (std::size_t i = 0; i < dropped.size(); ++i) {
            metrics_->record_lease_expired();
        }
        logger_->warn("dropped {} unresolved leases on {}", dropped.size(), subscription_.name);
    }

    if (!extend.empty()) {
        try {
            retry_.run("extend leases on " + subscription_.name, [&](std::chrono::milliseconds timeout) {
                transport_->modify_ack_deadline(subscription_.name, extend, ack_deadline, timeout);
            });
            logger_->debug("extended {} leases on {}", extend.size(), subscription_.name);
        } catch (const PubSubError& e) {
            logger_->error("extending {} leases on {} failed: {}", extend.size(), subscription_.name, e.what());
        }
    }
}

void LeaseManager::nack_all() {
    std::vector<std::string> ack_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : leases_) {
            ack_ids.push_back(entry.first);
        }
    }
    if (ack_ids.empty()) {
        return;
    }

    try {
        negative_acknowledge(subscription_.name, ack_ids);
    } catch (const PubSubError& e) {
        logger_->error("nack of {} unresolved messages on {} failed: {}", ack_ids.size(), subscription_.name,
                       e.what());
        forget(ack_ids);
    }
}

std::size_t LeaseManager::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.size();
}

std::vector<LeaseManager::Lease> LeaseManager::forget(const std::vector<std::string>& ack_ids) {
    std::vector<Lease> removed;
    std::int64_t bytes = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& ack_id : ack_ids) {
            auto it = leases_.find(ack_id);
            if (it != leases_.end()) {
                bytes += it->second.bytes;
                removed.push_back(it->second);
                leases_.erase(it);
            }
        }
    }
    if (!removed.empty()) {
        flow_.release(static_cast<std::int64_t>(removed.size()), bytes);
    }
    return removed;
}

} // namespace courier
