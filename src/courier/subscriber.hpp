#pragma once

#include "acknowledgeable_message.hpp"
#include "lease_manager.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace courier {

using MessageReceiver = std::function<void(const AcknowledgeableMessagePtr&)>;

/**
 * Subscriber delivers messages of one subscription to a callback.
 *
 * Architecture:
 * - Pull workers (parallel_pull_count threads): pull batches, reserve flow
 *   control per message, open a lease and post the message to the dispatch pool
 * - Dispatch pool (Boost.Asio thread_pool, executor_threads): runs the callback;
 *   an exception from the callback nacks the message
 * - Housekeeping thread: extends or drops leases (see LeaseManager::maintain)
 *
 * States: Stopped -> Running (start) -> Draining (stop) -> Stopped.
 * stop() never interrupts a running callback: it stops pulling, waits for the
 * dispatched callbacks, then nacks whatever is still unresolved.
 */
class Subscriber {
public:
    enum class State { Stopped, Running, Draining };

    Subscriber(const SubscriptionInfo& subscription, std::shared_ptr<Transport> transport,
               const SubscriberSettings& settings, MessageReceiver receiver);
    ~Subscriber();

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    // Throws PubSubError(FailedPrecondition) unless stopped.
    void start();

    void stop();

    State state() const { return state_.load(); }

    bool is_running() const { return state_.load() == State::Running; }

    const std::string& subscription() const { return subscription_.name; }

    std::size_t outstanding() const;

    Metrics::Stats get_metrics() { return metrics_->get_stats(); }

private:
    void pull_loop(int worker);

    void housekeeping_loop();

    void dispatch(const AcknowledgeableMessagePtr& message);

    // Zero while the outstanding element limit leaves no room.
    int next_batch_size() const;

    // Sleeps up to `duration`; returns early with true when stop was requested.
    bool wait_for_stop(std::chrono::milliseconds duration);

    SubscriptionInfo subscription_;
    std::shared_ptr<Transport> transport_;
    SubscriberSettings settings_;
    MessageReceiver receiver_;

    RetryPolicy retry_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<LeaseManager> leases_;

    std::atomic<State> state_{State::Stopped};
    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_signal_;

    std::vector<std::thread> pull_workers_;
    std::thread housekeeping_thread_;
    std::unique_ptr<boost::asio::thread_pool> dispatch_pool_;

    LoggerPtr logger_;
};

} // namespace courier
