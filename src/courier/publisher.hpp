#pragma once

#include "flow_controller.hpp"
#include "logging.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace courier {

/**
 * Publisher batches outbound messages for one topic.
 *
 * Architecture:
 * - Caller threads: reserve flow-control capacity and append to the open batch
 * - Executor (shared Boost.Asio thread_pool): sends closed batches and runs the
 *   delay-threshold timer
 * - A closed batch is moved out of the publisher before it is posted, so a flush
 *   never shares state with the next batch
 */
class Publisher {
public:
    Publisher(std::string topic, Transport& transport, const PublisherSettings& settings,
              boost::asio::thread_pool& executor);
    ~Publisher();

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    // Resolves with the service-assigned message id, or with the error of the
    // batch the message was sent in.
    std::future<std::string> publish(Message message);

    // Posts the open batch without waiting for a threshold.
    void flush();

    // Flushes the open batch and waits until every posted batch completed.
    void shutdown();

    const std::string& topic() const { return topic_; }

    std::size_t pending_count() const;

private:
    struct Pending {
        Message message;
        std::promise<std::string> promise;
    };

    struct Batch {
        std::vector<Pending> messages;
        std::int64_t bytes = 0;
        std::chrono::steady_clock::time_point created;
    };

    bool threshold_reached_locked() const;

    void arm_timer_locked();

    void on_timer(std::uint64_t generation);

    // Moves the open batch out and posts it to the executor.
    void post_batch_locked();

    void send_batch(Batch& batch);

    void finish_task();

    std::string topic_;
    Transport& transport_;
    PublisherSettings settings_;
    boost::asio::thread_pool& executor_;

    RetryPolicy retry_;
    FlowController flow_;

    mutable std::mutex mutex_;
    std::condition_variable tasks_done_;
    Batch batch_;
    boost::asio::steady_timer timer_;
    std::uint64_t timer_generation_ = 0;
    std::size_t tasks_in_flight_ = 0;
    bool shutdown_ = false;

    LoggerPtr logger_;
};

} // namespace courier
