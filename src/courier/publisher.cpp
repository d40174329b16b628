#include "publisher.hpp"
#include "errors.hpp"

#include <boost/asio/post.hpp>
#include <memory>

namespace courier {

Publisher::Publisher(std::string topic, Transport& transport, const PublisherSettings& settings,
                     boost::asio::thread_pool& executor)
    : topic_(std::move(topic))
    , transport_(transport)
    , settings_(settings)
    , executor_(executor)
    , retry_(settings.role.retry)
    , flow_(settings.role.flow_control)
    , timer_(executor)
    , logger_(get_logger("courier.publisher")) {
}

Publisher::~Publisher() {
    shutdown();
}

std::future<std::string> Publisher::publish(Message message) {
    std::promise<std::string> promise;
    auto future = promise.get_future();
    const auto bytes = static_cast<std::int64_t>(message.byte_size());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            promise.set_exception(std::make_exception_ptr(
                PubSubError(StatusCode::FailedPrecondition, "publisher for '" + topic_ + "' is shut down")));
            return future;
        }
    }

    try {
        flow_.reserve(1, bytes);
    } catch (const PubSubError&) {
        promise.set_exception(std::current_exception());
        return future;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        flow_.release(1, bytes);
        promise.set_exception(std::make_exception_ptr(
            PubSubError(StatusCode::FailedPrecondition, "publisher for '" + topic_ + "' is shut down")));
        return future;
    }

    if (batch_.messages.empty()) {
        batch_.created = std::chrono::steady_clock::now();
    }
    batch_.messages.push_back(Pending{std::move(message), std::move(promise)});
    batch_.bytes += bytes;

    if (!settings_.batching.enabled || threshold_reached_locked()) {
        post_batch_locked();
    } else if (batch_.messages.size() == 1) {
        arm_timer_locked();
    }
    return future;
}

void Publisher::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!batch_.messages.empty()) {
        post_batch_locked();
    }
}

void Publisher::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!shutdown_) {
        shutdown_ = true;
        if (!batch_.messages.empty()) {
            logger_->debug("force-flushing {} pending messages for {}", batch_.messages.size(), topic_);
            post_batch_locked();
        }
        ++timer_generation_;
        timer_.cancel();
    }
    tasks_done_.wait(lock, [this] { return tasks_in_flight_ == 0; });
}

std::size_t Publisher::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_.messages.size();
}

// Without any threshold configured every message is its own batch.
bool Publisher::threshold_reached_locked() const {
    const auto& batching = settings_.batching;
    if (!batching.element_count_threshold && !batching.request_byte_threshold && !batching.delay_threshold) {
        return true;
    }
    if (batching.element_count_threshold &&
        static_cast<std::int64_t>(batch_.messages.size()) >= *batching.element_count_threshold) {
        return true;
    }
    return batching.request_byte_threshold && batch_.bytes >= *batching.request_byte_threshold;
}

void Publisher::arm_timer_locked() {
    if (!settings_.batching.delay_threshold) {
        return;
    }

    const auto generation = ++timer_generation_;
    ++tasks_in_flight_;
    timer_.expires_after(*settings_.batching.delay_threshold);
    timer_.async_wait([this, generation](const boost::system::error_code&) {
        on_timer(generation);
        finish_task();
    });
}

void Publisher::on_timer(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation == timer_generation_ && !batch_.messages.empty()) {
        post_batch_locked();
    }
}

void Publisher::post_batch_locked() {
    auto batch = std::make_shared<Batch>(std::move(batch_));
    batch_ = Batch{};

    ++timer_generation_;
    timer_.cancel();

    ++tasks_in_flight_;
    boost::asio::post(executor_, [this, batch] {
        send_batch(*batch);
        finish_task();
    });
}

void Publisher::send_batch(Batch& batch) {
    std::vector<Message> messages;
    messages.reserve(batch.messages.size());
    for (const auto& pending : batch.messages) {
        messages.push_back(pending.message);
    }

    try {
        auto ids = retry_.run("publish to " + topic_, [&](std::chrono::milliseconds timeout) {
            return transport_.send(topic_, messages, timeout);
        });
        if (ids.size() != messages.size()) {
            throw PubSubError(StatusCode::Internal, "service returned " + std::to_string(ids.size()) +
                                                        " ids for " + std::to_string(messages.size()) + " messages");
        }
        for (std::size_t i = 0; i < ids.size(); ++i) {
            batch.messages[i].promise.set_value(ids[i]);
        }
        logger_->debug("flushed {} messages ({} bytes) to {}", messages.size(), batch.bytes, topic_);
    } catch (const std::exception& e) {
        logger_->error("publish of {} messages to {} failed: {}", messages.size(), topic_, e.what());
        auto error = std::current_exception();
        for (auto& pending : batch.messages) {
            pending.promise.set_exception(error);
        }
    }

    flow_.release(static_cast<std::int64_t>(batch.messages.size()), batch.bytes);
}

void Publisher::finish_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    --tasks_in_flight_;
    tasks_done_.notify_all();
}

} // namespace courier
