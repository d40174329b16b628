#include "subscriber.hpp"
#include "errors.hpp"

#include <boost/asio/post.hpp>
#include <algorithm>

namespace courier {

namespace {

// Shortest pause between pull retries, so a zero retry delay cannot spin.
const std::chrono::milliseconds kMinPullBackoff(10);

std::chrono::milliseconds housekeeping_period(std::chrono::milliseconds ack_deadline) {
    auto period = std::min(ack_deadline / 4, std::chrono::milliseconds(1000));
    return std::max(period, std::chrono::milliseconds(10));
}

} // namespace

Subscriber::Subscriber(const SubscriptionInfo& subscription, std::shared_ptr<Transport> transport,
                       const SubscriberSettings& settings, MessageReceiver receiver)
    : subscription_(subscription)
    , transport_(std::move(transport))
    , settings_(settings)
    , receiver_(std::move(receiver))
    , retry_(settings.role.retry,
             [this](std::chrono::milliseconds delay) { wait_for_stop(std::max(delay, kMinPullBackoff)); },
             [] { return RetryPolicy::Clock::now(); },
             [this] { return stop_requested_.load(); })
    , metrics_(std::make_shared<Metrics>())
    , logger_(get_logger("courier.subscriber")) {
}

Subscriber::~Subscriber() {
    stop();
}

void Subscriber::start() {
    auto expected = State::Stopped;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        throw PubSubError(StatusCode::FailedPrecondition,
                          "subscriber for '" + subscription_.name + "' is already running");
    }

    stop_requested_.store(false);
    leases_ = std::make_shared<LeaseManager>(transport_, subscription_, settings_, metrics_);
    dispatch_pool_.reset(new boost::asio::thread_pool(static_cast<std::size_t>(settings_.role.executor_threads)));

    for (int i = 0; i < settings_.parallel_pull_count; ++i) {
        pull_workers_.emplace_back(&Subscriber::pull_loop, this, i);
    }
    housekeeping_thread_ = std::thread(&Subscriber::housekeeping_loop, this);

    logger_->info("subscriber for {} started with {} pull workers", subscription_.name, settings_.parallel_pull_count);
}

void Subscriber::stop() {
    auto expected = State::Running;
    if (!state_.compare_exchange_strong(expected, State::Draining)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_signal_.notify_all();
    leases_->flow().interrupt();

    for (auto& worker : pull_workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    pull_workers_.clear();

    dispatch_pool_->join();
    dispatch_pool_.reset();

    if (housekeeping_thread_.joinable()) {
        housekeeping_thread_.join();
    }

    leases_->nack_all();
    metrics_->update_outstanding(leases_->outstanding());

    state_.store(State::Stopped);
    logger_->info("subscriber for {} stopped", subscription_.name);
}

std::size_t Subscriber::outstanding() const {
    auto leases = leases_;
    return leases ? leases->outstanding() : 0;
}

void Subscriber::pull_loop(int worker) {
    const auto& name = subscription_.name;

    while (!stop_requested_.load()) {
        const int batch_size = next_batch_size();
        if (batch_size == 0) {
            wait_for_stop(kMinPullBackoff);
            continue;
        }

        std::vector<ReceivedMessage> received;
        try {
            received = retry_.run("pull from " + name, [&](std::chrono::milliseconds timeout) {
                auto wait = timeout.count() > 0 ? std::min(timeout, settings_.pull_wait) : settings_.pull_wait;
                return transport_->pull(name, batch_size, wait);
            });
        } catch (const PubSubError& e) {
            if (stop_requested_.load()) {
                logger_->debug("pull worker {} for {} stopping: {}", worker, name, e.what());
                return;
            }
            if (!is_retryable(e.code())) {
                logger_->error("pull worker {} for {} stopped: {}", worker, name, e.what());
                return;
            }
            logger_->warn("pull worker {} for {} failed, pausing: {}", worker, name, e.what());
            wait_for_stop(settings_.pull_wait);
            continue;
        }

        std::vector<std::string> rejected;
        for (auto& message : received) {
            const auto bytes = static_cast<std::int64_t>(message.message.byte_size());
            try {
                leases_->flow().reserve(1, bytes);
            } catch (const PubSubError& e) {
                logger_->debug("pull worker {} rejected message {}: {}", worker, message.message.message_id,
                               e.what());
                rejected.push_back(message.ack_id);
                continue;
            }

            leases_->add(message.ack_id, bytes);
            metrics_->record_received();

            auto acknowledgeable = std::make_shared<AcknowledgeableMessage>(name, std::move(message), leases_);
            boost::asio::post(*dispatch_pool_, [this, acknowledgeable] { dispatch(acknowledgeable); });
        }

        if (!rejected.empty()) {
            try {
                transport_->negative_acknowledge(name, rejected, std::chrono::milliseconds(0));
            } catch (const PubSubError& e) {
                logger_->warn("returning {} rejected messages to {} failed: {}", rejected.size(), name, e.what());
            }
        }
    }
}

void Subscriber::housekeeping_loop() {
    const auto period = housekeeping_period(subscription_.ack_deadline);
    while (!wait_for_stop(period)) {
        leases_->maintain(LeaseManager::Clock::now());
        metrics_->update_outstanding(leases_->outstanding());
    }
}

void Subscriber::dispatch(const AcknowledgeableMessagePtr& message) {
    try {
        receiver_(message);
        return;
    } catch (const std::exception& e) {
        logger_->warn("callback for message {} on {} failed, nacking: {}", message->message().message_id,
                      subscription_.name, e.what());
    } catch (...) {
        logger_->warn("callback for message {} on {} threw a non-standard exception, nacking",
                      message->message().message_id, subscription_.name);
    }

    metrics_->record_callback_failure();
    try {
        message->nack();
    } catch (const PubSubError& e) {
        logger_->error("nack of message {} on {} failed: {}", message->message().message_id, subscription_.name,
                       e.what());
    }
}

int Subscriber::next_batch_size() const {
    int batch_size = settings_.max_messages_per_pull;
    const auto& flow_control = settings_.role.flow_control;
    if (flow_control.max_outstanding_element_count) {
        auto room = *flow_control.max_outstanding_element_count - leases_->flow().outstanding_elements();
        if (room <= 0) {
            return flow_control.limit_exceeded_behavior == LimitExceededBehavior::Ignore ? 1 : 0;
        }
        batch_size = static_cast<int>(std::min<std::int64_t>(room, batch_size));
    }
    return batch_size;
}

bool Subscriber::wait_for_stop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_signal_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

} // namespace courier
