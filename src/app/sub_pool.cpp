#include "courier/config.hpp"
#include "courier/logging.hpp"
#include "courier/metrics.hpp"
#include "courier/operations.hpp"
#include "courier/zmq_exchange.hpp"
#include <boost/optional.hpp>
#include <cstdint>
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <cstdlib>
#include <signal.h>

using namespace courier;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

std::atomic<std::uint64_t> g_handled{0};

// Transit time from the publisher's sent-at-ns header, when present.
boost::optional<std::chrono::nanoseconds> transit_time(const Message& message) {
    auto it = message.headers.find("sent-at-ns");
    if (it == message.headers.end()) {
        return boost::none;
    }
    try {
        auto sent = std::chrono::nanoseconds(std::stoll(it->second));
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now) - sent;
    } catch (const std::exception&) {
        return boost::none;
    }
}

void message_handler(const AcknowledgeableMessagePtr& message) {
    const auto handled = g_handled.fetch_add(1) + 1;
    if (handled % 1000 == 0) {
        auto transit = transit_time(message->message());
        std::cout << "Handled " << handled << " messages. "
                  << "Last id=" << message->message().message_id
                  << " attempt=" << message->delivery_attempt()
                  << " transit=" << (transit ? metrics_utils::format_duration(*transit) : std::string("n/a"))
                  << std::endl;
    }

    message->ack();
}

void metrics_thread(Subscriber& subscriber) {
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        auto stats = subscriber.get_metrics();
        std::cout << "METRICS: " << metrics_utils::format_stats(stats) << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string endpoint;
    std::string config_path;
    std::string project_id = "local-project";
    std::string log_level;
    std::string subscription = "topic0-sub";
    std::string topic;
    int num_workers = 0;

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        if (arg == "--endpoint") {
            endpoint = argv[i + 1];
        } else if (arg == "--config") {
            config_path = argv[i + 1];
        } else if (arg == "--project") {
            project_id = argv[i + 1];
        } else if (arg == "--log-level") {
            log_level = argv[i + 1];
        } else if (arg == "--subscription") {
            subscription = argv[i + 1];
        } else if (arg == "--topic") {
            topic = argv[i + 1];
        } else if (arg == "--workers") {
            num_workers = std::atoi(argv[i + 1]);
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        ClientConfig config;
        if (!config_path.empty()) {
            config = load_config_file(config_path);
        }
        if (config.project_id.empty()) {
            config.project_id = project_id;
        }
        if (!endpoint.empty()) {
            config.endpoint = endpoint;
        }
        if (num_workers > 0) {
            config.subscriber.role.executor_threads = num_workers;
        }
        set_log_level(log_level.empty() ? config.log_level : log_level);

        std::cout << "Starting subscriber with worker pool:" << std::endl;
        std::cout << "  Endpoint: " << config.endpoint << std::endl;
        std::cout << "  Subscription: " << subscription << std::endl;
        std::cout << "  Worker threads: " << config.subscriber.role.executor_threads << std::endl;
        std::cout << "  Parallel pulls: " << config.subscriber.parallel_pull_count << std::endl;
        std::cout << std::endl;

        auto transport = make_remote_transport(config.endpoint);
        auto pull_transport = config.pull_endpoint.empty() ? transport : make_remote_transport(config.pull_endpoint);
        Operations operations(config, transport, pull_transport);

        if (!topic.empty() && !operations.admin().get_subscription(subscription)) {
            if (!operations.admin().get_topic(topic)) {
                operations.admin().create_topic(topic);
            }
            operations.admin().create_subscription(subscription, topic);
            std::cout << "Created subscription " << subscription << " on " << topic << std::endl;
        }

        auto subscriber = operations.subscribe(subscription, message_handler);

        std::cout << "Subscriber started. Waiting for messages..." << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl << std::endl;

        std::thread metrics_worker(metrics_thread, std::ref(*subscriber));

        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << std::endl << "Shutting down..." << std::endl;

        metrics_worker.join();

        subscriber->stop();

        auto final_stats = subscriber->get_metrics();
        std::cout << "FINAL METRICS: " << metrics_utils::format_stats(final_stats) << std::endl;

        operations.shutdown();
        std::cout << "Subscriber stopped." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
