#include "courier/config.hpp"
#include "courier/errors.hpp"
#include "courier/logging.hpp"
#include "courier/operations.hpp"
#include "courier/zmq_exchange.hpp"
#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <future>

using namespace courier;

std::atomic<int> g_failures{0};

void producer_thread(Operations& operations, int tid, int msg_count, const std::vector<std::string>& topics) {
    std::vector<std::future<std::string>> results;
    results.reserve(static_cast<std::size_t>(msg_count));

    for (int i = 0; i < msg_count; ++i) {
        auto now = std::chrono::system_clock::now();
        auto ts = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();

        Message msg("Thread " + std::to_string(tid) + " Message " + std::to_string(i),
                    Headers{{"sent-at-ns", std::to_string(ts)}, {"producer", std::to_string(tid)}});

        const auto& topic = topics[static_cast<std::size_t>(tid) % topics.size()];
        results.push_back(operations.publish(topic, std::move(msg)));
    }

    for (auto& result : results) {
        try {
            result.get();
        } catch (const PubSubError& e) {
            if (g_failures.fetch_add(1) == 0) {
                std::cerr << "Publish failed: " << e.what() << std::endl;
            }
        }
    }
}

int main(int argc, char* argv[]) {
    std::string endpoint;
    std::string config_path;
    std::string project_id = "local-project";
    std::string log_level;
    int num_producers = 4;
    int messages_per_producer = 10000;
    std::string topic_prefix = "topic";
    int topic_count = 4;

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
        } else if (arg == "--producers") {
            num_producers = std::atoi(argv[i + 1]);
        } else if (arg == "--messages") {
            messages_per_producer = std::atoi(argv[i + 1]);
        } else if (arg == "--topics") {
            topic_prefix = argv[i + 1];
        } else if (arg == "--topic-count") {
            topic_count = std::atoi(argv[i + 1]);
        }
    }

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
        set_log_level(log_level.empty() ? config.log_level : log_level);

        std::vector<std::string> topics;
        for (int i = 0; i < std::max(1, topic_count); ++i) {
            topics.push_back(topic_prefix + std::to_string(i));
        }

        std::cout << "Starting multithreaded publisher:" << std::endl;
        std::cout << "  Publishers: " << num_producers << std::endl;
        std::cout << "  Messages per producer: " << messages_per_producer << std::endl;
        std::cout << "  Total messages: " << (num_producers * messages_per_producer) << std::endl;
        std::cout << "  Endpoint: " << config.endpoint << std::endl;
        std::cout << "  Project: " << config.project_id << std::endl;
        std::cout << "  Topic prefix: " << topic_prefix << std::endl;
        std::cout << std::endl;

        Operations operations(config, make_remote_transport(config.endpoint));

        for (const auto& topic : topics) {
            if (!operations.admin().get_topic(topic)) {
                operations.admin().create_topic(topic);
                std::cout << "Created topic " << topic << std::endl;
            }
        }

        std::vector<std::thread> producers;
        auto start_time = std::chrono::steady_clock::now();

        for (int i = 0; i < num_producers; ++i) {
            producers.emplace_back(producer_thread, std::ref(operations), i, messages_per_producer, std::cref(topics));
        }

        for (auto& producer : producers) {
            producer.join();
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        int total = num_producers * messages_per_producer;

        std::cout << "All messages confirmed in " << duration_us.count() / 1000 << " ms" << std::endl;
        if (duration_us.count() > 0) {
            std::cout << "Rate: " << (total * 1000000.0 / duration_us.count()) << " messages/sec" << std::endl;
        }
        std::cout << "Failures: " << g_failures.load() << std::endl;

        operations.shutdown();
        std::cout << "Publisher stopped" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return g_failures.load() == 0 ? 0 : 2;
}
