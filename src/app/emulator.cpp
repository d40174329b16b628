#include "courier/emulator_server.hpp"
#include "courier/local_transport.hpp"
#include "courier/logging.hpp"
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

int main(int argc, char* argv[]) {
    EmulatorConfig config;
    std::string log_level = "info";

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        if (arg == "--bind") {
            config.bind_addr = argv[i + 1];
        } else if (arg == "--workers") {
            config.worker_threads = std::atoi(argv[i + 1]);
        } else if (arg == "--log-level") {
            log_level = argv[i + 1];
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        set_log_level(log_level);

        EmulatorServer server(std::make_shared<LocalTransport>(), config);
        server.start();

        std::cout << "Emulator serving on " << config.bind_addr << ". Press Ctrl+C to stop." << std::endl;

        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << std::endl << "Shutting down..." << std::endl;
        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
