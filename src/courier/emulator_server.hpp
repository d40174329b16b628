#pragma once

#include "emulator_service.hpp"
#include "logging.hpp"
#include "transport.hpp"

#include <zmq.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace courier {

struct EmulatorConfig {
    std::string bind_addr = "tcp://127.0.0.1:8085";
    std::string inproc_egress = "inproc://courier-replies";
    int io_threads = 1;
    int worker_threads = 4;
    int hwm = 100000;
};

/**
 * EmulatorServer serves a Transport to RemoteTransport clients over ZeroMQ.
 *
 * Architecture:
 * - IO thread: owns the ROUTER socket and the inproc PULL socket; forwards
 *   requests to the worker pool and replies back to the ROUTER
 * - Worker pool (Boost.Asio thread_pool): runs requests against the backend,
 *   which may block (pull waits for messages)
 * - Workers hand replies back through thread-local PUSH sockets, so the ROUTER
 *   is only ever touched by the IO thread
 */
class EmulatorServer {
public:
    EmulatorServer(std::shared_ptr<Transport> backend, const EmulatorConfig& config);
    ~EmulatorServer();

    EmulatorServer(const EmulatorServer&) = delete;
    EmulatorServer& operator=(const EmulatorServer&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_.load(); }

    const EmulatorConfig& config() const { return config_; }

private:
    void io_thread_loop();

    void handle_request(std::string identity, wire::Frames request);

    zmq::socket_t& get_thread_local_push_socket();

    std::shared_ptr<Transport> backend_;
    EmulatorConfig config_;
    EmulatorService service_;

    zmq::context_t context_;
    std::unique_ptr<zmq::socket_t> router_socket_;
    std::unique_ptr<zmq::socket_t> pull_socket_;

    std::unique_ptr<boost::asio::thread_pool> worker_pool_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    std::mutex socket_mutex_;
    std::map<std::thread::id, std::unique_ptr<zmq::socket_t>> thread_sockets_;

    LoggerPtr logger_;
};

} // namespace courier
