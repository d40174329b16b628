#pragma once

#include "logging.hpp"
#include "remote_transport.hpp"

#include <zmq.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace courier {

/**
 * FrameExchange over a ZeroMQ DEALER socket connected to an emulator ROUTER.
 *
 * Every calling thread gets its own socket, created on first use. A reply that
 * times out leaves the socket in an unknown state, so it is closed and the next
 * call from that thread connects a fresh one.
 */
class ZmqFrameExchange : public FrameExchange {
public:
    explicit ZmqFrameExchange(std::string endpoint,
                              std::chrono::milliseconds default_timeout = std::chrono::seconds(30));
    ~ZmqFrameExchange() override;

    wire::Frames exchange(const wire::Frames& request, std::chrono::milliseconds timeout) override;

    const std::string& endpoint() const { return endpoint_; }

private:
    zmq::socket_t& get_thread_local_socket();

    void drop_thread_local_socket();

    std::string endpoint_;
    std::chrono::milliseconds default_timeout_;
    zmq::context_t context_;

    std::mutex socket_mutex_;
    std::map<std::thread::id, std::unique_ptr<zmq::socket_t>> thread_sockets_;

    LoggerPtr logger_;
};

// RemoteTransport talking to the emulator at `endpoint`.
std::shared_ptr<Transport> make_remote_transport(const std::string& endpoint);

} // namespace courier
