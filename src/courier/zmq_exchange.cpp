#include "zmq_exchange.hpp"
#include "errors.hpp"

#include <zmq_addon.hpp>
#include <iterator>
#include <vector>

namespace courier {

namespace {

// Slack on top of the RPC deadline the emulator enforces itself.
const std::chrono::milliseconds kReplyGrace(500);

} // namespace

ZmqFrameExchange::ZmqFrameExchange(std::string endpoint, std::chrono::milliseconds default_timeout)
    : endpoint_(std::move(endpoint))
    , default_timeout_(default_timeout)
    , context_(1)
    , logger_(get_logger("courier.transport")) {
}

ZmqFrameExchange::~ZmqFrameExchange() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    thread_sockets_.clear();
}

wire::Frames ZmqFrameExchange::exchange(const wire::Frames& request, std::chrono::milliseconds timeout) {
    const auto wait = timeout.count() > 0 ? timeout + kReplyGrace : default_timeout_;
    const auto deadline = std::chrono::steady_clock::now() + wait;

    try {
        auto& socket = get_thread_local_socket();

        std::vector<zmq::const_buffer> parts;
        parts.push_back(zmq::const_buffer(nullptr, 0));
        for (const auto& frame : request) {
            parts.push_back(zmq::buffer(frame.data(), frame.size()));
        }
        if (!zmq::send_multipart(socket, parts)) {
            throw PubSubError(StatusCode::Unavailable, "send to " + endpoint_ + " would block");
        }

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }

            zmq::pollitem_t items[] = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 1, remaining);
            if (!(items[0].revents & ZMQ_POLLIN)) {
                continue;
            }

            std::vector<zmq::message_t> msgs;
            if (!zmq::recv_multipart(socket, std::back_inserter(msgs))) {
                continue;
            }

            wire::Frames reply;
            // skip the empty delimiter
            for (std::size_t i = 1; i < msgs.size(); ++i) {
                reply.push_back(msgs[i].to_string());
            }
            if (!reply.empty() && !request.empty() && reply.front() != request.front()) {
                logger_->debug("discarding stale reply {} while waiting for {}", reply.front(), request.front());
                continue;
            }
            return reply;
        }
    } catch (const zmq::error_t& e) {
        drop_thread_local_socket();
        throw PubSubError(StatusCode::Unavailable, "emulator at " + endpoint_ + ": " + e.what());
    }

    drop_thread_local_socket();
    throw PubSubError(StatusCode::DeadlineExceeded,
                      "no reply from " + endpoint_ + " within " + std::to_string(wait.count()) + "ms");
}

zmq::socket_t& ZmqFrameExchange::get_thread_local_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    auto thread_id = std::this_thread::get_id();

    auto it = thread_sockets_.find(thread_id);
    if (it == thread_sockets_.end()) {
        auto socket = std::unique_ptr<zmq::socket_t>(new zmq::socket_t(context_, zmq::socket_type::dealer));
        socket->set(zmq::sockopt::linger, 0);
        socket->connect(endpoint_);
        thread_sockets_[thread_id] = std::move(socket);
        return *thread_sockets_[thread_id];
    }
    return *it->second;
}

void ZmqFrameExchange::drop_thread_local_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    thread_sockets_.erase(std::this_thread::get_id());
}

std::shared_ptr<Transport> make_remote_transport(const std::string& endpoint) {
    return std::make_shared<RemoteTransport>(
        std::unique_ptr<FrameExchange>(new ZmqFrameExchange(endpoint)));
}

} // namespace courier
