#include "emulator_server.hpp"

#include <zmq_addon.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <iterator>
#include <vector>

namespace courier {

EmulatorServer::EmulatorServer(std::shared_ptr<Transport> backend, const EmulatorConfig& config)
    : backend_(std::move(backend))
    , config_(config)
    , service_(*backend_)
    , context_(config.io_threads)
    , logger_(get_logger("courier.emulator")) {
}

EmulatorServer::~EmulatorServer() {
    stop();
}

void EmulatorServer::start() {
    if (running_.load()) {
        return;
    }

    pull_socket_.reset(new zmq::socket_t(context_, zmq::socket_type::pull));
    router_socket_.reset(new zmq::socket_t(context_, zmq::socket_type::router));

    pull_socket_->set(zmq::sockopt::rcvhwm, config_.hwm);
    router_socket_->set(zmq::sockopt::sndhwm, config_.hwm);
    router_socket_->set(zmq::sockopt::rcvhwm, config_.hwm);
    router_socket_->set(zmq::sockopt::linger, 0);

    pull_socket_->bind(config_.inproc_egress);
    router_socket_->bind(config_.bind_addr);

    worker_pool_.reset(new boost::asio::thread_pool(static_cast<std::size_t>(config_.worker_threads)));

    running_.store(true);
    io_thread_ = std::thread(&EmulatorServer::io_thread_loop, this);
    logger_->info("emulator listening on {} with {} workers", config_.bind_addr, config_.worker_threads);
}

void EmulatorServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // blocked pulls end at their own deadline
    worker_pool_->join();
    worker_pool_.reset();

    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        thread_sockets_.clear();
    }
    pull_socket_.reset();
    router_socket_.reset();
    logger_->info("emulator on {} stopped", config_.bind_addr);
}

void EmulatorServer::io_thread_loop() {
    while (running_.load()) {
        zmq::pollitem_t items[] = {
            {router_socket_->handle(), 0, ZMQ_POLLIN, 0},
            {pull_socket_->handle(), 0, ZMQ_POLLIN, 0},
        };
        zmq::poll(items, 2, std::chrono::milliseconds(10));

        if (items[0].revents & ZMQ_POLLIN) {
            std::vector<zmq::message_t> msgs;
            auto result = zmq::recv_multipart(*router_socket_, std::back_inserter(msgs), zmq::recv_flags::dontwait);
            // [identity, empty, request_id, ...]
            if (result.has_value() && msgs.size() >= 3) {
                std::string identity = msgs[0].to_string();
                wire::Frames request;
                for (std::size_t i = 2; i < msgs.size(); ++i) {
                    request.push_back(msgs[i].to_string());
                }
                boost::asio::post(*worker_pool_, [this, identity, request]() {
                    handle_request(identity, request);
                });
            } else if (result.has_value()) {
                logger_->warn("dropping malformed envelope of {} frames", msgs.size());
            }
        }

        if (items[1].revents & ZMQ_POLLIN) {
            std::vector<zmq::message_t> msgs;
            auto result = zmq::recv_multipart(*pull_socket_, std::back_inserter(msgs), zmq::recv_flags::dontwait);
            if (result.has_value()) {
                zmq::send_multipart(*router_socket_, msgs);
            }
        }
    }
}

void EmulatorServer::handle_request(std::string identity, wire::Frames request) {
    auto reply = service_.handle(request);

    std::vector<zmq::const_buffer> parts;
    parts.push_back(zmq::buffer(identity.data(), identity.size()));
    parts.push_back(zmq::const_buffer(nullptr, 0));
    for (const auto& frame : reply) {
        parts.push_back(zmq::buffer(frame.data(), frame.size()));
    }

    try {
        zmq::send_multipart(get_thread_local_push_socket(), parts);
    } catch (const zmq::error_t& e) {
        logger_->error("failed to hand back reply {}: {}", reply.empty() ? "" : reply.front(), e.what());
    }
}

zmq::socket_t& EmulatorServer::get_thread_local_push_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    auto thread_id = std::this_thread::get_id();

    auto it = thread_sockets_.find(thread_id);
    if (it == thread_sockets_.end()) {
        auto socket = std::unique_ptr<zmq::socket_t>(new zmq::socket_t(context_, zmq::socket_type::push));
        socket->set(zmq::sockopt::sndhwm, config_.hwm);
        socket->set(zmq::sockopt::linger, 0);
        socket->connect(config_.inproc_egress);
        thread_sockets_[thread_id] = std::move(socket);
        return *thread_sockets_[thread_id];
    }
    return *it->second;
}

} // namespace courier
