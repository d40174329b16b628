#pragma once

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace courier {

/**
 * Issues ack / nack / deadline RPCs on behalf of the messages it delivered.
 * Implemented by the Puller and by the Subscriber's lease manager.
 */
class Acknowledger {
public:
    virtual ~Acknowledger() = default;

    virtual void acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) = 0;

    virtual void negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) = 0;

    virtual void modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                                     std::chrono::milliseconds deadline) = 0;
};

/**
 * A received message with its delivery token. It is resolved at most once:
 * ack() and nack() after the first successful resolution are no-ops.
 */
class AcknowledgeableMessage {
public:
    enum class State { Delivered, Acknowledged, NegativelyAcknowledged };

    AcknowledgeableMessage(std::string subscription, ReceivedMessage received,
                           std::shared_ptr<Acknowledger> acknowledger);

    AcknowledgeableMessage(const AcknowledgeableMessage&) = delete;
    AcknowledgeableMessage& operator=(const AcknowledgeableMessage&) = delete;

    const Message& message() const { return received_.message; }
    const std::string& ack_id() const { return received_.ack_id; }
    const std::string& subscription() const { return subscription_; }
    int delivery_attempt() const { return received_.delivery_attempt; }

    State state() const { return state_.load(); }

    void ack();

    void nack();

    void modify_ack_deadline(std::chrono::milliseconds deadline);

    const std::shared_ptr<Acknowledger>& acknowledger() const { return acknowledger_; }

private:
    friend void acknowledge_all(const std::vector<std::shared_ptr<AcknowledgeableMessage>>& messages);
    friend void negative_acknowledge_all(const std::vector<std::shared_ptr<AcknowledgeableMessage>>& messages);

    using Resolve = void (Acknowledger::*)(const std::string&, const std::vector<std::string>&);

    static void resolve_batch(const std::vector<std::shared_ptr<AcknowledgeableMessage>>& messages, State to,
                              Resolve resolve);

    // Delivered -> `to`; false when already resolved.
    bool mark(State to);
    void unmark();

    std::string subscription_;
    ReceivedMessage received_;
    std::shared_ptr<Acknowledger> acknowledger_;
    std::atomic<State> state_{State::Delivered};
};

using AcknowledgeableMessagePtr = std::shared_ptr<AcknowledgeableMessage>;

/**
 * Resolve a set of messages with one RPC per acknowledger. All messages must
 * come from the same subscription, otherwise PubSubError(InvalidArgument) is
 * thrown and nothing is resolved. Already resolved messages are skipped. When
 * an RPC fails, its messages and those of every acknowledger not yet called
 * return to Delivered and the error propagates.
 */
void acknowledge_all(const std::vector<AcknowledgeableMessagePtr>& messages);

void negative_acknowledge_all(const std::vector<AcknowledgeableMessagePtr>& messages);

} // namespace courier
