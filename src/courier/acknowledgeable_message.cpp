#include "acknowledgeable_message.hpp"
#include "errors.hpp"

#include <map>

namespace courier {

namespace {

void check_single_subscription(const std::vector<AcknowledgeableMessagePtr>& messages) {
    for (const auto& message : messages) {
        if (!message) {
            throw PubSubError(StatusCode::InvalidArgument, "null message in acknowledgment batch");
        }
        if (message->subscription() != messages.front()->subscription()) {
            throw PubSubError(StatusCode::InvalidArgument,
                              "acknowledgment batch mixes subscriptions '" + messages.front()->subscription() +
                                  "' and '" + message->subscription() + "'");
        }
    }
}

} // namespace

AcknowledgeableMessage::AcknowledgeableMessage(std::string subscription, ReceivedMessage received,
                                               std::shared_ptr<Acknowledger> acknowledger)
    : subscription_(std::move(subscription))
    , received_(std::move(received))
    , acknowledger_(std::move(acknowledger)) {
}

void AcknowledgeableMessage::ack() {
    if (!mark(State::Acknowledged)) {
        return;
    }
    try {
        acknowledger_->acknowledge(subscription_, {received_.ack_id});
    } catch (const std::exception&) {
        unmark();
        throw;
    }
}

void AcknowledgeableMessage::nack() {
    if (!mark(State::NegativelyAcknowledged)) {
        return;
    }
    try {
        acknowledger_->negative_acknowledge(subscription_, {received_.ack_id});
    } catch (const std::exception&) {
        unmark();
        throw;
    }
}

void AcknowledgeableMessage::modify_ack_deadline(std::chrono::milliseconds deadline) {
    if (state_.load() != State::Delivered) {
        return;
    }
    acknowledger_->modify_ack_deadline(subscription_, {received_.ack_id}, deadline);
}

bool AcknowledgeableMessage::mark(State to) {
    auto expected = State::Delivered;
    return state_.compare_exchange_strong(expected, to);
}

void AcknowledgeableMessage::unmark() {
    state_.store(State::Delivered);
}

void AcknowledgeableMessage::resolve_batch(const std::vector<AcknowledgeableMessagePtr>& messages, State to,
                                           Resolve resolve) {
    if (messages.empty()) {
        return;
    }
    check_single_subscription(messages);

    std::map<Acknowledger*, std::vector<AcknowledgeableMessagePtr>> groups;
    for (const auto& message : messages) {
        if (message->mark(to)) {
            groups[message->acknowledger().get()].push_back(message);
        }
    }

    // Groups from the failing one onwards were never resolved at the service.
    const auto& subscription = messages.front()->subscription();
    for (auto group = groups.begin(); group != groups.end(); ++group) {
        std::vector<std::string> ack_ids;
        ack_ids.reserve(group->second.size());
        for (const auto& message : group->second) {
            ack_ids.push_back(message->ack_id());
        }
        try {
            (group->first->*resolve)(subscription, ack_ids);
        } catch (const std::exception&) {
            for (auto pending = group; pending != groups.end(); ++pending) {
                for (const auto& message : pending->second) {
                    message->unmark();
                }
            }
            throw;
        }
    }
}

void acknowledge_all(const std::vector<AcknowledgeableMessagePtr>& messages) {
    AcknowledgeableMessage::resolve_batch(messages, AcknowledgeableMessage::State::Acknowledged,
                                          &Acknowledger::acknowledge);
}

void negative_acknowledge_all(const std::vector<AcknowledgeableMessagePtr>& messages) {
    AcknowledgeableMessage::resolve_batch(messages, AcknowledgeableMessage::State::NegativelyAcknowledged,
                                          &Acknowledger::negative_acknowledge);
}

} // namespace courier
