#pragma once

#include "acknowledgeable_message.hpp"
#include "logging.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <vector>

namespace courier {

/**
 * Synchronous, bounded pulls. Each call blocks until the pull RPC completes or
 * the retry policy gives up. Messages returned by pull() are resolved through
 * this Puller, so it must be created with std::make_shared.
 */
class Puller : public Acknowledger, public std::enable_shared_from_this<Puller> {
public:
    Puller(std::shared_ptr<Transport> transport, const RetrySettings& retry);

    // Up to `max_messages` messages, possibly none.
    std::vector<AcknowledgeableMessagePtr> pull(const std::string& subscription, int max_messages);

    // Pulls and acknowledges in one RPC. A failed acknowledgment is logged and
    // the messages are still returned.
    std::vector<Message> pull_and_ack(const std::string& subscription, int max_messages);

    // Pulls at most one message and acknowledges it.
    boost::optional<Message> pull_next(const std::string& subscription);

    void ack(const std::vector<AcknowledgeableMessagePtr>& messages);

    void nack(const std::vector<AcknowledgeableMessagePtr>& messages);

    void modify_ack_deadline(const std::vector<AcknowledgeableMessagePtr>& messages,
                             std::chrono::milliseconds deadline);

    void acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) override;

    void negative_acknowledge(const std::string& subscription, const std::vector<std::string>& ack_ids) override;

    void modify_ack_deadline(const std::string& subscription, const std::vector<std::string>& ack_ids,
                             std::chrono::milliseconds deadline) override;

private:
    std::shared_ptr<Transport> transport_;
    RetryPolicy retry_;
    LoggerPtr logger_;
};

} // namespace courier
