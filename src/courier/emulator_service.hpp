#pragma once

#include "logging.hpp"
#include "transport.hpp"
#include "wire_protocol.hpp"

namespace courier {

/**
 * Decodes wire requests, runs them against a backing transport and encodes
 * the reply. Never throws: every failure becomes an error reply carrying its
 * status code.
 */
class EmulatorService {
public:
    explicit EmulatorService(Transport& backend);

    wire::Frames handle(const wire::Frames& request);

private:
    void dispatch(const std::string& operation, wire::FrameReader& arguments, std::chrono::milliseconds timeout,
                  wire::FrameWriter& results);

    Transport& backend_;
    LoggerPtr logger_;
};

} // namespace courier
