#pragma once

#include "types.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/variant.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace courier {

enum class PayloadType { Bytes, String, Json };

using Bytes = std::vector<std::uint8_t>;
using JsonTree = boost::property_tree::ptree;
using Payload = boost::variant<Bytes, std::string, JsonTree>;

/**
 * Codec between typed payloads and the wire envelope. Converters are plain
 * values holding stateless functions; they are selected by name from the
 * configuration and may be shared across threads.
 *
 * Unsupported payload types fail with PubSubError(InvalidArgument).
 */
struct MessageConverter {
    std::string name;
    std::function<Message(const Payload&, const Headers&)> to_wire_format;
    std::function<Payload(const Message&, PayloadType)> from_wire_format;
};

// Bytes and strings only.
MessageConverter make_default_converter();

// Bytes, strings and JSON trees.
MessageConverter make_json_converter();

// "default" or "json".
MessageConverter make_converter(const std::string& name);

PayloadType payload_type_of(const Payload& payload);

const char* payload_type_name(PayloadType type);

} // namespace courier
