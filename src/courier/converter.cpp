#include "converter.hpp"
#include "errors.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <sstream>

namespace courier {

namespace {

const char* const kContentType = "content-type";

PubSubError unsupported(const std::string& converter, PayloadType type) {
    return PubSubError(StatusCode::InvalidArgument, std::string("converter '") + converter +
                                                        "' does not support payload type " + payload_type_name(type));
}

bool encode_plain(const Payload& payload, std::string& data) {
    if (const auto* bytes = boost::get<Bytes>(&payload)) {
        data.assign(bytes->begin(), bytes->end());
        return true;
    }
    if (const auto* text = boost::get<std::string>(&payload)) {
        data = *text;
        return true;
    }
    return false;
}

bool decode_plain(const Message& message, PayloadType type, Payload& payload) {
    switch (type) {
    case PayloadType::Bytes:
        payload = Bytes(message.data.begin(), message.data.end());
        return true;
    case PayloadType::String:
        payload = message.data;
        return true;
    case PayloadType::Json:
        return false;
    }
    return false;
}

} // namespace

MessageConverter make_default_converter() {
    MessageConverter converter;
    converter.name = "default";
    converter.to_wire_format = [](const Payload& payload, const Headers& headers) {
        Message message;
        if (!encode_plain(payload, message.data)) {
            throw unsupported("default", payload_type_of(payload));
        }
        message.headers = headers;
        return message;
    };
    converter.from_wire_format = [](const Message& message, PayloadType type) {
        Payload payload;
        if (!decode_plain(message, type, payload)) {
            throw unsupported("default", type);
        }
        return payload;
    };
    return converter;
}

MessageConverter make_json_converter() {
    MessageConverter converter;
    converter.name = "json";
    converter.to_wire_format = [](const Payload& payload, const Headers& headers) {
        Message message;
        message.headers = headers;
        if (const auto* tree = boost::get<JsonTree>(&payload)) {
            std::ostringstream out;
            boost::property_tree::write_json(out, *tree, false);
            message.data = out.str();
            message.headers.emplace(kContentType, "application/json");
        } else {
            encode_plain(payload, message.data);
        }
        return message;
    };
    converter.from_wire_format = [](const Message& message, PayloadType type) {
        Payload payload;
        if (decode_plain(message, type, payload)) {
            return payload;
        }

        std::istringstream in(message.data);
        JsonTree tree;
        try {
            boost::property_tree::read_json(in, tree);
        } catch (const boost::property_tree::json_parser_error& e) {
            throw PubSubError(StatusCode::InvalidArgument,
                              "message " + message.message_id + " is not valid JSON: " + e.what());
        }
        payload = tree;
        return payload;
    };
    return converter;
}

MessageConverter make_converter(const std::string& name) {
    if (name == "default") {
        return make_default_converter();
    }
    if (name == "json") {
        return make_json_converter();
    }
    throw PubSubError(StatusCode::InvalidArgument, "unknown converter '" + name + "'");
}

PayloadType payload_type_of(const Payload& payload) {
    switch (payload.which()) {
    case 0: return PayloadType::Bytes;
    case 1: return PayloadType::String;
    default: return PayloadType::Json;
    }
}

const char* payload_type_name(PayloadType type) {
    switch (type) {
    case PayloadType::Bytes:  return "bytes";
    case PayloadType::String: return "string";
    case PayloadType::Json:   return "json";
    }
    return "unknown";
}

} // namespace courier
