#pragma once

#include "types.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace courier {

/**
 * Builds a ClientConfig from a YAML document. Missing keys keep their
 * defaults; malformed values raise PubSubError(InvalidArgument) naming the key.
 */
ClientConfig load_config(const YAML::Node& root);

ClientConfig load_config_file(const std::string& path);

LimitExceededBehavior parse_limit_exceeded_behavior(const std::string& name);

const char* limit_exceeded_behavior_name(LimitExceededBehavior behavior);

} // namespace courier
