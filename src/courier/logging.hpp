#pragma once

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace courier {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * Returns the registered logger with the given name, cloning the default
 * logger (sinks and level) on first use.
 */
LoggerPtr get_logger(const std::string& name);

// Applies the level to the default logger and every registered logger.
// Throws PubSubError(InvalidArgument) for an unknown level name.
void set_log_level(const std::string& level);

} // namespace courier
