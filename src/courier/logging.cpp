#include "logging.hpp"
#include "errors.hpp"

#include <mutex>

namespace courier {

namespace {

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

LoggerPtr get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    auto logger = spdlog::default_logger()->clone(name);
    spdlog::register_logger(logger);
    return logger;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw PubSubError(StatusCode::InvalidArgument, "unknown log level '" + level + "'");
    }

    spdlog::set_level(parsed);
}

} // namespace courier
