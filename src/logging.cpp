#include "mcpcore/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace mcpcore::logging {

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

void init(spdlog::level::level_enum level) {
    auto logger = get();
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace mcpcore::logging
