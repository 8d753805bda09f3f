#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mcpcore::logging {

constexpr const char* LOGGER_NAME = "mcpcore";

/// The library logger. Writes to stderr; stdout carries protocol frames.
std::shared_ptr<spdlog::logger> get();

/// Set the level of the library logger (and the default logger it replaces).
void init(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws std::invalid_argument for anything else.
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace mcpcore::logging
