#include "mcpcore/config.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/logging.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace mcpcore {

namespace {

unsigned long long parse_unsigned(const char* name, const std::string& value,
                                  unsigned long long max) {
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (value.empty() || value[0] == '-' || value[0] == '+') {
            throw std::invalid_argument(value);
        }
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw StartupError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw StartupError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    if (parsed > max) {
        throw StartupError(std::string(name) + " is out of range: " + value);
    }
    return parsed;
}

} // anonymous namespace

std::string env_or(const char* name, const std::string& fallback) {
    if (name == nullptr || *name == '\0') {
        return fallback;
    }
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

ServerOptions ServerOptions::from_env(ServerOptions defaults) {
    ServerOptions opts = std::move(defaults);

    std::string framing = env_or("MCPCORE_FRAMING", "");
    if (!framing.empty()) {
        try {
            opts.framing = framing_mode_from_string(framing);
        } catch (const std::invalid_argument& e) {
            throw StartupError(std::string("MCPCORE_FRAMING: ") + e.what());
        }
    }

    std::string max_bytes = env_or("MCPCORE_MAX_FRAME_BYTES", "");
    if (!max_bytes.empty()) {
        opts.max_frame_bytes = static_cast<size_t>(
            parse_unsigned("MCPCORE_MAX_FRAME_BYTES", max_bytes,
                           std::numeric_limits<size_t>::max()));
        if (opts.max_frame_bytes == 0) {
            throw StartupError("MCPCORE_MAX_FRAME_BYTES must be positive");
        }
    }

    std::string workers = env_or("MCPCORE_WORKERS", "");
    if (!workers.empty()) {
        opts.worker_threads = static_cast<int>(parse_unsigned("MCPCORE_WORKERS", workers, 256));
    }

    std::string level = env_or("MCPCORE_LOG_LEVEL", "");
    if (!level.empty()) {
        try {
            logging::parse_level(level);
        } catch (const std::invalid_argument& e) {
            throw StartupError(std::string("MCPCORE_LOG_LEVEL: ") + e.what());
        }
        opts.log_level = level;
    }

    return opts;
}

} // namespace mcpcore
