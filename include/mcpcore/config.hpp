#pragma once
#include "types.hpp"
#include "framing.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace mcpcore {

struct ServerOptions {
    Implementation server_info{"mcpcore", std::nullopt, "0.1.0"};
    std::optional<std::string> instructions;
    FramingMode framing = FramingMode::Newline;
    size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;
    /// 0 processes requests one at a time on the reading thread.
    int worker_threads = 0;
    std::string log_level = "info";

    /// Overlay MCPCORE_FRAMING, MCPCORE_MAX_FRAME_BYTES, MCPCORE_WORKERS and
    /// MCPCORE_LOG_LEVEL onto `defaults`. Unset or empty variables keep the
    /// default. Throws StartupError for values that do not parse.
    static ServerOptions from_env(ServerOptions defaults);

    static ServerOptions from_env() { return from_env(ServerOptions{}); }
};

/// Returns the value of the environment variable, or `fallback` when it is
/// unset or empty.
std::string env_or(const char* name, const std::string& fallback);

} // namespace mcpcore
