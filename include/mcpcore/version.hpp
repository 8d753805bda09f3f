#pragma once
#include <string_view>

namespace mcpcore {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol revisions accepted from a client during initialize, newest first.
constexpr std::string_view SUPPORTED_PROTOCOL_VERSIONS[] = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

} // namespace mcpcore
