#pragma once
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace mcpcore {

/// {"jsonrpc":"2.0","error":{"code":code,"message":message}}
/// Reported when the process cannot start or dies outside any request.
[[nodiscard]] nlohmann::json error_envelope(int code, const std::string& message);

/// Write the envelope as one line and flush.
void write_error_envelope(std::ostream& out, int code, const std::string& message);

/// Envelope for a failure while serving: code ServerFailure, message
/// "Server error: <what>".
void write_server_failure(std::ostream& out, const std::string& what);

} // namespace mcpcore
