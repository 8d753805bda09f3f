#include "mcpcore/startup.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/version.hpp"

namespace mcpcore {

nlohmann::json error_envelope(int code, const std::string& message) {
    return nlohmann::json{
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"error", {{"code", code}, {"message", message}}},
    };
}

void write_error_envelope(std::ostream& out, int code, const std::string& message) {
    out << error_envelope(code, message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        << std::endl;
}

void write_server_failure(std::ostream& out, const std::string& what) {
    write_error_envelope(out, error::ServerFailure, "Server error: " + what);
}

} // namespace mcpcore
