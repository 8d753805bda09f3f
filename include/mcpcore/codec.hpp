#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string_view>

namespace mcpcore {

class Codec {
public:
    /// Parse one frame payload into a message.
    /// Throws McpParseError: code ParseError for invalid JSON, InvalidRequest
    /// for JSON that is not a JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Best-effort extraction of the "id" member from a payload that failed
    /// to parse as a message. Returns nullopt when no usable id is present.
    [[nodiscard]] static std::optional<RequestId> recover_id(std::string_view raw);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpcore
