#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcpcore {

/// Correlation identifier linking a request to its response.
using RequestId = std::variant<int64_t, std::string>;

/// Human-readable form for logs: integers bare, strings quoted.
std::string to_string(const RequestId& id);

void to_json(nlohmann::json& j, const RequestId& id);
/// Throws std::invalid_argument unless `j` is an integer or a string.
void from_json(const nlohmann::json& j, RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of `result` and `error` is set on a well-formed response.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }

    [[nodiscard]] bool is_error() const { return error.has_value(); }
};

[[nodiscard]] JsonRpcResponse make_result(const RequestId& id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(const RequestId& id, JsonRpcError error);
[[nodiscard]] JsonRpcResponse make_error(const RequestId& id, int code, const std::string& message);

/// A request without an id. Never answered.
struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace mcpcore
