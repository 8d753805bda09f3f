#include "mcpcore/json_rpc.hpp"
#include "mcpcore/version.hpp"
#include <limits>
#include <stdexcept>

namespace mcpcore {

namespace {

nlohmann::json envelope(const RequestId* id = nullptr) {
    nlohmann::json j{{"jsonrpc", std::string(JSONRPC_VERSION)}};
    // std::variant is outside ADL reach of the serializer; convert by hand.
    if (id) to_json(j["id"], *id);
    return j;
}

} // anonymous namespace

// ---------- RequestId ----------

std::string to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return std::to_string(*i);
    }
    return "\"" + std::get<std::string>(id) + "\"";
}

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()
        && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        // Narrowing would answer under a different id.
        throw std::invalid_argument("id " + j.dump() + " is outside the signed 64-bit range");
    }
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument(std::string("id must be an integer or a string, got ")
                                    + j.type_name());
    }
}

// ---------- Builders ----------

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result) {
    return JsonRpcResponse{id, std::move(result), std::nullopt};
}

JsonRpcResponse make_error(const RequestId& id, JsonRpcError error) {
    return JsonRpcResponse{id, std::nullopt, std::move(error)};
}

JsonRpcResponse make_error(const RequestId& id, int code, const std::string& message) {
    return make_error(id, JsonRpcError{code, message, std::nullopt});
}

// ---------- Wire form ----------

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    j.at("code").get_to(e.code);
    j.at("message").get_to(e.message);
    e.data.reset();
    if (auto it = j.find("data"); it != j.end()) e.data = *it;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope(&r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    j.at("method").get_to(r.method);
    r.params.reset();
    if (auto it = j.find("params"); it != j.end()) r.params = *it;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope(&r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A response always carries one of the two members.
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    r.result.reset();
    r.error.reset();
    if (auto it = j.find("result"); it != j.end()) r.result = *it;
    if (auto it = j.find("error"); it != j.end()) r.error = it->get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    j.at("method").get_to(n.method);
    n.params.reset();
    if (auto it = j.find("params"); it != j.end()) n.params = *it;
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpcore
