#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "cancellation.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcpcore {

struct DispatcherOptions {
    Implementation server_info{"mcpcore", std::nullopt, "0.1.0"};
    std::optional<std::string> instructions;
};

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   const RequestContext& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Turns decoded requests into handler invocations and well-formed responses.
///
/// The method table is pre-populated with initialize, ping, tools/list,
/// tools/call, prompts/list, prompts/get and the initialized/cancelled
/// notifications. Every error raised while handling a request becomes a
/// JSON-RPC error response; nothing escapes handle().
class Dispatcher {
public:
    Dispatcher(const Registry& registry, DispatcherOptions opts);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one request. The returned response always carries `req.id`.
    /// A token that is already cancelled short-circuits to RequestCancelled.
    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& req,
                                         const CancellationToken& token = {});

    /// Dispatch any decoded message. Requests are tracked as in flight while
    /// they run. Returns a response for requests, nullopt otherwise.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    /// Register (or replace) a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register (or replace) a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    // ---- In-flight tracking ----

    /// Mark a request as in flight and return the token that cancels it.
    /// Requests reusing an id that is still in flight share its token.
    CancellationToken begin_request(const RequestId& id);

    /// Drop the in-flight record taken by begin_request().
    void end_request(const RequestId& id);

    /// Cancel one in-flight request. Returns false if the id is unknown.
    bool cancel(const RequestId& id);

    /// Cancel every in-flight request. Returns how many were cancelled.
    size_t cancel_all();

    [[nodiscard]] size_t in_flight() const;

    // ---- Handshake state ----
    [[nodiscard]] bool initialized() const;
    [[nodiscard]] std::string protocol_version() const;

    [[nodiscard]] const Registry& registry() const { return registry_; }

private:
    struct InFlight {
        CancellationToken token;
        int refs = 0;
    };

    void setup_handlers();
    ServerCapabilities build_capabilities() const;

    HandlerResult initialize(const nlohmann::json& params);
    HandlerResult call_tool(const nlohmann::json& params, const RequestContext& ctx) const;
    HandlerResult get_prompt(const nlohmann::json& params) const;
    void on_cancelled(const nlohmann::json& params);

    const Registry& registry_;
    DispatcherOptions opts_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;

    mutable std::mutex in_flight_mutex_;
    std::map<RequestId, InFlight> in_flight_;

    mutable std::mutex state_mutex_;
    bool initialized_ = false;
    std::string protocol_version_;
};

} // namespace mcpcore
