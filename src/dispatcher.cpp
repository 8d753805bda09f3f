#include "mcpcore/dispatcher.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/logging.hpp"
#include "mcpcore/version.hpp"

namespace mcpcore {

namespace {

const nlohmann::json& require_object_params(const nlohmann::json& params) {
    if (!params.is_object()) {
        throw McpProtocolError(error::InvalidParams, "params must be an object");
    }
    return params;
}

std::string require_name(const nlohmann::json& params) {
    auto it = params.find("name");
    if (it == params.end() || !it->is_string()) {
        throw McpProtocolError(error::InvalidParams, "params.name must be a string");
    }
    return it->get<std::string>();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    if (!it->is_object()) {
        throw McpProtocolError(error::InvalidParams, "params.arguments must be an object");
    }
    return *it;
}

} // anonymous namespace

Dispatcher::Dispatcher(const Registry& registry, DispatcherOptions opts)
    : registry_(registry), opts_(std::move(opts)) {
    setup_handlers();
}

void Dispatcher::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    request_handlers_[method] = std::move(handler);
}

void Dispatcher::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Dispatcher::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

// ---------------------------------------------------------------------------
// Built-in methods
// ---------------------------------------------------------------------------

ServerCapabilities Dispatcher::build_capabilities() const {
    ServerCapabilities caps;
    if (registry_.tool_count() > 0) {
        caps.tools = ListCapability{};
    }
    if (registry_.prompt_count() > 0) {
        caps.prompts = ListCapability{};
    }
    return caps;
}

HandlerResult Dispatcher::initialize(const nlohmann::json& params) {
    std::string requested;
    if (params.is_object() && params.contains("protocolVersion")
        && params.at("protocolVersion").is_string()) {
        requested = params.at("protocolVersion").get<std::string>();
    }

    // Negotiate protocol version - we accept the client's if we support it
    std::string negotiated(PROTOCOL_VERSION);
    for (auto supported : SUPPORTED_PROTOCOL_VERSIONS) {
        if (requested == supported) {
            negotiated = requested;
            break;
        }
    }

    std::string client = "unknown client";
    if (params.is_object() && params.contains("clientInfo")
        && params.at("clientInfo").is_object()) {
        client = params.at("clientInfo").value("name", client);
    }
    logging::get()->info("Initialize from {} (requested protocol '{}', using '{}')",
                         client, requested, negotiated);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        protocol_version_ = negotiated;
    }

    InitializeResult result;
    result.protocol_version = negotiated;
    result.capabilities = build_capabilities();
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::call_tool(const nlohmann::json& params,
                                    const RequestContext& ctx) const {
    require_object_params(params);
    std::string name = require_name(params);
    nlohmann::json arguments = arguments_of(params);

    const ToolEntry& entry = registry_.resolve_tool(name);
    entry.schema.check(arguments);

    CallToolResult result = entry.handler(arguments, ctx);
    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::get_prompt(const nlohmann::json& params) const {
    require_object_params(params);
    std::string name = require_name(params);
    nlohmann::json arguments = arguments_of(params);

    const PromptEntry& entry = registry_.resolve_prompt(name);
    auto problems = validate_prompt_arguments(entry.definition, arguments);
    if (!problems.empty()) {
        throw ValidationError(std::move(problems));
    }

    GetPromptResult result = entry.handler(name, arguments);
    nlohmann::json j;
    to_json(j, result);
    return j;
}

void Dispatcher::on_cancelled(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("requestId")) {
        logging::get()->debug("Ignoring cancellation without requestId");
        return;
    }
    RequestId id;
    try {
        from_json(params.at("requestId"), id);
    } catch (const std::invalid_argument&) {
        logging::get()->debug("Ignoring cancellation with malformed requestId");
        return;
    }
    std::string reason = params.value("reason", std::string());
    if (cancel(id)) {
        logging::get()->info("Cancelled request {}{}{}", to_string(id),
                             reason.empty() ? "" : ": ", reason);
    } else {
        logging::get()->debug("Cancellation for unknown request {}", to_string(id));
    }
}

void Dispatcher::setup_handlers() {
    on_request("initialize", [this](const nlohmann::json& params, const RequestContext&) {
        return initialize(params);
    });

    on_notification("notifications/initialized", [this](const nlohmann::json&) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        initialized_ = true;
    });

    on_request("ping", [](const nlohmann::json&, const RequestContext&) -> HandlerResult {
        return nlohmann::json::object();
    });

    // Discovery never runs a handler.
    on_request("tools/list", [this](const nlohmann::json&, const RequestContext&) -> HandlerResult {
        return nlohmann::json{{"tools", registry_.list_tools()}};
    });

    on_request("prompts/list", [this](const nlohmann::json&, const RequestContext&) -> HandlerResult {
        return nlohmann::json{{"prompts", registry_.list_prompts()}};
    });

    on_request("tools/call", [this](const nlohmann::json& params, const RequestContext& ctx) {
        return call_tool(params, ctx);
    });

    on_request("prompts/get", [this](const nlohmann::json& params, const RequestContext&) {
        return get_prompt(params);
    });

    on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
        on_cancelled(params);
    });
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

JsonRpcResponse Dispatcher::handle(const JsonRpcRequest& req, const CancellationToken& token) {
    auto log = logging::get();
    log->debug("-> {} ({})", req.method, to_string(req.id));

    if (token.is_cancelled()) {
        return make_error(req.id, error::RequestCancelled, "Request cancelled");
    }

    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            log->debug("Method not found: {}", req.method);
            return make_error(req.id, error::MethodNotFound, "Method not found: " + req.method);
        }
        handler = it->second;
    }

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    RequestContext ctx{req.id, token};

    // Call handler WITHOUT holding the lock; handlers may re-enter the dispatcher.
    try {
        auto result = handler(params, ctx);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return make_error(req.id, std::move(*err));
        }
        return make_result(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const ValidationError& e) {
        log->debug("{} ({}): {}", req.method, to_string(req.id), e.what());
        return make_error(req.id, JsonRpcError{error::InvalidParams, e.what(),
                                               nlohmann::json{{"errors", e.problems}}});
    } catch (const NotFoundError& e) {
        log->debug("{} ({}): {}", req.method, to_string(req.id), e.what());
        return make_error(req.id, error::NotFound, e.what());
    } catch (const CancelledError& e) {
        log->info("{} ({}) cancelled", req.method, to_string(req.id));
        return make_error(req.id, error::RequestCancelled, e.what());
    } catch (const McpProtocolError& e) {
        return make_error(req.id, e.code, e.what());
    } catch (const std::exception& e) {
        log->warn("Handler for {} ({}) failed: {}", req.method, to_string(req.id), e.what());
        return make_error(req.id, error::InternalError, e.what());
    }
}

std::optional<JsonRpcMessage> Dispatcher::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        CancellationToken token = begin_request(req->id);
        JsonRpcResponse resp = handle(*req, token);
        end_request(req->id);
        return resp;
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) {
                logging::get()->debug("Ignoring notification {}", notif->method);
                return std::nullopt;
            }
            handler = it->second;
        }
        try {
            handler(notif->params ? *notif->params : nlohmann::json::object());
        } catch (const std::exception& e) {
            // Notifications don't return responses
            logging::get()->warn("Notification handler for {} failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        // This server never issues requests, so there is nothing to correlate.
        logging::get()->debug("Ignoring unsolicited response ({})", to_string(resp->id));
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// In-flight tracking
// ---------------------------------------------------------------------------

CancellationToken Dispatcher::begin_request(const RequestId& id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto& entry = in_flight_[id];
    if (entry.refs > 0) {
        logging::get()->warn("Request id {} is already in flight", to_string(id));
    }
    ++entry.refs;
    return entry.token;
}

void Dispatcher::end_request(const RequestId& id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(id);
    if (it != in_flight_.end() && --it->second.refs <= 0) {
        in_flight_.erase(it);
    }
}

bool Dispatcher::cancel(const RequestId& id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(id);
    if (it == in_flight_.end()) return false;
    it->second.token.cancel();
    return true;
}

size_t Dispatcher::cancel_all() {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    for (auto& [id, entry] : in_flight_) {
        entry.token.cancel();
    }
    return in_flight_.size();
}

size_t Dispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

bool Dispatcher::initialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return initialized_;
}

std::string Dispatcher::protocol_version() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return protocol_version_;
}

} // namespace mcpcore
