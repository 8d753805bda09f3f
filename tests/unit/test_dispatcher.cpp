#include <gtest/gtest.h>
#include "mcpcore/dispatcher.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/version.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace mcpcore;
using namespace std::chrono_literals;

namespace {

JsonRpcRequest request(RequestId id, const std::string& method,
                       std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

JsonRpcRequest call(int64_t id, const std::string& tool, nlohmann::json args) {
    return request(RequestId{id}, "tools/call", nlohmann::json{{"name", tool}, {"arguments", std::move(args)}});
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ToolDefinition echo;
        echo.name = "echo";
        echo.description = "Echo back the provided message";
        echo.input_schema = SchemaBuilder().required("message", FieldType::String).build();
        registry.add_tool(echo, ToolHandler([this](const nlohmann::json& args) {
            ++echo_calls;
            return text_result("Echo: " + args.at("message").get<std::string>());
        }));

        ToolDefinition upper;
        upper.name = "uppercase";
        upper.input_schema = SchemaBuilder().required("text", FieldType::String).build();
        registry.add_tool(upper, ToolHandler([](const nlohmann::json&) { return text_result("X"); }));

        PromptDefinition greeting;
        greeting.name = "greeting";
        greeting.arguments.push_back({"name", std::string("Name to greet"), true});
        registry.add_prompt(greeting, [this](const std::string&, const nlohmann::json& args) {
            ++prompt_calls;
            GetPromptResult r;
            r.messages.push_back({Role::User, TextContent{
                "Hello, " + args.at("name").get<std::string>() + "! How are you today?", std::nullopt}});
            return r;
        });
    }

    void add_tool(const std::string& name, ContextToolHandler handler) {
        ToolDefinition def;
        def.name = name;
        registry.add_tool(def, std::move(handler));
    }

    Dispatcher& dispatcher() {
        if (!dispatcher_) {
            registry.seal();
            dispatcher_ = std::make_unique<Dispatcher>(
                registry, DispatcherOptions{{"test-server", std::nullopt, "1.0"}, std::string("hello")});
        }
        return *dispatcher_;
    }

    Registry registry;
    std::atomic<int> echo_calls{0};
    std::atomic<int> prompt_calls{0};

private:
    std::unique_ptr<Dispatcher> dispatcher_;
};

} // namespace

// ---- Discovery ----

TEST_F(DispatcherTest, ListToolsInRegistrationOrder) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{1}}, "tools/list"));
    ASSERT_FALSE(resp.is_error());
    const auto& tools = resp.result->at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["description"], "Echo back the provided message");
    EXPECT_EQ(tools[0]["inputSchema"]["required"][0], "message");
    EXPECT_EQ(tools[1]["name"], "uppercase");
    EXPECT_EQ(echo_calls.load(), 0);
}

TEST_F(DispatcherTest, ListPrompts) {
    auto resp = dispatcher().handle(request(RequestId{std::string{"p"}}, "prompts/list"));
    ASSERT_FALSE(resp.is_error());
    const auto& prompts = resp.result->at("prompts");
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0]["name"], "greeting");
    EXPECT_EQ(prompts[0]["arguments"][0]["required"], true);
    EXPECT_EQ(prompt_calls.load(), 0);
}

// ---- Not found ----

TEST_F(DispatcherTest, UnknownMethod) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{17}}, "resources/list"));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(std::get<int64_t>(resp.id), 17);
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Method not found: resources/list");
}

TEST_F(DispatcherTest, UnknownTool) {
    auto resp = dispatcher().handle(call(3, "nonexistent", nlohmann::json::object()));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(std::get<int64_t>(resp.id), 3);
    EXPECT_EQ(resp.error->code, error::NotFound);
    EXPECT_EQ(resp.error->message, "Tool not found: nonexistent");
}

TEST_F(DispatcherTest, UnknownPrompt) {
    auto resp = dispatcher().handle(request(RequestId{std::string{"g"}}, "prompts/get",
                                            nlohmann::json{{"name", "farewell"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(std::get<std::string>(resp.id), "g");
    EXPECT_EQ(resp.error->code, error::NotFound);
    EXPECT_EQ(resp.error->message, "Prompt not found: farewell");
}

// ---- Invocation ----

TEST_F(DispatcherTest, EchoTool) {
    auto resp = dispatcher().handle(call(1, "echo", {{"message", "hi"}}));
    ASSERT_FALSE(resp.is_error());
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
    const auto& content = resp.result->at("content");
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "Echo: hi");
    EXPECT_FALSE(resp.result->contains("isError"));
    EXPECT_EQ(echo_calls.load(), 1);
}

TEST_F(DispatcherTest, MissingArgumentNeverInvokesHandler) {
    auto resp = dispatcher().handle(call(2, "echo", nlohmann::json::object()));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(std::get<int64_t>(resp.id), 2);
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_NE(resp.error->message.find("missing required field 'message'"), std::string::npos);
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ(resp.error->data->at("errors").size(), 1u);
    EXPECT_EQ(echo_calls.load(), 0);
}

TEST_F(DispatcherTest, WrongArgumentTypeNeverInvokesHandler) {
    auto resp = dispatcher().handle(call(2, "echo", {{"message", 5}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(echo_calls.load(), 0);
}

TEST_F(DispatcherTest, MissingArgumentsMemberIsEmptyObject) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{4}}, "tools/call",
                                            nlohmann::json{{"name", "echo"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_NE(resp.error->message.find("message"), std::string::npos);
}

TEST_F(DispatcherTest, MalformedCallParams) {
    auto no_name = dispatcher().handle(request(RequestId{int64_t{1}}, "tools/call",
                                               nlohmann::json{{"arguments", nlohmann::json::object()}}));
    EXPECT_EQ(no_name.error->code, error::InvalidParams);

    auto bad_args = dispatcher().handle(request(RequestId{int64_t{2}}, "tools/call",
                                                nlohmann::json{{"name", "echo"}, {"arguments", "hi"}}));
    EXPECT_EQ(bad_args.error->code, error::InvalidParams);

    auto array_params = dispatcher().handle(request(RequestId{int64_t{3}}, "tools/call",
                                                    nlohmann::json::array({"echo"})));
    EXPECT_EQ(array_params.error->code, error::InvalidParams);
    EXPECT_EQ(echo_calls.load(), 0);
}

TEST_F(DispatcherTest, HandlerErrorBecomesInternalError) {
    add_tool("fail", [](const nlohmann::json&, const RequestContext&) -> CallToolResult {
        throw HandlerError("disk on fire");
    });
    add_tool("crash", [](const nlohmann::json&, const RequestContext&) -> CallToolResult {
        throw std::out_of_range("index 9");
    });

    auto resp = dispatcher().handle(call(5, "fail", nlohmann::json::object()));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "disk on fire");

    auto crash = dispatcher().handle(call(6, "crash", nlohmann::json::object()));
    EXPECT_EQ(crash.error->code, error::InternalError);
    EXPECT_EQ(crash.error->message, "index 9");

    // The dispatcher keeps serving afterwards.
    EXPECT_FALSE(dispatcher().handle(call(7, "echo", {{"message", "still here"}})).is_error());
}

TEST_F(DispatcherTest, ProtocolErrorKeepsItsCode) {
    add_tool("picky", [](const nlohmann::json&, const RequestContext&) -> CallToolResult {
        throw McpProtocolError(-32001, "rate limited");
    });
    auto resp = dispatcher().handle(call(8, "picky", nlohmann::json::object()));
    EXPECT_EQ(resp.error->code, -32001);
    EXPECT_EQ(resp.error->message, "rate limited");
}

TEST_F(DispatcherTest, PreCancelledTokenSkipsHandler) {
    CancellationToken token;
    token.cancel();
    auto resp = dispatcher().handle(call(9, "echo", {{"message", "hi"}}), token);
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::RequestCancelled);
    EXPECT_EQ(echo_calls.load(), 0);
}

TEST_F(DispatcherTest, CustomMethodHandler) {
    dispatcher().on_request("custom/sum", [](const nlohmann::json& p, const RequestContext&) -> HandlerResult {
        if (!p.contains("a")) return JsonRpcError{error::InvalidParams, "a required", std::nullopt};
        return nlohmann::json{{"sum", p["a"].get<int>() + 1}};
    });
    EXPECT_TRUE(dispatcher().has_handler("custom/sum"));

    auto ok = dispatcher().handle(request(RequestId{int64_t{1}}, "custom/sum", nlohmann::json{{"a", 1}}));
    EXPECT_EQ(ok.result->at("sum"), 2);
    auto bad = dispatcher().handle(request(RequestId{int64_t{2}}, "custom/sum", nlohmann::json::object()));
    EXPECT_EQ(bad.error->code, error::InvalidParams);
}

// ---- Prompts ----

TEST_F(DispatcherTest, GetPrompt) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{1}}, "prompts/get",
                                            nlohmann::json{{"name", "greeting"}, {"arguments", {{"name", "Ada"}}}}));
    ASSERT_FALSE(resp.is_error());
    const auto& msg = resp.result->at("messages")[0];
    EXPECT_EQ(msg["role"], "user");
    EXPECT_EQ(msg["content"]["text"], "Hello, Ada! How are you today?");
}

TEST_F(DispatcherTest, PromptMissingArgument) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{1}}, "prompts/get",
                                            nlohmann::json{{"name", "greeting"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(prompt_calls.load(), 0);
}

// ---- Handshake ----

TEST_F(DispatcherTest, InitializeNegotiatesSupportedVersion) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{0}}, "initialize",
        nlohmann::json{{"protocolVersion", "2024-11-05"},
                       {"clientInfo", {{"name", "ruby-client"}, {"version", "1"}}},
                       {"capabilities", nlohmann::json::object()}}));
    ASSERT_FALSE(resp.is_error());
    EXPECT_EQ(resp.result->at("protocolVersion"), "2024-11-05");
    EXPECT_EQ(resp.result->at("serverInfo")["name"], "test-server");
    EXPECT_EQ(resp.result->at("instructions"), "hello");
    EXPECT_TRUE(resp.result->at("capabilities").contains("tools"));
    EXPECT_TRUE(resp.result->at("capabilities").contains("prompts"));
    EXPECT_EQ(dispatcher().protocol_version(), "2024-11-05");
}

TEST_F(DispatcherTest, InitializeFallsBackToLatestVersion) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{0}}, "initialize",
        nlohmann::json{{"protocolVersion", "1999-01-01"}}));
    EXPECT_EQ(resp.result->at("protocolVersion"), std::string(PROTOCOL_VERSION));
}

TEST_F(DispatcherTest, InitializedNotification) {
    EXPECT_FALSE(dispatcher().initialized());
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    EXPECT_FALSE(dispatcher().dispatch(notif).has_value());
    EXPECT_TRUE(dispatcher().initialized());
}

TEST_F(DispatcherTest, Ping) {
    auto resp = dispatcher().handle(request(RequestId{int64_t{1}}, "ping"));
    ASSERT_FALSE(resp.is_error());
    EXPECT_EQ(*resp.result, nlohmann::json::object());
}

// ---- dispatch() ----

TEST_F(DispatcherTest, DispatchIgnoresUnknownNotificationsAndResponses) {
    JsonRpcNotification notif;
    notif.method = "notifications/progress";
    EXPECT_FALSE(dispatcher().dispatch(notif).has_value());

    EXPECT_FALSE(dispatcher().dispatch(make_result(RequestId{int64_t{1}}, nlohmann::json::object())).has_value());
}

TEST_F(DispatcherTest, DispatchRequestReturnsResponse) {
    auto out = dispatcher().dispatch(call(11, "echo", {{"message", "x"}}));
    ASSERT_TRUE(out.has_value());
    const auto& resp = std::get<JsonRpcResponse>(*out);
    EXPECT_EQ(std::get<int64_t>(resp.id), 11);
    EXPECT_EQ(dispatcher().in_flight(), 0u);
}

// ---- Cancellation ----

TEST_F(DispatcherTest, CancelledNotificationStopsRunningHandler) {
    std::atomic<bool> started{false};
    add_tool("slow", [&started](const nlohmann::json&, const RequestContext& ctx) -> CallToolResult {
        started = true;
        ctx.sleep_for(10s);
        return text_result("finished");
    });
    auto& d = dispatcher();

    std::optional<JsonRpcMessage> out;
    std::thread worker([&] { out = d.dispatch(call(42, "slow", nlohmann::json::object())); });

    for (int i = 0; i < 500 && !started; ++i) std::this_thread::sleep_for(5ms);
    ASSERT_TRUE(started);
    EXPECT_EQ(d.in_flight(), 1u);

    JsonRpcNotification cancel;
    cancel.method = "notifications/cancelled";
    cancel.params = nlohmann::json{{"requestId", 42}, {"reason", "user abort"}};
    EXPECT_FALSE(d.dispatch(cancel).has_value());

    worker.join();
    ASSERT_TRUE(out.has_value());
    const auto& resp = std::get<JsonRpcResponse>(*out);
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::RequestCancelled);
    EXPECT_EQ(d.in_flight(), 0u);
}

TEST_F(DispatcherTest, CancelUnknownRequest) {
    EXPECT_FALSE(dispatcher().cancel(RequestId{int64_t{99}}));
    EXPECT_EQ(dispatcher().cancel_all(), 0u);
}

TEST_F(DispatcherTest, InFlightTrackingSharesTokenForReusedId) {
    auto& d = dispatcher();
    CancellationToken a = d.begin_request(RequestId{int64_t{1}});
    CancellationToken b = d.begin_request(RequestId{int64_t{1}});
    EXPECT_EQ(d.in_flight(), 1u);
    EXPECT_EQ(d.cancel_all(), 1u);
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());
    d.end_request(RequestId{int64_t{1}});
    EXPECT_EQ(d.in_flight(), 1u);
    d.end_request(RequestId{int64_t{1}});
    EXPECT_EQ(d.in_flight(), 0u);
}
