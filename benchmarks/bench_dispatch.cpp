#include <benchmark/benchmark.h>
#include "mcpcore/dispatcher.hpp"
#include "mcpcore/schema.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcpcore;

namespace {

CallToolResult echo_result(const nlohmann::json& args) {
    CallToolResult r;
    r.content.push_back(TextContent{"Echo: " + args.at("message").get<std::string>(), std::nullopt});
    return r;
}

// A sealed registry with N echo-like tools.
std::unique_ptr<Registry> make_registry(int n_tools) {
    auto registry = std::make_unique<Registry>();
    for (int i = 0; i < n_tools; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.input_schema = SchemaBuilder()
            .required("message", FieldType::String)
            .optional("times", FieldType::Integer)
            .build();
        registry->add_tool(def, ToolHandler(echo_result));
    }
    registry->seal();
    return registry;
}

JsonRpcRequest make_request(int64_t id, const std::string& method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    req.params = std::move(params);
    return req;
}

DispatcherOptions bench_options() {
    return DispatcherOptions{{"bench-server", std::nullopt, "1.0"}, std::nullopt};
}

} // anonymous namespace

static void BM_DispatchPing(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_options());
    JsonRpcMessage msg = make_request(1, "ping", nlohmann::json::object());

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_options());
    JsonRpcMessage msg = make_request(1, "resources/list", nlohmann::json::object());

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);

static void BM_DispatchToolCall(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher(*registry, bench_options());

    std::vector<JsonRpcMessage> calls;
    for (int64_t i = 0; i < state.range(0); ++i) {
        calls.push_back(make_request(i, "tools/call", {
            {"name", "tool_" + std::to_string(i)},
            {"arguments", {{"message", "hi"}, {"times", 2}}},
        }));
    }

    size_t i = 0;
    for (auto _ : state) {
        auto resp = dispatcher.dispatch(calls[i++ % calls.size()]);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolCall)->Arg(1)->Arg(100);

static void BM_DispatchInvalidArguments(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_options());
    JsonRpcMessage msg = make_request(1, "tools/call", {
        {"name", "tool_0"}, {"arguments", {{"times", "two"}}},
    });

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchInvalidArguments);

static void BM_ToolsList(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher(*registry, bench_options());
    JsonRpcMessage msg = make_request(1, "tools/list", nlohmann::json::object());

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ToolsList)->Arg(10)->Arg(100);

static void BM_DispatchNotification(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_options());

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    JsonRpcMessage msg = notif;

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification);
