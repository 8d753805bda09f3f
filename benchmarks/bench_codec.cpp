#include <benchmark/benchmark.h>
#include "mcpcore/codec.hpp"
#include "mcpcore/framing.hpp"
#include "mcpcore/json_rpc.hpp"
#include <string>
#include <vector>

using namespace mcpcore;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello from the benchmark"}}})";

// A tools/list result with N entries, as a peer would see it.
static std::string make_tools_list_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Transforms text, variant " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"text", {{"type", "string"}, {"description", "Input text"}}}}},
                {"required", {"text"}},
            }},
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kToolsList = make_tools_list_response(100);

// ---- Decode ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsList);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_ParseLargeResponse);

static void BM_RecoverIdFromInvalidRequest(benchmark::State& state) {
    const std::string raw = R"({"jsonrpc":"1.0","id":"req-17","method":"ping"})";
    for (auto _ : state) {
        auto id = Codec::recover_id(raw);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_RecoverIdFromInvalidRequest);

// ---- Encode ----

static void BM_SerializeToolResult(benchmark::State& state) {
    nlohmann::json result = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", "Echo: hello from the benchmark"}}})},
    };
    JsonRpcMessage msg = make_result(RequestId{int64_t{42}}, result);
    for (auto _ : state) {
        auto out = Codec::serialize(msg);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeToolResult);

static void BM_SerializeError(benchmark::State& state) {
    JsonRpcMessage msg = make_error(RequestId{std::string("abc")}, error::MethodNotFound,
                                    "Method not found: resources/list");
    for (auto _ : state) {
        auto out = Codec::serialize(msg);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SerializeError);

// ---- Framing ----

static void BM_NewlineFraming(benchmark::State& state) {
    NewlineFramer framer;
    std::string stream;
    for (int i = 0; i < 100; ++i) stream += framer.encode(kToolCall);

    for (auto _ : state) {
        std::string buffer = stream;
        size_t frames = 0;
        while (auto frame = framer.next_frame(buffer)) {
            benchmark::DoNotOptimize(frame);
            ++frames;
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_NewlineFraming);

static void BM_ContentLengthFraming(benchmark::State& state) {
    ContentLengthFramer framer;
    std::string stream;
    for (int i = 0; i < 100; ++i) stream += framer.encode(kToolCall);

    for (auto _ : state) {
        std::string buffer = stream;
        size_t frames = 0;
        while (auto frame = framer.next_frame(buffer)) {
            benchmark::DoNotOptimize(frame);
            ++frames;
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_ContentLengthFraming);
