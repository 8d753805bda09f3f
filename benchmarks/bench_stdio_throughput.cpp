#include <benchmark/benchmark.h>
#include "mcpcore/codec.hpp"
#include "mcpcore/schema.hpp"
#include "mcpcore/server.hpp"
#include "mcpcore/transport/stdio_transport.hpp"
#include <unistd.h>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

using namespace mcpcore;

namespace {

std::string echo_call(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id)
         + R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":"payload"}}})";
}

// Write all of `data` to `fd`.
bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

// Read until `lines` newline-terminated responses arrived.
bool read_lines(int fd, int lines) {
    char buf[8192];
    int seen = 0;
    while (seen < lines) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) return false;
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == '\n') ++seen;
        }
    }
    return true;
}

} // anonymous namespace

/// Round trips N tools/call requests through a server on the other end of a
/// pipe pair. Arg 0: requests per iteration. Arg 1: worker threads.
static void BM_StdioEchoRoundTrip(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    std::signal(SIGPIPE, SIG_IGN);

    int c2s[2], s2c[2];
    if (::pipe(c2s) < 0 || ::pipe(s2c) < 0) {
        state.SkipWithError("pipe failed");
        return;
    }

    ServerOptions opts;
    opts.server_info = {"bench-server", std::nullopt, "1.0"};
    opts.worker_threads = static_cast<int>(state.range(1));
    opts.log_level = "off";
    Server server{opts};

    ToolDefinition echo;
    echo.name = "echo";
    echo.input_schema = SchemaBuilder().required("message", FieldType::String).build();
    server.add_tool(echo, [](const nlohmann::json& args) {
        CallToolResult r;
        r.content.push_back(TextContent{"Echo: " + args.at("message").get<std::string>(), std::nullopt});
        return r;
    });

    auto transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
    std::thread server_thread([&server, t = std::move(transport)]() mutable {
        server.serve(std::move(t));
    });

    std::string batch;
    for (int i = 1; i <= n; ++i) batch += echo_call(i) + "\n";

    // Writer and reader run concurrently so neither pipe fills up.
    for (auto _ : state) {
        bool ok = true;
        std::thread writer([&] { ok = write_all(c2s[1], batch) && ok; });
        bool got = read_lines(s2c[0], n);
        writer.join();
        if (!ok || !got) {
            state.SkipWithError("pipe closed mid-benchmark");
            break;
        }
    }
    state.SetItemsProcessed(state.iterations() * n);

    ::close(c2s[1]);
    server_thread.join();
    ::close(s2c[0]);
}
BENCHMARK(BM_StdioEchoRoundTrip)->Args({100, 0})->Args({100, 4})->UseRealTime();

static void BM_ParseAndSerialize1K(benchmark::State& state) {
    std::vector<std::string> messages;
    for (int i = 0; i < 1000; ++i) {
        messages.push_back(echo_call(i));
    }

    for (auto _ : state) {
        for (const auto& raw : messages) {
            auto msg = Codec::parse(raw);
            auto out = Codec::serialize(msg);
            benchmark::DoNotOptimize(out);
        }
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_ParseAndSerialize1K);
