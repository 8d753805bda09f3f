#include <gtest/gtest.h>
#include "mcpcore/error.hpp"
#include "mcpcore/schema.hpp"
#include "mcpcore/server.hpp"
#include "mcpcore/version.hpp"
#include "pipe_harness.hpp"

using namespace mcpcore;
using mcpcore::test::PipeHarness;

namespace {

ServerOptions lifecycle_options() {
    ServerOptions opts;
    opts.server_info = {"lifecycle-server", std::nullopt, "1.0"};
    opts.instructions = "Say hello.";
    opts.log_level = "warn";
    return opts;
}

} // anonymous namespace

TEST(StdioLifecycle, FullLifecycle) {
    Server server{lifecycle_options()};
    PipeHarness h(server);

    auto init = h.initialize();
    EXPECT_EQ(init["jsonrpc"], "2.0");
    EXPECT_EQ(init["id"], 0);
    EXPECT_EQ(init["result"]["protocolVersion"], std::string(PROTOCOL_VERSION));
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "lifecycle-server");
    EXPECT_EQ(init["result"]["serverInfo"]["version"], "1.0");
    EXPECT_EQ(init["result"]["instructions"], "Say hello.");

    auto pong = h.request(1, "ping");
    EXPECT_EQ(pong["result"], nlohmann::json::object());

    ServeResult result = h.finish();
    EXPECT_EQ(result.outcome, ServeOutcome::EndOfInput);
    EXPECT_TRUE(server.dispatcher().initialized());
    EXPECT_EQ(server.dispatcher().protocol_version(), std::string(PROTOCOL_VERSION));
}

TEST(StdioLifecycle, OlderSupportedVersionIsEchoed) {
    Server server{lifecycle_options()};
    PipeHarness h(server);

    auto init = h.initialize("2024-11-05");
    EXPECT_EQ(init["result"]["protocolVersion"], "2024-11-05");
}

TEST(StdioLifecycle, UnknownVersionGetsLatest) {
    Server server{lifecycle_options()};
    PipeHarness h(server);

    auto init = h.initialize("1999-01-01");
    EXPECT_EQ(init["result"]["protocolVersion"], std::string(PROTOCOL_VERSION));
}

TEST(StdioLifecycle, CapabilitiesFollowRegistry) {
    Server server{lifecycle_options()};

    ToolDefinition td;
    td.name = "test_tool";
    td.input_schema = SchemaBuilder().build();
    server.add_tool(td, [](const nlohmann::json&) { return CallToolResult{}; });

    PipeHarness h(server);
    auto caps = h.initialize()["result"]["capabilities"];
    ASSERT_TRUE(caps.contains("tools"));
    EXPECT_EQ(caps["tools"]["listChanged"], false);
    EXPECT_FALSE(caps.contains("prompts"));
}

TEST(StdioLifecycle, EmptyServerAdvertisesNothing) {
    Server server{lifecycle_options()};
    PipeHarness h(server);

    auto caps = h.initialize()["result"]["capabilities"];
    EXPECT_FALSE(caps.contains("tools"));
    EXPECT_FALSE(caps.contains("prompts"));

    // Discovery still answers with empty lists.
    EXPECT_EQ(h.request(1, "tools/list")["result"]["tools"], nlohmann::json::array());
    EXPECT_EQ(h.request(2, "prompts/list")["result"]["prompts"], nlohmann::json::array());
}

TEST(StdioLifecycle, RequestsBeforeInitializeAreServed) {
    Server server{lifecycle_options()};
    PipeHarness h(server);

    EXPECT_EQ(h.request(1, "ping")["result"], nlohmann::json::object());
    EXPECT_FALSE(server.dispatcher().initialized());
}

TEST(StdioLifecycle, ServeAgainAfterSessionEnds) {
    Server server{lifecycle_options()};
    {
        PipeHarness h(server);
        h.request(1, "ping");
        h.finish();
    }
    PipeHarness h(server);
    EXPECT_EQ(h.request(2, "ping")["id"], 2);
    EXPECT_EQ(h.finish().outcome, ServeOutcome::EndOfInput);
}
