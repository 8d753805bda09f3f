/// Echo server — exercises the core end to end over stdio.
/// Usage: ./echo_server
/// Environment: MCPCORE_FRAMING, MCPCORE_MAX_FRAME_BYTES, MCPCORE_WORKERS,
/// MCPCORE_LOG_LEVEL. Logs go to stderr; stdout carries protocol frames.

#include <mcpcore/mcpcore.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
    g_shutdown_requested = 1;
}

mcpcore::ToolDefinition text_tool(const std::string& name, const std::string& description,
                                  const std::string& field, const std::string& field_description) {
    mcpcore::ToolDefinition def;
    def.name = name;
    def.description = description;
    def.input_schema = mcpcore::SchemaBuilder()
        .required(field, mcpcore::FieldType::String, field_description)
        .build();
    return def;
}

void register_capabilities(mcpcore::Server& server) {
    server.add_tool(text_tool("echo", "Echo back the provided message",
                              "message", "Message to echo back"),
        [](const nlohmann::json& args) {
            return mcpcore::text_result("Echo: " + args.at("message").get<std::string>());
        });

    server.add_tool(text_tool("uppercase", "Convert text to uppercase",
                              "text", "Text to convert to uppercase"),
        [](const nlohmann::json& args) {
            std::string text = args.at("text").get<std::string>();
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return mcpcore::text_result(std::move(text));
        });

    server.add_tool(text_tool("count_words", "Count words in the provided text",
                              "text", "Text to count words in"),
        [](const nlohmann::json& args) {
            std::istringstream in(args.at("text").get<std::string>());
            size_t count = 0;
            std::string word;
            while (in >> word) ++count;
            return mcpcore::text_result("Word count: " + std::to_string(count));
        });

    mcpcore::PromptDefinition greeting;
    greeting.name = "greeting";
    greeting.description = "A simple greeting prompt";
    greeting.arguments.push_back({"name", std::string("Name to greet"), true});

    server.add_prompt(greeting, [](const std::string&, const nlohmann::json& args) {
        mcpcore::GetPromptResult result;
        result.description = "A greeting prompt";
        std::string name = args.value("name", std::string("World"));
        result.messages.push_back({mcpcore::Role::User, mcpcore::TextContent{
            "Hello, " + name + "! How are you today?", std::nullopt}});
        return result;
    });
}

} // namespace

int main() {
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
    // A vanished peer surfaces as a write error instead of killing the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        mcpcore::ServerOptions defaults;
        defaults.server_info = {"echo-server", std::nullopt, "1.0.0"};
        defaults.instructions = "Echo, uppercase and word-count tools plus a greeting prompt.";

        mcpcore::Server server{mcpcore::ServerOptions::from_env(defaults)};
        register_capabilities(server);

        std::atomic<bool> done{false};
        std::thread watcher([&] {
            while (!done && !g_shutdown_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (g_shutdown_requested) {
                mcpcore::logging::get()->info("Shutdown signal received");
                server.shutdown();
            }
        });

        mcpcore::ServeResult result;
        try {
            result = server.serve_stdio();
        } catch (...) {
            done = true;
            watcher.join();
            throw;
        }
        done = true;
        watcher.join();

        if (result.outcome == mcpcore::ServeOutcome::FramingError) {
            return 2;
        }
        if (!result.ok()) {
            mcpcore::write_server_failure(std::cerr, result.message);
            return 1;
        }
        return 0;
    } catch (const mcpcore::StartupError& e) {
        mcpcore::write_error_envelope(std::cerr, e.code, e.what());
        return 1;
    } catch (const std::exception& e) {
        mcpcore::write_server_failure(std::cerr, e.what());
        return 1;
    }
}
