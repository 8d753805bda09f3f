#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "registry.hpp"
#include "transport/transport.hpp"
#include <functional>
#include <memory>
#include <string>

namespace mcpcore {

/// States of the transport loop. Encoding and Writing are only visited by
/// the reading thread; with worker threads, responses are encoded and
/// written on the worker that produced them.
enum class LoopState {
    Idle,
    AwaitingFrame,
    Decoding,
    Dispatching,
    Encoding,
    Writing,
    Shutdown,
};

std::string to_string(LoopState state);

enum class ServeOutcome {
    EndOfInput,      // peer closed the stream
    Stopped,         // shutdown() was called
    FramingError,    // corrupt stream; session abandoned
    TransportError,  // read or write failed
};

std::string to_string(ServeOutcome outcome);

struct ServeResult {
    ServeOutcome outcome = ServeOutcome::EndOfInput;
    std::string message;
    size_t frames_read = 0;
    size_t responses_written = 0;
    size_t frames_dropped = 0;      // undecodable frames and suppressed responses

    [[nodiscard]] bool ok() const {
        return outcome == ServeOutcome::EndOfInput || outcome == ServeOutcome::Stopped;
    }
};

using StateObserver = std::function<void(LoopState from, LoopState to)>;

class Server {
public:
    explicit Server(ServerOptions opts = {});
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ---- Registration (before serving) ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_tool(ToolDefinition def, ContextToolHandler handler);
    void add_prompt(PromptDefinition def, PromptHandler handler);

    [[nodiscard]] Registry& registry();
    [[nodiscard]] Dispatcher& dispatcher();
    [[nodiscard]] const ServerOptions& options() const;

    /// Receives every loop state transition. Set before serve().
    void set_state_observer(StateObserver observer);
    [[nodiscard]] LoopState state() const;

    // ---- Transport ----

    /// Seal the registry and run the loop until end of input, shutdown()
    /// or a fatal stream error. In-flight requests are cancelled and drained
    /// before returning.
    ServeResult serve(std::unique_ptr<ITransport> transport);

    /// Serve stdin/stdout with the configured framing.
    /// Throws StartupError if the standard streams are unusable.
    ServeResult serve_stdio();

    /// Stop serving. Safe to call from any thread, including before serve().
    void shutdown();

    [[nodiscard]] bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpcore
