#include "mcpcore/server.hpp"
#include "mcpcore/codec.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/logging.hpp"
#include "mcpcore/transport/stdio_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <vector>

namespace mcpcore {

std::string to_string(LoopState state) {
    switch (state) {
        case LoopState::Idle:          return "Idle";
        case LoopState::AwaitingFrame: return "AwaitingFrame";
        case LoopState::Decoding:      return "Decoding";
        case LoopState::Dispatching:   return "Dispatching";
        case LoopState::Encoding:      return "Encoding";
        case LoopState::Writing:       return "Writing";
        case LoopState::Shutdown:      return "Shutdown";
    }
    return "Unknown";
}

std::string to_string(ServeOutcome outcome) {
    switch (outcome) {
        case ServeOutcome::EndOfInput:     return "end of input";
        case ServeOutcome::Stopped:        return "stopped";
        case ServeOutcome::FramingError:   return "framing error";
        case ServeOutcome::TransportError: return "transport error";
    }
    return "unknown";
}

// ----------- Server::Impl -----------

struct Server::Impl {
    ServerOptions opts;
    Registry registry;
    Dispatcher dispatcher;

    std::atomic<LoopState> state{LoopState::Idle};
    StateObserver observer;

    // Transport reference for shutdown() from other threads
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    // Set once the stream is unusable; no further responses are written.
    // Read freely, but set and acted on under write_mutex.
    std::atomic<bool> broken{false};
    std::mutex write_mutex;

    std::mutex failure_mutex;
    std::optional<std::string> write_failure;

    std::atomic<size_t> frames_read{0};
    std::atomic<size_t> responses_written{0};
    std::atomic<size_t> frames_dropped{0};

    // Thread pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    bool pool_running{false};
    size_t pending_tasks{0};
    std::condition_variable drained_cv;

    explicit Impl(ServerOptions o)
        : opts(std::move(o)),
          dispatcher(registry, DispatcherOptions{opts.server_info, opts.instructions}) {}

    void transition(LoopState next) {
        LoopState prev = state.exchange(next);
        if (prev == next) return;
        logging::get()->trace("Loop state {} -> {}", to_string(prev), to_string(next));
        if (observer) observer(prev, next);
    }

    void start_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = true;
        }
        for (int i = 0; i < opts.worker_threads; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        if (!pool_running && task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lock(pool_mutex);
                        --pending_tasks;
                    }
                    drained_cv.notify_all();
                }
            });
        }
    }

    /// Wait for every queued and running task, then join the workers.
    void drain_thread_pool() {
        {
            std::unique_lock<std::mutex> lock(pool_mutex);
            drained_cv.wait(lock, [this] { return pending_tasks == 0; });
            pool_running = false;
        }
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
            ++pending_tasks;
        }
        pool_cv.notify_one();
    }

    void mark_broken() {
        std::lock_guard<std::mutex> lock(write_mutex);
        broken = true;
    }

    void suppress(const JsonRpcResponse& resp) {
        ++frames_dropped;
        logging::get()->debug("Suppressing response to {} after stream failure", to_string(resp.id));
    }

    /// Encode and write one response. Throws McpTransportError.
    void write_response(ITransport& t, const JsonRpcResponse& resp, bool on_reader) {
        if (broken) {
            suppress(resp);
            return;
        }
        if (on_reader) transition(LoopState::Encoding);
        std::string text = Codec::serialize(resp);
        if (on_reader) transition(LoopState::Writing);

        std::lock_guard<std::mutex> lock(write_mutex);
        if (broken) {
            suppress(resp);
            return;
        }
        try {
            t.write_frame(text);
        } catch (const McpTransportError&) {
            broken = true;
            throw;
        }
        ++responses_written;
        logging::get()->debug("<- {} ({})", resp.is_error() ? "error" : "result", to_string(resp.id));
    }

    /// Runs on a worker; a failed write stops the loop instead of propagating.
    void deliver_from_worker(ITransport& t, const JsonRpcResponse& resp) {
        try {
            write_response(t, resp, false);
        } catch (const McpTransportError& e) {
            logging::get()->error("Failed to write response to {}: {}", to_string(resp.id), e.what());
            {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!write_failure) write_failure = e.what();
            }
            t.shutdown();
        }
    }

    void handle_undecodable(ITransport& t, const std::string& frame, const McpParseError& e) {
        auto id = Codec::recover_id(frame);
        if (!id) {
            ++frames_dropped;
            logging::get()->warn("Dropping undecodable frame ({} bytes): {}", frame.size(), e.what());
            return;
        }
        logging::get()->warn("Rejecting frame for request {}: {}", to_string(*id), e.what());
        write_response(t, make_error(*id, e.code, e.what()), true);
    }

    void handle_request_async(ITransport& t, JsonRpcRequest req) {
        CancellationToken token = dispatcher.begin_request(req.id);
        dispatch_to_pool([this, &t, req = std::move(req), token] {
            JsonRpcResponse resp = dispatcher.handle(req, token);
            dispatcher.end_request(req.id);
            deliver_from_worker(t, resp);
        });
    }

    void run(ITransport& t, ServeResult& result) {
        while (true) {
            transition(LoopState::AwaitingFrame);
            auto frame = t.read_frame();
            if (!frame) {
                if (!record_write_failure(result)) {
                    result.outcome = stop_requested ? ServeOutcome::Stopped : ServeOutcome::EndOfInput;
                }
                return;
            }
            ++frames_read;

            transition(LoopState::Decoding);
            JsonRpcMessage msg;
            try {
                msg = Codec::parse(*frame);
            } catch (const McpParseError& e) {
                handle_undecodable(t, *frame, e);
                transition(LoopState::Idle);
                continue;
            }

            transition(LoopState::Dispatching);
            auto* req = std::get_if<JsonRpcRequest>(&msg);
            if (req && opts.worker_threads > 0) {
                handle_request_async(t, std::move(*req));
            } else {
                auto response = dispatcher.dispatch(msg);
                if (response) {
                    write_response(t, std::get<JsonRpcResponse>(*response), true);
                }
            }
            transition(LoopState::Idle);

            if (record_write_failure(result)) return;
        }
    }

    /// Cancel in-flight work when asked, wait for the pool, release the transport.
    void end_session(bool cancel) {
        if (cancel) {
            size_t cancelled = dispatcher.cancel_all();
            if (cancelled > 0) {
                logging::get()->info("Cancelling {} in-flight requests", cancelled);
            }
        }
        if (!thread_pool.empty()) {
            drain_thread_pool();
        }
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            transport = nullptr;
        }
        running = false;
    }

    /// True if a worker failed to write; the session is then over.
    bool record_write_failure(ServeResult& result) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!write_failure) return false;
        result.outcome = ServeOutcome::TransportError;
        result.message = *write_failure;
        return true;
    }
};

// ----------- Server -----------

Server::Server(ServerOptions opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    if (impl_->opts.worker_threads < 0) {
        throw StartupError("worker_threads must not be negative");
    }
    try {
        logging::init(logging::parse_level(impl_->opts.log_level));
    } catch (const std::invalid_argument& e) {
        throw StartupError(e.what());
    }
}

Server::~Server() {
    if (impl_) {
        shutdown();
    }
}

void Server::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->registry.add_tool(std::move(def), std::move(handler));
}

void Server::add_tool(ToolDefinition def, ContextToolHandler handler) {
    impl_->registry.add_tool(std::move(def), std::move(handler));
}

void Server::add_prompt(PromptDefinition def, PromptHandler handler) {
    impl_->registry.add_prompt(std::move(def), std::move(handler));
}

Registry& Server::registry() { return impl_->registry; }

Dispatcher& Server::dispatcher() { return impl_->dispatcher; }

const ServerOptions& Server::options() const { return impl_->opts; }

void Server::set_state_observer(StateObserver observer) {
    impl_->observer = std::move(observer);
}

LoopState Server::state() const { return impl_->state; }

ServeResult Server::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("serve() requires a transport");
    }
    if (impl_->running.exchange(true)) {
        throw McpError("Server is already serving");
    }

    auto log = logging::get();
    impl_->registry.seal();
    ServeResult result;

    // If shutdown() was called before serve(), don't block
    if (impl_->stop_requested) {
        impl_->transition(LoopState::Shutdown);
        impl_->running = false;
        result.outcome = ServeOutcome::Stopped;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = transport.get();
    }
    log->info("Serving {} tools, {} prompts ({} workers)",
              impl_->registry.tool_count(), impl_->registry.prompt_count(),
              impl_->opts.worker_threads);

    impl_->broken = false;
    {
        std::lock_guard<std::mutex> lock(impl_->failure_mutex);
        impl_->write_failure.reset();
    }

    // Joins the workers on every way out, including an exception from the observer.
    struct SessionEnd {
        Impl& impl;
        bool cancel = true;
        bool done = false;
        void operator()() {
            if (done) return;
            done = true;
            impl.end_session(cancel);
        }
        ~SessionEnd() { (*this)(); }
    } session_end{*impl_};

    if (impl_->opts.worker_threads > 0) {
        impl_->start_thread_pool();
    }

    try {
        impl_->run(*transport, result);
    } catch (const FramingError& e) {
        impl_->mark_broken();
        log->error("Framing error, closing session: {}", e.what());
        result.outcome = ServeOutcome::FramingError;
        result.message = e.what();
    } catch (const McpTransportError& e) {
        impl_->mark_broken();
        log->error("Transport error, closing session: {}", e.what());
        result.outcome = ServeOutcome::TransportError;
        result.message = e.what();
    }
    impl_->transition(LoopState::Shutdown);

    // A clean end of input lets queued and running requests finish.
    session_end.cancel = result.outcome != ServeOutcome::EndOfInput;
    session_end();

    result.frames_read = impl_->frames_read;
    result.responses_written = impl_->responses_written;
    result.frames_dropped = impl_->frames_dropped;
    log->info("Session ended ({}): {} frames read, {} responses written, {} dropped",
              to_string(result.outcome), result.frames_read, result.responses_written,
              result.frames_dropped);
    return result;
}

ServeResult Server::serve_stdio() {
    if (::fcntl(STDIN_FILENO, F_GETFL) < 0) {
        throw StartupError("stdin is not open");
    }
    if (::fcntl(STDOUT_FILENO, F_GETFL) < 0) {
        throw StartupError("stdout is not open");
    }
    return serve(std::make_unique<StdioTransport>(
        make_framer(impl_->opts.framing, impl_->opts.max_frame_bytes)));
}

void Server::shutdown() {
    impl_->stop_requested = true;
    impl_->dispatcher.cancel_all();
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool Server::is_running() const {
    return impl_->running;
}

} // namespace mcpcore
