#pragma once
#include "transport.hpp"
#include "../framing.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace mcpcore {

/// StdioTransport reads framed messages from one file descriptor and writes
/// them to another. Reads use poll() on the input and a wakeup pipe so that
/// shutdown() can interrupt a blocked read from another thread.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout (not closed on destruction).
    explicit StdioTransport(std::unique_ptr<IFramer> framer = nullptr);

    /// Create transport using specified file descriptors, which it takes
    /// ownership of (for testing).
    StdioTransport(int read_fd, int write_fd, std::unique_ptr<IFramer> framer = nullptr);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_frame() override;
    void write_frame(std::string_view payload) override;
    void shutdown() override;
    bool is_connected() const override;

    [[nodiscard]] const IFramer& framer() const { return *framer_; }

private:
    void open_wakeup_pipe();
    void write_all(const char* data, size_t size);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::unique_ptr<IFramer> framer_;

    std::atomic<bool> connected_{true};
    std::atomic<bool> shutdown_requested_{false};
    bool eof_ = false;

    std::mutex read_mutex_;
    std::string buffer_;

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up the reader
};

} // namespace mcpcore
