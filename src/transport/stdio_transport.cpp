#include "mcpcore/transport/stdio_transport.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/logging.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcpcore {

namespace {

constexpr size_t READ_CHUNK = 4096;

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // anonymous namespace

StdioTransport::StdioTransport(std::unique_ptr<IFramer> framer)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false),
      framer_(framer ? std::move(framer) : std::make_unique<NewlineFramer>()) {
    open_wakeup_pipe();
}

StdioTransport::StdioTransport(int read_fd, int write_fd, std::unique_ptr<IFramer> framer)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true),
      framer_(framer ? std::move(framer) : std::make_unique<NewlineFramer>()) {
    open_wakeup_pipe();
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::open_wakeup_pipe() {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(errno_message("Failed to create wakeup pipe"));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

std::optional<std::string> StdioTransport::read_frame() {
    std::lock_guard<std::mutex> lock(read_mutex_);

    if (eof_) {
        return framer_->finish(buffer_);
    }

    char chunk[READ_CHUNK];
    while (true) {
        if (auto frame = framer_->next_frame(buffer_)) {
            return frame;
        }
        if (shutdown_requested_) return std::nullopt;

        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(errno_message("poll failed"));
        }

        // Wakeup pipe has data → shutdown() was called
        if (fds[1].revents & POLLIN) return std::nullopt;

        if (fds[0].revents & POLLNVAL) {
            throw McpTransportError("Input descriptor is not open");
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(errno_message("Read error"));
        }
        if (n == 0) {
            logging::get()->debug("End of input ({} bytes pending)", buffer_.size());
            eof_ = true;
            connected_ = false;
            return framer_->finish(buffer_);
        }

        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write_frame(std::string_view payload) {
    std::string frame = framer_->encode(payload);
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_all(frame.data(), frame.size());
}

void StdioTransport::write_all(const char* data, size_t remaining) {
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{write_fd_, POLLOUT, 0};
                ::poll(&pfd, 1, -1);
                continue;
            }
            throw McpTransportError(errno_message("Write error"));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    // Write to wakeup pipe to interrupt poll() in read_frame().
    char b = 1;
    ssize_t n = ::write(wakeup_pipe_[1], &b, 1);
    if (n < 0 && errno != EAGAIN) {
        logging::get()->warn("Failed to signal wakeup pipe: {}", std::strerror(errno));
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpcore
