#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpcore {

enum class FramingMode {
    Newline,        // one JSON text per '\n'-terminated line (MCP stdio)
    ContentLength,  // "Content-Length: N\r\n\r\n<body>" (LSP style)
};

std::string to_string(FramingMode mode);

/// Parses "newline" or "content-length". Throws std::invalid_argument.
FramingMode framing_mode_from_string(const std::string& name);

constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 4 * 1024 * 1024;

/// Splits a byte stream into message payloads and wraps payloads for writing.
/// Stateless apart from its limits; the caller owns the read buffer.
class IFramer {
public:
    virtual ~IFramer() = default;

    /// Wrap one payload for the wire.
    [[nodiscard]] virtual std::string encode(std::string_view payload) const = 0;

    /// Extract the next complete payload from the front of `buffer`,
    /// consuming its bytes. Returns nullopt if more input is needed.
    /// Throws FramingError when the stream is corrupt.
    virtual std::optional<std::string> next_frame(std::string& buffer) const = 0;

    /// Called at end of input, repeatedly until it returns nullopt, to drain
    /// what is left in `buffer`. Throws FramingError if the stream ended
    /// inside a frame.
    virtual std::optional<std::string> finish(std::string& buffer) const = 0;

    [[nodiscard]] virtual FramingMode mode() const = 0;
};

class NewlineFramer : public IFramer {
public:
    explicit NewlineFramer(std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    std::string encode(std::string_view payload) const override;
    std::optional<std::string> next_frame(std::string& buffer) const override;
    std::optional<std::string> finish(std::string& buffer) const override;
    FramingMode mode() const override { return FramingMode::Newline; }

private:
    std::string take_line(std::string& buffer, std::size_t end, std::size_t consumed) const;

    std::size_t max_frame_bytes_;
};

class ContentLengthFramer : public IFramer {
public:
    static constexpr std::size_t MAX_HEADER_BYTES = 8 * 1024;

    explicit ContentLengthFramer(std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    std::string encode(std::string_view payload) const override;
    std::optional<std::string> next_frame(std::string& buffer) const override;
    std::optional<std::string> finish(std::string& buffer) const override;
    FramingMode mode() const override { return FramingMode::ContentLength; }

private:
    std::size_t max_frame_bytes_;
};

std::unique_ptr<IFramer> make_framer(FramingMode mode,
                                     std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);

} // namespace mcpcore
