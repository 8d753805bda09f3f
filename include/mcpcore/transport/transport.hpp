#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mcpcore {

/// Abstract transport interface: one duplex byte stream carrying framed
/// message payloads.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until the next complete frame payload is available.
    /// Returns nullopt at end of input or once shutdown() has been called.
    /// Throws FramingError on a corrupt stream, McpTransportError on I/O failure.
    virtual std::optional<std::string> read_frame() = 0;

    /// Frame and write one payload, flushing it to the peer.
    /// Safe to call from several threads; frames never interleave.
    virtual void write_frame(std::string_view payload) = 0;

    /// Interrupt a blocked read_frame(). Does not close the stream.
    virtual void shutdown() = 0;

    /// False once end of input has been seen or shutdown() was called.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpcore
