#include "mcpcore/framing.hpp"
#include "mcpcore/error.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcpcore {

std::string to_string(FramingMode mode) {
    switch (mode) {
        case FramingMode::Newline:       return "newline";
        case FramingMode::ContentLength: return "content-length";
    }
    return "unknown";
}

FramingMode framing_mode_from_string(const std::string& name) {
    if (name == "newline") return FramingMode::Newline;
    if (name == "content-length") return FramingMode::ContentLength;
    throw std::invalid_argument("Unknown framing mode: " + name);
}

std::unique_ptr<IFramer> make_framer(FramingMode mode, std::size_t max_frame_bytes) {
    switch (mode) {
        case FramingMode::ContentLength:
            return std::make_unique<ContentLengthFramer>(max_frame_bytes);
        case FramingMode::Newline:
        default:
            return std::make_unique<NewlineFramer>(max_frame_bytes);
    }
}

// ---------------------------------------------------------------------------
// NewlineFramer
// ---------------------------------------------------------------------------

std::string NewlineFramer::encode(std::string_view payload) const {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload);
    frame += '\n';
    return frame;
}

std::string NewlineFramer::take_line(std::string& buffer, std::size_t end,
                                     std::size_t consumed) const {
    std::string line = buffer.substr(0, end);
    buffer.erase(0, consumed);

    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.size() > max_frame_bytes_) {
        throw FramingError("Frame of " + std::to_string(line.size())
                           + " bytes exceeds limit of " + std::to_string(max_frame_bytes_));
    }
    if (line.find('\0') != std::string::npos) {
        throw FramingError("Frame contains a NUL byte");
    }
    return line;
}

std::optional<std::string> NewlineFramer::next_frame(std::string& buffer) const {
    while (true) {
        size_t nl = buffer.find('\n');
        if (nl == std::string::npos) {
            if (buffer.size() > max_frame_bytes_) {
                throw FramingError("Unterminated frame exceeds limit of "
                                   + std::to_string(max_frame_bytes_) + " bytes");
            }
            return std::nullopt;
        }

        std::string line = take_line(buffer, nl, nl + 1);
        if (line.empty()) continue;
        return line;
    }
}

std::optional<std::string> NewlineFramer::finish(std::string& buffer) const {
    auto frame = next_frame(buffer);
    if (frame) return frame;

    bool blank = std::all_of(buffer.begin(), buffer.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        buffer.clear();
        return std::nullopt;
    }
    // A final line without its newline still counts.
    std::string line = take_line(buffer, buffer.size(), buffer.size());
    if (line.empty()) return std::nullopt;
    return line;
}

// ---------------------------------------------------------------------------
// ContentLengthFramer
// ---------------------------------------------------------------------------

namespace {

const std::string HEADER_SEPARATOR = "\r\n\r\n";

std::string trim(const std::string& s) {
    auto begin = std::find_if(s.begin(), s.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(s.rbegin(), s.rend(),
                            [](unsigned char c) { return !std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Drop CR/LF left over between frames.
void skip_line_breaks(std::string& buffer) {
    size_t start = buffer.find_first_not_of("\r\n");
    if (start == std::string::npos) {
        buffer.clear();
    } else if (start > 0) {
        buffer.erase(0, start);
    }
}

} // anonymous namespace

std::string ContentLengthFramer::encode(std::string_view payload) const {
    std::string header = "Content-Length: " + std::to_string(payload.size()) + HEADER_SEPARATOR;
    std::string frame;
    frame.reserve(header.size() + payload.size());
    frame.append(header);
    frame.append(payload);
    return frame;
}

std::optional<std::string> ContentLengthFramer::next_frame(std::string& buffer) const {
    skip_line_breaks(buffer);

    size_t header_end = buffer.find(HEADER_SEPARATOR);
    if (header_end == std::string::npos) {
        if (buffer.size() > MAX_HEADER_BYTES) {
            throw FramingError("Header block exceeds " + std::to_string(MAX_HEADER_BYTES) + " bytes");
        }
        return std::nullopt;
    }
    if (header_end > MAX_HEADER_BYTES) {
        throw FramingError("Header block exceeds " + std::to_string(MAX_HEADER_BYTES) + " bytes");
    }

    std::optional<size_t> content_length;
    size_t pos = 0;
    while (pos < header_end) {
        size_t eol = buffer.find("\r\n", pos);
        if (eol == std::string::npos || eol > header_end) eol = header_end;
        std::string line = buffer.substr(pos, eol - pos);
        pos = eol + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw FramingError("Malformed header line: " + line);
        }
        if (lower(trim(line.substr(0, colon))) != "content-length") continue;

        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || value.size() > 19
            || !std::all_of(value.begin(), value.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw FramingError("Invalid Content-Length header: " + value);
        }
        unsigned long long length = std::stoull(value);
        if (length > max_frame_bytes_) {
            throw FramingError("Content-Length " + value + " exceeds limit of "
                               + std::to_string(max_frame_bytes_));
        }
        content_length = static_cast<size_t>(length);
    }

    if (!content_length) {
        throw FramingError("Missing Content-Length header");
    }

    const size_t body_start = header_end + HEADER_SEPARATOR.size();
    if (buffer.size() < body_start + *content_length) {
        return std::nullopt;
    }

    std::string payload = buffer.substr(body_start, *content_length);
    buffer.erase(0, body_start + *content_length);
    return payload;
}

std::optional<std::string> ContentLengthFramer::finish(std::string& buffer) const {
    auto frame = next_frame(buffer);
    if (frame) return frame;
    if (!buffer.empty()) {
        throw FramingError("End of input inside a frame ("
                           + std::to_string(buffer.size()) + " bytes pending)");
    }
    return std::nullopt;
}

} // namespace mcpcore
