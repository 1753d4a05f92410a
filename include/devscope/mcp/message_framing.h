#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace devscope::mcp {

// On-wire message shapes accepted on stdio
enum class FramingMode {
    LineDelimited, // one JSON document per line
    ContentLength  // LSP-style "Content-Length: <n>" header block followed by n bytes
};

enum class FrameStatus { Message, EndOfStream, FramingError };

struct Frame {
    FrameStatus status = FrameStatus::EndOfStream;
    FramingMode mode = FramingMode::LineDelimited;
    std::string payload; // raw bytes; no JSON validation is performed here
    std::string error;

    bool isMessage() const noexcept { return status == FrameStatus::Message; }
};

const char* framingModeName(FramingMode mode) noexcept;

/**
 * Extracts one raw payload per inbound unit. The shape is detected per message from the first
 * non-blank line: a Content-Length header starts a header block, anything else is a complete
 * line-delimited payload.
 */
class MessageFramer {
public:
    static constexpr std::size_t kDefaultMaxMessageBytes = 64u * 1024u * 1024u;

    explicit MessageFramer(std::size_t maxMessageBytes = kDefaultMaxMessageBytes)
        : maxMessageBytes_(maxMessageBytes) {}

    Frame readOneMessage(std::istream& in) const;

    // Frames a serialized payload; the caller owns synchronization of the stream.
    static void writeMessage(std::ostream& out, std::string_view payload, FramingMode mode);
    static std::string frame(std::string_view payload, FramingMode mode);

    std::size_t maxMessageBytes() const noexcept { return maxMessageBytes_; }

private:
    Frame readContentLengthBody(std::istream& in, std::size_t length) const;

    std::size_t maxMessageBytes_;
};

namespace framing_detail {
// Returns true when `line` is a Content-Length header; `value` receives the trimmed value text.
bool matchContentLengthHeader(std::string_view line, std::string_view& value) noexcept;
// Trims ASCII whitespace and a trailing CR.
std::string_view trimLine(std::string_view line) noexcept;
} // namespace framing_detail

} // namespace devscope::mcp
