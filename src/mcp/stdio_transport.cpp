#include <devscope/mcp/transport.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace devscope::mcp {

std::optional<OutputFraming> parseOutputFraming(std::string_view name) {
    if (name == "ndjson" || name == "line" || name == "lines") {
        return OutputFraming::Ndjson;
    }
    if (name == "content-length" || name == "framed" || name == "lsp") {
        return OutputFraming::ContentLength;
    }
    if (name == "mirror" || name == "auto") {
        return OutputFraming::Mirror;
    }
    return std::nullopt;
}

const char* outputFramingName(OutputFraming framing) noexcept {
    switch (framing) {
        case OutputFraming::Ndjson:
            return "ndjson";
        case OutputFraming::ContentLength:
            return "content-length";
        case OutputFraming::Mirror:
            return "mirror";
    }
    return "unknown";
}

StdioTransport::StdioTransport(Options options) : StdioTransport(std::cin, std::cout, options) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, Options options)
    : in_(in), out_(out), options_(options), framer_(options.maxMessageBytes) {
    state_.store(TransportState::Connected);
}

StdioTransport::~StdioTransport() {
    state_.store(TransportState::Disconnected);
}

FramingMode StdioTransport::resolveOutputMode() const noexcept {
    switch (options_.outputFraming) {
        case OutputFraming::ContentLength:
            return FramingMode::ContentLength;
        case OutputFraming::Mirror:
            return lastInbound_.load();
        case OutputFraming::Ndjson:
            break;
    }
    return FramingMode::LineDelimited;
}

void StdioTransport::send(const json& message) {
    sendSerialized(message.dump());
}

void StdioTransport::sendSerialized(const std::string& payload) {
    // Responses produced while draining after close() are still delivered
    if (state_.load() == TransportState::Error) {
        spdlog::warn("StdioTransport: dropping outbound message, output stream is broken");
        return;
    }
    std::lock_guard<std::mutex> lock(outMutex_);
    MessageFramer::writeMessage(out_, payload, resolveOutputMode());
    if (!out_) {
        spdlog::error("StdioTransport: failed writing {} bytes to output", payload.size());
        state_.store(TransportState::Error);
        return;
    }
    sentCount_.fetch_add(1);
}

bool StdioTransport::waitForInput() {
    if (options_.pollFd < 0) {
        return true;
    }
    while (true) {
        if (state_.load() != TransportState::Connected) {
            return false;
        }
        if (externalRunning_ && !externalRunning_->load()) {
            return false;
        }
        // Buffered bytes are not visible to poll()
        if (in_.rdbuf() && in_.rdbuf()->in_avail() > 0) {
            return true;
        }

        struct pollfd fds;
        fds.fd = options_.pollFd;
        fds.events = POLLIN | POLLHUP;
        fds.revents = 0;
        int rc = poll(&fds, 1, options_.pollIntervalMs);
        if (rc > 0) {
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            spdlog::error("StdioTransport: poll failed (errno {})", errno);
            return true; // let the read surface the failure
        }
    }
}

Frame StdioTransport::receive() {
    if (!waitForInput()) {
        Frame f;
        f.status = FrameStatus::EndOfStream;
        f.error = "transport closed";
        return f;
    }

    auto frame = framer_.readOneMessage(in_);
    switch (frame.status) {
        case FrameStatus::Message:
            lastInbound_.store(frame.mode);
            errorCount_.store(0);
            break;
        case FrameStatus::EndOfStream:
            spdlog::debug("StdioTransport: end of input ({})", frame.error);
            state_.store(TransportState::Disconnected);
            break;
        case FrameStatus::FramingError:
            errorCount_.fetch_add(1);
            spdlog::error("StdioTransport: framing error: {}", frame.error);
            state_.store(TransportState::Closing);
            break;
    }
    return frame;
}

} // namespace devscope::mcp
