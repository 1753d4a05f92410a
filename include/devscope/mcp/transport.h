#pragma once

#include <devscope/mcp/error_handling.h>
#include <devscope/mcp/message_framing.h>

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace devscope::mcp {

// How outbound messages are framed
enum class OutputFraming {
    Ndjson,
    ContentLength,
    Mirror // answer in the framing of the most recent inbound message
};

std::optional<OutputFraming> parseOutputFraming(std::string_view name);
const char* outputFramingName(OutputFraming framing) noexcept;

/**
 * Transport interface for MCP communication
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    // Writes one complete serialized message; concurrent callers never interleave.
    virtual void send(const json& message) = 0;
    virtual void sendSerialized(const std::string& payload) = 0;
    // Blocks until one inbound unit is framed, the stream ends, or the framing is broken.
    virtual Frame receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Standard I/O transport. Input is read sequentially by a single reader; output writes take a
 * single mutex so a complete framed message is written before the next one begins.
 */
class StdioTransport : public ITransport {
public:
    struct Options {
        OutputFraming outputFraming = OutputFraming::Ndjson;
        std::size_t maxMessageBytes = MessageFramer::kDefaultMaxMessageBytes;
        // Descriptor polled for readiness so shutdown is observed while idle (-1 disables)
        int pollFd = -1;
        int pollIntervalMs = 200;
    };

    // Binds std::cin / std::cout
    explicit StdioTransport(Options options);
    StdioTransport(std::istream& in, std::ostream& out, Options options);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void send(const json& message) override;
    void sendSerialized(const std::string& payload) override;
    Frame receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

    // External running flag (true while the process should keep serving)
    void setShutdownFlag(std::atomic<bool>* running) { externalRunning_ = running; }

    FramingMode lastInboundFraming() const noexcept { return lastInbound_.load(); }
    std::size_t messagesSent() const noexcept { return sentCount_.load(); }

private:
    FramingMode resolveOutputMode() const noexcept;
    bool waitForInput();

    std::istream& in_;
    std::ostream& out_;
    Options options_;
    MessageFramer framer_;

    std::atomic<TransportState> state_{TransportState::Connected};
    std::atomic<bool>* externalRunning_{nullptr};
    std::atomic<FramingMode> lastInbound_{FramingMode::LineDelimited};
    std::atomic<std::size_t> sentCount_{0};
    std::atomic<std::size_t> errorCount_{0};

    mutable std::mutex outMutex_;
};

} // namespace devscope::mcp
