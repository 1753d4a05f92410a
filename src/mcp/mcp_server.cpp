#include <devscope/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <csignal>
#include <exception>

namespace devscope::mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::unique_ptr<ToolRegistry> toolRegistry,
                     std::shared_ptr<streaming::StreamingSessionManager> sessions,
                     ServerOptions options, std::atomic<bool>* externalRunning)
    : transport_(std::move(transport)), toolRegistry_(std::move(toolRegistry)),
      sessions_(std::move(sessions)), options_(std::move(options)),
      externalRunning_(externalRunning) {
    if (!toolRegistry_) {
        toolRegistry_ = std::make_unique<ToolRegistry>();
    }
    if (options_.workerThreads == 0) {
        options_.workerThreads = 1;
    }
    // Lets an idle blocking read observe process shutdown
    if (auto* stdioTransport = dynamic_cast<StdioTransport*>(transport_.get())) {
        stdioTransport->setShutdownFlag(externalRunning_);
    }
    registerCoreMethods();
}

MCPServer::~MCPServer() {
    stop();
    drainExecutor();
}

std::string MCPServer::negotiatedProtocolVersion() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return negotiatedProtocolVersion_;
}

ClientInfo MCPServer::clientInfo() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return clientInfo_;
}

void MCPServer::writeMessage(const json& message) {
    spdlog::trace("MCP server sending: {}", message.dump());
    transport_->send(message);
    responsesWritten_.fetch_add(1);
}

bool MCPServer::keepReading() const {
    return running_.load() && (!externalRunning_ || externalRunning_->load());
}

void MCPServer::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }
    // A client that stops reading must not terminate the process on write
    std::signal(SIGPIPE, SIG_IGN);

    startExecutor();
    spdlog::info("MCP server started ({} worker threads, {} tools)", options_.workerThreads,
                 toolRegistry_->size());

    while (keepReading()) {
        Frame frame = transport_->receive();
        if (frame.status == FrameStatus::EndOfStream) {
            spdlog::debug("Input closed: {}", frame.error);
            break;
        }
        if (frame.status == FrameStatus::FramingError) {
            spdlog::warn("Closing connection after framing error: {}", frame.error);
            break;
        }

        auto parsed = EnvelopeCodec::parse(frame.payload);
        if (!parsed) {
            // The stream position can no longer be trusted
            spdlog::warn("Closing connection after unparseable message: {}",
                         parsed.error().message);
            writeMessage(EnvelopeCodec::makeParseError(parsed.error().message));
            break;
        }

        for (auto& decoded : EnvelopeCodec::decodeAll(parsed.value())) {
            if (!decoded.envelope) {
                if (!decoded.rejection.is_null()) {
                    writeMessage(decoded.rejection);
                }
                continue;
            }
            handleEnvelope(std::move(*decoded.envelope));
        }
    }

    running_.store(false);
    drainExecutor();
    spdlog::info("MCP server stopped ({} messages written)", responsesWritten_.load());
}

void MCPServer::stop() {
    running_.store(false);
    cancelAll();
    if (transport_) {
        transport_->close();
    }
}

void MCPServer::handleEnvelope(Envelope envelope) {
    switch (envelope.kind) {
        case EnvelopeKind::Response:
        case EnvelopeKind::ErrorResponse:
            // The server issues no requests of its own
            spdlog::debug("Ignoring inbound {} for id {}", envelopeKindName(envelope.kind),
                          envelope.id.dump());
            return;
        case EnvelopeKind::Notification:
            runNotification(std::move(envelope));
            return;
        case EnvelopeKind::Request:
            break;
    }

    if (!dispatch_.contains(envelope.method)) {
        spdlog::debug("Method not found: {}", envelope.method);
        writeMessage(EnvelopeCodec::makeError(envelope.id, protocol::METHOD_NOT_FOUND,
                                              "Method not found: " + envelope.method));
        return;
    }

    auto token = registerCancelable(envelope.id);
    if (!token) {
        spdlog::warn("Dropping request with id {}: a request with that id is still in flight",
                     envelope.id.dump());
        return;
    }

    boost::asio::co_spawn(pool_->get_executor(), runRequest(std::move(envelope), token),
                          boost::asio::detached);
}

void MCPServer::runNotification(Envelope envelope) {
    if (!dispatch_.contains(envelope.method)) {
        spdlog::debug("Dropping unknown notification: {}", envelope.method);
        return;
    }

    // notifications/* stay inline and in arrival order; a tools/call without an id goes to the pool
    if (envelope.method.starts_with("notifications/")) {
        boost::asio::io_context io;
        boost::asio::co_spawn(io, notificationTask(std::move(envelope)), boost::asio::detached);
        io.run();
        return;
    }
    boost::asio::co_spawn(pool_->get_executor(), notificationTask(std::move(envelope)),
                          boost::asio::detached);
}

boost::asio::awaitable<void> MCPServer::notificationTask(Envelope envelope) {
    const RequestContext ctx{nullptr, nullptr};
    try {
        const auto* handler = dispatch_.find(envelope.method);
        const json params = envelope.params.is_null() ? json::object() : envelope.params;
        auto result = co_await (*handler)(params, ctx);
        if (!result) {
            spdlog::debug("Notification {} ignored: {}", envelope.method,
                          result.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Notification {} failed: {}", envelope.method, e.what());
    }
}

boost::asio::awaitable<void>
MCPServer::runRequest(Envelope envelope, std::shared_ptr<std::atomic<bool>> cancelToken) {
    const json id = envelope.id;
    const RequestContext ctx{id, cancelToken};
    json response;

    try {
        const auto* handler = dispatch_.find(envelope.method);
        if (ctx.cancelled()) {
            response = EnvelopeCodec::makeError(id, protocol::REQUEST_CANCELLED,
                                                "Request cancelled");
        } else {
            const json params = envelope.params.is_null() ? json::object() : envelope.params;
            auto result = co_await (*handler)(params, ctx);
            if (ctx.cancelled()) {
                response = EnvelopeCodec::makeError(id, protocol::REQUEST_CANCELLED,
                                                    "Request cancelled");
            } else if (result) {
                response = EnvelopeCodec::makeResponse(id, std::move(result).value());
            } else {
                const int code = rpcErrorCode(result.error().code);
                response = EnvelopeCodec::makeError(
                    id, code,
                    code == protocol::REQUEST_CANCELLED ? "Request cancelled"
                                                        : result.error().message);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Handler for '{}' (id {}) threw: {}", envelope.method, id.dump(), e.what());
        response = EnvelopeCodec::makeError(id, protocol::SERVER_ERROR, e.what());
    } catch (...) {
        spdlog::error("Handler for '{}' (id {}) threw a non-standard exception", envelope.method,
                      id.dump());
        response = EnvelopeCodec::makeError(id, protocol::SERVER_ERROR, "Unknown handler failure");
    }

    writeResponseOnce(id, response);
}

boost::asio::awaitable<void> MCPServer::sweepLoop() {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    activeSweepTimer_ = &timer;
    while (running_.load()) {
        timer.expires_after(options_.sweepInterval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !running_.load()) {
            break;
        }
        auto evicted = sessions_->evictIdle(streaming::StreamingSessionManager::Clock::now());
        if (evicted > 0) {
            spdlog::info("Evicted {} idle streaming session(s)", evicted);
        }
    }
    activeSweepTimer_ = nullptr;
}

void MCPServer::startExecutor() {
    pool_ = std::make_unique<boost::asio::thread_pool>(options_.workerThreads);
    if (sessions_ && options_.sweepInterval.count() > 0) {
        using SweepStrand = boost::asio::strand<boost::asio::thread_pool::executor_type>;
        sweepStrand_ =
            std::make_unique<SweepStrand>(boost::asio::make_strand(pool_->get_executor()));
        boost::asio::co_spawn(*sweepStrand_, sweepLoop(), boost::asio::detached);
    }
}

void MCPServer::drainExecutor() {
    if (!pool_) {
        return;
    }
    if (sweepStrand_) {
        boost::asio::post(*sweepStrand_, [this]() {
            if (activeSweepTimer_) {
                activeSweepTimer_->cancel();
            }
        });
    }
    // Waits for in-flight requests; their responses are still written
    pool_->join();
    sweepStrand_.reset();
    pool_.reset();
}

} // namespace devscope::mcp
