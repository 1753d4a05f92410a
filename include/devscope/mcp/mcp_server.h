#pragma once

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <devscope/core/types.h>
#include <devscope/mcp/dispatch_table.h>
#include <devscope/mcp/envelope.h>
#include <devscope/mcp/error_handling.h>
#include <devscope/mcp/tool_registry.h>
#include <devscope/mcp/transport.h>
#include <devscope/streaming/session_manager.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef DEVSCOPE_VERSION_STRING
#define DEVSCOPE_VERSION_STRING "0.1.0"
#endif

namespace devscope::mcp {

// Protocol revisions accepted during initialize, newest last
const std::vector<std::string>& supportedProtocolVersions();

struct ServerOptions {
    std::size_t workerThreads = 2;
    // Idle-session sweep period; zero disables the sweep
    std::chrono::seconds sweepInterval{60};
    std::string serverName = "devscope";
    std::string serverVersion = DEVSCOPE_VERSION_STRING;
};

struct ClientInfo {
    std::string name = "unknown";
    std::string version = "unknown";
};

/**
 * JSON-RPC server over a single transport. The read loop runs on the caller's thread and never
 * waits on a handler: protocol notifications are handled inline, requests and any other
 * notification run on a bounded boost::asio::thread_pool. Every request id receives exactly one
 * response, written through the transport's single output lock.
 */
class MCPServer {
public:
    MCPServer(std::unique_ptr<ITransport> transport, std::unique_ptr<ToolRegistry> toolRegistry,
              std::shared_ptr<streaming::StreamingSessionManager> sessions,
              ServerOptions options = {}, std::atomic<bool>* externalRunning = nullptr);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Serves until the input ends, the framing breaks, or stop() is called; in-flight requests
    // are drained before returning.
    void start();
    // Cancels every in-flight request and closes the transport
    void stop();
    bool isRunning() const { return running_.load(); }

    const DispatchTable& dispatchTable() const noexcept { return dispatch_; }
    const ToolRegistry& toolRegistry() const noexcept { return *toolRegistry_; }
    std::size_t responsesWritten() const noexcept { return responsesWritten_.load(); }
    std::size_t inFlightRequests() const;
    bool clientInitialized() const noexcept { return clientInitialized_.load(); }
    std::string negotiatedProtocolVersion() const;
    ClientInfo clientInfo() const;

private:
    // mcp_request_routing.cpp
    void registerCoreMethods();
    boost::asio::awaitable<Result<json>> handleInitialize(const json& params,
                                                          const RequestContext& ctx);
    boost::asio::awaitable<Result<json>> handleInitialized(const json& params,
                                                           const RequestContext& ctx);
    boost::asio::awaitable<Result<json>> handleCancelled(const json& params,
                                                         const RequestContext& ctx);
    boost::asio::awaitable<Result<json>> handleToolsList(const json& params,
                                                         const RequestContext& ctx);
    boost::asio::awaitable<Result<json>> handleToolsCall(const json& params,
                                                         const RequestContext& ctx);
    boost::asio::awaitable<Result<json>> handleSetLevel(const json& params,
                                                        const RequestContext& ctx);

    // mcp_server.cpp
    void handleEnvelope(Envelope envelope);
    void runNotification(Envelope envelope);
    boost::asio::awaitable<void> notificationTask(Envelope envelope);
    boost::asio::awaitable<void> runRequest(Envelope envelope,
                                            std::shared_ptr<std::atomic<bool>> cancelToken);
    boost::asio::awaitable<void> sweepLoop();
    void startExecutor();
    void drainExecutor();
    void writeMessage(const json& message);
    bool keepReading() const;

    // mcp_cancellation.cpp
    // nullptr when a request with the same id is still in flight
    std::shared_ptr<std::atomic<bool>> registerCancelable(const json& id);
    void cancelRequest(const json& id);
    void cancelAll();
    // Writes the response for `id` unless one was already written
    bool writeResponseOnce(const json& id, const json& response);

    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<ToolRegistry> toolRegistry_;
    std::shared_ptr<streaming::StreamingSessionManager> sessions_;
    ServerOptions options_;
    std::atomic<bool>* externalRunning_;
    std::atomic<bool> running_{false};

    DispatchTable dispatch_;

    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::unique_ptr<boost::asio::strand<boost::asio::thread_pool::executor_type>> sweepStrand_;
    boost::asio::steady_timer* activeSweepTimer_{nullptr}; // touched only on sweepStrand_

    mutable std::mutex cancelMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> cancelTokens_;

    mutable std::mutex stateMutex_;
    std::string negotiatedProtocolVersion_;
    ClientInfo clientInfo_;
    std::atomic<bool> clientInitialized_{false};
    std::atomic<std::size_t> responsesWritten_{0};
};

} // namespace devscope::mcp
