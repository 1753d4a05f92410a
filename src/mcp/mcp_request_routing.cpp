#include <devscope/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace devscope::mcp {

namespace {

std::optional<spdlog::level::level_enum> parseMcpLogLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info" || level == "notice")
        return spdlog::level::info;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical" || level == "alert" || level == "emergency")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return std::nullopt;
}

void must(const Result<void>& r) {
    if (!r) {
        spdlog::critical("Failed to register core method: {}", r.error().message);
        throw std::logic_error(r.error().message);
    }
}

} // namespace

const std::vector<std::string>& supportedProtocolVersions() {
    static const std::vector<std::string> kSupported = {"2024-11-05", "2025-03-26",
                                                        "2025-06-18"};
    return kSupported;
}

void MCPServer::registerCoreMethods() {
    auto bind = [this](auto fn) -> MethodHandler {
        return [this, fn](const json& params,
                          const RequestContext& ctx) -> boost::asio::awaitable<Result<json>> {
            return (this->*fn)(params, ctx);
        };
    };

    must(dispatch_.add(std::string(protocol::METHOD_INITIALIZE),
                       bind(&MCPServer::handleInitialize)));
    must(dispatch_.add(std::string(protocol::METHOD_INITIALIZED),
                       bind(&MCPServer::handleInitialized)));
    must(dispatch_.add(std::string(protocol::METHOD_CANCELLED),
                       bind(&MCPServer::handleCancelled)));
    must(dispatch_.add(std::string(protocol::METHOD_TOOLS_LIST),
                       bind(&MCPServer::handleToolsList)));
    must(dispatch_.add(std::string(protocol::METHOD_TOOLS_CALL),
                       bind(&MCPServer::handleToolsCall)));
    must(dispatch_.add(std::string(protocol::METHOD_SET_LOG_LEVEL),
                       bind(&MCPServer::handleSetLevel)));
    dispatch_.freeze();
}

boost::asio::awaitable<Result<json>> MCPServer::handleInitialize(const json& params,
                                                                 const RequestContext&) {
    const auto& supported = supportedProtocolVersions();
    const std::string latest = supported.back();

    std::string requested = latest;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    spdlog::debug("MCP client requested protocol version: {}", requested);

    // Unsupported revisions fall back to the newest one we speak
    std::string negotiated = latest;
    if (std::find(supported.begin(), supported.end(), requested) != supported.end()) {
        negotiated = requested;
    }

    ClientInfo info;
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        info.name = params["clientInfo"].value("name", "unknown");
        info.version = params["clientInfo"].value("version", "unknown");
    }

    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        negotiatedProtocolVersion_ = negotiated;
        clientInfo_ = info;
    }
    spdlog::info("MCP initialize from {} {} (protocol {})", info.name, info.version, negotiated);

    co_return json{
        {"protocolVersion", negotiated},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", options_.serverName}, {"version", options_.serverVersion}}}};
}

boost::asio::awaitable<Result<json>> MCPServer::handleInitialized(const json&,
                                                                  const RequestContext&) {
    spdlog::info("MCP marking client as initialized");
    clientInitialized_.store(true);
    co_return json::object();
}

boost::asio::awaitable<Result<json>> MCPServer::handleCancelled(const json& params,
                                                                const RequestContext&) {
    // {"requestId": <id>} per MCP; {"id": <id>} is accepted too
    json target;
    if (params.is_object() && params.contains("requestId")) {
        target = params["requestId"];
    } else if (params.is_object() && params.contains("id")) {
        target = params["id"];
    } else {
        spdlog::warn("notifications/cancelled missing requestId");
        co_return Error{ErrorCode::InvalidArgument, "Missing requestId"};
    }
    cancelRequest(target);
    if (params.contains("reason") && params["reason"].is_string()) {
        spdlog::info("Cancel requested for id {} ({})", target.dump(),
                     params["reason"].get<std::string>());
    } else {
        spdlog::info("Cancel requested for id {}", target.dump());
    }
    co_return json::object();
}

boost::asio::awaitable<Result<json>> MCPServer::handleToolsList(const json&,
                                                                const RequestContext&) {
    co_return toolRegistry_->listTools();
}

boost::asio::awaitable<Result<json>> MCPServer::handleToolsCall(const json& params,
                                                                const RequestContext& ctx) {
    if (!params.is_object()) {
        co_return Error{ErrorCode::InvalidArgument, "tools/call params must be an object"};
    }
    auto name = json_utils::get_field<std::string>(params, "name");
    if (!name) {
        co_return name.error();
    }
    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object() && !arguments.is_null()) {
        co_return Error{ErrorCode::InvalidArgument, "tools/call arguments must be an object"};
    }

    const auto& toolName = name.value();
    if (!toolRegistry_->getTool(toolName)) {
        spdlog::debug("MCP tool call for unknown tool '{}'", toolName);
        co_return json{{"content", json::array({json{{"type", "text"},
                                                     {"text", "Unknown tool: " + toolName}}})},
                       {"isError", true}};
    }
    if (ctx.cancelled()) {
        co_return Error{ErrorCode::OperationCancelled, "Request cancelled"};
    }

    spdlog::debug("MCP tool call: '{}' with args: {}", toolName, arguments.dump());
    co_return co_await toolRegistry_->callTool(toolName, arguments);
}

boost::asio::awaitable<Result<json>> MCPServer::handleSetLevel(const json& params,
                                                               const RequestContext&) {
    auto level = json_utils::get_field<std::string>(params, "level");
    if (!level) {
        co_return level.error();
    }
    auto parsed = parseMcpLogLevel(level.value());
    if (!parsed) {
        co_return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level.value()};
    }
    spdlog::set_level(*parsed);
    spdlog::info("Log level set to {}", level.value());
    co_return json::object();
}

} // namespace devscope::mcp
