#pragma once

#include <devscope/config/server_config.h>
#include <devscope/core/types.h>
#include <devscope/integration/browser_driver.h>
#include <devscope/integration/introspection_backend.h>
#include <devscope/mcp/tool_registry.h>
#include <devscope/streaming/session_manager.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devscope::mcp {

// Collaborators the tools are bound to; owned by the caller and shared with the server
struct ToolServices {
    std::shared_ptr<streaming::StreamingSessionManager> sessions;
    std::shared_ptr<integration::IBrowserDriver> browser;
    std::shared_ptr<integration::IIntrospectionBackend> analyzer;
};

// Tool groups in registration order
const std::vector<std::string>& toolGroups();

/**
 * Registers every tool, grouped by feature area, in a fixed order. Fails only when a name is
 * registered twice.
 */
Result<std::unique_ptr<ToolRegistry>> buildToolRegistry(const ToolServices& services,
                                                        const config::ServerConfig& config);

// ----- Requests -----

// Tools without arguments; any object is accepted
struct MCPNoArgsRequest {
    using RequestType = MCPNoArgsRequest;

    static Result<MCPNoArgsRequest> fromJson(const json& j);
    json arguments() const { return json::object(); }
};

struct MCPFindImplementationsRequest {
    using RequestType = MCPFindImplementationsRequest;

    std::string interfaceName;

    static Result<MCPFindImplementationsRequest> fromJson(const json& j);
    json arguments() const { return json{{"interface", interfaceName}}; }
};

struct MCPCallGraphRequest {
    using RequestType = MCPCallGraphRequest;

    std::string function = "main";

    static Result<MCPCallGraphRequest> fromJson(const json& j);
    json arguments() const { return json{{"function", function}}; }
};

struct MCPSearchCodeRequest {
    using RequestType = MCPSearchCodeRequest;

    std::string query;

    static Result<MCPSearchCodeRequest> fromJson(const json& j);
    json arguments() const { return json{{"query", query}}; }
};

struct MCPCampaignPipelineRequest {
    using RequestType = MCPCampaignPipelineRequest;

    std::string campaignId;

    static Result<MCPCampaignPipelineRequest> fromJson(const json& j);
    json arguments() const { return json{{"campaignId", campaignId}}; }
};

struct MCPFindByTypeRequest {
    using RequestType = MCPFindByTypeRequest;

    std::string type;

    static Result<MCPFindByTypeRequest> fromJson(const json& j);
    json arguments() const { return json{{"type", type}}; }
};

struct MCPReferencesRequest {
    using RequestType = MCPReferencesRequest;

    std::string symbol;
    std::optional<std::string> filePath;

    static Result<MCPReferencesRequest> fromJson(const json& j);
    json arguments() const;
};

struct MCPChangeImpactRequest {
    using RequestType = MCPChangeImpactRequest;

    std::string file;

    static Result<MCPChangeImpactRequest> fromJson(const json& j);
    json arguments() const { return json{{"file", file}}; }
};

struct MCPRunTerminalCommandRequest {
    using RequestType = MCPRunTerminalCommandRequest;

    std::string command;
    std::optional<std::string> workingDir;

    static Result<MCPRunTerminalCommandRequest> fromJson(const json& j);
};

struct MCPApplyCodeChangeRequest {
    using RequestType = MCPApplyCodeChangeRequest;

    std::string diff;

    static Result<MCPApplyCodeChangeRequest> fromJson(const json& j);
};

struct MCPBrowseRequest {
    using RequestType = MCPBrowseRequest;

    std::string url;

    static Result<MCPBrowseRequest> fromJson(const json& j);
};

struct MCPScreenshotRequest {
    using RequestType = MCPScreenshotRequest;

    bool base64 = false;

    static Result<MCPScreenshotRequest> fromJson(const json& j);
};

struct MCPUiTestPromptRequest {
    using RequestType = MCPUiTestPromptRequest;

    std::string url;
    std::vector<integration::UiAction> actions;

    static Result<MCPUiTestPromptRequest> fromJson(const json& j);
};

struct MCPBrowseIncrementalRequest {
    using RequestType = MCPBrowseIncrementalRequest;

    std::string url;
    std::optional<std::string> sessionId; // generated when absent
    std::optional<streaming::StreamingMode> mode;

    static Result<MCPBrowseIncrementalRequest> fromJson(const json& j);
};

struct MCPProcessUiActionRequest {
    using RequestType = MCPProcessUiActionRequest;

    std::string sessionId;
    integration::UiAction action;

    static Result<MCPProcessUiActionRequest> fromJson(const json& j);
};

struct MCPIncrementalStateRequest {
    using RequestType = MCPIncrementalStateRequest;

    std::string sessionId;
    bool includeScreenshot = false;
    bool includeDeltas = false;

    static Result<MCPIncrementalStateRequest> fromJson(const json& j);
};

struct MCPSetStreamingModeRequest {
    using RequestType = MCPSetStreamingModeRequest;

    std::string sessionId;
    streaming::StreamingMode mode = streaming::StreamingMode::Adaptive;
    std::optional<double> adaptiveThreshold;

    static Result<MCPSetStreamingModeRequest> fromJson(const json& j);
};

struct MCPStreamStatsRequest {
    using RequestType = MCPStreamStatsRequest;

    std::optional<std::string> sessionId;

    static Result<MCPStreamStatsRequest> fromJson(const json& j);
};

struct MCPSessionIdRequest {
    using RequestType = MCPSessionIdRequest;

    std::string sessionId;

    static Result<MCPSessionIdRequest> fromJson(const json& j);
};

struct MCPDebugInfoRequest {
    using RequestType = MCPDebugInfoRequest;

    std::string sessionId;
    bool includeDetailedState = false;

    static Result<MCPDebugInfoRequest> fromJson(const json& j);
};

// ----- Responses -----

// Analyzer output rendered as its summary followed by the data
struct MCPAnalysisResponse {
    using ResponseType = MCPAnalysisResponse;

    integration::AnalysisReport report;

    json toJson() const;
    std::string toText() const;
};

struct MCPCommandResponse {
    using ResponseType = MCPCommandResponse;

    std::string headline;
    int exitCode = 0;
    std::string stdoutData;
    std::string stderrData;

    json toJson() const;
    std::string toText() const;
};

struct MCPUiCaptureResponse {
    using ResponseType = MCPUiCaptureResponse;

    streaming::UiSnapshot snapshot;
    bool includeContent = false;

    json toJson() const;
};

struct MCPUiMetadataResponse {
    using ResponseType = MCPUiMetadataResponse;

    streaming::UiSnapshot snapshot;

    json toJson() const;
};

struct MCPScreenshotResponse {
    using ResponseType = MCPScreenshotResponse;

    std::string url;
    std::string screenshot;
    bool base64 = false;

    json toJson() const;
};

struct MCPUiTestPromptResponse {
    using ResponseType = MCPUiTestPromptResponse;

    struct Step {
        integration::UiAction action;
        std::string title;
        std::size_t regionCount = 0;
    };

    std::string url;
    std::vector<Step> steps;
    streaming::UiSnapshot finalSnapshot;

    json toJson() const;
    std::string toText() const;
};

// Streaming results already carry their JSON shape
template <typename T> struct MCPStructuredResponse {
    using ResponseType = MCPStructuredResponse<T>;

    T value;

    json toJson() const { return value.toJson(); }
};

using MCPCaptureResponse = MCPStructuredResponse<streaming::CaptureResult>;
using MCPSessionStateResponse = MCPStructuredResponse<streaming::SessionState>;
using MCPStreamStatsResponse = MCPStructuredResponse<streaming::StreamStats>;
using MCPCleanupResponse = MCPStructuredResponse<streaming::CleanupResult>;
using MCPDebugInfoResponse = MCPStructuredResponse<streaming::DebugInfo>;

} // namespace devscope::mcp
