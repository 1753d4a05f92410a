#include <devscope/integration/process_runner.h>
#include <devscope/mcp/tool_catalog.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>

namespace devscope::mcp {

using boost::asio::awaitable;
using integration::AnalysisQuery;
using integration::ProcessRunner;
using integration::ProcessSpec;
using streaming::UiSnapshot;

namespace {

namespace group {
constexpr std::string_view Database = "Database";
constexpr std::string_view CodeAnalysis = "Code Analysis";
constexpr std::string_view Configuration = "Configuration";
constexpr std::string_view Search = "Search";
constexpr std::string_view WebSocket = "WebSocket";
constexpr std::string_view BusinessLogic = "Business Logic";
constexpr std::string_view Advanced = "Advanced";
constexpr std::string_view Interactive = "Interactive";
constexpr std::string_view UI = "UI";
constexpr std::string_view UIStreaming = "UI Streaming";
constexpr std::string_view Analysis = "Analysis";
constexpr std::string_view Frontend = "Frontend";
constexpr std::string_view BusinessDomain = "Business Domain";
constexpr std::string_view EnhancedAnalysis = "Enhanced Analysis";
} // namespace group

// Session id used by the one-shot UI tools
constexpr const char* kBrowseSessionId = "devscope-browse";

json objectSchema(json properties, std::vector<std::string> required = {}) {
    json schema{{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) {
        schema["required"] = std::move(required);
    }
    return schema;
}

json prop(std::string_view type, std::string_view description) {
    return json{{"type", std::string(type)}, {"description", std::string(description)}};
}

json modeProp(std::string_view description) {
    auto p = prop("string", description);
    p["enum"] = json::array({"full", "incremental", "adaptive"});
    return p;
}

json actionProperties() {
    auto action = prop("string", "Type of action to perform");
    action["enum"] = integration::supportedUiActions();
    auto timeout = prop("integer", "Timeout in milliseconds");
    timeout["minimum"] = 0;
    return json{{"action", std::move(action)},
                {"selector", prop("string", "CSS selector for the target element")},
                {"text", prop("string", "Text to type (for type action)")},
                {"url", prop("string", "URL to navigate to (for navigate action)")},
                {"timeout", std::move(timeout)},
                {"x", prop("number", "X coordinate for action")},
                {"y", prop("number", "Y coordinate for action")}};
}

std::string generateSessionId() {
    static std::atomic<std::uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};
    auto n = counter.fetch_add(1) + 1;
    return fmt::format("ui-{}-{:08x}", n, static_cast<std::uint32_t>(rng()));
}

// The most recent one-shot capture, read by the metadata and screenshot tools
class LatestCapture {
public:
    void store(const UiSnapshot& snapshot) {
        std::lock_guard<std::mutex> lk(mutex_);
        latest_ = snapshot;
    }

    Result<UiSnapshot> get() const {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!latest_) {
            return Error{ErrorCode::NotFound,
                         "No UI capture available; call browse_with_playwright first"};
        }
        return *latest_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<UiSnapshot> latest_;
};

struct CatalogContext {
    ToolServices services;
    bool allowTerminal = true;
    std::chrono::milliseconds commandTimeout{120'000};
    std::filesystem::path projectRoot;
    std::shared_ptr<LatestCapture> latest = std::make_shared<LatestCapture>();
    std::atomic<std::uint64_t> uiTestRuns{0};
};

class CatalogBuilder {
public:
    CatalogBuilder(ToolRegistry& registry, std::shared_ptr<CatalogContext> ctx)
        : registry_(registry), ctx_(std::move(ctx)) {}

    Result<void> build() {
        for (auto step : {&CatalogBuilder::database, &CatalogBuilder::codeAnalysis,
                          &CatalogBuilder::configuration, &CatalogBuilder::search,
                          &CatalogBuilder::websocket, &CatalogBuilder::businessLogic,
                          &CatalogBuilder::advanced, &CatalogBuilder::interactive,
                          &CatalogBuilder::ui, &CatalogBuilder::uiStreaming,
                          &CatalogBuilder::analysis, &CatalogBuilder::frontend,
                          &CatalogBuilder::businessDomain, &CatalogBuilder::enhancedAnalysis}) {
            (this->*step)();
            if (!status_) {
                return status_;
            }
        }
        return {};
    }

private:
    void keep(Result<void> r) {
        if (status_ && !r) {
            status_ = std::move(r);
        }
    }

    // Informational tool answered by the analyzer; `kind` defaults to the tool name
    template <typename Req>
    void analysisTool(std::string_view name, std::string_view description, json schema,
                      std::string_view grp, std::string_view kind = {}) {
        auto analyzer = ctx_->services.analyzer;
        std::string queryKind(kind.empty() ? name : kind);
        keep(registry_.registerTool<Req, MCPAnalysisResponse>(
            name,
            [analyzer, queryKind](const Req& req) -> awaitable<Result<MCPAnalysisResponse>> {
                auto report = analyzer->query(AnalysisQuery{queryKind, req.arguments()});
                if (!report) {
                    co_return report.error();
                }
                co_return MCPAnalysisResponse{std::move(report).value()};
            },
            std::move(schema), description, grp));
    }

    void noArgs(std::string_view name, std::string_view description, std::string_view grp,
                std::string_view kind = {}) {
        analysisTool<MCPNoArgsRequest>(name, description, noParamsSchema(), grp, kind);
    }

    void database() {
        noArgs("get_database_schema",
               "Get the database schema including tables, columns, and indexes", group::Database);
        noArgs("get_backend_openapi_schema",
               "Get OpenAPI schema including specifications and route definitions",
               group::Database);
        noArgs("get_database_stats", "Get database performance statistics and metrics",
               group::Database);
    }

    void codeAnalysis() {
        noArgs("get_backend_data_models", "Get all backend data models and their structures",
               group::CodeAnalysis);
        noArgs("get_backend_api_routes", "Get all API routes and endpoints", group::CodeAnalysis);
        noArgs("get_backend_api_endpoints",
               "Get all API endpoints (alias for get_backend_api_routes)", group::CodeAnalysis,
               "get_backend_api_routes");
        noArgs("get_backend_request_handlers", "Get all backend request handlers",
               group::CodeAnalysis);
        noArgs("get_backend_services", "Get all backend service definitions and interfaces",
               group::CodeAnalysis);
        noArgs("get_interfaces", "Get all interfaces and their methods", group::CodeAnalysis);
        analysisTool<MCPFindImplementationsRequest>(
            "find_implementations", "Find implementations of interfaces",
            stringParamSchema("interface", "Interface name to find implementations for", true),
            group::CodeAnalysis);
        analysisTool<MCPCallGraphRequest>(
            "get_call_graph", "Get call graph analysis of functions",
            stringParamSchema("function",
                              "Function name to analyze (optional, defaults to 'main')", false),
            group::CodeAnalysis);
    }

    void configuration() {
        noArgs("get_config", "Get application configuration structure", group::Configuration);
        noArgs("get_middleware", "Get middleware configuration and usage", group::Configuration);
        noArgs("get_env_vars", "Get environment variables used in the application",
               group::Configuration);
    }

    void search() {
        analysisTool<MCPSearchCodeRequest>(
            "search_code", "Search for code patterns and implementations",
            stringParamSchema("query", "Search query for code", true), group::Search);
        noArgs("get_package_structure", "Get the package and module structure", group::Search);
        noArgs("get_dependencies", "Get project dependencies and their relationships",
               group::Search);
        noArgs("get_dependency_graph", "Get project package dependency graph", group::Search);
    }

    void websocket() {
        noArgs("get_websocket_endpoints", "Get WebSocket endpoints and their configurations",
               group::WebSocket);
        noArgs("get_websocket_handlers", "Get WebSocket message handlers", group::WebSocket);
        noArgs("get_websocket_messages", "Get WebSocket message types and structures",
               group::WebSocket);
        noArgs("get_websocket_lifecycle",
               "Get WebSocket connection lifecycle and state management", group::WebSocket);
        noArgs("test_websocket_flow", "Test WebSocket message flow and connectivity",
               group::WebSocket);
    }

    void businessLogic() {
        noArgs("get_middleware_usage", "Get middleware usage patterns and analysis",
               group::BusinessLogic);
        noArgs("trace_middleware_flow", "Trace middleware execution flow and pipeline",
               group::BusinessLogic);
        noArgs("get_workflows", "Get business workflows and processes", group::BusinessLogic);
        noArgs("get_business_rules", "Get business rules and validation logic",
               group::BusinessLogic);
        noArgs("get_feature_flags", "Get feature flags and their configurations",
               group::BusinessLogic);
        analysisTool<MCPCampaignPipelineRequest>(
            "get_campaign_pipeline", "Get the pipeline status for a campaign",
            stringParamSchema("campaignId", "Campaign UUID", true), group::BusinessLogic);
    }

    void advanced() {
        analysisTool<MCPFindByTypeRequest>("find_by_type", "Find code elements by type",
                                           stringParamSchema("type", "Type to search for", true),
                                           group::Advanced);
        analysisTool<MCPReferencesRequest>(
            "get_references", "Get references and usages of code elements",
            objectSchema({{"symbol", prop("string", "Symbol to find references for")},
                          {"filePath", prop("string", "File path context (optional)")}},
                         {"symbol"}),
            group::Advanced);
        analysisTool<MCPChangeImpactRequest>(
            "get_change_impact", "Analyze the impact of code changes",
            stringParamSchema("file", "File to analyze impact for", true), group::Advanced);
        noArgs("snapshot", "Create a snapshot of the current codebase state", group::Advanced);
        noArgs("contract_drift_check", "Check for API contract drift and inconsistencies",
               group::Advanced);
    }

    void interactive() {
        auto ctx = ctx_;
        keep(registry_.registerTool<MCPRunTerminalCommandRequest, MCPCommandResponse>(
            "run_terminal_command",
            [ctx](const MCPRunTerminalCommandRequest& req)
                -> awaitable<Result<MCPCommandResponse>> {
                if (!ctx->allowTerminal) {
                    co_return Error{ErrorCode::NotSupported,
                                    "run_terminal_command is disabled (tools.allow_terminal)"};
                }
                ProcessSpec spec;
                spec.executable = "/bin/sh";
                spec.args = {"-c", req.command};
                spec.workdir = ctx->projectRoot;
                if (req.workingDir && !req.workingDir->empty()) {
                    spec.workdir = ctx->projectRoot / *req.workingDir;
                }
                spec.timeout = ctx->commandTimeout;
                spdlog::info("run_terminal_command: {}", req.command);

                auto run = ProcessRunner::run(spec);
                if (!run) {
                    co_return Error{run.error().code,
                                    "running terminal command: " + run.error().message};
                }
                auto& out = run.value();
                if (out.timedOut) {
                    co_return Error{ErrorCode::Timeout,
                                    "Command timed out after " +
                                        std::to_string(ctx->commandTimeout.count()) + " ms"};
                }
                if (out.exitCode != 0) {
                    co_return Error{ErrorCode::InternalError,
                                    "Command exited with status " + std::to_string(out.exitCode) +
                                        "\nOutput: " + out.stdoutData +
                                        "\nError: " + out.stderrData};
                }
                co_return MCPCommandResponse{"Command executed successfully.", out.exitCode,
                                             std::move(out.stdoutData),
                                             std::move(out.stderrData)};
            },
            objectSchema({{"command", prop("string", "Command to execute")},
                          {"workingDir",
                           prop("string",
                                "Working directory for command execution (optional)")}},
                         {"command"}),
            "Execute terminal commands in the project context", group::Interactive));

        keep(registry_.registerTool<MCPApplyCodeChangeRequest, MCPCommandResponse>(
            "apply_code_change",
            [ctx](const MCPApplyCodeChangeRequest& req) -> awaitable<Result<MCPCommandResponse>> {
                ProcessSpec spec;
                spec.executable = "git";
                spec.args = {"apply", "-"};
                spec.workdir = ctx->projectRoot;
                spec.stdinData = req.diff;
                spec.timeout = ctx->commandTimeout;

                auto run = ProcessRunner::run(spec);
                if (!run) {
                    co_return Error{run.error().code,
                                    "applying code change: " + run.error().message};
                }
                auto& out = run.value();
                if (!out.succeeded()) {
                    co_return Error{ErrorCode::InternalError,
                                    "applying code change failed" +
                                        (out.timedOut ? std::string(" (timed out)")
                                                      : " (exit " + std::to_string(out.exitCode) +
                                                            ")") +
                                        "\nStdout: " + out.stdoutData +
                                        "\nStderr: " + out.stderrData};
                }
                co_return MCPCommandResponse{"Code change applied successfully.", out.exitCode,
                                             std::move(out.stdoutData),
                                             std::move(out.stderrData)};
            },
            stringParamSchema("diff", "The diff to apply", true),
            "Apply a code change using diff/patch", group::Interactive));
    }

    void ui() {
        auto ctx = ctx_;
        const json urlSchema = stringParamSchema("url", "URL to visit", true);

        keep(registry_.registerTool<MCPBrowseRequest, MCPUiCaptureResponse>(
            "browse_with_playwright",
            [ctx](const MCPBrowseRequest& req) -> awaitable<Result<MCPUiCaptureResponse>> {
                auto snap = ctx->services.browser->capture(kBrowseSessionId, req.url);
                if (!snap) {
                    co_return snap.error();
                }
                ctx->latest->store(snap.value());
                co_return MCPUiCaptureResponse{std::move(snap).value(), false};
            },
            urlSchema, "Fetch a URL in a headless browser and capture a screenshot", group::UI));

        keep(registry_.registerTool<MCPScreenshotRequest, MCPScreenshotResponse>(
            "get_latest_screenshot",
            [ctx](const MCPScreenshotRequest& req) -> awaitable<Result<MCPScreenshotResponse>> {
                auto snap = ctx->latest->get();
                if (!snap) {
                    co_return snap.error();
                }
                if (!snap.value().screenshot) {
                    co_return Error{ErrorCode::NotFound, "The latest capture has no screenshot"};
                }
                co_return MCPScreenshotResponse{snap.value().url, *snap.value().screenshot,
                                                req.base64};
            },
            objectSchema({{"base64", prop("boolean", "Return base64 encoded data")}}),
            "Return the most recent Playwright screenshot", group::UI));

        keep(registry_.registerTool<MCPNoArgsRequest, MCPUiMetadataResponse>(
            "get_ui_metadata",
            [ctx](const MCPNoArgsRequest&) -> awaitable<Result<MCPUiMetadataResponse>> {
                auto snap = ctx->latest->get();
                if (!snap) {
                    co_return snap.error();
                }
                co_return MCPUiMetadataResponse{std::move(snap).value()};
            },
            noParamsSchema(), "Extract component metadata from the last HTML capture",
            group::UI));

        keep(registry_.registerTool<MCPBrowseRequest, MCPUiCaptureResponse>(
            "get_visual_context",
            [ctx](const MCPBrowseRequest& req) -> awaitable<Result<MCPUiCaptureResponse>> {
                auto snap = ctx->services.browser->capture(kBrowseSessionId, req.url);
                if (!snap) {
                    co_return snap.error();
                }
                ctx->latest->store(snap.value());
                co_return MCPUiCaptureResponse{std::move(snap).value(), true};
            },
            urlSchema, "Run Playwright and assemble screenshot, metadata and code mapping",
            group::UI));

        auto actionItem = objectSchema(actionProperties(), {"action"});
        keep(registry_.registerTool<MCPUiTestPromptRequest, MCPUiTestPromptResponse>(
            "generate_ui_test_prompt_with_actions",
            [ctx](const MCPUiTestPromptRequest& req)
                -> awaitable<Result<MCPUiTestPromptResponse>> {
                auto sessionId = "devscope-ui-test-" + std::to_string(++ctx->uiTestRuns);
                auto snap = ctx->services.browser->capture(sessionId, req.url);
                if (!snap) {
                    co_return snap.error();
                }
                MCPUiTestPromptResponse resp;
                resp.url = req.url;
                resp.finalSnapshot = std::move(snap).value();
                for (const auto& action : req.actions) {
                    auto next = ctx->services.browser->perform(sessionId, action);
                    if (!next) {
                        co_return Error{next.error().code, "action '" + action.action +
                                                               "' failed: " +
                                                               next.error().message};
                    }
                    resp.finalSnapshot = std::move(next).value();
                    resp.steps.push_back(MCPUiTestPromptResponse::Step{
                        action, resp.finalSnapshot.title, resp.finalSnapshot.regions.size()});
                }
                ctx->latest->store(resp.finalSnapshot);
                co_return resp;
            },
            objectSchema({{"url", prop("string", "Initial URL")},
                          {"actions", {{"type", "array"},
                                       {"description", "List of UI actions"},
                                       {"items", std::move(actionItem)}}}},
                         {"url", "actions"}),
            "Run Playwright with scripted actions and return visual context", group::UI));
    }

    void uiStreaming() {
        auto sessions = ctx_->services.sessions;

        keep(registry_.registerTool<MCPBrowseIncrementalRequest, MCPCaptureResponse>(
            "browse_with_playwright_incremental",
            [sessions](const MCPBrowseIncrementalRequest& req)
                -> awaitable<Result<MCPCaptureResponse>> {
                auto sessionId = req.sessionId ? *req.sessionId : generateSessionId();
                auto r = sessions->capture(sessionId, req.url, req.mode);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPCaptureResponse{std::move(r).value()};
            },
            objectSchema(
                {{"url", prop("string", "URL to visit")},
                 {"sessionId",
                  prop("string", "Session ID for incremental state tracking (optional)")},
                 {"streamingMode",
                  modeProp("Streaming mode: 'full', 'incremental', or 'adaptive'")}},
                {"url"}),
            "Browse with incremental UI state streaming for optimized token usage",
            group::UIStreaming));

        auto actionSchema = actionProperties();
        actionSchema["sessionId"] = prop("string", "Session ID for incremental state tracking");
        keep(registry_.registerTool<MCPProcessUiActionRequest, MCPCaptureResponse>(
            "process_ui_action_incremental",
            [sessions](const MCPProcessUiActionRequest& req)
                -> awaitable<Result<MCPCaptureResponse>> {
                auto r = sessions->processAction(req.sessionId, req.action);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPCaptureResponse{std::move(r).value()};
            },
            objectSchema(std::move(actionSchema), {"sessionId", "action"}),
            "Process UI action with incremental state updates", group::UIStreaming));

        keep(registry_.registerTool<MCPIncrementalStateRequest, MCPSessionStateResponse>(
            "get_incremental_ui_state",
            [sessions](const MCPIncrementalStateRequest& req)
                -> awaitable<Result<MCPSessionStateResponse>> {
                auto r = sessions->getState(req.sessionId, req.includeDeltas,
                                            req.includeScreenshot);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPSessionStateResponse{std::move(r).value()};
            },
            objectSchema(
                {{"sessionId", prop("string", "Session ID for incremental state tracking")},
                 {"includeScreenshot", prop("boolean", "Include screenshot in response")},
                 {"includeDeltas", prop("boolean", "Include DOM deltas in response")}},
                {"sessionId"}),
            "Get current incremental UI state for a session", group::UIStreaming));

        auto threshold = prop("number", "Token usage threshold for adaptive mode (optional)");
        threshold["minimum"] = 0;
        keep(registry_.registerTool<MCPSetStreamingModeRequest, MCPSessionStateResponse>(
            "set_streaming_mode",
            [sessions](const MCPSetStreamingModeRequest& req)
                -> awaitable<Result<MCPSessionStateResponse>> {
                auto r = sessions->setMode(req.sessionId, req.mode, req.adaptiveThreshold);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPSessionStateResponse{std::move(r).value()};
            },
            objectSchema(
                {{"sessionId", prop("string", "Session ID for incremental state tracking")},
                 {"mode", modeProp("Streaming mode to set")},
                 {"adaptiveThreshold", std::move(threshold)}},
                {"sessionId", "mode"}),
            "Set streaming mode for incremental UI updates", group::UIStreaming));

        keep(registry_.registerTool<MCPStreamStatsRequest, MCPStreamStatsResponse>(
            "get_stream_stats",
            [sessions](const MCPStreamStatsRequest& req)
                -> awaitable<Result<MCPStreamStatsResponse>> {
                auto r = sessions->getStats(req.sessionId);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPStreamStatsResponse{std::move(r).value()};
            },
            objectSchema({{"sessionId", prop("string", "Session ID for incremental state "
                                                       "tracking (optional)")}}),
            "Get streaming statistics and performance metrics", group::UIStreaming));

        keep(registry_.registerTool<MCPSessionIdRequest, MCPCleanupResponse>(
            "cleanup_incremental_session",
            [sessions](const MCPSessionIdRequest& req) -> awaitable<Result<MCPCleanupResponse>> {
                auto r = sessions->cleanup(req.sessionId);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPCleanupResponse{std::move(r).value()};
            },
            objectSchema({{"sessionId", prop("string", "Session ID to clean up")}},
                         {"sessionId"}),
            "Clean up incremental session and free resources", group::UIStreaming));

        keep(registry_.registerTool<MCPDebugInfoRequest, MCPDebugInfoResponse>(
            "get_incremental_debug_info",
            [sessions](const MCPDebugInfoRequest& req) -> awaitable<Result<MCPDebugInfoResponse>> {
                auto r = sessions->getDebugInfo(req.sessionId, req.includeDetailedState);
                if (!r) {
                    co_return r.error();
                }
                co_return MCPDebugInfoResponse{std::move(r).value()};
            },
            objectSchema(
                {{"sessionId", prop("string", "Session ID for debug information")},
                 {"includeDetailedState",
                  prop("boolean", "Include detailed internal state information")}},
                {"sessionId"}),
            "Get debug information for incremental streaming session", group::UIStreaming));
    }

    void analysis() {
        noArgs("analyze_performance", "Analyze application performance bottlenecks",
               group::Analysis);
        noArgs("get_security_analysis", "Perform security analysis of the codebase",
               group::Analysis);
        noArgs("validate_api_contracts", "Validate API contracts and OpenAPI specifications",
               group::Analysis);
        noArgs("get_test_coverage", "Get test coverage analysis and metrics", group::Analysis);
        noArgs("analyze_code_quality", "Analyze code quality metrics and technical debt",
               group::Analysis);
        noArgs("analyze_complexity", "Run gocyclo to report function complexity",
               group::Analysis);
        noArgs("get_lint_diagnostics", "Run golangci-lint or staticcheck and go build",
               group::Analysis);
    }

    void frontend() {
        noArgs("frontend_nextjs_app_routes", "[Frontend] List Next.js app router routes",
               group::Frontend);
        noArgs("frontend_react_component_tree",
               "[Frontend] Get React component import tree and dependencies", group::Frontend);
        noArgs("frontend_api_client_analysis",
               "[Frontend] Analyze sophisticated TypeScript API client structure and "
               "capabilities",
               group::Frontend);
    }

    void businessDomain() {
        noArgs("get_business_domains", "Analyze business domains within the backend architecture",
               group::BusinessDomain);
        noArgs("get_advanced_tooling", "Analyze advanced development and database tooling",
               group::BusinessDomain);
        noArgs("get_business_domain_middleware", "Analyze middleware specific to business domains",
               group::BusinessDomain);
    }

    void enhancedAnalysis() {
        noArgs("get_enhanced_dependencies",
               "Get enhanced dependency analysis with business domain mapping",
               group::EnhancedAnalysis);
        noArgs("get_enhanced_security_analysis",
               "Get enhanced security analysis for business domains", group::EnhancedAnalysis);
        noArgs("get_enhanced_api_schema",
               "Get enhanced API schema analysis with business domain awareness",
               group::EnhancedAnalysis);
    }

    ToolRegistry& registry_;
    std::shared_ptr<CatalogContext> ctx_;
    Result<void> status_;
};

} // namespace

const std::vector<std::string>& toolGroups() {
    static const std::vector<std::string> kGroups = {
        std::string(group::Database),       std::string(group::CodeAnalysis),
        std::string(group::Configuration),  std::string(group::Search),
        std::string(group::WebSocket),      std::string(group::BusinessLogic),
        std::string(group::Advanced),       std::string(group::Interactive),
        std::string(group::UI),             std::string(group::UIStreaming),
        std::string(group::Analysis),       std::string(group::Frontend),
        std::string(group::BusinessDomain), std::string(group::EnhancedAnalysis)};
    return kGroups;
}

Result<std::unique_ptr<ToolRegistry>> buildToolRegistry(const ToolServices& services,
                                                        const config::ServerConfig& config) {
    if (!services.sessions || !services.browser || !services.analyzer) {
        return Error{ErrorCode::InvalidArgument,
                     "Tool services require a session manager, browser driver and analyzer"};
    }

    auto ctx = std::make_shared<CatalogContext>();
    ctx->services = services;
    ctx->allowTerminal = config.allowTerminal;
    ctx->commandTimeout = config.commandTimeout;
    ctx->projectRoot = config.projectRoot;

    auto registry = std::make_unique<ToolRegistry>();
    CatalogBuilder builder(*registry, ctx);
    if (auto r = builder.build(); !r) {
        return r.error();
    }
    spdlog::debug("Registered {} tools in {} groups", registry->size(), registry->groups().size());
    return std::move(registry);
}

} // namespace devscope::mcp
