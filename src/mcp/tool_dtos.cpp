#include <devscope/mcp/tool_catalog.h>

#include <sstream>

namespace devscope::mcp {

namespace {

Error requiredStringError(const char* key) {
    return Error{ErrorCode::InvalidArgument,
                 std::string(key) + " parameter is required and must be a string"};
}

Result<std::string> requiredString(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        return requiredStringError(key);
    }
    auto value = j[key].get<std::string>();
    if (value.empty()) {
        return Error{ErrorCode::InvalidArgument, std::string(key) + " must not be empty"};
    }
    return value;
}

Result<std::optional<std::string>> optionalString(const json& j, const char* key) {
    return json_utils::get_optional_field<std::string>(j, key);
}

Result<bool> optionalBool(const json& j, const char* key, bool fallback) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (!j[key].is_boolean()) {
        return Error{ErrorCode::InvalidArgument, std::string(key) + " must be a boolean"};
    }
    return j[key].get<bool>();
}

Result<streaming::StreamingMode> modeFrom(const std::string& name) {
    if (auto mode = streaming::parseStreamingMode(name)) {
        return *mode;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Invalid streaming mode: '" + name + "' (expected full, incremental or adaptive)"};
}

// Single required string argument
template <typename Req, typename Assign>
Result<Req> fromSingleString(const json& j, const char* key, Assign assign) {
    auto v = requiredString(j, key);
    if (!v) {
        return v.error();
    }
    Req req;
    assign(req, std::move(v).value());
    return req;
}

} // namespace

Result<MCPNoArgsRequest> MCPNoArgsRequest::fromJson(const json& j) {
    if (!j.is_null() && !j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "arguments must be an object"};
    }
    return MCPNoArgsRequest{};
}

Result<MCPFindImplementationsRequest> MCPFindImplementationsRequest::fromJson(const json& j) {
    return fromSingleString<MCPFindImplementationsRequest>(
        j, "interface", [](auto& r, std::string v) { r.interfaceName = std::move(v); });
}

Result<MCPCallGraphRequest> MCPCallGraphRequest::fromJson(const json& j) {
    auto fn = optionalString(j, "function");
    if (!fn) {
        return fn.error();
    }
    MCPCallGraphRequest req;
    if (fn.value() && !fn.value()->empty()) {
        req.function = *fn.value();
    }
    return req;
}

Result<MCPSearchCodeRequest> MCPSearchCodeRequest::fromJson(const json& j) {
    return fromSingleString<MCPSearchCodeRequest>(
        j, "query", [](auto& r, std::string v) { r.query = std::move(v); });
}

Result<MCPCampaignPipelineRequest> MCPCampaignPipelineRequest::fromJson(const json& j) {
    return fromSingleString<MCPCampaignPipelineRequest>(
        j, "campaignId", [](auto& r, std::string v) { r.campaignId = std::move(v); });
}

Result<MCPFindByTypeRequest> MCPFindByTypeRequest::fromJson(const json& j) {
    return fromSingleString<MCPFindByTypeRequest>(
        j, "type", [](auto& r, std::string v) { r.type = std::move(v); });
}

Result<MCPReferencesRequest> MCPReferencesRequest::fromJson(const json& j) {
    auto symbol = requiredString(j, "symbol");
    if (!symbol) {
        return symbol.error();
    }
    auto filePath = optionalString(j, "filePath");
    if (!filePath) {
        return filePath.error();
    }
    MCPReferencesRequest req;
    req.symbol = std::move(symbol).value();
    req.filePath = std::move(filePath).value();
    return req;
}

json MCPReferencesRequest::arguments() const {
    json args{{"symbol", symbol}};
    if (filePath) {
        args["filePath"] = *filePath;
    }
    return args;
}

Result<MCPChangeImpactRequest> MCPChangeImpactRequest::fromJson(const json& j) {
    return fromSingleString<MCPChangeImpactRequest>(
        j, "file", [](auto& r, std::string v) { r.file = std::move(v); });
}

Result<MCPRunTerminalCommandRequest> MCPRunTerminalCommandRequest::fromJson(const json& j) {
    auto command = requiredString(j, "command");
    if (!command) {
        return command.error();
    }
    auto workingDir = optionalString(j, "workingDir");
    if (!workingDir) {
        return workingDir.error();
    }
    MCPRunTerminalCommandRequest req;
    req.command = std::move(command).value();
    req.workingDir = std::move(workingDir).value();
    return req;
}

Result<MCPApplyCodeChangeRequest> MCPApplyCodeChangeRequest::fromJson(const json& j) {
    return fromSingleString<MCPApplyCodeChangeRequest>(
        j, "diff", [](auto& r, std::string v) { r.diff = std::move(v); });
}

Result<MCPBrowseRequest> MCPBrowseRequest::fromJson(const json& j) {
    return fromSingleString<MCPBrowseRequest>(
        j, "url", [](auto& r, std::string v) { r.url = std::move(v); });
}

Result<MCPScreenshotRequest> MCPScreenshotRequest::fromJson(const json& j) {
    auto base64 = optionalBool(j, "base64", false);
    if (!base64) {
        return base64.error();
    }
    MCPScreenshotRequest req;
    req.base64 = base64.value();
    return req;
}

Result<MCPUiTestPromptRequest> MCPUiTestPromptRequest::fromJson(const json& j) {
    auto url = requiredString(j, "url");
    if (!url) {
        return url.error();
    }
    if (!j.contains("actions") || !j["actions"].is_array()) {
        return Error{ErrorCode::InvalidArgument,
                     "actions parameter is required and must be an array"};
    }
    MCPUiTestPromptRequest req;
    req.url = std::move(url).value();
    std::size_t index = 0;
    for (const auto& entry : j["actions"]) {
        auto action = integration::UiAction::fromJson(entry);
        if (!action) {
            return Error{action.error().code,
                         "actions[" + std::to_string(index) + "]: " + action.error().message};
        }
        req.actions.push_back(std::move(action).value());
        ++index;
    }
    return req;
}

Result<MCPBrowseIncrementalRequest> MCPBrowseIncrementalRequest::fromJson(const json& j) {
    auto url = requiredString(j, "url");
    if (!url) {
        return url.error();
    }
    auto sessionId = optionalString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    // "streamingMode" is the advertised name; "mode" is accepted as well
    auto modeName = optionalString(j, "streamingMode");
    if (!modeName) {
        return modeName.error();
    }
    if (!modeName.value()) {
        modeName = optionalString(j, "mode");
        if (!modeName) {
            return modeName.error();
        }
    }

    MCPBrowseIncrementalRequest req;
    req.url = std::move(url).value();
    if (sessionId.value() && !sessionId.value()->empty()) {
        req.sessionId = *sessionId.value();
    }
    if (modeName.value()) {
        auto mode = modeFrom(*modeName.value());
        if (!mode) {
            return mode.error();
        }
        req.mode = mode.value();
    }
    return req;
}

Result<MCPProcessUiActionRequest> MCPProcessUiActionRequest::fromJson(const json& j) {
    auto sessionId = requiredString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    // Action fields sit beside sessionId
    auto action = integration::UiAction::fromJson(j);
    if (!action) {
        return action.error();
    }
    MCPProcessUiActionRequest req;
    req.sessionId = std::move(sessionId).value();
    req.action = std::move(action).value();
    return req;
}

Result<MCPIncrementalStateRequest> MCPIncrementalStateRequest::fromJson(const json& j) {
    auto sessionId = requiredString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    auto screenshot = optionalBool(j, "includeScreenshot", false);
    if (!screenshot) {
        return screenshot.error();
    }
    auto deltas = optionalBool(j, "includeDeltas", false);
    if (!deltas) {
        return deltas.error();
    }
    MCPIncrementalStateRequest req;
    req.sessionId = std::move(sessionId).value();
    req.includeScreenshot = screenshot.value();
    req.includeDeltas = deltas.value();
    return req;
}

Result<MCPSetStreamingModeRequest> MCPSetStreamingModeRequest::fromJson(const json& j) {
    auto sessionId = requiredString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    auto modeName = requiredString(j, "mode");
    if (!modeName) {
        return modeName.error();
    }
    auto mode = modeFrom(modeName.value());
    if (!mode) {
        return mode.error();
    }
    MCPSetStreamingModeRequest req;
    req.sessionId = std::move(sessionId).value();
    req.mode = mode.value();
    if (j.contains("adaptiveThreshold") && !j["adaptiveThreshold"].is_null()) {
        if (!j["adaptiveThreshold"].is_number()) {
            return Error{ErrorCode::InvalidArgument, "adaptiveThreshold must be a number"};
        }
        req.adaptiveThreshold = j["adaptiveThreshold"].get<double>();
    }
    return req;
}

Result<MCPStreamStatsRequest> MCPStreamStatsRequest::fromJson(const json& j) {
    auto sessionId = optionalString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    MCPStreamStatsRequest req;
    if (sessionId.value() && !sessionId.value()->empty()) {
        req.sessionId = *sessionId.value();
    }
    return req;
}

Result<MCPSessionIdRequest> MCPSessionIdRequest::fromJson(const json& j) {
    return fromSingleString<MCPSessionIdRequest>(
        j, "sessionId", [](auto& r, std::string v) { r.sessionId = std::move(v); });
}

Result<MCPDebugInfoRequest> MCPDebugInfoRequest::fromJson(const json& j) {
    auto sessionId = requiredString(j, "sessionId");
    if (!sessionId) {
        return sessionId.error();
    }
    auto detailed = optionalBool(j, "includeDetailedState", false);
    if (!detailed) {
        return detailed.error();
    }
    MCPDebugInfoRequest req;
    req.sessionId = std::move(sessionId).value();
    req.includeDetailedState = detailed.value();
    return req;
}

json MCPAnalysisResponse::toJson() const {
    return json{{"summary", report.summary}, {"itemCount", report.itemCount},
                {"data", report.data}};
}

std::string MCPAnalysisResponse::toText() const {
    std::string text = report.summary;
    if (!report.data.is_null()) {
        if (!text.empty()) {
            text += "\n\n";
        }
        text += report.data.dump(2);
    }
    return text;
}

json MCPCommandResponse::toJson() const {
    return json{{"exitCode", exitCode}, {"stdout", stdoutData}, {"stderr", stderrData}};
}

std::string MCPCommandResponse::toText() const {
    std::string text = headline + "\nOutput: " + stdoutData;
    if (!stderrData.empty()) {
        text += "\nError: " + stderrData;
    }
    return text;
}

json MCPUiCaptureResponse::toJson() const {
    json out{{"url", snapshot.url},
             {"title", snapshot.title},
             {"regionCount", snapshot.regions.size()},
             {"screenshotAvailable", snapshot.screenshot.has_value()}};
    if (includeContent) {
        out["regions"] = snapshot.toJson()["regions"];
    } else {
        json selectors = json::array();
        for (const auto& region : snapshot.regions) {
            selectors.push_back(region.selector);
        }
        out["regions"] = std::move(selectors);
    }
    return out;
}

json MCPUiMetadataResponse::toJson() const {
    json components = json::array();
    for (const auto& region : snapshot.regions) {
        components.push_back(json{{"selector", region.selector},
                                  {"contentType", region.content.type_name()},
                                  {"bytes", region.content.dump().size()}});
    }
    return json{{"url", snapshot.url},
                {"title", snapshot.title},
                {"regionCount", snapshot.regions.size()},
                {"components", std::move(components)}};
}

json MCPScreenshotResponse::toJson() const {
    json out{{"url", url}, {"encoding", "base64"}, {"length", screenshot.size()}};
    if (base64) {
        out["data"] = screenshot;
    }
    return out;
}

json MCPUiTestPromptResponse::toJson() const {
    json stepsJson = json::array();
    for (const auto& step : steps) {
        stepsJson.push_back(json{{"action", step.action.toJson()},
                                 {"title", step.title},
                                 {"regionCount", step.regionCount}});
    }
    return json{{"url", url}, {"steps", std::move(stepsJson)},
                {"finalPage", finalSnapshot.toJson()}};
}

std::string MCPUiTestPromptResponse::toText() const {
    std::ostringstream out;
    out << "Write an end-to-end UI test for " << url;
    if (!finalSnapshot.title.empty()) {
        out << " (" << finalSnapshot.title << ")";
    }
    out << ".\n\nSteps:\n";
    std::size_t n = 1;
    for (const auto& step : steps) {
        out << n++ << ". " << step.action.action;
        if (step.action.selector) {
            out << " " << *step.action.selector;
        }
        if (step.action.text) {
            out << " \"" << *step.action.text << "\"";
        }
        if (step.action.url) {
            out << " " << *step.action.url;
        }
        out << " -> \"" << step.title << "\" (" << step.regionCount << " regions)\n";
    }
    out << "\nFinal page regions:\n";
    for (const auto& region : finalSnapshot.regions) {
        out << "- " << region.selector << "\n";
    }
    return out.str();
}

} // namespace devscope::mcp
