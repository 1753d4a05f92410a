#include <devscope/integration/browser_driver.h>
#include <devscope/integration/process_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devscope::integration {

const std::vector<std::string>& supportedUiActions() {
    static const std::vector<std::string> kActions = {
        "click",         "type",        "hover",    "scroll",  "navigate",
        "wait",          "moveto",      "clickat",  "doubleclickat",
        "rightclickat",  "dragfrom",    "hoverat",  "scrollat", "gesture"};
    return kActions;
}

bool isSupportedUiAction(std::string_view action) {
    const auto& actions = supportedUiActions();
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

json UiAction::toJson() const {
    json j{{"action", action}};
    if (selector) {
        j["selector"] = *selector;
    }
    if (text) {
        j["text"] = *text;
    }
    if (url) {
        j["url"] = *url;
    }
    if (timeoutMs) {
        j["timeout"] = *timeoutMs;
    }
    if (x) {
        j["x"] = *x;
    }
    if (y) {
        j["y"] = *y;
    }
    return j;
}

Result<UiAction> UiAction::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "action must be an object"};
    }
    if (!j.contains("action") || !j["action"].is_string()) {
        return Error{ErrorCode::InvalidArgument,
                     "action parameter is required and must be a string"};
    }
    UiAction a;
    a.action = j["action"].get<std::string>();
    if (!isSupportedUiAction(a.action)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported action: " + a.action};
    }

    auto optString = [&j](const char* key, std::optional<std::string>& out) -> Result<void> {
        if (!j.contains(key) || j[key].is_null()) {
            return {};
        }
        if (!j[key].is_string()) {
            return Error{ErrorCode::InvalidArgument, std::string(key) + " must be a string"};
        }
        out = j[key].get<std::string>();
        return {};
    };
    auto optNumber = [&j](const char* key, std::optional<double>& out) -> Result<void> {
        if (!j.contains(key) || j[key].is_null()) {
            return {};
        }
        if (!j[key].is_number()) {
            return Error{ErrorCode::InvalidArgument, std::string(key) + " must be a number"};
        }
        out = j[key].get<double>();
        return {};
    };

    for (auto r : {optString("selector", a.selector), optString("text", a.text),
                   optString("url", a.url), optNumber("x", a.x), optNumber("y", a.y)}) {
        if (!r) {
            return r.error();
        }
    }
    if (j.contains("timeout") && !j["timeout"].is_null()) {
        if (!j["timeout"].is_number_integer() || j["timeout"].get<long long>() < 0) {
            return Error{ErrorCode::InvalidArgument, "timeout must be a non-negative integer"};
        }
        a.timeoutMs = j["timeout"].get<int>();
    }
    return a;
}

CommandBrowserDriver::CommandBrowserDriver(std::string commandLine,
                                           std::chrono::milliseconds timeout)
    : commandLine_(std::move(commandLine)), timeout_(timeout) {}

Result<streaming::UiSnapshot> CommandBrowserDriver::capture(const std::string& sessionId,
                                                            const std::string& url) {
    return invoke("capture", json{{"sessionId", sessionId}, {"url", url}});
}

Result<streaming::UiSnapshot> CommandBrowserDriver::perform(const std::string& sessionId,
                                                            const UiAction& action) {
    return invoke("action", json{{"sessionId", sessionId}, {"action", action.toJson()}});
}

Result<streaming::UiSnapshot> CommandBrowserDriver::invoke(const std::string& verb,
                                                           const json& request) {
    auto spec = makeCommandSpec(commandLine_, {verb});
    if (!spec) {
        return Error{ErrorCode::NotSupported, "Browser driver command is not configured"};
    }
    auto processSpec = std::move(spec).value();
    processSpec.stdinData = request.dump();
    processSpec.timeout = timeout_;

    auto run = ProcessRunner::run(processSpec);
    if (!run) {
        return run.error();
    }
    const auto& out = run.value();
    if (out.timedOut) {
        return Error{ErrorCode::Timeout, "Browser driver timed out after " +
                                             std::to_string(timeout_.count()) + " ms"};
    }
    if (out.exitCode != 0) {
        spdlog::warn("CommandBrowserDriver: '{}' exited with {}: {}", verb, out.exitCode,
                     out.stderrData);
        return Error{ErrorCode::InternalError,
                     "Browser driver failed (exit " + std::to_string(out.exitCode) +
                         "): " + out.stderrData};
    }

    auto parsed = json::parse(out.stdoutData, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Browser driver returned malformed JSON"};
    }
    if (parsed.contains("error") && parsed["error"].is_string()) {
        return Error{ErrorCode::InternalError, parsed["error"].get<std::string>()};
    }
    return streaming::UiSnapshot::fromJson(parsed);
}

Result<streaming::UiSnapshot> UnavailableBrowserDriver::capture(const std::string&,
                                                                const std::string&) {
    return Error{ErrorCode::NotSupported,
                 "No browser driver configured (set browser.command or --browser-command)"};
}

Result<streaming::UiSnapshot> UnavailableBrowserDriver::perform(const std::string&,
                                                                const UiAction&) {
    return Error{ErrorCode::NotSupported,
                 "No browser driver configured (set browser.command or --browser-command)"};
}

} // namespace devscope::integration
