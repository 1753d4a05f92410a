#pragma once

#include <devscope/core/types.h>
#include <devscope/streaming/ui_snapshot.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devscope::integration {

using json = nlohmann::json;

// Interaction kinds understood by browser drivers
const std::vector<std::string>& supportedUiActions();
bool isSupportedUiAction(std::string_view action);

struct UiAction {
    std::string action;
    std::optional<std::string> selector;
    std::optional<std::string> text;
    std::optional<std::string> url;
    std::optional<int> timeoutMs;
    std::optional<double> x;
    std::optional<double> y;

    json toJson() const;
    // Reads {action, selector?, text?, url?, timeout?, x?, y?}; unknown actions are rejected
    static Result<UiAction> fromJson(const json& j);
};

/**
 * Browser automation boundary. Calls may block for the duration of a page load; implementations
 * enforce their own timeouts.
 */
class IBrowserDriver {
public:
    virtual ~IBrowserDriver() = default;
    virtual Result<streaming::UiSnapshot> capture(const std::string& sessionId,
                                                  const std::string& url) = 0;
    // Performs the action on the session's page and returns the page afterwards
    virtual Result<streaming::UiSnapshot> perform(const std::string& sessionId,
                                                  const UiAction& action) = 0;
};

/**
 * Runs an external driver per call: `<command> capture` or `<command> action`, with a JSON
 * request on stdin and one snapshot JSON object expected on stdout.
 */
class CommandBrowserDriver : public IBrowserDriver {
public:
    CommandBrowserDriver(std::string commandLine, std::chrono::milliseconds timeout);

    Result<streaming::UiSnapshot> capture(const std::string& sessionId,
                                          const std::string& url) override;
    Result<streaming::UiSnapshot> perform(const std::string& sessionId,
                                          const UiAction& action) override;

private:
    Result<streaming::UiSnapshot> invoke(const std::string& verb, const json& request);

    std::string commandLine_;
    std::chrono::milliseconds timeout_;
};

// Used when no driver command is configured; every call fails with NotSupported
class UnavailableBrowserDriver : public IBrowserDriver {
public:
    Result<streaming::UiSnapshot> capture(const std::string& sessionId,
                                          const std::string& url) override;
    Result<streaming::UiSnapshot> perform(const std::string& sessionId,
                                          const UiAction& action) override;
};

} // namespace devscope::integration
