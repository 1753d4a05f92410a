// In-process stand-ins for the browser driver and the analyzer

#pragma once

#include <devscope/integration/browser_driver.h>
#include <devscope/integration/introspection_backend.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace devscope::test {

/**
 * @brief Serves one mutable page. Actions of kind "type" replace the content of the region
 * named by the selector; "click" appends a "clicked" region. A gate can hold captures until
 * released.
 */
class FakeBrowserDriver : public integration::IBrowserDriver {
public:
    FakeBrowserDriver() {
        page_.title = "Fake page";
        page_.regions = {{"#header", "Welcome"},
                         {"#main", "Lorem ipsum dolor sit amet, consectetur adipiscing elit"},
                         {"#footer", "(c) devscope"}};
    }

    Result<streaming::UiSnapshot> capture(const std::string& sessionId,
                                          const std::string& url) override {
        waitAtGate();
        std::lock_guard<std::mutex> lk(mutex_);
        captures_++;
        capturedSessions_.push_back(sessionId);
        if (failure_) {
            return *failure_;
        }
        page_.url = url;
        return page_;
    }

    Result<streaming::UiSnapshot> perform(const std::string&,
                                          const integration::UiAction& action) override {
        waitAtGate();
        std::lock_guard<std::mutex> lk(mutex_);
        actions_.push_back(action.action);
        if (failure_) {
            return *failure_;
        }
        if (action.action == "type" && action.selector) {
            setRegionLocked(*action.selector, action.text.value_or(""));
        } else if (action.action == "click") {
            setRegionLocked("#clicked", action.selector.value_or("page"));
        } else if (action.action == "navigate" && action.url) {
            page_.url = *action.url;
        }
        return page_;
    }

    void setRegion(const std::string& selector, nlohmann::json content) {
        std::lock_guard<std::mutex> lk(mutex_);
        setRegionLocked(selector, std::move(content));
    }

    void setRegions(std::vector<streaming::UiRegion> regions) {
        std::lock_guard<std::mutex> lk(mutex_);
        page_.regions = std::move(regions);
    }

    void setScreenshot(std::string base64) {
        std::lock_guard<std::mutex> lk(mutex_);
        page_.screenshot = std::move(base64);
    }

    void failWith(std::optional<Error> error) {
        std::lock_guard<std::mutex> lk(mutex_);
        failure_ = std::move(error);
    }

    // Subsequent calls block until release()
    void closeGate() {
        std::lock_guard<std::mutex> lk(gateMutex_);
        gateOpen_ = false;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(gateMutex_);
            gateOpen_ = true;
        }
        gateCv_.notify_all();
    }

    // Blocks until a call is parked at the closed gate
    void waitUntilBlocked() {
        std::unique_lock<std::mutex> lk(gateMutex_);
        gateCv_.wait(lk, [this] { return waiting_ > 0; });
    }

    int captures() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return captures_;
    }

    std::vector<std::string> actions() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return actions_;
    }

    std::vector<std::string> capturedSessions() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return capturedSessions_;
    }

private:
    void setRegionLocked(const std::string& selector, nlohmann::json content) {
        for (auto& region : page_.regions) {
            if (region.selector == selector) {
                region.content = std::move(content);
                return;
            }
        }
        page_.regions.push_back({selector, std::move(content)});
    }

    void waitAtGate() {
        std::unique_lock<std::mutex> lk(gateMutex_);
        if (gateOpen_) {
            return;
        }
        waiting_++;
        gateCv_.notify_all();
        gateCv_.wait(lk, [this] { return gateOpen_; });
        waiting_--;
    }

    mutable std::mutex mutex_;
    streaming::UiSnapshot page_;
    std::optional<Error> failure_;
    int captures_ = 0;
    std::vector<std::string> actions_;
    std::vector<std::string> capturedSessions_;

    std::mutex gateMutex_;
    std::condition_variable gateCv_;
    bool gateOpen_ = true;
    int waiting_ = 0;
};

/**
 * @brief Answers every query with a canned report naming the query kind.
 */
class FakeIntrospectionBackend : public integration::IIntrospectionBackend {
public:
    Result<integration::AnalysisReport> query(const integration::AnalysisQuery& query) override {
        std::lock_guard<std::mutex> lk(mutex_);
        queries_.push_back(query);
        if (failure_) {
            return *failure_;
        }
        integration::AnalysisReport report;
        report.summary = "Report for " + query.kind;
        report.itemCount = 1;
        report.data = nlohmann::json{{"kind", query.kind}, {"arguments", query.arguments}};
        return report;
    }

    void failWith(std::optional<Error> error) {
        std::lock_guard<std::mutex> lk(mutex_);
        failure_ = std::move(error);
    }

    std::vector<integration::AnalysisQuery> queries() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<integration::AnalysisQuery> queries_;
    std::optional<Error> failure_;
};

} // namespace devscope::test
