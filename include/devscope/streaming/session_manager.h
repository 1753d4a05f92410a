#pragma once

#include <devscope/core/types.h>
#include <devscope/integration/browser_driver.h>
#include <devscope/streaming/region_diff.h>
#include <devscope/streaming/ui_snapshot.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devscope::streaming {

enum class StreamingMode { Full, Incremental, Adaptive };
enum class SessionPhase { Uninitialized, Initial, Streaming, Resyncing };
enum class ResponseKind { Initial, Full, Incremental, Resync };

std::optional<StreamingMode> parseStreamingMode(std::string_view name);
const char* streamingModeName(StreamingMode mode) noexcept;
const char* sessionPhaseName(SessionPhase phase) noexcept;
const char* responseKindName(ResponseKind kind) noexcept;

struct StreamingOptions {
    // Adaptive mode resyncs when a delta is larger than this fraction of the full snapshot
    double adaptiveThreshold = 0.5;
    std::chrono::seconds idleTimeout{1800};
    std::chrono::seconds retiredRetention{3600};
};

// Reply to a capture or action call
struct CaptureResult {
    ResponseKind kind = ResponseKind::Initial;
    std::string sessionId;
    std::string url;
    std::string title;
    StreamingMode mode = StreamingMode::Adaptive;
    std::optional<UiSnapshot> snapshot;            // full kinds
    std::optional<std::vector<RegionDelta>> regions; // incremental kind
    std::optional<ChangeSummary> changes;            // incremental kind
    std::size_t fullBytes = 0;
    std::size_t bytesSent = 0;
    std::int64_t tokenSavings = 0;

    json toJson() const;
};

struct ModeChange {
    std::string event; // "initial", "set_mode", "capture_mode"
    StreamingMode mode = StreamingMode::Adaptive;
    std::int64_t atMs = 0; // since session creation
};

struct SessionState {
    std::string sessionId;
    std::string url;
    std::string title;
    StreamingMode mode = StreamingMode::Adaptive;
    SessionPhase phase = SessionPhase::Uninitialized;
    double adaptiveThreshold = 0.5;
    std::optional<ResponseKind> lastResponse;
    std::size_t regionCount = 0;
    std::uint64_t totalChanges = 0;
    std::int64_t bytesSaved = 0;
    std::int64_t tokensSaved = 0;
    std::uint64_t forcedResyncs = 0;
    std::optional<std::vector<RegionDelta>> lastDeltas;
    std::optional<std::string> screenshot;

    json toJson() const;
};

struct StreamStats {
    std::optional<std::string> sessionId; // empty when aggregated
    std::uint64_t totalDeltas = 0;
    std::uint64_t totalChanges = 0;
    std::int64_t tokensSaved = 0;
    std::int64_t bytesSaved = 0;
    std::uint64_t fullEquivalentBytes = 0;
    std::uint64_t bytesSent = 0;
    double compressionRatio = 1.0;
    std::int64_t sessionDurationMs = 0;
    std::uint64_t forcedResyncs = 0;
    std::size_t activeSessions = 0;

    json toJson() const;
};

struct DebugInfo {
    std::string sessionId;
    SessionPhase phase = SessionPhase::Uninitialized;
    StreamingMode mode = StreamingMode::Adaptive;
    double adaptiveThreshold = 0.5;
    std::vector<ModeChange> modeHistory;
    std::uint64_t captures = 0;
    std::uint64_t fullSnapshotsSent = 0;
    std::uint64_t deltasSent = 0;
    std::uint64_t forcedResyncs = 0;
    std::uint64_t totalChanges = 0;
    std::uint64_t fullEquivalentBytes = 0;
    std::uint64_t bytesSent = 0;
    std::size_t snapshotRegionCount = 0;
    std::size_t snapshotBytes = 0;
    std::int64_t ageMs = 0;
    std::int64_t idleMs = 0;
    int inFlight = 0;
    bool detailed = false;
    std::vector<std::string> regionSelectors; // detailed only

    json toJson() const;
};

struct CleanupResult {
    std::string sessionId;
    std::size_t releasedBytes = 0;
    std::uint64_t capturesServed = 0;

    json toJson() const;
};

/**
 * Owns every streaming session. One mutex guards the session table; browser driver calls run
 * outside it and their results are applied only if the session is still live, so a cleanup
 * that wins a race is never undone. Cleaned-up and evicted ids are retired and report
 * "Session not found" instead of being recreated.
 */
class StreamingSessionManager {
public:
    using Clock = std::chrono::steady_clock;

    StreamingSessionManager(std::shared_ptr<integration::IBrowserDriver> driver,
                            StreamingOptions options = {});

    // Creates the session on first use; `mode` (if any) is applied before capturing.
    Result<CaptureResult> capture(const std::string& sessionId, const std::string& url,
                                  std::optional<StreamingMode> mode = std::nullopt);
    Result<CaptureResult> processAction(const std::string& sessionId,
                                        const integration::UiAction& action);

    Result<SessionState> setMode(const std::string& sessionId, StreamingMode mode,
                                 std::optional<double> adaptiveThreshold = std::nullopt);
    Result<SessionState> getState(const std::string& sessionId, bool includeDeltas,
                                  bool includeScreenshot = false) const;
    Result<CleanupResult> cleanup(const std::string& sessionId);
    // Aggregated across live sessions when no id is given
    Result<StreamStats> getStats(const std::optional<std::string>& sessionId) const;
    Result<DebugInfo> getDebugInfo(const std::string& sessionId, bool detailed) const;

    // Removes idle sessions without in-flight calls; returns how many were evicted
    std::size_t evictIdle(Clock::time_point now);

    std::size_t activeSessions() const;
    bool isRetired(const std::string& sessionId) const;
    const StreamingOptions& options() const noexcept { return options_; }

private:
    struct Session {
        std::string id;
        std::string startUrl;
        StreamingMode mode = StreamingMode::Adaptive;
        SessionPhase phase = SessionPhase::Uninitialized;
        double adaptiveThreshold = 0.5;
        std::optional<UiSnapshot> lastSnapshot;
        std::size_t lastSnapshotBytes = 0;
        std::optional<std::vector<RegionDelta>> lastDeltas;
        std::optional<ResponseKind> lastResponse;
        std::vector<ModeChange> modeHistory;

        std::uint64_t captures = 0;
        std::uint64_t totalChanges = 0;
        std::int64_t bytesSaved = 0;
        std::int64_t tokensSaved = 0;
        std::uint64_t fullEquivalentBytes = 0;
        std::uint64_t bytesSent = 0;
        std::uint64_t fullSnapshotsSent = 0;
        std::uint64_t deltasSent = 0;
        std::uint64_t forcedResyncs = 0;

        Clock::time_point createdAt;
        Clock::time_point lastActivityAt;
        int inFlight = 0;
    };

    // Reserves the session for a driver call; creates a placeholder when `createIfMissing`
    Result<void> beginCall(const std::string& sessionId, bool createIfMissing,
                           std::optional<StreamingMode> mode, const std::string& url);
    Result<CaptureResult> finishCall(const std::string& sessionId,
                                     Result<UiSnapshot> captured);
    CaptureResult applySnapshot(Session& session, UiSnapshot snapshot);
    SessionState stateOf(const Session& session, bool includeDeltas,
                         bool includeScreenshot) const;
    void retire(const std::string& sessionId, Clock::time_point now);
    Error sessionNotFound(const std::string& sessionId) const;
    std::int64_t elapsedMs(const Session& session, Clock::time_point now) const;

    std::shared_ptr<integration::IBrowserDriver> driver_;
    StreamingOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, Clock::time_point> retired_;
};

} // namespace devscope::streaming
