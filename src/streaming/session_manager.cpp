#include <devscope/streaming/session_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devscope::streaming {

std::optional<StreamingMode> parseStreamingMode(std::string_view name) {
    if (name == "full") {
        return StreamingMode::Full;
    }
    if (name == "incremental") {
        return StreamingMode::Incremental;
    }
    if (name == "adaptive") {
        return StreamingMode::Adaptive;
    }
    return std::nullopt;
}

const char* streamingModeName(StreamingMode mode) noexcept {
    switch (mode) {
        case StreamingMode::Full:
            return "full";
        case StreamingMode::Incremental:
            return "incremental";
        case StreamingMode::Adaptive:
            return "adaptive";
    }
    return "unknown";
}

const char* sessionPhaseName(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Uninitialized:
            return "uninitialized";
        case SessionPhase::Initial:
            return "initial";
        case SessionPhase::Streaming:
            return "streaming";
        case SessionPhase::Resyncing:
            return "resyncing";
    }
    return "unknown";
}

const char* responseKindName(ResponseKind kind) noexcept {
    switch (kind) {
        case ResponseKind::Initial:
            return "initial";
        case ResponseKind::Full:
            return "full";
        case ResponseKind::Incremental:
            return "incremental";
        case ResponseKind::Resync:
            return "resync";
    }
    return "unknown";
}

json CaptureResult::toJson() const {
    json j{{"type", responseKindName(kind)},
           {"sessionId", sessionId},
           {"url", url},
           {"title", title},
           {"mode", streamingModeName(mode)},
           {"tokenSavings", tokenSavings},
           {"bytesSent", bytesSent},
           {"fullBytes", fullBytes}};
    if (snapshot) {
        j["snapshot"] = snapshot->toJson();
    }
    if (regions) {
        j["regions"] = deltasToJson(*regions);
    }
    if (changes) {
        j["changes"] = changes->toJson();
    }
    return j;
}

json SessionState::toJson() const {
    json j{{"sessionId", sessionId},
           {"url", url},
           {"title", title},
           {"mode", streamingModeName(mode)},
           {"phase", sessionPhaseName(phase)},
           {"adaptiveThreshold", adaptiveThreshold},
           {"lastResponse", lastResponse ? json(responseKindName(*lastResponse)) : json(nullptr)},
           {"regionCount", regionCount},
           {"totalChanges", totalChanges},
           {"bytesSaved", bytesSaved},
           {"tokensSaved", tokensSaved},
           {"forcedResyncs", forcedResyncs}};
    if (lastDeltas) {
        j["deltas"] = deltasToJson(*lastDeltas);
    }
    if (screenshot) {
        j["screenshot"] = *screenshot;
    }
    return j;
}

json StreamStats::toJson() const {
    return json{{"sessionId", sessionId ? json(*sessionId) : json(nullptr)},
                {"totalDeltas", totalDeltas},
                {"totalChanges", totalChanges},
                {"tokensSaved", tokensSaved},
                {"bytesSaved", bytesSaved},
                {"fullEquivalentBytes", fullEquivalentBytes},
                {"bytesSent", bytesSent},
                {"compressionRatio", compressionRatio},
                {"sessionDurationMs", sessionDurationMs},
                {"forcedResyncs", forcedResyncs},
                {"activeSessions", activeSessions}};
}

json DebugInfo::toJson() const {
    json history = json::array();
    for (const auto& change : modeHistory) {
        history.push_back(json{{"event", change.event},
                               {"mode", streamingModeName(change.mode)},
                               {"atMs", change.atMs}});
    }
    json j{{"sessionId", sessionId},
           {"phase", sessionPhaseName(phase)},
           {"mode", streamingModeName(mode)},
           {"adaptiveThreshold", adaptiveThreshold},
           {"modeHistory", std::move(history)},
           {"counters",
            {{"captures", captures},
             {"fullSnapshotsSent", fullSnapshotsSent},
             {"deltasSent", deltasSent},
             {"forcedResyncs", forcedResyncs},
             {"totalChanges", totalChanges},
             {"fullEquivalentBytes", fullEquivalentBytes},
             {"bytesSent", bytesSent}}},
           {"snapshot", {{"regionCount", snapshotRegionCount}, {"bytes", snapshotBytes}}},
           {"ageMs", ageMs},
           {"idleMs", idleMs},
           {"inFlight", inFlight}};
    if (detailed) {
        j["snapshot"]["selectors"] = regionSelectors;
    }
    return j;
}

json CleanupResult::toJson() const {
    return json{{"sessionId", sessionId},
                {"cleaned", true},
                {"releasedBytes", releasedBytes},
                {"capturesServed", capturesServed}};
}

StreamingSessionManager::StreamingSessionManager(
    std::shared_ptr<integration::IBrowserDriver> driver, StreamingOptions options)
    : driver_(std::move(driver)), options_(options) {}

Error StreamingSessionManager::sessionNotFound(const std::string& sessionId) const {
    return Error{ErrorCode::NotFound, "Session not found: " + sessionId};
}

std::int64_t StreamingSessionManager::elapsedMs(const Session& session,
                                                Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - session.createdAt).count();
}

void StreamingSessionManager::retire(const std::string& sessionId, Clock::time_point now) {
    retired_[sessionId] = now;
}

Result<CaptureResult> StreamingSessionManager::capture(const std::string& sessionId,
                                                       const std::string& url,
                                                       std::optional<StreamingMode> mode) {
    if (sessionId.empty()) {
        return Error{ErrorCode::InvalidArgument, "sessionId must not be empty"};
    }
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "url must not be empty"};
    }
    if (auto r = beginCall(sessionId, true, mode, url); !r) {
        return r.error();
    }
    return finishCall(sessionId, driver_->capture(sessionId, url));
}

Result<CaptureResult> StreamingSessionManager::processAction(const std::string& sessionId,
                                                             const integration::UiAction& action) {
    if (!integration::isSupportedUiAction(action.action)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported action: " + action.action};
    }
    if (auto r = beginCall(sessionId, false, std::nullopt, {}); !r) {
        return r.error();
    }
    return finishCall(sessionId, driver_->perform(sessionId, action));
}

Result<void> StreamingSessionManager::beginCall(const std::string& sessionId,
                                                bool createIfMissing,
                                                std::optional<StreamingMode> mode,
                                                const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_.contains(sessionId)) {
        return sessionNotFound(sessionId);
    }
    auto now = Clock::now();
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        if (!createIfMissing) {
            return sessionNotFound(sessionId);
        }
        Session session;
        session.id = sessionId;
        session.startUrl = url;
        session.mode = mode.value_or(StreamingMode::Adaptive);
        session.adaptiveThreshold = options_.adaptiveThreshold;
        session.createdAt = now;
        session.lastActivityAt = now;
        session.modeHistory.push_back(ModeChange{"initial", session.mode, 0});
        it = sessions_.emplace(sessionId, std::move(session)).first;
        spdlog::debug("StreamingSessionManager: created session '{}' ({})", sessionId,
                      streamingModeName(it->second.mode));
    } else if (mode && *mode != it->second.mode) {
        it->second.mode = *mode;
        it->second.modeHistory.push_back(
            ModeChange{"capture_mode", *mode, elapsedMs(it->second, now)});
    }
    it->second.inFlight++;
    it->second.lastActivityAt = now;
    return {};
}

Result<CaptureResult> StreamingSessionManager::finishCall(const std::string& sessionId,
                                                          Result<UiSnapshot> captured) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        // Cleaned up or evicted while the driver was running
        spdlog::debug("StreamingSessionManager: discarding capture for retired '{}'", sessionId);
        return sessionNotFound(sessionId);
    }
    auto& session = it->second;
    session.inFlight--;
    session.lastActivityAt = Clock::now();

    if (!captured) {
        if (!session.lastSnapshot && session.inFlight == 0) {
            // Never captured: drop the placeholder so the id stays usable
            sessions_.erase(it);
        }
        return captured.error();
    }
    return applySnapshot(session, std::move(captured).value());
}

CaptureResult StreamingSessionManager::applySnapshot(Session& session, UiSnapshot snapshot) {
    session.captures++;
    const std::size_t fullBytes = snapshot.byteSize();

    CaptureResult result;
    result.sessionId = session.id;
    result.url = snapshot.url;
    result.title = snapshot.title;
    result.mode = session.mode;
    result.fullBytes = fullBytes;

    auto sendFull = [&](ResponseKind kind) {
        result.kind = kind;
        result.snapshot = snapshot;
        result.bytesSent = fullBytes;
        session.fullEquivalentBytes += fullBytes;
        session.bytesSent += fullBytes;
        session.fullSnapshotsSent++;
        session.lastDeltas = std::vector<RegionDelta>{};
    };

    if (!session.lastSnapshot) {
        session.phase = SessionPhase::Initial;
        sendFull(ResponseKind::Initial);
        session.phase = SessionPhase::Streaming;
    } else if (session.mode == StreamingMode::Full) {
        sendFull(ResponseKind::Full);
    } else {
        auto deltas = diffSnapshots(*session.lastSnapshot, snapshot);
        const std::size_t deltaBytes = deltaByteSize(deltas);
        const bool resync = session.mode == StreamingMode::Adaptive &&
                            static_cast<double>(deltaBytes) >
                                session.adaptiveThreshold * static_cast<double>(fullBytes);
        if (resync) {
            session.phase = SessionPhase::Resyncing;
            spdlog::debug("StreamingSessionManager: '{}' resync, delta {} > {} x {} bytes",
                          session.id, deltaBytes, session.adaptiveThreshold, fullBytes);
            sendFull(ResponseKind::Resync);
            session.forcedResyncs++;
            session.phase = SessionPhase::Streaming;
        } else {
            const auto saved = static_cast<std::int64_t>(fullBytes) -
                               static_cast<std::int64_t>(deltaBytes);
            const auto tokens = static_cast<std::int64_t>(estimateTokens(fullBytes)) -
                                static_cast<std::int64_t>(estimateTokens(deltaBytes));
            result.kind = ResponseKind::Incremental;
            result.bytesSent = deltaBytes;
            result.tokenSavings = tokens;
            session.totalChanges += deltas.size();
            session.bytesSaved += saved;
            session.tokensSaved += tokens;
            session.fullEquivalentBytes += fullBytes;
            session.bytesSent += deltaBytes;
            session.deltasSent++;
            session.lastDeltas = deltas;
            result.changes = summarizeChanges(deltas);
            result.regions = std::move(deltas);
        }
    }

    session.lastResponse = result.kind;
    session.lastSnapshotBytes = fullBytes;
    session.lastSnapshot = std::move(snapshot);
    return result;
}

SessionState StreamingSessionManager::stateOf(const Session& session, bool includeDeltas,
                                              bool includeScreenshot) const {
    SessionState state;
    state.sessionId = session.id;
    state.url = session.lastSnapshot ? session.lastSnapshot->url : session.startUrl;
    state.title = session.lastSnapshot ? session.lastSnapshot->title : std::string{};
    state.mode = session.mode;
    state.phase = session.phase;
    state.adaptiveThreshold = session.adaptiveThreshold;
    state.lastResponse = session.lastResponse;
    state.regionCount = session.lastSnapshot ? session.lastSnapshot->regions.size() : 0;
    state.totalChanges = session.totalChanges;
    state.bytesSaved = session.bytesSaved;
    state.tokensSaved = session.tokensSaved;
    state.forcedResyncs = session.forcedResyncs;
    if (includeDeltas) {
        state.lastDeltas = session.lastDeltas.value_or(std::vector<RegionDelta>{});
    }
    if (includeScreenshot && session.lastSnapshot) {
        state.screenshot = session.lastSnapshot->screenshot;
    }
    return state;
}

Result<SessionState> StreamingSessionManager::setMode(const std::string& sessionId,
                                                      StreamingMode mode,
                                                      std::optional<double> adaptiveThreshold) {
    if (adaptiveThreshold && !(*adaptiveThreshold > 0.0 && *adaptiveThreshold <= 1.0)) {
        return Error{ErrorCode::InvalidArgument, "adaptiveThreshold must be in (0, 1]"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return sessionNotFound(sessionId);
    }
    auto& session = it->second;
    auto now = Clock::now();
    session.mode = mode;
    if (adaptiveThreshold) {
        session.adaptiveThreshold = *adaptiveThreshold;
    }
    session.modeHistory.push_back(ModeChange{"set_mode", mode, elapsedMs(session, now)});
    session.lastActivityAt = now;
    return stateOf(session, false, false);
}

Result<SessionState> StreamingSessionManager::getState(const std::string& sessionId,
                                                       bool includeDeltas,
                                                       bool includeScreenshot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return sessionNotFound(sessionId);
    }
    return stateOf(it->second, includeDeltas, includeScreenshot);
}

Result<CleanupResult> StreamingSessionManager::cleanup(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return sessionNotFound(sessionId);
    }
    CleanupResult result{sessionId, it->second.lastSnapshotBytes, it->second.captures};
    sessions_.erase(it);
    retire(sessionId, Clock::now());
    spdlog::debug("StreamingSessionManager: cleaned up '{}'", sessionId);
    return result;
}

Result<StreamStats> StreamingSessionManager::getStats(
    const std::optional<std::string>& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    StreamStats stats;
    stats.activeSessions = sessions_.size();

    auto accumulate = [&](const Session& s) {
        stats.totalDeltas += s.deltasSent;
        stats.totalChanges += s.totalChanges;
        stats.tokensSaved += s.tokensSaved;
        stats.bytesSaved += s.bytesSaved;
        stats.fullEquivalentBytes += s.fullEquivalentBytes;
        stats.bytesSent += s.bytesSent;
        stats.forcedResyncs += s.forcedResyncs;
        stats.sessionDurationMs = std::max(stats.sessionDurationMs, elapsedMs(s, now));
    };

    if (sessionId) {
        auto it = sessions_.find(*sessionId);
        if (it == sessions_.end()) {
            return sessionNotFound(*sessionId);
        }
        stats.sessionId = *sessionId;
        accumulate(it->second);
    } else {
        for (const auto& [id, session] : sessions_) {
            accumulate(session);
        }
    }

    if (stats.bytesSent > 0) {
        stats.compressionRatio = static_cast<double>(stats.fullEquivalentBytes) /
                                 static_cast<double>(stats.bytesSent);
    }
    return stats;
}

Result<DebugInfo> StreamingSessionManager::getDebugInfo(const std::string& sessionId,
                                                        bool detailed) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return sessionNotFound(sessionId);
    }
    const auto& s = it->second;
    auto now = Clock::now();

    DebugInfo info;
    info.sessionId = s.id;
    info.phase = s.phase;
    info.mode = s.mode;
    info.adaptiveThreshold = s.adaptiveThreshold;
    info.modeHistory = s.modeHistory;
    info.captures = s.captures;
    info.fullSnapshotsSent = s.fullSnapshotsSent;
    info.deltasSent = s.deltasSent;
    info.forcedResyncs = s.forcedResyncs;
    info.totalChanges = s.totalChanges;
    info.fullEquivalentBytes = s.fullEquivalentBytes;
    info.bytesSent = s.bytesSent;
    info.snapshotRegionCount = s.lastSnapshot ? s.lastSnapshot->regions.size() : 0;
    info.snapshotBytes = s.lastSnapshotBytes;
    info.ageMs = elapsedMs(s, now);
    info.idleMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - s.lastActivityAt).count();
    info.inFlight = s.inFlight;
    info.detailed = detailed;
    if (detailed && s.lastSnapshot) {
        for (const auto& region : s.lastSnapshot->regions) {
            info.regionSelectors.push_back(region.selector);
        }
    }
    return info;
}

std::size_t StreamingSessionManager::evictIdle(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = retired_.begin(); it != retired_.end();) {
        if (now - it->second > options_.retiredRetention) {
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }

    std::size_t evicted = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& s = it->second;
        if (s.inFlight == 0 && now - s.lastActivityAt > options_.idleTimeout) {
            spdlog::info("StreamingSessionManager: evicting idle session '{}'", s.id);
            retire(s.id, now);
            it = sessions_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::size_t StreamingSessionManager::activeSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool StreamingSessionManager::isRetired(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.contains(sessionId);
}

} // namespace devscope::streaming
