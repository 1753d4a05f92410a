#include <devscope/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

namespace devscope::mcp {

std::shared_ptr<std::atomic<bool>> MCPServer::registerCancelable(const json& id) {
    if (id.is_null())
        return nullptr;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    auto key = EnvelopeCodec::idKey(id);
    if (cancelTokens_.find(key) != cancelTokens_.end()) {
        return nullptr;
    }
    auto token = std::make_shared<std::atomic<bool>>(false);
    cancelTokens_.emplace(std::move(key), token);
    return token;
}

void MCPServer::cancelRequest(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    auto it = cancelTokens_.find(EnvelopeCodec::idKey(id));
    if (it != cancelTokens_.end()) {
        it->second->store(true);
    } else {
        // Already answered, or never seen
        spdlog::debug("cancel: no in-flight request with id {}", id.dump());
    }
}

void MCPServer::cancelAll() {
    std::lock_guard<std::mutex> lk(cancelMutex_);
    for (auto& [key, token] : cancelTokens_) {
        token->store(true);
    }
    if (!cancelTokens_.empty()) {
        spdlog::info("Cancelled {} in-flight request(s)", cancelTokens_.size());
    }
}

std::size_t MCPServer::inFlightRequests() const {
    std::lock_guard<std::mutex> lk(cancelMutex_);
    return cancelTokens_.size();
}

bool MCPServer::writeResponseOnce(const json& id, const json& response) {
    {
        std::lock_guard<std::mutex> lk(cancelMutex_);
        if (cancelTokens_.erase(EnvelopeCodec::idKey(id)) == 0) {
            spdlog::error("Refusing second response for request id {}", id.dump());
            return false;
        }
    }
    writeMessage(response);
    return true;
}

} // namespace devscope::mcp
