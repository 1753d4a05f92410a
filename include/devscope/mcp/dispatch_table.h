#pragma once

#include <devscope/mcp/error_handling.h>

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devscope::mcp {

// Per-call state handed to a method handler
struct RequestContext {
    json id; // null for notifications
    std::shared_ptr<std::atomic<bool>> cancelToken;

    bool isNotification() const noexcept { return id.is_null(); }
    bool cancelled() const noexcept { return cancelToken && cancelToken->load(); }
};

using MethodHandler =
    std::function<boost::asio::awaitable<Result<json>>(const json& params, const RequestContext&)>;

// JSON-RPC error code for a handler-level failure
int rpcErrorCode(ErrorCode code) noexcept;

/**
 * Method name to handler map. Populated by explicit add() calls during startup and frozen
 * before the first message is read; lookups after freeze() need no locking.
 */
class DispatchTable {
public:
    DispatchTable() = default;

    DispatchTable(const DispatchTable&) = delete;
    DispatchTable& operator=(const DispatchTable&) = delete;

    Result<void> add(std::string method, MethodHandler handler);
    void freeze() noexcept { frozen_ = true; }
    bool frozen() const noexcept { return frozen_; }

    // nullptr when the method is not registered
    const MethodHandler* find(std::string_view method) const;
    bool contains(std::string_view method) const { return find(method) != nullptr; }

    std::size_t size() const noexcept { return order_.size(); }
    const std::vector<std::string>& methods() const noexcept { return order_; }

private:
    std::unordered_map<std::string, MethodHandler> handlers_;
    std::vector<std::string> order_;
    bool frozen_{false};
};

} // namespace devscope::mcp
