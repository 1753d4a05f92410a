#include <devscope/mcp/dispatch_table.h>

#include <spdlog/spdlog.h>

namespace devscope::mcp {

int rpcErrorCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationError:
            return protocol::INVALID_PARAMS;
        case ErrorCode::OperationCancelled:
            return protocol::REQUEST_CANCELLED;
        default:
            return protocol::SERVER_ERROR;
    }
}

Result<void> DispatchTable::add(std::string method, MethodHandler handler) {
    if (frozen_) {
        return Error{ErrorCode::InvalidState,
                     "Dispatch table is frozen; cannot register '" + method + "'"};
    }
    if (method.empty() || !handler) {
        return Error{ErrorCode::InvalidArgument, "Method name and handler are required"};
    }
    auto [it, inserted] = handlers_.emplace(method, std::move(handler));
    if (!inserted) {
        return Error{ErrorCode::InvalidArgument, "Method already registered: " + method};
    }
    order_.push_back(std::move(method));
    spdlog::debug("DispatchTable: registered '{}'", order_.back());
    return {};
}

const MethodHandler* DispatchTable::find(std::string_view method) const {
    if (auto it = handlers_.find(std::string(method)); it != handlers_.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace devscope::mcp
