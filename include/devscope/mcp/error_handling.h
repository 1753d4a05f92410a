#pragma once

#include <devscope/core/types.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace devscope::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

using JsonParseResult = MCPResult<json>;

// Transport state management with atomic operations
enum class TransportState : int {
    Disconnected = 0,
    Connected = 1,
    Error = 2,
    Closing = 3
};

// Protocol constants (constexpr for compile-time validation)
namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_CANCELLED = "notifications/cancelled";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";
constexpr std::string_view METHOD_SET_LOG_LEVEL = "logging/setLevel";

// Error codes from JSON-RPC 2.0 specification
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
// Server-defined range: uncaught handler failures
constexpr int SERVER_ERROR = -32000;
// LSP-compatible code for requests answered after cancellation
constexpr int REQUEST_CANCELLED = -32800;
} // namespace protocol

// JSON parsing utilities with error handling
namespace json_utils {
// Safe JSON parsing without exceptions
inline JsonParseResult parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Safe JSON field access
template <typename T>
MCPResult<T> get_field(const json& obj, std::string_view field_name) noexcept {
    try {
        if (!obj.is_object() || !obj.contains(field_name)) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Missing required field: ") + std::string(field_name)};
        }
        return obj[field_name].get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid field '") + std::string(field_name) + "': " + e.what()};
    }
}

// Optional field access: absent or null yields std::nullopt, a wrong type is an error
template <typename T>
MCPResult<std::optional<T>> get_optional_field(const json& obj,
                                               std::string_view field_name) noexcept {
    try {
        if (!obj.is_object() || !obj.contains(field_name) || obj[field_name].is_null()) {
            return std::optional<T>{};
        }
        return std::optional<T>{obj[field_name].get<T>()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid field '") + std::string(field_name) + "': " + e.what()};
    }
}
} // namespace json_utils

} // namespace devscope::mcp
