#pragma once

#include <devscope/core/types.h>
#include <devscope/mcp/error_handling.h>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devscope::mcp {

// Successful tool result carrying `text` as its only content item
json makeToolText(std::string text);

// Tool-level failure: a successful RPC result flagged with isError
json makeToolError(std::string_view message);

// Structured results are returned as their compact JSON text
json wrapToolResult(const json& structured);

// JSON schema for a tool without arguments
json noParamsSchema();
json stringParamSchema(std::string_view name, std::string_view description, bool required);

// C++20 concepts for tool system
template <typename T>
concept ToolRequest = requires {
    typename T::RequestType;
    requires std::same_as<T, typename T::RequestType>;
};

template <typename T>
concept ToolResponse = requires {
    typename T::ResponseType;
    requires std::same_as<T, typename T::ResponseType>;
};

// Requests validate their arguments while decoding
template <typename T>
concept ToolDecodable = requires(const json& j) {
    { T::fromJson(j) } -> std::same_as<Result<T>>;
};

template <typename T>
concept ToolEncodable = requires(const T& t) {
    { t.toJson() } -> std::same_as<json>;
};

// Informational responses render a human-readable summary instead of raw JSON
template <typename T>
concept ToolTextSummary = requires(const T& t) {
    { t.toText() } -> std::convertible_to<std::string>;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    json inputSchema;
    std::string group; // documentation only
};

// Async tool wrapper template for coroutine-based handlers
template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolDecodable<RequestType> && ToolEncodable<ResponseType>
class AsyncToolWrapper {
public:
    using AsyncHandlerFn =
        std::function<boost::asio::awaitable<Result<ResponseType>>(const RequestType&)>;

    explicit AsyncToolWrapper(AsyncHandlerFn handler) : handler_(std::move(handler)) {}

    boost::asio::awaitable<json> operator()(const json& args) const {
        try {
            auto req = RequestType::fromJson(args.is_null() ? json::object() : args);
            if (!req) {
                co_return makeToolError(req.error().message);
            }

            auto result = co_await handler_(req.value());
            if (!result) {
                co_return makeToolError(result.error().message);
            }

            if constexpr (ToolTextSummary<ResponseType>) {
                co_return makeToolText(result.value().toText());
            } else {
                co_return wrapToolResult(result.value().toJson());
            }
        } catch (const json::exception& e) {
            co_return makeToolError("JSON error: " + std::string(e.what()));
        }
    }

private:
    AsyncHandlerFn handler_;
};

/**
 * Append-only tool catalog. Built once during startup; afterwards it is only read, so concurrent
 * callTool/listTools calls need no locking.
 */
class ToolRegistry {
public:
    using AsyncHandler = std::function<boost::asio::awaitable<json>(const json&)>;

    ToolRegistry() { entries_.reserve(64); }

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    template <ToolRequest RequestType, ToolResponse ResponseType>
    requires ToolDecodable<RequestType> && ToolEncodable<ResponseType>
    Result<void> registerTool(
        std::string_view name,
        std::function<boost::asio::awaitable<Result<ResponseType>>(const RequestType&)> handler,
        json schema, std::string_view description, std::string_view group = {}) {
        AsyncToolWrapper<RequestType, ResponseType> wrapper(std::move(handler));
        AsyncHandler fn = [wrapper = std::move(wrapper)](
                              const json& args) -> boost::asio::awaitable<json> {
            return wrapper(args);
        };
        return addEntry(ToolDescriptor{std::string(name), std::string(description),
                                       schema.is_null() ? noParamsSchema() : std::move(schema),
                                       std::string(group)},
                        std::move(fn));
    }

    // Unknown names produce an "Unknown tool" error result, never a protocol error
    boost::asio::awaitable<json> callTool(std::string_view name, const json& arguments) const;

    const ToolDescriptor* getTool(std::string_view name) const;
    json listTools() const;

    std::size_t size() const noexcept { return entries_.size(); }
    // Groups in first-registration order
    std::vector<std::string> groups() const;
    std::vector<std::string> toolsInGroup(std::string_view group) const;

private:
    struct Entry {
        ToolDescriptor descriptor;
        AsyncHandler handler;
    };

    Result<void> addEntry(ToolDescriptor descriptor, AsyncHandler handler);

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace devscope::mcp
