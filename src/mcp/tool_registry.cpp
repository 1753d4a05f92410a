#include <devscope/mcp/tool_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devscope::mcp {

json makeToolText(std::string text) {
    return json{{"content", json::array({json{{"type", "text"}, {"text", std::move(text)}}})}};
}

json makeToolError(std::string_view message) {
    return json{{"content", json::array({json{{"type", "text"},
                                              {"text", "Error: " + std::string(message)}}})},
                {"isError", true}};
}

json wrapToolResult(const json& structured) {
    return makeToolText(structured.dump());
}

json noParamsSchema() {
    return json{{"type", "object"}, {"properties", json::object()}};
}

json stringParamSchema(std::string_view name, std::string_view description, bool required) {
    json schema = {{"type", "object"},
                   {"properties",
                    {{std::string(name),
                      {{"type", "string"}, {"description", std::string(description)}}}}}};
    if (required) {
        schema["required"] = json::array({std::string(name)});
    }
    return schema;
}

Result<void> ToolRegistry::addEntry(ToolDescriptor descriptor, AsyncHandler handler) {
    if (descriptor.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tool name must not be empty"};
    }
    if (index_.contains(descriptor.name)) {
        return Error{ErrorCode::InvalidArgument, "Tool already registered: " + descriptor.name};
    }
    index_.emplace(descriptor.name, entries_.size());
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
    return {};
}

boost::asio::awaitable<json> ToolRegistry::callTool(std::string_view name,
                                                    const json& arguments) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        spdlog::debug("ToolRegistry: unknown tool '{}'", name);
        co_return json{{"content", json::array({json{{"type", "text"},
                                                     {"text", "Unknown tool: " +
                                                                  std::string(name)}}})},
                       {"isError", true}};
    }
    co_return co_await entries_[it->second].handler(arguments);
}

const ToolDescriptor* ToolRegistry::getTool(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &entries_[it->second].descriptor;
    }
    return nullptr;
}

json ToolRegistry::listTools() const {
    json tools = json::array();
    for (const auto& entry : entries_) {
        const auto& desc = entry.descriptor;
        tools.push_back(json{{"name", desc.name},
                             {"description", desc.description},
                             {"inputSchema", desc.inputSchema}});
    }
    return json{{"tools", std::move(tools)}};
}

std::vector<std::string> ToolRegistry::groups() const {
    std::vector<std::string> out;
    for (const auto& entry : entries_) {
        const auto& g = entry.descriptor.group;
        if (std::find(out.begin(), out.end(), g) == out.end()) {
            out.push_back(g);
        }
    }
    return out;
}

std::vector<std::string> ToolRegistry::toolsInGroup(std::string_view group) const {
    std::vector<std::string> out;
    for (const auto& entry : entries_) {
        if (entry.descriptor.group == group) {
            out.push_back(entry.descriptor.name);
        }
    }
    return out;
}

} // namespace devscope::mcp
