#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"

namespace mcp_tools {

static const ToolName ALL_TOOL_NAMES[] = {
    ToolName::Navigate,
    ToolName::Screenshot,
    ToolName::GetContent,
    ToolName::Click,
    ToolName::Fill,
    ToolName::ExecuteScript,
    ToolName::GetAttribute,
    ToolName::WaitFor,
};

std::string tool_name_string(ToolName name) {
    switch (name) {
    case ToolName::Navigate:
        return "navigate";
    case ToolName::Screenshot:
        return "screenshot";
    case ToolName::GetContent:
        return "get_content";
    case ToolName::Click:
        return "click";
    case ToolName::Fill:
        return "fill";
    case ToolName::ExecuteScript:
        return "execute_script";
    case ToolName::GetAttribute:
        return "get_attribute";
    case ToolName::WaitFor:
        return "wait_for";
    }
    return "unknown";
}

std::optional<ToolName> parse_tool_name(const std::string &name) {
    for (ToolName candidate : ALL_TOOL_NAMES) {
        if (tool_name_string(candidate) == name) {
            return candidate;
        }
    }
    return std::nullopt;
}

static ToolDefinition definition_for(ToolName name) {
    switch (name) {
    case ToolName::Navigate:
        return tool_navigate::definition();
    case ToolName::Screenshot:
        return tool_screenshot::definition();
    case ToolName::GetContent:
        return tool_get_content::definition();
    case ToolName::Click:
        return tool_click::definition();
    case ToolName::Fill:
        return tool_fill::definition();
    case ToolName::ExecuteScript:
        return tool_execute_script::definition();
    case ToolName::GetAttribute:
        return tool_get_attribute::definition();
    case ToolName::WaitFor:
        return tool_wait_for::definition();
    }
    return tool_navigate::definition();
}

static std::vector<ToolDefinition> build_registry() {
    std::vector<ToolDefinition> tools;
    for (ToolName name : ALL_TOOL_NAMES) {
        tools.push_back(definition_for(name));
    }
    return tools;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    static const std::vector<ToolDefinition> registered_tools = build_registry();
    return registered_tools;
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : get_registered_tools()) {
        json tool_entry;
        tool_entry["name"] = tool_name_string(tool.name);
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
