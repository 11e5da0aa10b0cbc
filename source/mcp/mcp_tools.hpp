#ifndef PAGEMCP_MCP_TOOLS_HPP
#define PAGEMCP_MCP_TOOLS_HPP

// MCP tool registry: the fixed catalog of tools served by tools/list.
// The catalog is built once on first use and never changes afterwards.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::ordered_json;

// Every tool the server exposes. Switches over this enum are exhaustive.
enum class ToolName {
    Navigate,
    Screenshot,
    GetContent,
    Click,
    Fill,
    ExecuteScript,
    GetAttribute,
    WaitFor
};

// Wire name of a tool ("navigate", "get_content", ...).
std::string tool_name_string(ToolName name);

// Reverse of tool_name_string. Returns nullopt for unregistered names.
std::optional<ToolName> parse_tool_name(const std::string &name);

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    ToolName name;
    std::string description;
    json input_schema; // JSON Schema object
};

// The registry. Same object, same contents, for the process lifetime.
const std::vector<ToolDefinition> &get_registered_tools();

// Build the response payload for tools/list.
json build_tools_list_response();

} // namespace mcp_tools

#endif // PAGEMCP_MCP_TOOLS_HPP
