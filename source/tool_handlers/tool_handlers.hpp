#ifndef PAGEMCP_TOOL_HANDLERS_HPP
#define PAGEMCP_TOOL_HANDLERS_HPP

// Tool handlers.
// Each tool_*.cpp file provides the tool's definition for the registry and a run function
// that performs one navigation and one primitive on a freshly launched page.
// run returns {"status": "success", ...} or {"status": "error", "error": "..."}.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"

namespace tool_handlers {

using json = nlohmann::ordered_json;

// Object schema with the given tool-specific properties plus the shared "browser" and
// "headless" properties.
json build_input_schema(const json &properties, const std::vector<std::string> &required);

// {"status": "error", "error": message}
json error_result(const std::string &message);

// Navigate and fill error_out on failure. Every handler starts with this.
bool navigate_page(browser_driver::Page &page, const std::string &url, browser_driver::WaitUntil wait_until,
                   browser_driver::NavigateResult &navigate_result, json &error_out);

} // namespace tool_handlers

namespace tool_navigate {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::NavigateArguments &arguments);
} // namespace tool_navigate

namespace tool_screenshot {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::ScreenshotArguments &arguments);
} // namespace tool_screenshot

namespace tool_get_content {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::GetContentArguments &arguments);
} // namespace tool_get_content

namespace tool_click {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::ClickArguments &arguments);
} // namespace tool_click

namespace tool_fill {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::FillArguments &arguments);
} // namespace tool_fill

namespace tool_execute_script {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::ExecuteScriptArguments &arguments);
} // namespace tool_execute_script

namespace tool_get_attribute {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::GetAttributeArguments &arguments);
} // namespace tool_get_attribute

namespace tool_wait_for {
mcp_tools::ToolDefinition definition();
tool_handlers::json run(browser_driver::Page &page, const tool_arguments::WaitForArguments &arguments);
} // namespace tool_wait_for

#endif // PAGEMCP_TOOL_HANDLERS_HPP
