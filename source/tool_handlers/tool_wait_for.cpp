#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "wait_for".
// Polls the selector until it reaches the requested state or the timeout expires.

namespace tool_wait_for {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to open."}
    };
    properties["selector"] = {
        {"type", "string"},
        {"description", "CSS selector to wait for."}
    };
    properties["state"] = {
        {"type", "string"},
        {"enum", json::array({"visible", "hidden", "attached"})},
        {"description", "State to wait for (default visible)."}
    };
    properties["timeout"] = {
        {"type", "integer"},
        {"description", "Maximum wait in milliseconds (default 30000)."}
    };

    return {
        mcp_tools::ToolName::WaitFor,
        "Open the URL in a fresh browser session and wait until the element matching the selector "
        "is visible, hidden or attached.",
        tool_handlers::build_input_schema(properties, {"url", "selector"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::WaitForArguments &arguments) {
    std::string state_name = tool_arguments::element_state_name(arguments.state);
    debug_log::log("wait_for invoked selector=" + arguments.selector + " state=" + state_name +
                   " timeout=" + std::to_string(arguments.timeout_milliseconds));

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::DriverResult wait_result =
        page.wait_for_selector(arguments.selector, arguments.state, arguments.timeout_milliseconds);
    if (!wait_result.success) {
        return tool_handlers::error_result(wait_result.error_detail);
    }

    json result;
    result["status"] = "success";
    result["selector"] = arguments.selector;
    result["state"] = state_name;
    return result;
}

} // namespace tool_wait_for
