#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "click".

namespace tool_click {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to open before clicking."}
    };
    properties["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the element to click."}
    };

    return {
        mcp_tools::ToolName::Click,
        "Open the URL in a fresh browser session and click the element matching the selector. "
        "Returns the URL after the click.",
        tool_handlers::build_input_schema(properties, {"url", "selector"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::ClickArguments &arguments) {
    debug_log::log("click invoked selector=" + arguments.selector);

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::DriverResult click_result = page.click(arguments.selector);
    if (!click_result.success) {
        return tool_handlers::error_result("Click failed: " + click_result.error_detail);
    }

    json result;
    result["status"] = "success";
    result["selector"] = arguments.selector;
    result["url"] = page.current_url();
    return result;
}

} // namespace tool_click
