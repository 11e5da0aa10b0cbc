#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "fill".
// Replaces the field's value: the field is cleared, then the text is inserted as if typed.

namespace tool_fill {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to open before filling."}
    };
    properties["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the <input>, <textarea> or contenteditable element."}
    };
    properties["value"] = {
        {"type", "string"},
        {"description", "Text to put into the field."}
    };

    return {
        mcp_tools::ToolName::Fill,
        "Open the URL in a fresh browser session and fill the form field matching the selector.",
        tool_handlers::build_input_schema(properties, {"url", "selector", "value"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::FillArguments &arguments) {
    debug_log::log("fill invoked selector=" + arguments.selector);

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::DriverResult fill_result = page.fill(arguments.selector, arguments.value);
    if (!fill_result.success) {
        return tool_handlers::error_result("Fill failed: " + fill_result.error_detail);
    }

    json result;
    result["status"] = "success";
    result["selector"] = arguments.selector;
    result["value"] = arguments.value;
    return result;
}

} // namespace tool_fill
