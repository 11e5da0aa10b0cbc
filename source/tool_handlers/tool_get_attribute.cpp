#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "get_attribute".

namespace tool_get_attribute {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to open."}
    };
    properties["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the element."}
    };
    properties["attribute"] = {
        {"type", "string"},
        {"description", "Attribute name, e.g. href."}
    };

    return {
        mcp_tools::ToolName::GetAttribute,
        "Open the URL in a fresh browser session and read one attribute of the element matching "
        "the selector (null when the element lacks it).",
        tool_handlers::build_input_schema(properties, {"url", "selector", "attribute"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::GetAttributeArguments &arguments) {
    debug_log::log("get_attribute invoked selector=" + arguments.selector + " attribute=" + arguments.attribute);

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::AttributeResult attribute_result = page.get_attribute(arguments.selector, arguments.attribute);
    if (!attribute_result.success) {
        return tool_handlers::error_result("Reading attribute failed: " + attribute_result.error_detail);
    }

    json result;
    result["status"] = "success";
    result["selector"] = arguments.selector;
    result["attribute"] = arguments.attribute;
    if (attribute_result.has_value) {
        result["value"] = attribute_result.value;
    } else {
        result["value"] = nullptr;
    }
    return result;
}

} // namespace tool_get_attribute
