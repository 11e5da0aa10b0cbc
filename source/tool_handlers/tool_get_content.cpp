#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "get_content".
//   html, no selector: the whole document (doctype + outerHTML)
//   html, selector:    innerHTML of the first match, null when nothing matches
//   text:              innerText of the first match, or of <body>

namespace tool_get_content {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to read."}
    };
    properties["content_type"] = {
        {"type", "string"},
        {"enum", json::array({"html", "text"})},
        {"description", "html for markup, text for rendered text."}
    };
    properties["selector"] = {
        {"type", "string"},
        {"description", "CSS selector to limit extraction to one element (optional)."}
    };

    return {
        mcp_tools::ToolName::GetContent,
        "Open the URL in a fresh browser session and return its HTML or visible text, "
        "optionally limited to one element.",
        tool_handlers::build_input_schema(properties, {"url", "content_type"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::GetContentArguments &arguments) {
    debug_log::log("get_content invoked type=" + tool_arguments::content_type_name(arguments.content_type));

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::ContentResult content_result;
    switch (arguments.content_type) {
    case tool_arguments::ContentType::Html:
        content_result = arguments.selector ? page.get_inner_html(*arguments.selector) : page.get_html();
        break;
    case tool_arguments::ContentType::Text:
        content_result = page.get_inner_text(arguments.selector ? *arguments.selector : "body");
        break;
    }

    if (!content_result.success) {
        return tool_handlers::error_result("Reading content failed: " + content_result.error_detail);
    }

    json result;
    result["status"] = "success";
    result["url"] = navigate_result.url;
    result["content_type"] = tool_arguments::content_type_name(arguments.content_type);
    if (content_result.found) {
        result["content"] = content_result.content;
    } else {
        result["content"] = nullptr;
    }
    return result;
}

} // namespace tool_get_content
