#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "navigate".
// Loads the URL and reports where the page ended up after redirects.

namespace tool_navigate {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to navigate to (e.g. https://example.com)"}
    };
    properties["wait_until"] = {
        {"type", "string"},
        {"enum", json::array({"load", "domcontentloaded", "networkidle"})},
        {"description", "Lifecycle event that counts as loaded (default load)."}
    };

    return {
        mcp_tools::ToolName::Navigate,
        "Open the URL in a fresh browser session and return the final URL, page title and HTTP status.",
        tool_handlers::build_input_schema(properties, {"url"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::NavigateArguments &arguments) {
    debug_log::log("navigate invoked");

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, arguments.wait_until, navigate_result, error_out)) {
        return error_out;
    }

    json result;
    result["status"] = "success";
    result["url"] = navigate_result.url;
    result["title"] = navigate_result.title;
    if (navigate_result.http_status > 0) {
        result["http_status"] = navigate_result.http_status;
    } else {
        result["http_status"] = nullptr;
    }
    return result;
}

} // namespace tool_navigate
