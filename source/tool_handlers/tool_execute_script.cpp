#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = tool_handlers::json;

// Tool handler for "execute_script".
// The script is evaluated as an expression; promises are awaited and the value is
// returned by value (it must be JSON-serializable).

namespace tool_execute_script {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to open before running the script."}
    };
    properties["script"] = {
        {"type", "string"},
        {"description", "JavaScript expression to evaluate, e.g. document.title or "
                        "(() => { return [...document.links].length; })()"}
    };

    return {
        mcp_tools::ToolName::ExecuteScript,
        "Open the URL in a fresh browser session, evaluate a JavaScript expression in the page "
        "and return its JSON value.",
        tool_handlers::build_input_schema(properties, {"url", "script"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::ExecuteScriptArguments &arguments) {
    debug_log::log("execute_script invoked (" + std::to_string(arguments.script.size()) + " bytes)");

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::EvaluateResult evaluate_result = page.evaluate(arguments.script);
    if (!evaluate_result.success) {
        return tool_handlers::error_result("Script failed: " + evaluate_result.error_detail);
    }

    json value;
    try {
        value = json::parse(evaluate_result.result_json_string);
    } catch (const json::parse_error &) {
        value = evaluate_result.result_json_string;
    }

    json result;
    result["status"] = "success";
    result["result"] = value;
    return result;
}

} // namespace tool_execute_script
