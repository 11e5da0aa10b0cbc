#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

namespace tool_handlers {

json build_input_schema(const json &properties, const std::vector<std::string> &required) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = properties;
    input_schema["properties"]["browser"] = {
        {"type", "string"},
        {"enum", browser_driver::engine_family_names()},
        {"description", "Browser engine to run this call in (default chromium)."}
    };
    input_schema["properties"]["headless"] = {
        {"type", "boolean"},
        {"description", "Run the browser without a window (default true)."}
    };
    input_schema["required"] = required;
    return input_schema;
}

json error_result(const std::string &message) {
    json result;
    result["status"] = "error";
    result["error"] = message;
    return result;
}

bool navigate_page(browser_driver::Page &page, const std::string &url, browser_driver::WaitUntil wait_until,
                   browser_driver::NavigateResult &navigate_result, json &error_out) {
    debug_log::log("Navigating to URL: " + url);
    navigate_result = page.navigate(url, wait_until);
    if (!navigate_result.success) {
        error_out = error_result("Navigation failed: " + navigate_result.error_text);
        return false;
    }
    return true;
}

} // namespace tool_handlers
