#include "tool_handlers/tool_handlers.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>

using json = tool_handlers::json;

// Tool handler for "screenshot".
// Captures the page as PNG via the driver and writes it to the requested path.
// The image is not returned inline; the result carries the absolute path.

namespace tool_screenshot {

mcp_tools::ToolDefinition definition() {
    json properties = json::object();
    properties["url"] = {
        {"type", "string"},
        {"description", "The URL to capture."}
    };
    properties["path"] = {
        {"type", "string"},
        {"description", "Where to write the PNG file (default screenshot.png, relative to the server's working directory)."}
    };
    properties["full_page"] = {
        {"type", "boolean"},
        {"description", "Capture the whole scrollable page instead of the viewport (default false)."}
    };

    return {
        mcp_tools::ToolName::Screenshot,
        "Open the URL in a fresh browser session and save a PNG screenshot to a file.",
        tool_handlers::build_input_schema(properties, {"url"})
    };
}

json run(browser_driver::Page &page, const tool_arguments::ScreenshotArguments &arguments) {
    debug_log::log("screenshot invoked path=" + arguments.path +
                   " full_page=" + std::string(arguments.full_page ? "true" : "false"));

    browser_driver::NavigateResult navigate_result;
    json error_out;
    if (!tool_handlers::navigate_page(page, arguments.url, browser_driver::WaitUntil::Load, navigate_result,
                                      error_out)) {
        return error_out;
    }

    browser_driver::CaptureScreenshotResult screenshot_result = page.capture_screenshot(arguments.full_page);
    if (!screenshot_result.success) {
        return tool_handlers::error_result("Screenshot failed: " + screenshot_result.error_detail);
    }

    std::error_code path_error;
    std::filesystem::path absolute_path = std::filesystem::absolute(arguments.path, path_error);
    if (path_error) {
        return tool_handlers::error_result("Invalid screenshot path '" + arguments.path + "': " +
                                           path_error.message());
    }

    std::string write_error;
    if (!platform::write_file_contents(absolute_path.string(), screenshot_result.image_bytes, write_error)) {
        return tool_handlers::error_result("Failed to write screenshot: " + write_error);
    }

    json result;
    result["status"] = "success";
    result["path"] = absolute_path.string();
    return result;
}

} // namespace tool_screenshot
