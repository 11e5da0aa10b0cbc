#ifndef PAGEMCP_TOOL_ARGUMENTS_HPP
#define PAGEMCP_TOOL_ARGUMENTS_HPP

// Typed argument records, one per tool, parsed from the tools/call "arguments" object.
// The shared "browser" and "headless" arguments are not part of these records; they
// go into the invocation context instead.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

#include "browser/browser_driver_abi.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_arguments {

using json = nlohmann::ordered_json;

enum class ContentType {
    Html,
    Text
};

std::string content_type_name(ContentType content_type);
std::string wait_until_name(browser_driver::WaitUntil wait_until);
std::string element_state_name(browser_driver::ElementState state);

struct NavigateArguments {
    std::string url;
    browser_driver::WaitUntil wait_until = browser_driver::WaitUntil::Load;
    bool wait_until_given = false;
};

struct ScreenshotArguments {
    std::string url;
    std::string path = "screenshot.png";
    bool full_page = false;
};

struct GetContentArguments {
    std::string url;
    ContentType content_type = ContentType::Html;
    std::optional<std::string> selector;
};

struct ClickArguments {
    std::string url;
    std::string selector;
};

struct FillArguments {
    std::string url;
    std::string selector;
    std::string value;
};

struct ExecuteScriptArguments {
    std::string url;
    std::string script;
};

struct GetAttributeArguments {
    std::string url;
    std::string selector;
    std::string attribute;
};

struct WaitForArguments {
    std::string url;
    std::string selector;
    browser_driver::ElementState state = browser_driver::ElementState::Visible;
    int timeout_milliseconds = 30000;
};

using ToolArguments = std::variant<NavigateArguments, ScreenshotArguments, GetContentArguments,
                                   ClickArguments, FillArguments, ExecuteScriptArguments,
                                   GetAttributeArguments, WaitForArguments>;

struct ParseResult {
    bool success = false;
    ToolArguments arguments;
    std::string error_detail; // "<tool> requires 'url' (string)."
};

// Parse arguments for the given tool. A non-object arguments value is treated as empty.
ParseResult parse(mcp_tools::ToolName tool_name, const json &arguments);

} // namespace tool_arguments

#endif // PAGEMCP_TOOL_ARGUMENTS_HPP
