#include "tool_handlers/tool_arguments.hpp"

namespace tool_arguments {

std::string content_type_name(ContentType content_type) {
    switch (content_type) {
    case ContentType::Html:
        return "html";
    case ContentType::Text:
        return "text";
    }
    return "html";
}

std::string wait_until_name(browser_driver::WaitUntil wait_until) {
    switch (wait_until) {
    case browser_driver::WaitUntil::Load:
        return "load";
    case browser_driver::WaitUntil::DomContentLoaded:
        return "domcontentloaded";
    case browser_driver::WaitUntil::NetworkIdle:
        return "networkidle";
    }
    return "load";
}

std::string element_state_name(browser_driver::ElementState state) {
    switch (state) {
    case browser_driver::ElementState::Visible:
        return "visible";
    case browser_driver::ElementState::Hidden:
        return "hidden";
    case browser_driver::ElementState::Attached:
        return "attached";
    }
    return "visible";
}

// Reads fields off one arguments object. The first problem found is kept in error_detail
// and later reads become no-ops.
class ArgumentReader {
public:
    ArgumentReader(const std::string &tool, const json &arguments)
        : tool(tool), arguments(arguments.is_object() ? arguments : json::object()) {}

    bool ok() const { return error_detail.empty(); }
    const std::string &error() const { return error_detail; }

    void required_string(const char *key, std::string &target) {
        if (!ok()) {
            return;
        }
        if (!arguments.contains(key) || !arguments[key].is_string()) {
            error_detail = tool + " requires '" + key + "' (string).";
            return;
        }
        target = arguments[key].get<std::string>();
    }

    // Absent or null leaves target untouched. Returns true if a value was read.
    bool optional_string(const char *key, std::string &target) {
        if (!ok() || !present(key)) {
            return false;
        }
        if (!arguments[key].is_string()) {
            error_detail = tool + ": '" + std::string(key) + "' must be a string.";
            return false;
        }
        target = arguments[key].get<std::string>();
        return true;
    }

    void optional_bool(const char *key, bool &target) {
        if (!ok() || !present(key)) {
            return;
        }
        if (!arguments[key].is_boolean()) {
            error_detail = tool + ": '" + std::string(key) + "' must be a boolean.";
            return;
        }
        target = arguments[key].get<bool>();
    }

    void optional_milliseconds(const char *key, int &target) {
        if (!ok() || !present(key)) {
            return;
        }
        const json &value = arguments[key];
        if (!value.is_number() || value.get<double>() < 0 || value.get<double>() > 3600000) {
            error_detail = tool + ": '" + std::string(key) + "' must be a number of milliseconds (0 to 3600000).";
            return;
        }
        target = static_cast<int>(value.get<double>());
    }

    void fail(const std::string &message) {
        if (ok()) {
            error_detail = tool + ": " + message;
        }
    }

private:
    bool present(const char *key) const {
        return arguments.contains(key) && !arguments[key].is_null();
    }

    std::string tool;
    json arguments;
    std::string error_detail;
};

static ParseResult finish(const ArgumentReader &reader, ToolArguments arguments) {
    ParseResult result;
    if (!reader.ok()) {
        result.error_detail = reader.error();
        return result;
    }
    result.success = true;
    result.arguments = std::move(arguments);
    return result;
}

static ParseResult parse_navigate(ArgumentReader &reader) {
    NavigateArguments parsed;
    reader.required_string("url", parsed.url);
    std::string wait_until;
    if (reader.optional_string("wait_until", wait_until)) {
        parsed.wait_until_given = true;
        if (wait_until == "load") {
            parsed.wait_until = browser_driver::WaitUntil::Load;
        } else if (wait_until == "domcontentloaded") {
            parsed.wait_until = browser_driver::WaitUntil::DomContentLoaded;
        } else if (wait_until == "networkidle") {
            parsed.wait_until = browser_driver::WaitUntil::NetworkIdle;
        } else {
            reader.fail("'wait_until' must be one of load, domcontentloaded, networkidle.");
        }
    }
    return finish(reader, parsed);
}

static ParseResult parse_screenshot(ArgumentReader &reader) {
    ScreenshotArguments parsed;
    reader.required_string("url", parsed.url);
    reader.optional_string("path", parsed.path);
    reader.optional_bool("full_page", parsed.full_page);
    if (reader.ok() && parsed.path.empty()) {
        reader.fail("'path' must not be empty.");
    }
    return finish(reader, parsed);
}

static ParseResult parse_get_content(ArgumentReader &reader) {
    GetContentArguments parsed;
    reader.required_string("url", parsed.url);
    std::string content_type;
    reader.required_string("content_type", content_type);
    if (reader.ok()) {
        if (content_type == "html") {
            parsed.content_type = ContentType::Html;
        } else if (content_type == "text") {
            parsed.content_type = ContentType::Text;
        } else {
            reader.fail("'content_type' must be 'html' or 'text'.");
        }
    }
    std::string selector;
    if (reader.optional_string("selector", selector) && !selector.empty()) {
        parsed.selector = selector;
    }
    return finish(reader, parsed);
}

static ParseResult parse_click(ArgumentReader &reader) {
    ClickArguments parsed;
    reader.required_string("url", parsed.url);
    reader.required_string("selector", parsed.selector);
    return finish(reader, parsed);
}

static ParseResult parse_fill(ArgumentReader &reader) {
    FillArguments parsed;
    reader.required_string("url", parsed.url);
    reader.required_string("selector", parsed.selector);
    reader.required_string("value", parsed.value);
    return finish(reader, parsed);
}

static ParseResult parse_execute_script(ArgumentReader &reader) {
    ExecuteScriptArguments parsed;
    reader.required_string("url", parsed.url);
    reader.required_string("script", parsed.script);
    return finish(reader, parsed);
}

static ParseResult parse_get_attribute(ArgumentReader &reader) {
    GetAttributeArguments parsed;
    reader.required_string("url", parsed.url);
    reader.required_string("selector", parsed.selector);
    reader.required_string("attribute", parsed.attribute);
    return finish(reader, parsed);
}

static ParseResult parse_wait_for(ArgumentReader &reader) {
    WaitForArguments parsed;
    reader.required_string("url", parsed.url);
    reader.required_string("selector", parsed.selector);
    std::string state;
    if (reader.optional_string("state", state)) {
        if (state == "visible") {
            parsed.state = browser_driver::ElementState::Visible;
        } else if (state == "hidden") {
            parsed.state = browser_driver::ElementState::Hidden;
        } else if (state == "attached") {
            parsed.state = browser_driver::ElementState::Attached;
        } else {
            reader.fail("'state' must be one of visible, hidden, attached.");
        }
    }
    reader.optional_milliseconds("timeout", parsed.timeout_milliseconds);
    return finish(reader, parsed);
}

ParseResult parse(mcp_tools::ToolName tool_name, const json &arguments) {
    ArgumentReader reader(mcp_tools::tool_name_string(tool_name), arguments);
    switch (tool_name) {
    case mcp_tools::ToolName::Navigate:
        return parse_navigate(reader);
    case mcp_tools::ToolName::Screenshot:
        return parse_screenshot(reader);
    case mcp_tools::ToolName::GetContent:
        return parse_get_content(reader);
    case mcp_tools::ToolName::Click:
        return parse_click(reader);
    case mcp_tools::ToolName::Fill:
        return parse_fill(reader);
    case mcp_tools::ToolName::ExecuteScript:
        return parse_execute_script(reader);
    case mcp_tools::ToolName::GetAttribute:
        return parse_get_attribute(reader);
    case mcp_tools::ToolName::WaitFor:
        return parse_wait_for(reader);
    }
    ParseResult unknown;
    unknown.error_detail = "Unknown tool.";
    return unknown;
}

} // namespace tool_arguments
