// Tests for the tool catalog served by tools/list.

#include "mcp/mcp_tools.hpp"

#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace test_tool_registry {

using json = mcp_tools::json;

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static std::set<std::string> required_of(const json &schema) {
    std::set<std::string> required;
    for (const auto &field : schema["required"]) {
        required.insert(field.get<std::string>());
    }
    return required;
}

static bool test_catalog_names_and_required_fields() {
    const std::map<std::string, std::set<std::string>> expected = {
        {"navigate", {"url"}},
        {"screenshot", {"url"}},
        {"get_content", {"url", "content_type"}},
        {"click", {"url", "selector"}},
        {"fill", {"url", "selector", "value"}},
        {"execute_script", {"url", "script"}},
        {"get_attribute", {"url", "selector", "attribute"}},
        {"wait_for", {"url", "selector"}},
    };

    json listing = mcp_tools::build_tools_list_response();
    std::map<std::string, std::set<std::string>> actual;
    for (const auto &tool : listing["tools"]) {
        actual[tool["name"].get<std::string>()] = required_of(tool["inputSchema"]);
    }

    bool ok = listing["tools"].size() == 8 && actual == expected;
    return expect(ok, "tools/list has exactly the eight tools with their required fields");
}

static bool test_shared_properties() {
    bool ok = true;
    for (const auto &tool : mcp_tools::get_registered_tools()) {
        const json &properties = tool.input_schema["properties"];
        bool browser_ok = properties.contains("browser") &&
                          properties["browser"]["enum"] == json::array({"chromium", "firefox", "webkit"});
        bool headless_ok = properties.contains("headless") && properties["headless"]["type"] == "boolean";
        bool not_required = required_of(tool.input_schema).count("browser") == 0 &&
                            required_of(tool.input_schema).count("headless") == 0;
        bool described = !tool.description.empty() && tool.input_schema["type"] == "object";
        if (!(browser_ok && headless_ok && not_required && described)) {
            std::cout << "    schema problem in " << mcp_tools::tool_name_string(tool.name) << std::endl;
            ok = false;
        }
    }
    return expect(ok, "Every tool takes optional browser (three engines) and headless");
}

static bool test_registry_is_stable() {
    const std::vector<mcp_tools::ToolDefinition> *first = &mcp_tools::get_registered_tools();
    json first_listing = mcp_tools::build_tools_list_response();
    const std::vector<mcp_tools::ToolDefinition> *second = &mcp_tools::get_registered_tools();
    json second_listing = mcp_tools::build_tools_list_response();
    return expect(first == second && first_listing == second_listing,
                  "The registry is the same object with the same content on every call");
}

static bool test_name_round_trip() {
    bool ok = true;
    for (const auto &tool : mcp_tools::get_registered_tools()) {
        std::optional<mcp_tools::ToolName> parsed = mcp_tools::parse_tool_name(mcp_tools::tool_name_string(tool.name));
        ok &= parsed.has_value() && *parsed == tool.name;
    }
    ok &= !mcp_tools::parse_tool_name("open_browser").has_value();
    ok &= !mcp_tools::parse_tool_name("Navigate").has_value();
    ok &= !mcp_tools::parse_tool_name("").has_value();
    return expect(ok, "Tool names parse back; unknown and differently-cased names do not");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_catalog_names_and_required_fields();
    all_passed &= test_shared_properties();
    all_passed &= test_registry_is_stable();
    all_passed &= test_name_round_trip();
    return all_passed;
}

} // namespace test_tool_registry
