// pagemcp_driver: command-line browser driver.
// Default external driver for the server's CLI backend; also usable by hand.
//
//   pagemcp_driver [--json] navigate --url U [--browser B] [--wait_until W] [--headless]
//   pagemcp_driver [--json] navigate_and_screenshot --url U --path P [--browser B] [--headless] [--full_page]
//   pagemcp_driver [--json] get_content --url U [--type html|text] [--browser B] [--headless] [--selector S]
//
// Exit code 0 on success, 1 on a failed browser action, 2 on a usage error.

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge/direct_backend.hpp"
#include "browser/cdp/cdp_session.hpp"
#include "config/server_config.hpp"
#include "protocol/json_text.hpp"
#include "tool_handlers/tool_arguments.hpp"

using json = nlohmann::ordered_json;

static const int EXIT_TOOL_FAILED = 1;
static const int EXIT_USAGE = 2;

static void print_usage() {
    std::cerr << "usage: pagemcp_driver [--json] <command> [options]\n"
                 "commands:\n"
                 "  navigate --url U [--browser B] [--wait_until load|domcontentloaded|networkidle] [--headless]\n"
                 "  navigate_and_screenshot --url U --path P [--browser B] [--headless] [--full_page]\n"
                 "  get_content --url U [--type html|text] [--browser B] [--headless] [--selector S]\n"
                 "browsers: chromium (default), firefox, webkit\n";
}

struct CommandLine {
    bool json_output = false;
    std::string command;
    std::string browser = "chromium";
    bool headless = false;
    json arguments = json::object();
};

// Options taking a value, mapped to the tool argument they set.
struct ValueOption {
    const char *flag;
    const char *argument;
};

static bool parse_command_line(int argc, char **argv, CommandLine &command_line, std::string &error) {
    static const ValueOption value_options[] = {
        {"--url", "url"},
        {"--path", "path"},
        {"--type", "content_type"},
        {"--selector", "selector"},
        {"--wait_until", "wait_until"},
    };

    for (int index = 1; index < argc; ++index) {
        std::string token = argv[index];
        if (token == "--json") {
            command_line.json_output = true;
            continue;
        }
        if (token == "--headless") {
            command_line.headless = true;
            continue;
        }
        if (token == "--full_page") {
            command_line.arguments["full_page"] = true;
            continue;
        }
        if (token == "--browser") {
            if (index + 1 >= argc) {
                error = "--browser needs a value";
                return false;
            }
            command_line.browser = argv[++index];
            continue;
        }

        bool matched = false;
        for (const auto &option : value_options) {
            if (token == option.flag) {
                if (index + 1 >= argc) {
                    error = token + " needs a value";
                    return false;
                }
                command_line.arguments[option.argument] = argv[++index];
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        if (!token.empty() && token[0] != '-' && command_line.command.empty()) {
            command_line.command = token;
            continue;
        }
        error = "unexpected argument: " + token;
        return false;
    }

    if (command_line.command.empty()) {
        error = "missing command";
        return false;
    }
    return true;
}

static bool tool_for_command(const std::string &command, mcp_tools::ToolName &tool_name) {
    if (command == "navigate") {
        tool_name = mcp_tools::ToolName::Navigate;
        return true;
    }
    if (command == "navigate_and_screenshot") {
        tool_name = mcp_tools::ToolName::Screenshot;
        return true;
    }
    if (command == "get_content") {
        tool_name = mcp_tools::ToolName::GetContent;
        return true;
    }
    return false;
}

static void print_human_readable(mcp_tools::ToolName tool_name, const json &arguments, const json &result) {
    std::string url = arguments.value("url", std::string());
    switch (tool_name) {
    case mcp_tools::ToolName::Screenshot:
        std::cout << "Navigated to " << url << " and saved screenshot to "
                  << result.value("path", std::string()) << std::endl;
        return;
    case mcp_tools::ToolName::GetContent: {
        std::cout << "Content from " << url << " (" << result.value("content_type", std::string()) << "):\n";
        bool has_content = result.contains("content") && result["content"].is_string();
        std::cout << (has_content ? result["content"].get<std::string>() : std::string("(no match)")) << std::endl;
        return;
    }
    default:
        std::cout << "Navigated to " << result.value("url", url) << " (" << result.value("title", std::string())
                  << ")" << std::endl;
        return;
    }
}

int main(int argc, char **argv) {
    CommandLine command_line;
    std::string usage_error;
    if (!parse_command_line(argc, argv, command_line, usage_error)) {
        std::cerr << "pagemcp_driver: " << usage_error << "\n";
        print_usage();
        return EXIT_USAGE;
    }

    mcp_tools::ToolName tool_name = mcp_tools::ToolName::Navigate;
    if (!tool_for_command(command_line.command, tool_name)) {
        std::cerr << "pagemcp_driver: unknown command '" << command_line.command << "'\n";
        print_usage();
        return EXIT_USAGE;
    }
    if (tool_name == mcp_tools::ToolName::GetContent && !command_line.arguments.contains("content_type")) {
        command_line.arguments["content_type"] = "text";
    }

    tool_arguments::ParseResult parsed = tool_arguments::parse(tool_name, command_line.arguments);
    if (!parsed.success) {
        std::cerr << "pagemcp_driver: " << parsed.error_detail << "\n";
        return EXIT_USAGE;
    }

    server_config::ServerConfig config = server_config::load_from_environment();
    cdp_engine_launch::ExecutableOverrides overrides = config.engine_executables;
    direct_backend::SessionLauncher launcher = [overrides](const browser_driver::LaunchOptions &options) {
        return cdp_session::launch_session(options, overrides);
    };

    json result;
    try {
        result = direct_backend::execute(launcher, command_line.browser, command_line.headless, parsed.arguments);
    } catch (const std::exception &error) {
        result["status"] = "error";
        result["error"] = error.what();
    }

    bool failed = result.value("status", std::string()) == "error";
    if (command_line.json_output) {
        std::cout << json_text::dump_spaced(result) << std::endl;
    } else if (!failed) {
        print_human_readable(tool_name, command_line.arguments, result);
    }

    if (failed) {
        std::cerr << result.value("error", std::string("unknown error")) << std::endl;
        return EXIT_TOOL_FAILED;
    }
    return 0;
}
