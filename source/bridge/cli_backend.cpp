#include "bridge/cli_backend.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_signal.hpp"
#include "utils/string_utils.hpp"
#include "mcp/mcp_stdio.hpp"

#include <algorithm>
#include <chrono>
#include <future>

namespace cli_backend {

// Subcommand and options for the tools the driver understands.
struct CliArgumentVisitor {
    const std::string &engine_family;
    bool headless;

    std::optional<std::vector<std::string>> operator()(const tool_arguments::NavigateArguments &arguments) const {
        std::vector<std::string> argv = {"navigate", "--url", arguments.url, "--browser", engine_family};
        if (arguments.wait_until_given) {
            argv.push_back("--wait_until");
            argv.push_back(tool_arguments::wait_until_name(arguments.wait_until));
        }
        if (headless) {
            argv.push_back("--headless");
        }
        return argv;
    }

    std::optional<std::vector<std::string>> operator()(const tool_arguments::ScreenshotArguments &arguments) const {
        std::vector<std::string> argv = {"navigate_and_screenshot", "--url", arguments.url,
                                         "--path", arguments.path, "--browser", engine_family};
        if (headless) {
            argv.push_back("--headless");
        }
        if (arguments.full_page) {
            argv.push_back("--full_page");
        }
        return argv;
    }

    std::optional<std::vector<std::string>> operator()(const tool_arguments::GetContentArguments &arguments) const {
        std::vector<std::string> argv = {"get_content", "--url", arguments.url,
                                         "--type", tool_arguments::content_type_name(arguments.content_type),
                                         "--browser", engine_family};
        if (headless) {
            argv.push_back("--headless");
        }
        if (arguments.selector) {
            argv.push_back("--selector");
            argv.push_back(*arguments.selector);
        }
        return argv;
    }

    // No mapping for the remaining tools.
    template <typename Arguments>
    std::optional<std::vector<std::string>> operator()(const Arguments &) const {
        return std::nullopt;
    }
};

std::optional<std::vector<std::string>> build_cli_arguments(const CliSettings &settings,
                                                            const std::string &engine_family, bool headless,
                                                            const tool_arguments::ToolArguments &arguments) {
    std::optional<std::vector<std::string>> subcommand = std::visit(CliArgumentVisitor{engine_family, headless},
                                                                    arguments);
    if (!subcommand) {
        return std::nullopt;
    }

    std::vector<std::string> argv;
    if (!settings.interpreter.empty()) {
        argv.push_back(settings.interpreter);
    }
    argv.push_back(settings.cli_path);
    argv.push_back("--json");
    argv.insert(argv.end(), subcommand->begin(), subcommand->end());
    return argv;
}

json interpret_process_result(const platform::ProcessResult &process_result, int timeout_seconds) {
    if (!process_result.started) {
        return tool_handlers::error_result("Failed to start CLI driver: " + process_result.error_message);
    }
    if (process_result.timed_out) {
        return tool_handlers::error_result("CLI driver timed out after " + std::to_string(timeout_seconds) + " s");
    }
    if (process_result.exit_code != 0) {
        std::string standard_error = string_utils::trim(process_result.standard_error);
        if (standard_error.empty()) {
            standard_error = "exit code " + std::to_string(process_result.exit_code);
        }
        return tool_handlers::error_result(standard_error);
    }

    std::string standard_output = string_utils::trim(process_result.standard_output);
    try {
        json parsed = json::parse(standard_output);
        if (parsed.is_object()) {
            return parsed;
        }
    } catch (const json::parse_error &) {
        debug_log::log("CLI driver output is not JSON; returning it as raw_output.");
    }

    json result;
    result["status"] = "success";
    result["raw_output"] = standard_output;
    return result;
}

json execute(const CliSettings &settings, const CommandRunner &runner, mcp_tools::ToolName tool_name,
             const std::string &engine_family, bool headless, const tool_arguments::ToolArguments &arguments) {
    std::string name = mcp_tools::tool_name_string(tool_name);
    std::optional<std::vector<std::string>> argv = build_cli_arguments(settings, engine_family, headless, arguments);
    if (!argv) {
        return tool_handlers::error_result("Tool '" + name + "' is not available in CLI mode. Use direct mode.");
    }
    if (!browser_driver::parse_engine_family(engine_family)) {
        return tool_handlers::error_result("Unsupported browser: " + engine_family);
    }

    if (debug_log::is_debug_enabled()) {
        std::string command_text;
        for (const auto &argument : *argv) {
            command_text += (command_text.empty() ? "" : " ") + argument;
        }
        debug_log::log("CLI driver argv: " + command_text);
    }

    int timeout_seconds = std::min(std::max(settings.timeout_seconds, 1), MAX_TIMEOUT_SECONDS);
    int timeout_milliseconds = timeout_seconds * 1000;
    std::future<platform::ProcessResult> worker =
        std::async(std::launch::async, runner, *argv, timeout_milliseconds);

    bool shutdown_noted = false;
    while (worker.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (shutdown_signal::is_requested() && !shutdown_noted) {
            mcp_stdio::log_message("Shutdown requested; waiting for the CLI driver to finish '" + name + "'.");
            shutdown_noted = true;
        }
    }

    return interpret_process_result(worker.get(), timeout_seconds);
}

} // namespace cli_backend
