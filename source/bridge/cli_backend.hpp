#ifndef PAGEMCP_CLI_BACKEND_HPP
#define PAGEMCP_CLI_BACKEND_HPP

// CLI-bridge backend: runs navigate, screenshot and get_content through an external
// command-line driver. The driver is started with an argument vector (no shell) and
// "--json"; its stdout is the tool result.

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "tool_handlers/tool_arguments.hpp"

namespace cli_backend {

using json = nlohmann::ordered_json;

// Upper bound for a driver run; larger settings are clamped to it.
const int MAX_TIMEOUT_SECONDS = 86400;

struct CliSettings {
    std::string cli_path;
    std::string interpreter; // optional program that runs cli_path (e.g. python3)
    int timeout_seconds = 120;
};

// Runs argv to completion. The real one is platform::run_process; tests inject doubles.
using CommandRunner = std::function<platform::ProcessResult(const std::vector<std::string> &argv,
                                                            int timeout_milliseconds)>;

// Full driver argv for the call, or nullopt if the tool has no CLI mapping.
std::optional<std::vector<std::string>> build_cli_arguments(const CliSettings &settings,
                                                            const std::string &engine_family, bool headless,
                                                            const tool_arguments::ToolArguments &arguments);

// Turn a finished driver run into a tool result.
json interpret_process_result(const platform::ProcessResult &process_result, int timeout_seconds);

// Run the call through the driver on a worker thread and wait for it.
json execute(const CliSettings &settings, const CommandRunner &runner, mcp_tools::ToolName tool_name,
             const std::string &engine_family, bool headless, const tool_arguments::ToolArguments &arguments);

} // namespace cli_backend

#endif // PAGEMCP_CLI_BACKEND_HPP
