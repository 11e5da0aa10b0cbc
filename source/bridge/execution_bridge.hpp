#ifndef PAGEMCP_EXECUTION_BRIDGE_HPP
#define PAGEMCP_EXECUTION_BRIDGE_HPP

// Execution bridge: turns one tools/call into a tool result through the configured backend.
// Results are {"status": "success", ...} or {"status": "error", "error": "..."}; no
// exception leaves execute().

#include <nlohmann/json.hpp>
#include <string>

#include "bridge/cli_backend.hpp"
#include "bridge/direct_backend.hpp"
#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace execution_bridge {

using json = nlohmann::ordered_json;

// Everything one call needs. Built per tools/call and dropped once the response is written.
struct InvocationContext {
    mcp_tools::ToolName tool_name = mcp_tools::ToolName::Navigate;
    json arguments = json::object();
    server_config::BackendMode backend_mode = server_config::BackendMode::Direct;
    std::string engine_family;
    bool headless = true;
};

// engine_family from arguments.browser, else the configured default; headless likewise.
InvocationContext make_context(mcp_tools::ToolName tool_name, const json &arguments,
                               const server_config::ServerConfig &config);

class ExecutionBridge {
public:
    ExecutionBridge(direct_backend::SessionLauncher session_launcher, cli_backend::CliSettings cli_settings,
                    cli_backend::CommandRunner command_runner);

    json execute(const InvocationContext &context) const;

private:
    json run_backend(const InvocationContext &context, const tool_arguments::ToolArguments &arguments) const;

    direct_backend::SessionLauncher session_launcher;
    cli_backend::CliSettings cli_settings;
    cli_backend::CommandRunner command_runner;
};

// Bridge wired to the CDP session launcher and platform::run_process.
ExecutionBridge make_default_bridge(const server_config::ServerConfig &config);

} // namespace execution_bridge

#endif // PAGEMCP_EXECUTION_BRIDGE_HPP
