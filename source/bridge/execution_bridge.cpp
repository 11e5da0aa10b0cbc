#include "bridge/execution_bridge.hpp"
#include "browser/cdp/cdp_session.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>

namespace execution_bridge {

InvocationContext make_context(mcp_tools::ToolName tool_name, const json &arguments,
                               const server_config::ServerConfig &config) {
    InvocationContext context;
    context.tool_name = tool_name;
    context.arguments = arguments.is_object() ? arguments : json::object();
    context.backend_mode = config.backend_mode;

    context.engine_family = config.default_browser;
    if (context.arguments.contains("browser") && !context.arguments["browser"].is_null()) {
        const json &browser = context.arguments["browser"];
        context.engine_family = browser.is_string() ? browser.get<std::string>() : browser.dump();
    }

    context.headless = config.default_headless;
    if (context.arguments.contains("headless") && context.arguments["headless"].is_boolean()) {
        context.headless = context.arguments["headless"].get<bool>();
    }
    return context;
}

ExecutionBridge::ExecutionBridge(direct_backend::SessionLauncher session_launcher,
                                 cli_backend::CliSettings cli_settings,
                                 cli_backend::CommandRunner command_runner)
    : session_launcher(std::move(session_launcher)),
      cli_settings(std::move(cli_settings)),
      command_runner(std::move(command_runner)) {}

json ExecutionBridge::run_backend(const InvocationContext &context,
                                  const tool_arguments::ToolArguments &arguments) const {
    switch (context.backend_mode) {
    case server_config::BackendMode::Direct:
        return direct_backend::execute(session_launcher, context.engine_family, context.headless, arguments);
    case server_config::BackendMode::Cli:
        return cli_backend::execute(cli_settings, command_runner, context.tool_name, context.engine_family,
                                    context.headless, arguments);
    }
    return tool_handlers::error_result("Unknown backend mode.");
}

json ExecutionBridge::execute(const InvocationContext &context) const {
    std::string name = mcp_tools::tool_name_string(context.tool_name);

    tool_arguments::ParseResult parsed = tool_arguments::parse(context.tool_name, context.arguments);
    if (!parsed.success) {
        return tool_handlers::error_result(parsed.error_detail);
    }

    debug_log::log("Executing " + name + " via " + server_config::backend_mode_name(context.backend_mode) +
                   " backend (browser=" + context.engine_family +
                   ", headless=" + std::string(context.headless ? "true" : "false") + ")");

    try {
        return run_backend(context, parsed.arguments);
    } catch (const std::exception &error) {
        debug_log::log(name + " raised: " + error.what());
        return tool_handlers::error_result(error.what());
    }
}

ExecutionBridge make_default_bridge(const server_config::ServerConfig &config) {
    cdp_engine_launch::ExecutableOverrides overrides = config.engine_executables;
    direct_backend::SessionLauncher launcher = [overrides](const browser_driver::LaunchOptions &options) {
        return cdp_session::launch_session(options, overrides);
    };

    cli_backend::CliSettings cli_settings;
    cli_settings.cli_path = config.cli_path;
    cli_settings.interpreter = config.cli_interpreter;
    cli_settings.timeout_seconds = config.cli_timeout_seconds;

    return ExecutionBridge(launcher, cli_settings, platform::run_process);
}

} // namespace execution_bridge
