// pagemcp: browser automation tool server.
// Entry point: stdio MCP server loop.
//
// Reads Content-Length framed JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr.

#include <iostream>
#include <stdexcept>
#include <string>

#include "bridge/execution_bridge.hpp"
#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_signal.hpp"

int main() {
    std::cerr << "[pagemcp] pagemcp browser tool server, build " << __DATE__ << " " << __TIME__ << std::endl;

    shutdown_signal::install_handlers();

    try {
        server_config::ServerConfig config = server_config::load_from_environment();
        execution_bridge::ExecutionBridge bridge = execution_bridge::make_default_bridge(config);

        mcp_stdio::log_message("Backend: " + server_config::backend_mode_name(config.backend_mode) +
                               ", default browser: " + config.default_browser +
                               ", headless: " + std::string(config.default_headless ? "true" : "false"));
        if (config.backend_mode == server_config::BackendMode::Cli) {
            mcp_stdio::log_message("CLI driver: " + config.cli_path);
        }
        debug_log::log(std::to_string(mcp_tools::get_registered_tools().size()) + " tools registered.");

        mcp_dispatch::Dispatcher dispatcher(
            [&bridge](const execution_bridge::InvocationContext &context) { return bridge.execute(context); },
            config);

        mcp_stdio::log_message("Server started. Waiting for MCP messages on stdin.");
        dispatcher.run(std::cin, std::cout);
    } catch (const std::exception &error) {
        mcp_stdio::log_message(std::string("Fatal error: ") + error.what());
        return 1;
    }

    mcp_stdio::log_message("Server shut down.");
    return 0;
}
