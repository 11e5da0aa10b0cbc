// pagemcp_bridge: run one tool invocation through the execution bridge and print the result.
//
//   pagemcp_bridge --tool <name> --params '<json object>' [--mode direct|cli] [--cli-path P]
//
// The result is printed with an indent of 2. Exit code 0 when the tool succeeded, 1 when
// it reported an error, 2 on a usage error.

#include <iostream>
#include <stdexcept>
#include <string>

#include "bridge/execution_bridge.hpp"
#include "config/server_config.hpp"
#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::ordered_json;

static void print_usage() {
    std::cerr << "usage: pagemcp_bridge --tool <name> --params '<json>' [--mode direct|cli] [--cli-path P]\n";
}

int main(int argc, char **argv) {
    std::string tool_text;
    std::string params_text;
    std::string mode_text;
    std::string cli_path;

    for (int index = 1; index < argc; ++index) {
        std::string token = argv[index];
        if (index + 1 >= argc) {
            std::cerr << "pagemcp_bridge: " << token << " needs a value\n";
            print_usage();
            return 2;
        }
        std::string value = argv[++index];
        if (token == "--tool") {
            tool_text = value;
        } else if (token == "--params") {
            params_text = value;
        } else if (token == "--mode") {
            mode_text = value;
        } else if (token == "--cli-path") {
            cli_path = value;
        } else {
            std::cerr << "pagemcp_bridge: unexpected argument: " << token << "\n";
            print_usage();
            return 2;
        }
    }
    if (tool_text.empty() || params_text.empty()) {
        print_usage();
        return 2;
    }

    json params;
    try {
        params = json::parse(params_text);
    } catch (const json::parse_error &error) {
        std::cerr << "pagemcp_bridge: --params is not valid JSON: " << error.what() << "\n";
        return 2;
    }

    server_config::ServerConfig config = server_config::load_from_environment();
    if (!mode_text.empty() && !server_config::parse_backend_mode(mode_text, config.backend_mode)) {
        std::cerr << "pagemcp_bridge: --mode must be direct or cli\n";
        return 2;
    }
    if (!cli_path.empty()) {
        config.cli_path = cli_path;
    }

    json result;
    std::optional<mcp_tools::ToolName> tool_name = mcp_tools::parse_tool_name(tool_text);
    if (!tool_name) {
        result = tool_handlers::error_result("Unknown tool: " + tool_text);
    } else {
        execution_bridge::ExecutionBridge bridge = execution_bridge::make_default_bridge(config);
        result = bridge.execute(execution_bridge::make_context(*tool_name, params, config));
    }

    std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return result.value("status", std::string()) == "error" ? 1 : 0;
}
