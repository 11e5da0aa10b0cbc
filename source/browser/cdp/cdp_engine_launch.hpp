#ifndef PAGEMCP_CDP_ENGINE_LAUNCH_HPP
#define PAGEMCP_CDP_ENGINE_LAUNCH_HPP

// Browser engine launch and port discovery via the DevToolsActivePort file.
// Every launch gets its own throwaway profile directory and an OS-assigned debug port.

#include <map>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_engine_launch {

// Result of launching an engine and discovering the debug port.
struct EngineLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory;
    std::string error_message;
};

// Executable overrides per family (from configuration). Missing entries use built-in search.
using ExecutableOverrides = std::map<browser_driver::EngineFamily, std::string>;

// Command line for launching an engine.
struct EngineCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// Find the executable for a family: override first, then the well-known Chromium locations.
// Firefox and WebKit have no built-in DevTools-capable candidates. Returns empty if none found.
std::string find_engine_executable(browser_driver::EngineFamily family,
                                   const ExecutableOverrides &overrides = {});

// Build the command-line arguments for launching an engine with remote debugging.
EngineCommandLine build_engine_command_line(const std::string &executable_path,
                                            const std::string &user_data_directory,
                                            bool headless);

// Parse the DevToolsActivePort file: port on the first line, browser path on the second.
// Returns the port number, or -1 on failure. browser_path receives the normalized path.
int parse_devtools_active_port(const std::string &file_path, std::string &browser_path);

// Build the WebSocket debugger URL from the port and browser path.
std::string build_websocket_url(int port, const std::string &browser_path);

// Create a fresh profile directory under the system temp directory.
std::string create_profile_directory();

// Launch one engine instance. On failure no process is left running.
EngineLaunchResult launch_engine(const browser_driver::LaunchOptions &options,
                                 const ExecutableOverrides &overrides = {});

} // namespace cdp_engine_launch

#endif // PAGEMCP_CDP_ENGINE_LAUNCH_HPP
