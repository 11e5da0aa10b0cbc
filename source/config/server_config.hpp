#ifndef PAGEMCP_SERVER_CONFIG_HPP
#define PAGEMCP_SERVER_CONFIG_HPP

// Server configuration, read from PAGEMCP_* environment variables once at startup.

#include <map>
#include <string>

#include "browser/browser_driver_abi.hpp"

namespace server_config {

// Which execution backend tools/call uses.
enum class BackendMode {
    Direct,
    Cli
};

// "direct" | "cli"; returns false for anything else.
bool parse_backend_mode(const std::string &text, BackendMode &mode);
std::string backend_mode_name(BackendMode mode);

struct ServerConfig {
    BackendMode backend_mode = BackendMode::Direct;
    std::string default_browser = "chromium";
    bool default_headless = true;

    // CLI-bridge backend.
    std::string cli_path;
    std::string cli_interpreter;
    int cli_timeout_seconds = 120;

    // Engine executable overrides, keyed by family. Empty map means built-in search only.
    std::map<browser_driver::EngineFamily, std::string> engine_executables;
};

// Defaults, then PAGEMCP_* overrides. Invalid values are logged and ignored.
ServerConfig load_from_environment();

// Default driver path: pagemcp_driver next to the running executable.
std::string default_cli_path();

} // namespace server_config

#endif // PAGEMCP_SERVER_CONFIG_HPP
