#include "config/server_config.hpp"
#include "bridge/cli_backend.hpp"
#include "platform/platform_abi.hpp"
#include "utils/string_utils.hpp"
#include "mcp/mcp_stdio.hpp"

#include <cstdlib>

namespace server_config {

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return string_utils::trim(value);
}

bool parse_backend_mode(const std::string &text, BackendMode &mode) {
    std::string normalized = string_utils::to_lower(string_utils::trim(text));
    if (normalized == "direct") {
        mode = BackendMode::Direct;
        return true;
    }
    if (normalized == "cli") {
        mode = BackendMode::Cli;
        return true;
    }
    return false;
}

std::string backend_mode_name(BackendMode mode) {
    switch (mode) {
    case BackendMode::Direct:
        return "direct";
    case BackendMode::Cli:
        return "cli";
    }
    return "unknown";
}

std::string default_cli_path() {
    std::string directory = platform::current_executable_directory();
    if (directory.empty()) {
        return "pagemcp_driver";
    }
    return directory + "/pagemcp_driver";
}

ServerConfig load_from_environment() {
    ServerConfig config;
    config.cli_path = default_cli_path();

    std::string mode_text = read_environment("PAGEMCP_MODE");
    if (!mode_text.empty() && !parse_backend_mode(mode_text, config.backend_mode)) {
        mcp_stdio::log_message("Ignoring PAGEMCP_MODE='" + mode_text + "' (expected direct or cli).");
    }

    std::string browser_text = read_environment("PAGEMCP_BROWSER");
    if (!browser_text.empty()) {
        if (browser_driver::parse_engine_family(browser_text)) {
            config.default_browser = browser_text;
        } else {
            mcp_stdio::log_message("Ignoring PAGEMCP_BROWSER='" + browser_text +
                                   "' (expected chromium, firefox or webkit).");
        }
    }

    std::string headless_text = read_environment("PAGEMCP_HEADLESS");
    if (!headless_text.empty()) {
        config.default_headless = string_utils::parse_bool(headless_text, config.default_headless);
    }

    std::string cli_path_text = read_environment("PAGEMCP_CLI_PATH");
    if (!cli_path_text.empty()) {
        config.cli_path = cli_path_text;
    }
    config.cli_interpreter = read_environment("PAGEMCP_CLI_INTERPRETER");

    std::string timeout_text = read_environment("PAGEMCP_CLI_TIMEOUT_SECONDS");
    if (!timeout_text.empty()) {
        try {
            int timeout_seconds = std::stoi(timeout_text);
            if (timeout_seconds <= 0) {
                mcp_stdio::log_message("Ignoring non-positive PAGEMCP_CLI_TIMEOUT_SECONDS.");
            } else if (timeout_seconds > cli_backend::MAX_TIMEOUT_SECONDS) {
                mcp_stdio::log_message("Ignoring PAGEMCP_CLI_TIMEOUT_SECONDS='" + timeout_text + "' (at most " +
                                       std::to_string(cli_backend::MAX_TIMEOUT_SECONDS) + ").");
            } else {
                config.cli_timeout_seconds = timeout_seconds;
            }
        } catch (const std::exception &) {
            mcp_stdio::log_message("Ignoring PAGEMCP_CLI_TIMEOUT_SECONDS='" + timeout_text + "'.");
        }
    }

    const std::pair<browser_driver::EngineFamily, const char *> executable_variables[] = {
        {browser_driver::EngineFamily::Chromium, "PAGEMCP_CHROMIUM_EXECUTABLE"},
        {browser_driver::EngineFamily::Firefox, "PAGEMCP_FIREFOX_EXECUTABLE"},
        {browser_driver::EngineFamily::Webkit, "PAGEMCP_WEBKIT_EXECUTABLE"},
    };
    for (const auto &entry : executable_variables) {
        std::string path = read_environment(entry.second);
        if (!path.empty()) {
            config.engine_executables[entry.first] = path;
        }
    }

    return config;
}

} // namespace server_config
