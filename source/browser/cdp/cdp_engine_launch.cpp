#include "browser/cdp/cdp_engine_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace cdp_engine_launch {

// Well-known Chrome/Chromium executable paths on Linux.
static const std::vector<std::string> LINUX_CHROMIUM_PATHS = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

static const int ENGINE_STARTUP_TIMEOUT_MILLISECONDS = 15000;

static std::string search_path(const std::string &name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

static std::string resolve_candidate(const std::string &candidate) {
    if (candidate.find('/') != std::string::npos) {
        return access(candidate.c_str(), X_OK) == 0 ? candidate : "";
    }
    return search_path(candidate);
}

std::string find_engine_executable(browser_driver::EngineFamily family,
                                   const ExecutableOverrides &overrides) {
    auto override_iterator = overrides.find(family);
    if (override_iterator != overrides.end() && !override_iterator->second.empty()) {
        return resolve_candidate(override_iterator->second);
    }

    switch (family) {
    case browser_driver::EngineFamily::Chromium:
        for (const auto &candidate : LINUX_CHROMIUM_PATHS) {
            std::string resolved = resolve_candidate(candidate);
            if (!resolved.empty()) {
                return resolved;
            }
        }
        return "";
    case browser_driver::EngineFamily::Firefox:
    case browser_driver::EngineFamily::Webkit:
        return "";
    }
    return "";
}

EngineCommandLine build_engine_command_line(const std::string &executable_path,
                                            const std::string &user_data_directory,
                                            bool headless) {
    EngineCommandLine command_line;
    command_line.executable_path = executable_path;
    command_line.arguments = {
        "--remote-debugging-port=0",
        "--remote-allow-origins=*",
        "--user-data-dir=" + user_data_directory,
    };
    if (headless) {
        command_line.arguments.push_back("--headless=new");
        command_line.arguments.push_back("--hide-scrollbars");
        command_line.arguments.push_back("--mute-audio");
    }
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-client-side-phishing-detection",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-hang-monitor",
        "--disable-popup-blocking",
        "--disable-prompt-on-repost",
        "--disable-sync",
        "--disable-translate",
        "--metrics-recording-only",
        "--safebrowsing-disable-auto-update",
        "about:blank",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

int parse_devtools_active_port(const std::string &file_path, std::string &browser_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return -1;
    }

    std::istringstream line_stream(contents);
    std::string first_line;
    std::string second_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return -1;
    }
    std::getline(line_stream, second_line);

    int port = -1;
    try {
        port = std::stoi(first_line);
    } catch (const std::exception &) {
        return -1;
    }
    if (port <= 0 || port > 65535) {
        return -1;
    }

    // Normalize to exactly one leading slash (engines write it with or without).
    browser_path = second_line;
    while (!browser_path.empty() && (browser_path.back() == '\r' || browser_path.back() == ' ')) {
        browser_path.pop_back();
    }
    while (!browser_path.empty() && browser_path[0] == '/') {
        browser_path.erase(0, 1);
    }
    if (!browser_path.empty()) {
        browser_path = "/" + browser_path;
    }
    return port;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    std::string path = browser_path.empty() ? "/devtools/browser" : browser_path;
    if (path[0] != '/') {
        path = "/" + path;
    }
    return "ws://127.0.0.1:" + std::to_string(port) + path;
}

std::string create_profile_directory() {
    static std::atomic<int> launch_counter{0};
    std::error_code temp_error;
    std::filesystem::path base = std::filesystem::temp_directory_path(temp_error);
    if (temp_error) {
        base = "/tmp";
    }
    std::filesystem::path profile = base / ("pagemcp_profile_" + std::to_string(getpid()) + "_" +
                                            std::to_string(launch_counter++));
    std::error_code remove_error;
    std::filesystem::remove_all(profile, remove_error);
    std::error_code create_error;
    std::filesystem::create_directories(profile, create_error);
    if (create_error) {
        debug_log::log("create_profile_directory: " + create_error.message());
        return "";
    }
    return profile.string();
}

static void remove_profile_directory(const std::string &directory) {
    if (directory.empty()) {
        return;
    }
    std::error_code remove_error;
    std::filesystem::remove_all(directory, remove_error);
}

EngineLaunchResult launch_engine(const browser_driver::LaunchOptions &options,
                                 const ExecutableOverrides &overrides) {
    EngineLaunchResult result;
    std::string family_name = browser_driver::engine_family_name(options.family);

    debug_log::log("Engine launch starting, family=" + family_name +
                   " headless=" + std::string(options.headless ? "true" : "false"));

    std::string executable_path = find_engine_executable(options.family, overrides);
    if (executable_path.empty()) {
        if (options.family == browser_driver::EngineFamily::Chromium) {
            result.error_message = "Could not find a Chromium executable on this system. "
                                   "Install google-chrome or chromium, or set PAGEMCP_CHROMIUM_EXECUTABLE.";
        } else {
            std::string variable = family_name;
            for (auto &character : variable) {
                character = static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
            }
            result.error_message = "No executable found for browser engine '" + family_name +
                                   "'. Set PAGEMCP_" + variable +
                                   "_EXECUTABLE to a build of this engine that speaks the DevTools protocol.";
        }
        return result;
    }

    std::string profile_directory = create_profile_directory();
    if (profile_directory.empty()) {
        result.error_message = "Failed to create a profile directory for the browser engine.";
        return result;
    }
    result.user_data_directory = profile_directory;

    EngineCommandLine command_line = build_engine_command_line(executable_path, profile_directory,
                                                               options.headless);
    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path,
                                                                 command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn " + family_name + ": " + spawn_result.error_message;
        remove_profile_directory(profile_directory);
        return result;
    }
    result.process_id = spawn_result.process_id;

    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    if (!platform::wait_for_file(active_port_file, ENGINE_STARTUP_TIMEOUT_MILLISECONDS)) {
        debug_log::log("launch_engine: timed out waiting for DevToolsActivePort, killing pid=" +
                       std::to_string(result.process_id));
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        platform::terminate_and_reap(result.process_id, 2000);
        remove_profile_directory(profile_directory);
        result.process_id = -1;
        return result;
    }

    std::string browser_path;
    result.debug_port = parse_devtools_active_port(active_port_file, browser_path);
    if (result.debug_port <= 0) {
        debug_log::log("launch_engine: failed to parse DevToolsActivePort, killing pid=" +
                       std::to_string(result.process_id));
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        platform::terminate_and_reap(result.process_id, 2000);
        remove_profile_directory(profile_directory);
        result.process_id = -1;
        return result;
    }

    result.websocket_debugger_url = build_websocket_url(result.debug_port, browser_path);
    debug_log::log("Engine launched (pid=" + std::to_string(result.process_id) + ", port=" +
                   std::to_string(result.debug_port) + ", url=" + result.websocket_debugger_url + ")");

    result.success = true;
    return result;
}

} // namespace cdp_engine_launch
