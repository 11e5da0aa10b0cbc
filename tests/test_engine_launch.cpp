// Tests for the engine launch helpers: command-line building, executable lookup and
// DevToolsActivePort parsing. No browser process is started.

#include "browser/cdp/cdp_engine_launch.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace test_engine_launch {

static bool check_argument_present(const std::vector<std::string> &arguments,
                                   const std::string &expected_prefix,
                                   const std::string &test_description) {
    bool found = false;
    for (const auto &argument : arguments) {
        if (argument.find(expected_prefix) == 0) {
            found = true;
            break;
        }
    }
    if (!found) {
        std::cout << "  FAIL: " << test_description << " (expected prefix '"
                  << expected_prefix << "' not found in arguments)" << std::endl;
    } else {
        std::cout << "  OK: " << test_description << std::endl;
    }
    return found;
}

static bool test_command_line_has_remote_debugging_port() {
    auto command_line = cdp_engine_launch::build_engine_command_line("/usr/bin/chromium", "/tmp/test_profile", true);
    return check_argument_present(command_line.arguments,
                                  "--remote-debugging-port=0",
                                  "Command line asks for an OS-assigned debugging port");
}

static bool test_command_line_has_user_data_directory() {
    std::string test_directory = "/tmp/test_profile_xyz";
    auto command_line = cdp_engine_launch::build_engine_command_line("/usr/bin/chromium", test_directory, true);
    return check_argument_present(command_line.arguments,
                                  "--user-data-dir=" + test_directory,
                                  "Command line contains --user-data-dir with correct path");
}

static bool test_headless_flag_follows_option() {
    auto headless = cdp_engine_launch::build_engine_command_line("/usr/bin/chromium", "/tmp/p", true);
    auto headed = cdp_engine_launch::build_engine_command_line("/usr/bin/chromium", "/tmp/p", false);

    bool headless_has_flag = std::find(headless.arguments.begin(), headless.arguments.end(),
                                       "--headless=new") != headless.arguments.end();
    bool headed_has_flag = std::any_of(headed.arguments.begin(), headed.arguments.end(),
                                       [](const std::string &argument) {
                                           return argument.find("--headless") == 0;
                                       });

    if (headless_has_flag && !headed_has_flag) {
        std::cout << "  OK: --headless=new only when headless" << std::endl;
        return true;
    }
    std::cout << "  FAIL: headless flag placement (headless=" << headless_has_flag
              << ", headed=" << headed_has_flag << ")" << std::endl;
    return false;
}

static bool test_command_line_opens_blank_page() {
    auto command_line = cdp_engine_launch::build_engine_command_line("/usr/bin/chromium", "/tmp/p", true);
    bool success = command_line.executable_path == "/usr/bin/chromium" && !command_line.arguments.empty() &&
                   command_line.arguments.back() == "about:blank";
    if (success) {
        std::cout << "  OK: Command line ends with about:blank" << std::endl;
    } else {
        std::cout << "  FAIL: Command line does not end with about:blank" << std::endl;
    }
    return success;
}

static bool test_chromium_executable_found() {
    std::string executable = cdp_engine_launch::find_engine_executable(browser_driver::EngineFamily::Chromium);
    if (!executable.empty()) {
        std::cout << "  OK: Chromium executable found at: " << executable << std::endl;
    } else {
        std::cout << "  WARN: Chromium executable not found (not installed?). "
                  << "This test is informational only." << std::endl;
    }
    return true;
}

static bool test_firefox_requires_override() {
    std::string executable = cdp_engine_launch::find_engine_executable(browser_driver::EngineFamily::Firefox);
    if (!executable.empty()) {
        std::cout << "  FAIL: Firefox resolved without an override: " << executable << std::endl;
        return false;
    }

    browser_driver::LaunchOptions options;
    options.family = browser_driver::EngineFamily::Firefox;
    cdp_engine_launch::EngineLaunchResult launch = cdp_engine_launch::launch_engine(options);
    bool success = !launch.success && launch.process_id == -1 &&
                   launch.error_message.find("PAGEMCP_FIREFOX_EXECUTABLE") != std::string::npos;
    if (success) {
        std::cout << "  OK: Firefox launch without override fails with: " << launch.error_message << std::endl;
    } else {
        std::cout << "  FAIL: unexpected Firefox launch outcome: " << launch.error_message << std::endl;
    }
    return success;
}

static bool test_missing_override_is_not_found() {
    cdp_engine_launch::ExecutableOverrides overrides;
    overrides[browser_driver::EngineFamily::Webkit] = "/nonexistent/pagemcp/webkit";
    std::string executable = cdp_engine_launch::find_engine_executable(browser_driver::EngineFamily::Webkit,
                                                                       overrides);
    if (executable.empty()) {
        std::cout << "  OK: Override pointing at a missing file is not used" << std::endl;
        return true;
    }
    std::cout << "  FAIL: Missing override resolved to " << executable << std::endl;
    return false;
}

static bool test_parse_devtools_active_port() {
    std::string temp_file = "/tmp/pagemcp_test_devtools_port";
    {
        std::ofstream file(temp_file);
        file << "9333\n";
        file << "devtools/browser/abc-123-def\n";
    }

    std::string browser_path;
    int parsed_port = cdp_engine_launch::parse_devtools_active_port(temp_file, browser_path);
    bool success = (parsed_port == 9333) && browser_path == "/devtools/browser/abc-123-def";

    if (success) {
        std::cout << "  OK: DevToolsActivePort parsed correctly (port=" << parsed_port
                  << ", path=" << browser_path << ")" << std::endl;
    } else {
        std::cout << "  FAIL: DevToolsActivePort parse returned " << parsed_port
                  << " path '" << browser_path << "'" << std::endl;
    }

    std::remove(temp_file.c_str());
    return success;
}

static bool test_parse_devtools_active_port_rejects_garbage() {
    std::string temp_file = "/tmp/pagemcp_test_devtools_port_bad";
    {
        std::ofstream file(temp_file);
        file << "not-a-port\n";
    }

    std::string browser_path;
    int parsed_port = cdp_engine_launch::parse_devtools_active_port(temp_file, browser_path);
    int missing_port = cdp_engine_launch::parse_devtools_active_port("/tmp/pagemcp_no_such_file", browser_path);
    std::remove(temp_file.c_str());

    if (parsed_port == -1 && missing_port == -1) {
        std::cout << "  OK: Bad or missing DevToolsActivePort yields -1" << std::endl;
        return true;
    }
    std::cout << "  FAIL: expected -1, got " << parsed_port << " and " << missing_port << std::endl;
    return false;
}

static bool test_parse_devtools_active_port_collapses_slashes() {
    std::string temp_file = "/tmp/pagemcp_test_devtools_port_slashes";
    {
        std::ofstream file(temp_file);
        file << "9444\r\n";
        file << "//devtools/browser/xyz\r\n";
    }

    std::string browser_path;
    int parsed_port = cdp_engine_launch::parse_devtools_active_port(temp_file, browser_path);
    std::remove(temp_file.c_str());

    std::string url = cdp_engine_launch::build_websocket_url(parsed_port, browser_path);
    if (url == "ws://127.0.0.1:9444/devtools/browser/xyz") {
        std::cout << "  OK: Leading slashes and CR normalized: " << url << std::endl;
        return true;
    }
    std::cout << "  FAIL: WebSocket URL was: " << url << std::endl;
    return false;
}

static bool test_build_websocket_url() {
    std::string url = cdp_engine_launch::build_websocket_url(9333, "/devtools/browser/abc-123");
    std::string fallback = cdp_engine_launch::build_websocket_url(9333, "");
    bool success = url == "ws://127.0.0.1:9333/devtools/browser/abc-123" &&
                   fallback == "ws://127.0.0.1:9333/devtools/browser";

    if (success) {
        std::cout << "  OK: WebSocket URL built correctly: " << url << std::endl;
    } else {
        std::cout << "  FAIL: WebSocket URLs were: " << url << " and " << fallback << std::endl;
    }
    return success;
}

static bool test_profile_directories_are_distinct() {
    std::string first = cdp_engine_launch::create_profile_directory();
    std::string second = cdp_engine_launch::create_profile_directory();
    bool success = !first.empty() && !second.empty() && first != second &&
                   std::filesystem::is_directory(first) && std::filesystem::is_directory(second);

    std::error_code ignored;
    std::filesystem::remove_all(first, ignored);
    std::filesystem::remove_all(second, ignored);

    if (success) {
        std::cout << "  OK: Each launch gets its own profile directory" << std::endl;
    } else {
        std::cout << "  FAIL: profile directories '" << first << "' and '" << second << "'" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_command_line_has_remote_debugging_port();
    all_passed &= test_command_line_has_user_data_directory();
    all_passed &= test_headless_flag_follows_option();
    all_passed &= test_command_line_opens_blank_page();
    all_passed &= test_chromium_executable_found();
    all_passed &= test_firefox_requires_override();
    all_passed &= test_missing_override_is_not_found();
    all_passed &= test_parse_devtools_active_port();
    all_passed &= test_parse_devtools_active_port_rejects_garbage();
    all_passed &= test_parse_devtools_active_port_collapses_slashes();
    all_passed &= test_build_websocket_url();
    all_passed &= test_profile_directories_are_distinct();
    return all_passed;
}

} // namespace test_engine_launch
