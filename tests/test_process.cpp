// Tests for platform::run_process with small standard utilities.

#include "platform/platform_abi.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace test_process {

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static bool test_captures_standard_output() {
    platform::ProcessResult result = platform::run_process({"echo", "hello world"}, 5000);
    return expect(result.started && !result.timed_out && result.exit_code == 0 &&
                      result.standard_output == "hello world\n",
                  "stdout of a finished process is captured");
}

static bool test_arguments_are_not_interpreted_by_a_shell() {
    platform::ProcessResult result = platform::run_process({"echo", "$(whoami); ls"}, 5000);
    return expect(result.exit_code == 0 && result.standard_output == "$(whoami); ls\n",
                  "Arguments reach the program verbatim");
}

static bool test_captures_standard_error_and_exit_code() {
    platform::ProcessResult result = platform::run_process({"sh", "-c", "echo oops >&2; exit 3"}, 5000);
    return expect(result.started && result.exit_code == 3 && result.standard_error == "oops\n" &&
                      result.standard_output.empty(),
                  "stderr and the exit code are reported separately");
}

static bool test_timeout_kills_process() {
    auto start_time = std::chrono::steady_clock::now();
    platform::ProcessResult result = platform::run_process({"sleep", "10"}, 300);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    return expect(result.started && result.timed_out && elapsed < 5000,
                  "A process running past the timeout is killed");
}

static bool test_missing_program() {
    platform::ProcessResult result = platform::run_process({"/nonexistent/pagemcp_driver"}, 1000);
    platform::ProcessResult empty = platform::run_process({}, 1000);
    return expect(!result.started && !result.error_message.empty() && !empty.started,
                  "A program that cannot be started is reported, not run");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_captures_standard_output();
    all_passed &= test_arguments_are_not_interpreted_by_a_shell();
    all_passed &= test_captures_standard_error_and_exit_code();
    all_passed &= test_timeout_kills_process();
    all_passed &= test_missing_program();
    return all_passed;
}

} // namespace test_process
