#ifndef PAGEMCP_PLATFORM_ABI_HPP
#define PAGEMCP_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The process runs detached (not waited on immediately); stdout/stderr are inherited
// except that stdout is redirected to stderr so a child can never write onto the protocol stream.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Result of running a child process to completion.
struct ProcessResult {
    bool started = false;     // false if the process could not be spawned
    bool timed_out = false;   // true if it was killed after timeout_milliseconds
    int exit_code = -1;       // exit status, or 128 + signal number
    std::string standard_output;
    std::string standard_error;
    std::string error_message;
};

// Run argv[0] (searched on PATH when it has no slash) with argv[1..] as arguments,
// capturing stdout and stderr. No shell is involved. stdin is /dev/null.
ProcessResult run_process(const std::vector<std::string> &argv, int timeout_milliseconds);

// Read the entire contents of a file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Write contents to a file (binary, truncating). Returns false and fills error_message on failure.
bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message);

// Wait (poll) until a file exists and is non-empty, up to timeout_milliseconds.
// Returns true if the file appeared, false if timed out.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Terminate and reap a child: SIGTERM, wait up to grace_milliseconds, then SIGKILL.
void terminate_and_reap(int process_id, int grace_milliseconds);

// Directory holding the running executable, or empty if unknown.
std::string current_executable_directory();

} // namespace platform

#endif // PAGEMCP_PLATFORM_ABI_HPP
