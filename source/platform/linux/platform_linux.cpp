#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

// Builds the argv array for posix_spawn: [arg0, arg1, ..., nullptr].
// The pointers refer into argv_strings, which must outlive the call.
static std::vector<char *> build_argv_pointers(std::vector<std::string> &argv_strings) {
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);
    return argv_pointers;
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers = build_argv_pointers(argv_strings);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, STDERR_FILENO, STDOUT_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.success = false;
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

ProcessResult run_process(const std::vector<std::string> &argv, int timeout_milliseconds) {
    ProcessResult result;

    if (argv.empty()) {
        result.error_message = "run_process called with an empty argument vector";
        return result;
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[0]);
    posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[0]);

    std::vector<std::string> argv_strings = argv;
    std::vector<char *> argv_pointers = build_argv_pointers(argv_strings);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, argv_strings[0].c_str(),
                                    &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    if (spawn_status != 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.error_message = "Failed to start " + argv[0] + ": " + std::string(strerror(spawn_status));
        return result;
    }
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    struct pollfd poll_descriptors[2];
    poll_descriptors[0].fd = stdout_pipe[0];
    poll_descriptors[0].events = POLLIN;
    poll_descriptors[1].fd = stderr_pipe[0];
    poll_descriptors[1].events = POLLIN;
    int open_descriptors = 2;
    char read_buffer[4096];

    while (open_descriptors > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            kill(child_pid, SIGKILL);
            break;
        }

        int ready = poll(poll_descriptors, 2, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = "poll failed: " + std::string(strerror(errno));
            kill(child_pid, SIGKILL);
            break;
        }

        for (int index = 0; index < 2; ++index) {
            if (poll_descriptors[index].fd < 0 || poll_descriptors[index].revents == 0) {
                continue;
            }
            ssize_t bytes_read = read(poll_descriptors[index].fd, read_buffer, sizeof(read_buffer));
            if (bytes_read > 0) {
                std::string &target = (index == 0) ? result.standard_output : result.standard_error;
                target.append(read_buffer, static_cast<size_t>(bytes_read));
            } else if (bytes_read == 0 || errno != EINTR) {
                close(poll_descriptors[index].fd);
                poll_descriptors[index].fd = -1;
                open_descriptors--;
            }
        }
    }

    for (auto &descriptor : poll_descriptors) {
        if (descriptor.fd >= 0) {
            close(descriptor.fd);
        }
    }

    int status = 0;
    while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = decode_wait_status(status);
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        error_message = "Cannot open " + file_path + " for writing: " + std::string(strerror(errno));
        return false;
    }
    file_stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!file_stream) {
        error_message = "Failed to write " + file_path;
        return false;
    }
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    int elapsed_milliseconds = 0;
    int poll_interval_milliseconds = 100;

    while (true) {
        std::error_code exists_error;
        if (std::filesystem::exists(file_path, exists_error)) {
            // The engine may create the file before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }

        if (elapsed_milliseconds >= timeout_milliseconds) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
        elapsed_milliseconds += poll_interval_milliseconds;
    }
}

void terminate_and_reap(int process_id, int grace_milliseconds) {
    if (process_id <= 0) {
        return;
    }
    pid_t child_pid = static_cast<pid_t>(process_id);
    kill(child_pid, SIGTERM);

    int status = 0;
    int elapsed_milliseconds = 0;
    while (elapsed_milliseconds < grace_milliseconds) {
        pid_t waited = waitpid(child_pid, &status, WNOHANG);
        if (waited == child_pid || (waited < 0 && errno == ECHILD)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        elapsed_milliseconds += 50;
    }

    kill(child_pid, SIGKILL);
    while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {
    }
}

std::string current_executable_directory() {
    std::error_code link_error;
    std::filesystem::path executable = std::filesystem::read_symlink("/proc/self/exe", link_error);
    if (link_error) {
        return "";
    }
    return executable.parent_path().string();
}

} // namespace platform
