#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether::internal::process {

    struct spawn_options {
        std::vector<std::string> argv{};
        // merged over the parent's environment
        std::map<std::string, std::string> env{};
        std::optional<std::filesystem::path> working_dir{};
        bool capture_stderr{false};
    };

    struct child {
        pid_t pid{-1};
        int stdin_fd{-1};
        int stdout_fd{-1};
        // -1 unless stderr is captured
        int stderr_fd{-1};
    };

    // throws launch_error when the executable cannot be found or spawned
    child spawn(const spawn_options& opts);

    void close_fd(int& fd);
    void close_fds(child& c);

    // exit code (128 + signal for signalled children) once reaped, nullopt if still running at the deadline
    std::optional<int> wait_for_exit(pid_t pid, std::chrono::milliseconds timeout);

    // SIGTERM, then SIGKILL once `grace` elapses; returns the exit code
    int terminate(pid_t pid, std::chrono::milliseconds grace);

    std::string describe_exit(int exit_code);

}  // namespace tether::internal::process
