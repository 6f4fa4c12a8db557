#include "process.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"
#include "tether/log.hpp"

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

using namespace tether::literals;

namespace tether::internal::process {

    namespace detail {

        static constexpr auto reap_poll_interval = std::chrono::milliseconds{5};
        static constexpr auto eof_exit_grace = std::chrono::milliseconds{100};

        static int exit_code_from_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static void close_pair(int (&fds)[2]) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        // KEY=VALUE strings for execvpe, parent environment first, overrides replacing entries
        static std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
            std::vector<std::string> entries{};
            for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
                std::string_view text{*entry};
                auto eq = text.find('=');
                auto key = text.substr(0, eq);
                if (overrides.contains(std::string{key})) {
                    continue;
                }
                entries.emplace_back(text);
            }
            for (const auto& [key, value] : overrides) {
                entries.push_back("{}={}"_format(key, value));
            }
            return entries;
        }

        static std::vector<char*> to_pointers(std::vector<std::string>& values) {
            std::vector<char*> ptrs{};
            ptrs.reserve(values.size() + 1);
            for (auto& value : values) {
                ptrs.push_back(value.data());
            }
            ptrs.push_back(nullptr);
            return ptrs;
        }

        // only async-signal-safe calls between fork and exec
        [[noreturn]] static void exec_child(
                int in_fd,
                int out_fd,
                int err_fd,
                int status_fd,
                const char* working_dir,
                char* const* argv,
                char* const* envp) {
            ::dup2(in_fd, STDIN_FILENO);
            ::dup2(out_fd, STDOUT_FILENO);
            if (err_fd >= 0) {
                ::dup2(err_fd, STDERR_FILENO);
            }
            ::signal(SIGPIPE, SIG_DFL);

            if (working_dir != nullptr && ::chdir(working_dir) != 0) {
                int err = errno;
                (void)::write(status_fd, &err, sizeof(err));
                _exit(127);
            }

            ::execvpe(argv[0], argv, envp);

            int err = errno;
            (void)::write(status_fd, &err, sizeof(err));
            _exit(127);
        }

    }  // namespace detail

    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = -1;
    }

    void close_fds(child& c) {
        close_fd(c.stdin_fd);
        close_fd(c.stdout_fd);
        close_fd(c.stderr_fd);
    }

    child spawn(const spawn_options& opts) {
        if (opts.argv.empty() || opts.argv.front().empty()) {
            throw launch_error{"no server command configured"};
        }

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};

        if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
            (opts.capture_stderr && ::pipe2(err_pipe, O_CLOEXEC) != 0) || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
            int err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw launch_error{"pipe() failed: {}"_format(std::strerror(err))};
        }

        // everything exec needs is built before fork
        auto args = opts.argv;
        auto argv = detail::to_pointers(args);
        auto env_entries = detail::build_environment(opts.env);
        auto envp = detail::to_pointers(env_entries);
        std::string working_dir = opts.working_dir ? opts.working_dir->string() : std::string{};

        auto pid = ::fork();
        if (pid < 0) {
            int err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(status_pipe);
            throw launch_error{"fork() failed: {}"_format(std::strerror(err))};
        }

        if (pid == 0) {
            detail::exec_child(
                    in_pipe[0],
                    out_pipe[1],
                    err_pipe[1],
                    status_pipe[1],
                    working_dir.empty() ? nullptr : working_dir.c_str(),
                    argv.data(),
                    envp.data());
        }

        // parent
        close_fd(in_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(status_pipe[1]);

        // the status pipe closes on a successful exec; an errno arrives otherwise
        int child_errno = 0;
        ssize_t n = -1;
        do {
            n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            ::waitpid(pid, nullptr, 0);
            close_fd(in_pipe[1]);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            if (!working_dir.empty() && child_errno == ENOENT && !std::filesystem::is_directory(working_dir)) {
                throw launch_error{"working directory '{}' does not exist"_format(working_dir)};
            }
            throw launch_error{"failed to launch '{}': {}"_format(opts.argv.front(), std::strerror(child_errno))};
        }

        log_debug{"spawned '", opts.argv.front(), "' pid=", pid};
        return child{.pid = pid, .stdin_fd = in_pipe[1], .stdout_fd = out_pipe[0], .stderr_fd = err_pipe[0]};
    }

    std::optional<int> wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            int status = 0;
            auto rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid) {
                return detail::exit_code_from_status(status);
            }
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                // already reaped elsewhere or not our child
                return -1;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(detail::reap_poll_interval);
        }
    }

    int terminate(pid_t pid, std::chrono::milliseconds grace) {
        if (pid <= 0) {
            return -1;
        }

        // a peer whose stdin was just closed usually exits on its own
        if (auto code = wait_for_exit(pid, std::min(grace, detail::eof_exit_grace))) {
            return *code;
        }

        ::kill(pid, SIGTERM);
        if (auto code = wait_for_exit(pid, grace)) {
            return *code;
        }

        log_warn{"pid ", pid, " ignored SIGTERM for ", grace.count(), "ms, sending SIGKILL"};
        ::kill(pid, SIGKILL);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return -1;
            }
        }
        return detail::exit_code_from_status(status);
    }

    std::string describe_exit(int exit_code) {
        if (exit_code < 0) {
            return "unknown exit status";
        }
        if (exit_code > 128) {
            return "killed by signal {}"_format(exit_code - 128);
        }
        return "exit code {}"_format(exit_code);
    }

}  // namespace tether::internal::process
