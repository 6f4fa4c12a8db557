#include "tether/transport.hpp"

#include "tether/format.hpp"
#include "tether/log.hpp"

#include "internal/process.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

using namespace tether::literals;

namespace tether {

    namespace detail {
        static constexpr size_t read_chunk_bytes = 4096U;
        static constexpr auto reap_poll_interval = std::chrono::milliseconds{5};

        static void close_pair(int (&fds)[2]) {
            internal::process::close_fd(fds[0]);
            internal::process::close_fd(fds[1]);
        }

        /*
         * Blocks SIGPIPE in the calling thread for the duration of a write. A SIGPIPE raised by
         * that write is consumed before the previous mask is restored, so a dead peer shows up
         * as EPIPE only and the process-wide disposition is left to the application.
         */
        class sigpipe_guard {
          public:
            sigpipe_guard() {
                sigemptyset(&pipe_set_);
                sigaddset(&pipe_set_, SIGPIPE);

                sigset_t pending{};
                sigemptyset(&pending);
                if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                    // someone else's SIGPIPE is already queued; leave it alone
                    return;
                }
                active_ = ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &previous_) == 0;
            }

            ~sigpipe_guard() {
                if (!active_) {
                    return;
                }
                int saved_errno = errno;
                timespec zero{.tv_sec = 0, .tv_nsec = 0};
                while (::sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {}
                ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
                errno = saved_errno;
            }

            sigpipe_guard(const sigpipe_guard&) = delete;
            sigpipe_guard& operator=(const sigpipe_guard&) = delete;

          private:
            sigset_t pipe_set_{};
            sigset_t previous_{};
            bool active_{false};
        };
    }  // namespace detail

    transport_session::transport_session(transport_options opts, transport_handlers handlers)
            : opts_{std::move(opts)},
              handlers_{std::move(handlers)},
              stdout_framer_{opts_.max_message_bytes},
              stderr_framer_{opts_.max_message_bytes} {}

    transport_session::~transport_session() {
        stop();
        if (reader_.joinable()) {
            reader_.join();
        }
        close_read_fds();
    }

    void transport_session::start() {
        auto expected = session_state::not_started;
        if (!state_.compare_exchange_strong(expected, session_state::running)) {
            throw launch_error{"session is {} and cannot be started again"_format(expected)};
        }

        if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0 || ::pipe2(write_wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
            int err = errno;
            detail::close_pair(wake_fds_);
            detail::close_pair(write_wake_fds_);
            state_.store(session_state::closed);
            std::lock_guard lock{stop_mutex_};
            stopped_ = true;
            throw launch_error{"pipe() failed: {}"_format(std::strerror(err))};
        }

        internal::process::child child{};
        try {
            child = internal::process::spawn(
                    internal::process::spawn_options{
                            .argv = opts_.argv,
                            .env = opts_.env,
                            .working_dir = opts_.working_dir,
                            .capture_stderr = opts_.capture_stderr});
        } catch (const launch_error&) {
            detail::close_pair(wake_fds_);
            detail::close_pair(write_wake_fds_);
            state_.store(session_state::closed);
            std::lock_guard lock{stop_mutex_};
            stopped_ = true;
            throw;
        }

        pid_ = child.pid;
        stdin_fd_ = child.stdin_fd;
        stdout_fd_ = child.stdout_fd;
        stderr_fd_ = child.stderr_fd;

        // only the parent's end; the child keeps a blocking stdin
        int flags = ::fcntl(stdin_fd_, F_GETFL);
        if (flags < 0 || ::fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
            int err = errno;
            internal::process::close_fd(stdin_fd_);
            record_exit(internal::process::terminate(pid_, opts_.stop_grace));
            close_read_fds();
            state_.store(session_state::closed);
            std::lock_guard lock{stop_mutex_};
            stopped_ = true;
            throw launch_error{"cannot make server stdin non-blocking: {}"_format(std::strerror(err))};
        }

        log_info{"started '", utils::join_with_separator(opts_.argv, " "), "' (pid ", pid_, ")"};

        reader_ = std::thread{[this] { read_loop(); }};
    }

    void transport_session::send(const message& msg, std::optional<std::chrono::steady_clock::time_point> deadline) {
        auto line = encode_message(msg);
        line.push_back('\n');

        std::lock_guard lock{write_mutex_};
        auto current = state_.load();
        if (current != session_state::running || stdin_fd_ < 0) {
            throw write_error{"cannot write to a session that is {}"_format(current)};
        }
        if (torn_frame_) {
            throw write_error{"an earlier write stopped mid-message, server stdin is unusable"};
        }

        detail::sigpipe_guard no_sigpipe{};
        size_t offset = 0;
        while (offset < line.size()) {
            auto n = ::write(stdin_fd_, line.data() + offset, line.size() - offset);
            if (n >= 0) {
                offset += static_cast<size_t>(n);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                throw write_error{"write to server stdin failed: {}"_format(std::strerror(errno))};
            }
            wait_writable(deadline, offset);
        }
        log_debug{"-> ", utils::truncate_for_display(line.substr(0, line.size() - 1U))};
    }

    // called with write_mutex_ held
    void transport_session::wait_writable(
            std::optional<std::chrono::steady_clock::time_point> deadline, size_t written) {
        for (;;) {
            if (stop_requested_.load()) {
                torn_frame_ = torn_frame_ || written > 0;
                throw write_error{"session is closing, write abandoned"};
            }

            int timeout_ms = -1;
            if (deadline) {
                auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0) {
                    torn_frame_ = torn_frame_ || written > 0;
                    throw write_error{
                            "server is not reading its input, write timed out after {} bytes"_format(written)};
                }
                timeout_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(left.count(), INT_MAX));
            }

            pollfd fds[2]{};
            fds[0] = {.fd = stdin_fd_, .events = POLLOUT, .revents = 0};
            fds[1] = {.fd = write_wake_fds_[0], .events = POLLIN, .revents = 0};

            int ret = ::poll(fds, 2, timeout_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw write_error{"poll() on server stdin failed: {}"_format(std::strerror(errno))};
            }
            // POLLERR and POLLHUP are left for the next write() to report as EPIPE
            if (fds[0].revents != 0 && fds[1].revents == 0) {
                return;
            }
        }
    }

    void transport_session::stop() {
        std::lock_guard stop_lock{stop_mutex_};
        if (stopped_) {
            return;
        }
        stopped_ = true;

        if (state_.load() == session_state::not_started) {
            state_.store(session_state::closed);
            return;
        }

        stop_requested_.store(true);
        auto expected = session_state::running;
        state_.compare_exchange_strong(expected, session_state::closing);

        // a writer waiting for room in the pipe gives up the lock once woken
        wake_writer();
        {
            std::lock_guard write_lock{write_mutex_};
            internal::process::close_fd(stdin_fd_);
        }

        {
            std::lock_guard reap_lock{reap_mutex_};
            if (!exit_code()) {
                auto code = internal::process::terminate(pid_, opts_.stop_grace);
                record_exit(code);
                log_info{"server pid ", pid_, " stopped: ", internal::process::describe_exit(code)};
            }
        }

        wake_reader();
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
            close_read_fds();
        }

        state_.store(session_state::closed);
    }

    std::optional<int> transport_session::exit_code() const {
        std::lock_guard lock{exit_mutex_};
        return exit_code_;
    }

    void transport_session::record_exit(int code) {
        std::lock_guard lock{exit_mutex_};
        if (!exit_code_ || *exit_code_ < 0) {
            exit_code_ = code;
        }
    }

    void transport_session::wake_reader() {
        if (wake_fds_[1] >= 0) {
            char byte = 1;
            (void)::write(wake_fds_[1], &byte, 1);
        }
    }

    // the byte is never drained, so every later poll by a writer returns at once
    void transport_session::wake_writer() {
        if (write_wake_fds_[1] >= 0) {
            char byte = 1;
            (void)::write(write_wake_fds_[1], &byte, 1);
        }
    }

    void transport_session::close_read_fds() {
        internal::process::close_fd(stdout_fd_);
        internal::process::close_fd(stderr_fd_);
        detail::close_pair(wake_fds_);
        detail::close_pair(write_wake_fds_);
    }

    void transport_session::report_parse_error(const parse_error& err) {
        if (!handlers_.on_parse_error) {
            log_warn{err.what()};
            return;
        }
        try {
            handlers_.on_parse_error(err);
        } catch (const std::exception& e) {
            log_error{"parse error handler threw: ", e.what()};
        }
    }

    void transport_session::dispatch_frames(std::vector<frame> frames) {
        for (auto& f : frames) {
            if (f.oversized) {
                report_parse_error(parse_error{
                        "message exceeds {} bytes, discarded"_format(opts_.max_message_bytes), std::move(f.text)});
                continue;
            }

            log_debug{"<- ", utils::truncate_for_display(f.text)};

            std::optional<message> decoded{};
            try {
                decoded = decode_message(f.text);
            } catch (const parse_error& e) {
                report_parse_error(e);
                continue;
            }

            if (!handlers_.on_message) {
                continue;
            }
            try {
                handlers_.on_message(std::move(*decoded));
            } catch (const std::exception& e) {
                log_error{"message handler threw: ", e.what()};
            }
        }
    }

    void transport_session::dispatch_stderr(std::vector<frame> frames) {
        for (auto& f : frames) {
            if (!handlers_.on_stderr_line) {
                log_info{"peer: ", f.text};
                continue;
            }
            try {
                handlers_.on_stderr_line(f.text);
            } catch (const std::exception& e) {
                log_error{"stderr handler threw: ", e.what()};
            }
        }
    }

    // whatever the peer already wrote to stderr is still logged after a stop
    void transport_session::drain_stderr() {
        char chunk[detail::read_chunk_bytes]{};
        for (;;) {
            pollfd pfd{.fd = stderr_fd_, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, 0) <= 0 || (pfd.revents & POLLIN) == 0) {
                return;
            }
            auto n = ::read(stderr_fd_, chunk, sizeof(chunk));
            if (n <= 0) {
                return;
            }
            dispatch_stderr(stderr_framer_.feed(std::string_view{chunk, static_cast<size_t>(n)}));
        }
    }

    void transport_session::finish_stream() {
        auto expected = session_state::running;
        state_.compare_exchange_strong(expected, session_state::closing);

        // a requested stop is reported by whoever called stop()
        if (stop_requested_.load() || end_of_stream_signalled_.exchange(true)) {
            return;
        }
        if (handlers_.on_end_of_stream) {
            try {
                handlers_.on_end_of_stream();
            } catch (const std::exception& e) {
                log_error{"end-of-stream handler threw: ", e.what()};
            }
        }
    }

    void transport_session::read_loop() {
        char chunk[detail::read_chunk_bytes]{};
        bool stderr_open = stderr_fd_ >= 0;
        bool reached_eof = false;

        for (;;) {
            pollfd fds[3]{};
            fds[0] = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = wake_fds_[0], .events = POLLIN, .revents = 0};
            fds[2] = {.fd = stderr_open ? stderr_fd_ : -1, .events = POLLIN, .revents = 0};

            int ret = ::poll(fds, 3, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                log_error{"poll() on server pipes failed: ", std::strerror(errno)};
                break;
            }

            if (fds[1].revents != 0 || stop_requested_.load()) {
                break;
            }

            if ((fds[2].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                auto n = ::read(stderr_fd_, chunk, sizeof(chunk));
                if (n > 0) {
                    dispatch_stderr(stderr_framer_.feed(std::string_view{chunk, static_cast<size_t>(n)}));
                }
                else if (n == 0 || errno != EINTR) {
                    stderr_open = false;
                }
            }

            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                auto n = ::read(stdout_fd_, chunk, sizeof(chunk));
                if (n > 0) {
                    dispatch_frames(stdout_framer_.feed(std::string_view{chunk, static_cast<size_t>(n)}));
                }
                else if (n == 0) {
                    reached_eof = true;
                    break;
                }
                else if (errno != EINTR && errno != EAGAIN) {
                    log_error{"read from server stdout failed: ", std::strerror(errno)};
                    break;
                }
            }
        }

        if (reached_eof) {
            log_info{"server pid ", pid_, " closed its output stream"};
            if (auto rest = stdout_framer_.finish()) {
                report_parse_error(parse_error{"truncated message at end of stream", std::move(*rest)});
            }
        }
        if (stderr_open) {
            drain_stderr();
        }
        if (auto rest = stderr_framer_.finish()) {
            dispatch_stderr({frame{.text = std::move(*rest)}});
        }

        finish_stream();
        if (reached_eof) {
            reap_exited_peer();
        }
    }

    // a peer that closed its output is expected to exit; once reaped the session is closed
    void transport_session::reap_exited_peer() {
        auto deadline = std::chrono::steady_clock::now() + opts_.stop_grace;
        for (;;) {
            {
                std::lock_guard lock{reap_mutex_};
                if (stop_requested_.load()) {
                    return;
                }
                if (auto code = internal::process::wait_for_exit(pid_, std::chrono::milliseconds{0})) {
                    record_exit(*code);
                    log_info{"server pid ", pid_, " exited: ", internal::process::describe_exit(*code)};
                    state_.store(session_state::closed);
                    return;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                log_warn{"server pid ", pid_, " closed its output but is still running"};
                return;
            }
            std::this_thread::sleep_for(detail::reap_poll_interval);
        }
    }

}  // namespace tether
