#pragma once

#include "errors.hpp"
#include "framer.hpp"
#include "message.hpp"

extern "C" {
#include <sys/types.h>
}

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {

    using namespace std::string_view_literals;

    enum class session_state : uint8_t { not_started, running, closing, closed };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::not_started:
                return "not_started"sv;
            case session_state::running:
                return "running"sv;
            case session_state::closing:
                return "closing"sv;
            case session_state::closed:
                return "closed"sv;
        }
        return "closed"sv;
    }

    struct transport_options {
        std::vector<std::string> argv{};
        std::map<std::string, std::string> env{};
        std::optional<std::filesystem::path> working_dir{};
        // stderr is inherited unless captured; captured lines go to `on_stderr_line`
        bool capture_stderr{false};
        std::size_t max_message_bytes{16U << 20U};
        std::chrono::milliseconds stop_grace{3'000};
    };

    // invoked on the reader thread; must not call transport_session::stop()
    struct transport_handlers {
        std::function<void(message)> on_message{};
        std::function<void(const parse_error&)> on_parse_error{};
        std::function<void()> on_end_of_stream{};
        std::function<void(std::string_view)> on_stderr_line{};
    };

    /*
     * Owns one child process and its stdin/stdout pipes.
     *
     * Outbound messages are written as one JSON object per line under a write lock, so
     * concurrent senders never interleave. A background thread reads stdout, frames lines,
     * decodes them and hands them to the handlers. The session moves
     * not_started -> running -> closing -> closed and is never restarted; a peer that ends
     * its output on its own is reaped by the reader and the session reads as closed.
     *
     * Writes never block indefinitely: stdin is non-blocking, a write waits for room up to
     * its deadline and stop() wakes it. SIGPIPE is masked in the writing thread only, so a
     * dead peer surfaces as write_error without touching the process signal disposition.
     */
    class transport_session {
      public:
        transport_session(transport_options opts, transport_handlers handlers);
        ~transport_session();

        transport_session(const transport_session&) = delete;
        transport_session& operator=(const transport_session&) = delete;

        // throws launch_error; a failed start leaves the session closed
        void start();

        // throws write_error when the session is not running, the pipe is gone, the deadline
        // passes before the whole line is written or stop() interrupts the write
        void send(const message& msg, std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

        // idempotent; never waits on a blocked writer, returns once the child is reaped and
        // the reader has exited. The end-of-stream handler is not invoked for a requested stop.
        void stop();

        session_state state() const { return state_.load(); }
        pid_t pid() const { return pid_; }
        std::optional<int> exit_code() const;

      private:
        void read_loop();
        void report_parse_error(const parse_error& err);
        void dispatch_frames(std::vector<frame> frames);
        void dispatch_stderr(std::vector<frame> frames);
        void drain_stderr();
        void finish_stream();
        void reap_exited_peer();
        void record_exit(int code);
        void wait_writable(std::optional<std::chrono::steady_clock::time_point> deadline, size_t written);
        void wake_reader();
        void wake_writer();
        void close_read_fds();

        transport_options opts_;
        transport_handlers handlers_;

        std::atomic<session_state> state_{session_state::not_started};
        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
        int wake_fds_[2]{-1, -1};
        int write_wake_fds_[2]{-1, -1};

        std::mutex write_mutex_{};
        // set when a write gave up mid-line; nothing may follow a partial frame
        bool torn_frame_{false};
        // serializes reaping between the reader and stop()
        std::mutex reap_mutex_{};
        std::mutex stop_mutex_{};
        bool stopped_{false};
        std::atomic<bool> stop_requested_{false};
        std::atomic<bool> end_of_stream_signalled_{false};

        mutable std::mutex exit_mutex_{};
        std::optional<int> exit_code_{};

        line_framer stdout_framer_;
        line_framer stderr_framer_;
        std::thread reader_{};
    };

}  // namespace tether
