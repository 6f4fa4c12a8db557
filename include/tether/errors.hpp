#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tether {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        launch,
        write,
        parse,
        protocol,
        handshake,
        remote,
        timeout,
        session_closed,
        cancelled,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::launch:
                return "launch"sv;
            case error_kind::write:
                return "write"sv;
            case error_kind::parse:
                return "parse"sv;
            case error_kind::protocol:
                return "protocol"sv;
            case error_kind::handshake:
                return "handshake"sv;
            case error_kind::remote:
                return "remote"sv;
            case error_kind::timeout:
                return "timeout"sv;
            case error_kind::session_closed:
                return "session_closed"sv;
            case error_kind::cancelled:
                return "cancelled"sv;
        }
        return "protocol"sv;
    }

    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& what) : std::runtime_error{what}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

    // subprocess could not be spawned; fatal to the session
    class launch_error : public error {
      public:
        explicit launch_error(const std::string& what) : error{error_kind::launch, what} {}
    };

    class write_error : public error {
      public:
        explicit write_error(const std::string& what) : error{error_kind::write, what} {}
    };

    // one malformed line; the read loop keeps going
    class parse_error : public error {
      public:
        parse_error(const std::string& what, std::string line)
                : error{error_kind::parse, what}, line_{std::move(line)} {}

        const std::string& line() const noexcept { return line_; }

      private:
        std::string line_;
    };

    // orphan responses and messages of unexpected shape
    class protocol_error : public error {
      public:
        explicit protocol_error(const std::string& what) : error{error_kind::protocol, what} {}
    };

    class handshake_error : public error {
      public:
        explicit handshake_error(const std::string& what) : error{error_kind::handshake, what} {}
    };

    class remote_error : public error {
      public:
        remote_error(std::int64_t code, std::string message, std::optional<std::string> data = std::nullopt)
                : error{error_kind::remote, "remote error " + std::to_string(code) + ": " + message},
                  code_{code},
                  message_{std::move(message)},
                  data_{std::move(data)} {}

        std::int64_t code() const noexcept { return code_; }
        const std::string& message() const noexcept { return message_; }
        // raw JSON text of the error's `data` member, if the peer sent one
        const std::optional<std::string>& data() const noexcept { return data_; }

      private:
        std::int64_t code_;
        std::string message_;
        std::optional<std::string> data_;
    };

    class timeout_error : public error {
      public:
        timeout_error(std::int64_t id, std::chrono::milliseconds timeout)
                : error{error_kind::timeout,
                        "request " + std::to_string(id) + " timed out after " + std::to_string(timeout.count()) +
                                "ms"},
                  id_{id},
                  timeout_{timeout} {}

        std::int64_t id() const noexcept { return id_; }
        std::chrono::milliseconds timeout() const noexcept { return timeout_; }

      private:
        std::int64_t id_;
        std::chrono::milliseconds timeout_;
    };

    class session_closed_error : public error {
      public:
        explicit session_closed_error(const std::string& what = "session closed")
                : error{error_kind::session_closed, what} {}
    };

    class cancelled_error : public error {
      public:
        explicit cancelled_error(std::int64_t id)
                : error{error_kind::cancelled, "request " + std::to_string(id) + " cancelled"}, id_{id} {}

        std::int64_t id() const noexcept { return id_; }

      private:
        std::int64_t id_;
    };

}  // namespace tether
