#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tether {

    using namespace std::string_view_literals;

    inline constexpr std::string_view version = "0.1.0";

    /*
     * Tether Client Config Options
     *
     * Server process
     * - command: Executable launched as the peer; resolved through PATH.
     * - args: Arguments passed to the command, in order.
     * - env: Extra environment variables for the peer, layered over ours.
     * - working_dir: Directory the peer is started in (inherits ours when unset).
     * - capture_stderr: Read the peer's stderr and log it line by line instead of inheriting it.
     *
     * Credential
     * - credential: Opaque token handed to the peer; never inspected, redacted when printed.
     * - credential_env: Name of the peer environment variable the credential is forwarded as.
     *
     * Protocol
     * - client_name/client_version: clientInfo advertised during the handshake.
     * - protocol_version: MCP protocol revision requested during the handshake.
     *
     * Limits
     * - request_timeout_ms: Default per-call timeout; every call has one.
     * - handshake_timeout_ms: Timeout for the initialize request.
     * - stop_grace_ms: Time between SIGTERM and SIGKILL when stopping the peer.
     * - max_message_bytes: Longest accepted inbound line; longer ones are dropped.
     *
     * UX
     * - log: Log threshold (debug|info|warn|error|off).
     * - output: Result rendering for the command line (text|json).
     * - print_config: Print the resolved config and exit.
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct client_config {
        std::string command{};
        std::vector<std::string> args{};
        std::map<std::string, std::string> env{};
        std::optional<std::filesystem::path> working_dir{};
        bool capture_stderr{false};

        std::optional<std::string> credential{};
        std::string credential_env{"TETHER_CREDENTIAL"};

        std::string client_name{"tether"};
        std::string client_version{version};
        std::string protocol_version{"2024-11-05"};

        int request_timeout_ms{30'000};
        int handshake_timeout_ms{30'000};
        int stop_grace_ms{3'000};
        std::size_t max_message_bytes{16U << 20U};

        log_level log{log_level::info};
        output_mode output{output_mode::text};
        bool print_config{false};
    };

    // argv for the peer: command followed by args
    std::vector<std::string> server_argv(const client_config& cfg);

    // env overrides for the peer, with the credential forwarded under credential_env
    std::map<std::string, std::string> server_environment(const client_config& cfg);

    /*
     * Server definition file (JSON):
     *
     *   {"schema_version": 1, "command": "...", "args": [...], "env": {...},
     *    "working_dir": "...", "credential_env": "...", "request_timeout_ms": 30000, ...}
     *
     * Present keys override cfg; unknown keys are ignored. Throws std::runtime_error on
     * unreadable files, malformed JSON or a newer schema_version.
     */
    void load_config_file(const std::filesystem::path& path, client_config& cfg);

    // TETHER_LOG_LEVEL, TETHER_TIMEOUT_MS and the credential variable named by credential_env
    void apply_environment(client_config& cfg);

    void print_config(const client_config& cfg, std::ostream& os);

    // throws std::runtime_error on out-of-range limits or a missing command
    void validate_config(const client_config& cfg);

}  // namespace tether
