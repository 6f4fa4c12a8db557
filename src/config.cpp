#include "tether/config.hpp"

#include "tether/format.hpp"

#include <glaze/glaze.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace tether::literals;
namespace fs = std::filesystem;

namespace tether {

    namespace detail {

        struct persisted_server {
            int schema_version{1};
            std::optional<std::string> command{};
            std::optional<std::vector<std::string>> args{};
            std::optional<std::map<std::string, std::string>> env{};
            std::optional<std::string> working_dir{};
            std::optional<bool> capture_stderr{};
            std::optional<std::string> credential_env{};
            std::optional<std::string> client_name{};
            std::optional<std::string> protocol_version{};
            std::optional<int> request_timeout_ms{};
            std::optional<int> handshake_timeout_ms{};
            std::optional<int> stop_grace_ms{};
            std::optional<std::size_t> max_message_bytes{};
            std::optional<std::string> log_level{};
        };

        static constexpr int supported_schema_version = 1;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static std::optional<std::string> read_env(const char* name) {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string{value};
        }

    }  // namespace detail

    std::vector<std::string> server_argv(const client_config& cfg) {
        std::vector<std::string> argv{};
        argv.reserve(cfg.args.size() + 1);
        argv.push_back(cfg.command);
        argv.insert(argv.end(), cfg.args.begin(), cfg.args.end());
        return argv;
    }

    std::map<std::string, std::string> server_environment(const client_config& cfg) {
        auto env = cfg.env;
        if (cfg.credential && !cfg.credential_env.empty()) {
            env[cfg.credential_env] = *cfg.credential;
        }
        return env;
    }

    void load_config_file(const fs::path& path, client_config& cfg) {
        auto json = detail::read_text_file(path);

        detail::persisted_server data{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw std::runtime_error(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }
        if (data.schema_version > detail::supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), data.schema_version, detail::supported_schema_version));
        }

        if (data.command) {
            cfg.command = *data.command;
        }
        if (data.args) {
            cfg.args = *data.args;
        }
        if (data.env) {
            for (auto& [key, value] : *data.env) {
                cfg.env[key] = value;
            }
        }
        if (data.working_dir) {
            // relative to the file that names it
            fs::path dir{*data.working_dir};
            cfg.working_dir = dir.is_relative() ? path.parent_path() / dir : dir;
        }
        if (data.capture_stderr) {
            cfg.capture_stderr = *data.capture_stderr;
        }
        if (data.credential_env) {
            cfg.credential_env = *data.credential_env;
        }
        if (data.client_name) {
            cfg.client_name = *data.client_name;
        }
        if (data.protocol_version) {
            cfg.protocol_version = *data.protocol_version;
        }
        if (data.request_timeout_ms) {
            cfg.request_timeout_ms = *data.request_timeout_ms;
        }
        if (data.handshake_timeout_ms) {
            cfg.handshake_timeout_ms = *data.handshake_timeout_ms;
        }
        if (data.stop_grace_ms) {
            cfg.stop_grace_ms = *data.stop_grace_ms;
        }
        if (data.max_message_bytes) {
            cfg.max_message_bytes = *data.max_message_bytes;
        }
        if (data.log_level && !try_parse_log_level(*data.log_level, cfg.log)) {
            throw std::runtime_error("invalid log_level in {}: {}"_format(path.string(), *data.log_level));
        }
    }

    void apply_environment(client_config& cfg) {
        if (auto level = detail::read_env("TETHER_LOG_LEVEL")) {
            if (!try_parse_log_level(*level, cfg.log)) {
                throw std::runtime_error("invalid TETHER_LOG_LEVEL: {}"_format(*level));
            }
        }
        if (auto timeout = detail::read_env("TETHER_TIMEOUT_MS")) {
            auto parsed = utils::parse_arithmetic<int>(*timeout);
            if (!parsed) {
                throw std::runtime_error("invalid TETHER_TIMEOUT_MS: {}"_format(*timeout));
            }
            cfg.request_timeout_ms = *parsed;
        }
        if (!cfg.credential && !cfg.credential_env.empty()) {
            cfg.credential = detail::read_env(cfg.credential_env.c_str());
        }
    }

    void print_config(const client_config& cfg, std::ostream& os) {
        os << "command=" << (cfg.command.empty() ? "<unset>" : cfg.command) << '\n';
        os << "args=" << utils::join_with_separator(cfg.args, " ") << '\n';
        for (const auto& [key, value] : cfg.env) {
            os << "env." << key << '=' << value << '\n';
        }
        os << "working_dir=" << (cfg.working_dir ? cfg.working_dir->string() : "<inherit>") << '\n';
        os << "capture_stderr=" << (cfg.capture_stderr ? "true" : "false") << '\n';
        os << "credential=" << (cfg.credential ? "<set>" : "<unset>") << '\n';
        os << "credential_env=" << cfg.credential_env << '\n';
        os << "client=" << cfg.client_name << ' ' << cfg.client_version << '\n';
        os << "protocol_version=" << cfg.protocol_version << '\n';
        os << "request_timeout_ms=" << cfg.request_timeout_ms << '\n';
        os << "handshake_timeout_ms=" << cfg.handshake_timeout_ms << '\n';
        os << "stop_grace_ms=" << cfg.stop_grace_ms << '\n';
        os << "max_message_bytes=" << cfg.max_message_bytes << '\n';
        os << "log=" << to_string(cfg.log) << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
    }

    void validate_config(const client_config& cfg) {
        if (cfg.command.empty()) {
            throw std::runtime_error("no server command configured");
        }
        if (cfg.request_timeout_ms <= 0) {
            throw std::runtime_error("request_timeout_ms must be positive, got {}"_format(cfg.request_timeout_ms));
        }
        if (cfg.handshake_timeout_ms <= 0) {
            throw std::runtime_error("handshake_timeout_ms must be positive, got {}"_format(cfg.handshake_timeout_ms));
        }
        if (cfg.stop_grace_ms < 0) {
            throw std::runtime_error("stop_grace_ms must not be negative, got {}"_format(cfg.stop_grace_ms));
        }
        if (cfg.max_message_bytes == 0U) {
            throw std::runtime_error("max_message_bytes must be positive");
        }
    }

}  // namespace tether
