#include "tether/cli.hpp"

#include "editor.hpp"

#include "tether/client.hpp"
#include "tether/format.hpp"
#include "tether/log.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace tether::literals;

namespace tether::cli { namespace detail {

    using namespace std::string_view_literals;

    static void print_error(const error& e, std::ostream& err) {
        err << "error: " << to_string(e.kind()) << ": " << e.what() << '\n';
    }

    static void print_error(const std::exception& e, std::ostream& err) {
        err << "error: " << e.what() << '\n';
    }

    static void print_help(std::ostream& os) {
        os << "commands:\n";
        os << "  :help\n";
        os << "  :tools\n";
        os << "  :info\n";
        os << "  :call <tool> [json-arguments]\n";
        os << "  :raw <method> [json-params]\n";
        os << "  :quit\n";
        os << "examples:\n";
        os << "  :call echo {\"text\":\"hi\"}\n";
        os << "  :raw ping\n";
    }

    // tools/call arguments must be a JSON object
    static glz::raw_json parse_tool_arguments(std::string_view text) {
        if (utils::trim_view(text).empty()) {
            return glz::raw_json{"{}"};
        }
        auto raw = parse_raw_json(text);
        if (raw.str.front() != '{') {
            throw std::runtime_error("tool arguments must be a JSON object");
        }
        return raw;
    }

    static std::unique_ptr<client> open_session(const client_config& cfg) {
        auto session = std::make_unique<client>(cfg);
        session->start();
        (void)session->initialize();
        return session;
    }

    static void print_tools(const std::vector<protocol::tool_definition>& tools, output_mode mode, std::ostream& os) {
        if (mode == output_mode::json) {
            std::string json{};
            if (auto ec = glz::write_json(tools, json)) {
                throw std::runtime_error("failed to serialize tool list");
            }
            os << json << '\n';
            return;
        }

        if (tools.empty()) {
            os << "(no tools)\n";
            return;
        }
        for (const auto& tool : tools) {
            os << tool.name;
            if (tool.description && !tool.description->empty()) {
                os << "  " << *tool.description;
            }
            os << '\n';
        }
    }

    // false when the tool flagged its result as an error
    static bool print_tool_result(const glz::raw_json& raw, output_mode mode, std::ostream& out, std::ostream& err) {
        auto result = protocol::decode_tool_call_result(raw);

        if (mode == output_mode::json) {
            out << raw.str << '\n';
        }
        else {
            for (const auto& block : result.content) {
                if (block.text) {
                    out << *block.text << '\n';
                    continue;
                }
                out << '[' << block.type;
                if (block.mimeType) {
                    out << ' ' << *block.mimeType;
                }
                out << ", " << (block.data ? block.data->size() : 0U) << " bytes]\n";
            }
        }

        if (result.isError) {
            err << "tool reported an error\n";
            return false;
        }
        return true;
    }

    static void print_info(const client& session, std::ostream& os) {
        if (const auto& server = session.server()) {
            os << "server=" << server->serverInfo.name << ' ' << server->serverInfo.version << '\n';
            os << "protocol_version=" << server->protocolVersion << '\n';
            os << "capabilities=" << server->capabilities.str << '\n';
            if (server->instructions) {
                os << "instructions=" << *server->instructions << '\n';
            }
        }
        os << "state=" << to_string(session.state()) << '\n';
        os << "pending=" << session.pending_count() << '\n';
        os << "tools=" << session.tools().size() << '\n';
    }

    static std::vector<std::string> tool_names(const std::vector<protocol::tool_definition>& tools) {
        std::vector<std::string> names{};
        names.reserve(tools.size());
        for (const auto& tool : tools) {
            names.push_back(tool.name);
        }
        return names;
    }

    static void call_tool_command(client& session, std::string_view rest, output_mode mode) {
        auto [name, json] = utils::split_first_token(rest);
        if (name.empty()) {
            std::cerr << "usage: :call <tool> [json-arguments]\n";
            return;
        }
        auto arguments = parse_tool_arguments(json);

        auto known = session.tools();
        if (!known.empty() && !session.has_tool(name)) {
            std::cerr << "error: unknown tool: " << name << '\n';
            return;
        }

        auto raw = session.call_tool_async(name, std::move(arguments)).wait();
        (void)print_tool_result(raw, mode, std::cout, std::cerr);
    }

    static void raw_command(client& session, std::string_view rest) {
        auto [method, json] = utils::split_first_token(rest);
        if (method.empty()) {
            std::cerr << "usage: :raw <method> [json-params]\n";
            return;
        }

        std::optional<glz::raw_json> params{};
        if (!json.empty()) {
            params = parse_raw_json(json);
        }
        auto raw = session.call(method, std::move(params));
        std::cout << raw.str << '\n';
    }

    static void process_command(
            std::string_view cmd, client& session, line_editor& editor, output_mode mode, bool& should_quit) {
        if (cmd == ":quit"sv || cmd == ":q"sv) {
            should_quit = true;
            return;
        }
        if (cmd == ":help"sv) {
            print_help(std::cout);
            return;
        }
        if (cmd == ":info"sv) {
            print_info(session, std::cout);
            return;
        }

        try {
            if (cmd == ":tools"sv) {
                auto tools = session.list_tools();
                editor.set_tool_names(tool_names(tools));
                print_tools(tools, mode, std::cout);
                return;
            }
            if (cmd == ":call"sv || cmd.starts_with(":call "sv)) {
                call_tool_command(session, cmd.substr(5U), mode);
                return;
            }
            if (cmd == ":raw"sv || cmd.starts_with(":raw "sv)) {
                raw_command(session, cmd.substr(4U));
                return;
            }
        } catch (const error& e) {
            print_error(e, std::cerr);
            return;
        } catch (const std::runtime_error& e) {
            print_error(e, std::cerr);
            return;
        }

        if (cmd.starts_with(":"sv)) {
            std::cerr << "unknown command: " << cmd << '\n';
            return;
        }
        std::cerr << "expected a command, type :help for commands\n";
    }

}}  // namespace tether::cli::detail

namespace tether::cli {

    int run_action(const invocation& inv) {
        const auto& cfg = inv.client;
        try {
            auto session = detail::open_session(cfg);

            if (inv.list_tools) {
                detail::print_tools(session->list_tools(), cfg.output, std::cout);
            }
            if (!inv.call_tool) {
                return 0;
            }

            if (!inv.list_tools) {
                try {
                    (void)session->list_tools();
                } catch (const remote_error& e) {
                    // servers without tools/list still accept direct calls
                    log_debug{"tools/list unavailable: ", e.what()};
                }
            }
            if (!session->tools().empty() && !session->has_tool(*inv.call_tool)) {
                std::cerr << "error: unknown tool: " << *inv.call_tool << '\n';
                return 1;
            }

            auto arguments = detail::parse_tool_arguments(inv.arguments);
            auto raw = session->call_tool_async(*inv.call_tool, std::move(arguments)).wait();
            return detail::print_tool_result(raw, cfg.output, std::cout, std::cerr) ? 0 : 1;
        } catch (const error& e) {
            detail::print_error(e, std::cerr);
            return 1;
        } catch (const std::runtime_error& e) {
            detail::print_error(e, std::cerr);
            return 1;
        }
    }

    int run_repl(const client_config& cfg) {
        std::unique_ptr<client> session{};
        try {
            session = detail::open_session(cfg);
        } catch (const error& e) {
            detail::print_error(e, std::cerr);
            return 1;
        }

        std::vector<std::string> names{};
        try {
            names = detail::tool_names(session->list_tools());
        } catch (const error& e) {
            log_warn{"could not list tools: ", e.what()};
        }

        line_editor editor{std::move(names)};
        bool should_quit = false;

        const auto& server = session->server();
        std::cout << "tether " << version << " connected to " << server->serverInfo.name << ' '
                  << server->serverInfo.version << '\n';
        std::cout << "type :help for commands\n";

        while (!should_quit) {
            auto next_line = editor.read_line("tether> "sv);
            if (!next_line) {
                std::cout << '\n';
                break;
            }

            auto cmd = utils::trim_view(*next_line);
            if (cmd.empty()) {
                continue;
            }
            detail::process_command(cmd, *session, editor, cfg.output, should_quit);
        }

        session->close();
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, invocation& inv) {
        CLI::App app{"tether: MCP client for servers speaking JSON-RPC over stdio"};
        auto& cfg = inv.client;

        bool show_version = false;
        bool list_tools = false;
        bool capture_stderr = false;
        std::string config_arg{};
        std::vector<std::string> env_args{};
        std::string credential_env_arg{};
        std::string cwd_arg{};
        int timeout_arg{};
        std::string log_level_arg{};
        std::string output_arg{};
        std::string call_arg{};
        std::string arguments_arg{"{}"};
        std::vector<std::string> server_cmd{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "Server definition file (JSON)");
        app.add_option("--env", env_args, "Extra server environment variable KEY=VALUE (repeatable)")
                ->allow_extra_args(false);
        app.add_option("--credential-env", credential_env_arg, "Variable the credential is read from and forwarded as");
        app.add_option("--cwd", cwd_arg, "Working directory for the server");
        app.add_flag("--capture-stderr", capture_stderr, "Log the server's stderr instead of inheriting it");
        app.add_option("--timeout-ms", timeout_arg, "Per-request timeout in milliseconds");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warn|error|off");
        app.add_option("--output", output_arg, "Output mode: text|json");
        app.add_flag("--list-tools", list_tools, "List the server's tools and exit");
        app.add_option("--call", call_arg, "Call a tool and exit");
        app.add_option("--arguments", arguments_arg, "Tool arguments as a JSON object (with --call)");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_option("server", server_cmd, "Server command and arguments, after --");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "tether " << version << '\n';
            return std::optional<int>{0};
        }

        try {
            if (!config_arg.empty()) {
                inv.config_file = config_arg;
                load_config_file(*inv.config_file, cfg);
            }
            if (!credential_env_arg.empty()) {
                cfg.credential_env = credential_env_arg;
            }
            apply_environment(cfg);
        } catch (const std::runtime_error& e) {
            detail::print_error(e, std::cerr);
            return std::optional<int>{2};
        }

        for (const auto& assignment : env_args) {
            auto pair = utils::split_assignment(assignment);
            if (!pair) {
                std::cerr << "invalid --env value: " << assignment << " (expected KEY=VALUE)\n";
                return std::optional<int>{2};
            }
            cfg.env[pair->first] = pair->second;
        }
        if (!cwd_arg.empty()) {
            cfg.working_dir = cwd_arg;
        }
        if (capture_stderr) {
            cfg.capture_stderr = true;
        }
        if (app.count("--timeout-ms") > 0U) {
            cfg.request_timeout_ms = timeout_arg;
        }
        if (!log_level_arg.empty() && !try_parse_log_level(log_level_arg, cfg.log)) {
            std::cerr << "invalid --log-level value: " << log_level_arg << " (expected debug|info|warn|error|off)\n";
            return std::optional<int>{2};
        }
        if (!output_arg.empty() && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (!server_cmd.empty()) {
            cfg.command = server_cmd.front();
            cfg.args.assign(server_cmd.begin() + 1, server_cmd.end());
        }

        log::set_level(cfg.log);

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        inv.list_tools = list_tools;
        if (!call_arg.empty()) {
            inv.call_tool = call_arg;
        }
        if (app.count("--arguments") > 0U && !inv.call_tool) {
            std::cerr << "--arguments requires --call\n";
            return std::optional<int>{2};
        }
        inv.arguments = arguments_arg;
        if (inv.call_tool) {
            try {
                (void)detail::parse_tool_arguments(inv.arguments);
            } catch (const std::runtime_error& e) {
                std::cerr << "invalid --arguments value: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        try {
            validate_config(cfg);
        } catch (const std::runtime_error& e) {
            detail::print_error(e, std::cerr);
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace tether::cli
