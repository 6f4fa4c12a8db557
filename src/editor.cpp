#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <string_view>
#include <utility>

namespace tether::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] =
            {":help", ":tools", ":info", ":call", ":raw", ":quit", ":q", nullptr};

    static const char* raw_method_completions[] =
            {"ping", "tools/list", "tools/call", "resources/list", "prompts/list", nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    // number of whitespace separated words, counting a trailing partial one
    static size_t word_count(std::string_view value) {
        size_t count = 0;
        bool in_word = false;
        for (auto c : value) {
            bool space = c == ' ' || c == '\t';
            if (!space && !in_word) {
                ++count;
            }
            in_word = !space;
        }
        return count + ((!value.empty() && !in_word) ? 1U : 0U);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static bool is_tool_char(const char* s, long len) {
        if (len == 1 && (s[0] == '-' || s[0] == '_' || s[0] == '.' || s[0] == '/')) {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_raw_methods(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, raw_method_completions);
    }

    static void complete_tool_names(ic_completion_env_t* cenv, const char* prefix) {
        auto* editor = static_cast<const line_editor*>(ic_completion_arg(cenv));
        if (editor == nullptr) {
            return;
        }
        std::string_view wanted{prefix};
        for (const auto& name : editor->tool_names()) {
            if (std::string_view{name}.starts_with(wanted)) {
                if (!ic_add_completion(cenv, name.c_str())) {
                    return;
                }
            }
        }
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.empty() || !trimmed.starts_with(':')) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        auto command = first_token(trimmed);
        if (command.size() == trimmed.size()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        // only the word right after the command is completed; the JSON argument is free text
        if (word_count(trimmed) != 2U) {
            return;
        }
        if (command == ":call"sv) {
            ic_complete_word(cenv, prefix, complete_tool_names, is_tool_char);
            return;
        }
        if (command == ":raw"sv) {
            ic_complete_word(cenv, prefix, complete_raw_methods, is_tool_char);
            return;
        }
    }

}}  // namespace tether::cli::detail

namespace tether::cli {

    line_editor::line_editor(std::vector<std::string> tool_names) : tool_names_{std::move(tool_names)} {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_history(nullptr, 200);
        ic_set_default_completer(detail::complete_repl, this);
    }

    line_editor::~line_editor() {
        ic_set_default_completer(nullptr, nullptr);
    }

    void line_editor::set_tool_names(std::vector<std::string> tool_names) {
        tool_names_ = std::move(tool_names);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

}  // namespace tether::cli
