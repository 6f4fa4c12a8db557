#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::cli {

    class line_editor {
      public:
        // tool names offered as completions after `:call`
        explicit line_editor(std::vector<std::string> tool_names);
        ~line_editor();

        line_editor(const line_editor&) = delete;
        line_editor& operator=(const line_editor&) = delete;

        std::optional<std::string> read_line(std::string_view prompt);

        void set_tool_names(std::vector<std::string> tool_names);
        const std::vector<std::string>& tool_names() const { return tool_names_; }

      private:
        std::vector<std::string> tool_names_;
    };

}  // namespace tether::cli
