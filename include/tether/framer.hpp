#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

    struct frame {
        std::string text{};
        // the line exceeded the size limit; `text` holds only its head
        bool oversized{false};
    };

    /*
     * Splits a byte stream into newline-terminated lines.
     *
     * A trailing '\r' is stripped and blank lines are skipped. A line that grows past
     * `max_line_bytes` before its newline arrives is reported once as oversized and the
     * rest of it is dropped; framing resumes after the next '\n'.
     */
    class line_framer {
      public:
        explicit line_framer(std::size_t max_line_bytes = 16U << 20U);

        std::vector<frame> feed(std::string_view bytes);

        // bytes left over without a terminating newline, consumed by the call
        std::optional<std::string> finish();

        std::size_t buffered() const { return buffer_.size(); }

      private:
        void push_line(std::vector<frame>& out, std::string_view line);

        std::string buffer_{};
        std::size_t max_line_bytes_;
        bool discarding_{false};
    };

}  // namespace tether
