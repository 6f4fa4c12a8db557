#include "tether/framer.hpp"

#include "tether/utils.hpp"

namespace tether {

    namespace detail {
        static constexpr std::size_t oversized_head_bytes = 256U;
    }

    line_framer::line_framer(std::size_t max_line_bytes) : max_line_bytes_{max_line_bytes} {}

    void line_framer::push_line(std::vector<frame>& out, std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (utils::trim_view(line).empty()) {
            return;
        }
        out.push_back(frame{.text = std::string{line}});
    }

    std::vector<frame> line_framer::feed(std::string_view bytes) {
        std::vector<frame> out{};

        while (!bytes.empty()) {
            auto nl = bytes.find('\n');

            if (discarding_) {
                if (nl == std::string_view::npos) {
                    return out;
                }
                discarding_ = false;
                bytes.remove_prefix(nl + 1U);
                continue;
            }

            if (nl == std::string_view::npos) {
                buffer_.append(bytes);
                if (buffer_.size() > max_line_bytes_) {
                    out.push_back(frame{.text = buffer_.substr(0, detail::oversized_head_bytes), .oversized = true});
                    buffer_.clear();
                    discarding_ = true;
                }
                return out;
            }

            auto chunk = bytes.substr(0, nl);
            bytes.remove_prefix(nl + 1U);

            if (buffer_.size() + chunk.size() > max_line_bytes_) {
                buffer_.append(chunk.substr(0, std::min(chunk.size(), detail::oversized_head_bytes)));
                out.push_back(frame{.text = buffer_.substr(0, detail::oversized_head_bytes), .oversized = true});
                buffer_.clear();
                continue;
            }

            if (buffer_.empty()) {
                push_line(out, chunk);
            }
            else {
                buffer_.append(chunk);
                push_line(out, buffer_);
                buffer_.clear();
            }
        }

        return out;
    }

    std::optional<std::string> line_framer::finish() {
        discarding_ = false;
        if (utils::trim_view(buffer_).empty()) {
            buffer_.clear();
            return std::nullopt;
        }
        auto rest = std::move(buffer_);
        buffer_.clear();
        return rest;
    }

}  // namespace tether
