#include "tether/protocol.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"

using namespace tether::literals;

namespace tether::protocol {

    namespace detail {
        template <typename T>
        static T read_payload(const glz::raw_json& raw, std::string_view what) {
            T value{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, raw.str);
            if (ec) {
                throw protocol_error{"unexpected {} payload: {}"_format(what, glz::format_error(ec, raw.str))};
            }
            return value;
        }
    }  // namespace detail

    std::string tool_call_result::text() const {
        std::vector<std::string> parts{};
        for (const auto& block : content) {
            if (block.type == "text" && block.text) {
                parts.push_back(*block.text);
            }
        }
        return utils::join_with_separator(parts, "\n");
    }

    initialize_result decode_initialize_result(const glz::raw_json& raw) {
        return detail::read_payload<initialize_result>(raw, "initialize result");
    }

    tools_list_result decode_tools_list_result(const glz::raw_json& raw) {
        return detail::read_payload<tools_list_result>(raw, "tools/list result");
    }

    tool_call_result decode_tool_call_result(const glz::raw_json& raw) {
        return detail::read_payload<tool_call_result>(raw, "tools/call result");
    }

}  // namespace tether::protocol
