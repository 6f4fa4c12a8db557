#pragma once

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::protocol {

    inline constexpr std::string_view default_protocol_version = "2024-11-05";

    namespace method {
        inline constexpr std::string_view initialize = "initialize";
        inline constexpr std::string_view initialized = "notifications/initialized";
        inline constexpr std::string_view tools_list = "tools/list";
        inline constexpr std::string_view tools_call = "tools/call";
        inline constexpr std::string_view ping = "ping";
    }  // namespace method

    struct implementation_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = implementation_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{};
        glz::raw_json capabilities{"{}"};
        implementation_info clientInfo{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value = glz::object(
                    "protocolVersion",
                    &T::protocolVersion,
                    "capabilities",
                    &T::capabilities,
                    "clientInfo",
                    &T::clientInfo);
        };
    };

    struct initialize_result {
        std::string protocolVersion{};
        glz::raw_json capabilities{"{}"};
        implementation_info serverInfo{};
        std::optional<std::string> instructions{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(
                    "protocolVersion",
                    &T::protocolVersion,
                    "capabilities",
                    &T::capabilities,
                    "serverInfo",
                    &T::serverInfo,
                    "instructions",
                    &T::instructions);
        };
    };

    struct tool_definition {
        std::string name{};
        std::optional<std::string> description{};
        glz::raw_json inputSchema{"{}"};
        struct glaze {
            using T = tool_definition;
            static constexpr auto value =
                    glz::object(&T::name, "description", &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_params {
        std::optional<std::string> cursor{};
        struct glaze {
            using T = tools_list_params;
            static constexpr auto value = glz::object(&T::cursor);
        };
    };

    struct tools_list_result {
        std::vector<tool_definition> tools{};
        std::optional<std::string> nextCursor{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools, "nextCursor", &T::nextCursor);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::raw_json arguments{"{}"};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    // text blocks carry `text`; image/audio blocks carry `data` + `mimeType`
    struct content_block {
        std::string type{"text"};
        std::optional<std::string> text{};
        std::optional<std::string> data{};
        std::optional<std::string> mimeType{};
        struct glaze {
            using T = content_block;
            static constexpr auto value =
                    glz::object(&T::type, &T::text, "data", &T::data, "mimeType", &T::mimeType);
        };
    };

    struct tool_call_result {
        std::vector<content_block> content{};
        bool isError{false};
        struct glaze {
            using T = tool_call_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };

        // text blocks joined by newlines
        std::string text() const;
    };

    // throw protocol_error when the payload does not have the expected shape
    initialize_result decode_initialize_result(const glz::raw_json& raw);
    tools_list_result decode_tools_list_result(const glz::raw_json& raw);
    tool_call_result decode_tool_call_result(const glz::raw_json& raw);

}  // namespace tether::protocol
