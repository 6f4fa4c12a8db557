#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether {

    inline constexpr std::string_view jsonrpc_version = "2.0";

    struct rpc_error {
        std::int64_t code{};
        std::string message{};
        std::optional<glz::raw_json> data{};

        struct glaze {
            using T = rpc_error;
            static constexpr auto value = glz::object("code", &T::code, "message", &T::message, "data", &T::data);
        };
    };

    /*
     * One JSON-RPC 2.0 envelope, in either direction.
     *
     * - request:      id + method (+ params)
     * - notification: method (+ params), no id
     * - response:     id + result, or id + error
     *
     * `params`, `result` and `error.data` keep the peer's JSON text verbatim.
     * Inbound ids that are not integers are kept in `raw_id` only; `id` stays empty.
     */
    struct message {
        std::string jsonrpc{jsonrpc_version};
        std::optional<std::int64_t> id{};
        std::optional<std::string> raw_id{};
        std::optional<std::string> method{};
        std::optional<glz::raw_json> params{};
        std::optional<glz::raw_json> result{};
        std::optional<rpc_error> error{};

        bool has_id() const { return id.has_value() || raw_id.has_value(); }
        bool is_request() const { return method.has_value() && has_id(); }
        bool is_notification() const { return method.has_value() && !has_id(); }
        bool is_response() const { return !method.has_value() && has_id(); }
    };

    message make_request(std::int64_t id, std::string method, std::optional<glz::raw_json> params = std::nullopt);
    message make_notification(std::string method, std::optional<glz::raw_json> params = std::nullopt);
    message make_result_response(std::int64_t id, glz::raw_json result);
    message make_error_response(std::int64_t id, std::int64_t code, std::string text);

    // single JSON object, no trailing newline
    std::string encode_message(const message& msg);

    // throws parse_error on malformed JSON or a non-object top level value
    message decode_message(const std::string& line);

    // validated JSON text as a raw payload; throws std::runtime_error on malformed input
    glz::raw_json parse_raw_json(std::string_view text);

    // serializes any glaze-describable value into a raw JSON payload
    template <typename T>
    glz::raw_json to_raw_json(const T& value) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json payload");
        }
        return glz::raw_json{json};
    }

}  // namespace tether
