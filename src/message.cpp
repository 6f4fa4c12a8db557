#include "tether/message.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"

using namespace tether::literals;

namespace tether {

    namespace detail {

        // id is kept as raw text so integer, string and null ids all parse
        struct wire_message {
            std::string jsonrpc{};
            std::optional<glz::raw_json> id{};
            std::optional<std::string> method{};
            std::optional<glz::raw_json> params{};
            std::optional<glz::raw_json> result{};
            std::optional<rpc_error> error{};

            struct glaze {
                using T = wire_message;
                static constexpr auto value = glz::object(
                        "jsonrpc",
                        &T::jsonrpc,
                        "id",
                        &T::id,
                        "method",
                        &T::method,
                        "params",
                        &T::params,
                        "result",
                        &T::result,
                        "error",
                        &T::error);
            };
        };

        static constexpr size_t max_logged_line = 200U;

    }  // namespace detail

    message make_request(std::int64_t id, std::string method, std::optional<glz::raw_json> params) {
        message msg{};
        msg.id = id;
        msg.method = std::move(method);
        msg.params = std::move(params);
        return msg;
    }

    message make_notification(std::string method, std::optional<glz::raw_json> params) {
        message msg{};
        msg.method = std::move(method);
        msg.params = std::move(params);
        return msg;
    }

    message make_result_response(std::int64_t id, glz::raw_json result) {
        message msg{};
        msg.id = id;
        msg.result = std::move(result);
        return msg;
    }

    message make_error_response(std::int64_t id, std::int64_t code, std::string text) {
        message msg{};
        msg.id = id;
        msg.error = rpc_error{.code = code, .message = std::move(text)};
        return msg;
    }

    std::string encode_message(const message& msg) {
        detail::wire_message wire{};
        wire.jsonrpc = msg.jsonrpc;
        if (msg.id) {
            wire.id = glz::raw_json{std::to_string(*msg.id)};
        }
        else if (msg.raw_id) {
            wire.id = glz::raw_json{*msg.raw_id};
        }
        wire.method = msg.method;
        wire.params = msg.params;
        wire.result = msg.result;
        wire.error = msg.error;

        std::string json{};
        auto ec = glz::write_json(wire, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json-rpc message");
        }
        return json;
    }

    glz::raw_json parse_raw_json(std::string_view text) {
        std::string json{utils::trim_view(text)};
        if (json.empty()) {
            throw std::runtime_error("empty JSON value");
        }
        if (auto ec = glz::validate_json(json)) {
            throw std::runtime_error("invalid JSON: {}"_format(glz::format_error(ec, json)));
        }
        return glz::raw_json{std::move(json)};
    }

    message decode_message(const std::string& line) {
        auto body = utils::trim_view(line);
        if (body.empty() || body.front() != '{') {
            auto shown = utils::truncate_for_display(body, detail::max_logged_line);
            throw parse_error{"message is not a JSON object: {}"_format(shown), line};
        }

        detail::wire_message wire{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, line);
        if (ec) {
            throw parse_error{"malformed JSON-RPC message: {}"_format(glz::format_error(ec, line)), line};
        }

        message msg{};
        msg.jsonrpc = std::move(wire.jsonrpc);
        if (wire.id) {
            auto id_text = std::string{utils::trim_view(wire.id->str)};
            if (auto numeric = utils::parse_arithmetic<std::int64_t>(id_text)) {
                msg.id = *numeric;
            }
            else {
                msg.raw_id = std::move(id_text);
            }
        }
        msg.method = std::move(wire.method);
        msg.params = std::move(wire.params);
        msg.result = std::move(wire.result);
        msg.error = std::move(wire.error);
        return msg;
    }

}  // namespace tether
