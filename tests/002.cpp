#include "utils.hpp"

namespace tether::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: encode request as a single json object", "[002][message]") {
        auto msg = make_request(1, "tools/call", glz::raw_json{R"({"name":"echo","arguments":{"text":"hi"}})"});
        auto json = encode_message(msg);

        CHECK(json.find('\n') == std::string::npos);
        CHECK(json.find(R"("jsonrpc":"2.0")") != std::string::npos);
        CHECK(json.find(R"("id":1)") != std::string::npos);
        CHECK(json.find(R"("method":"tools/call")") != std::string::npos);
        CHECK(json.find(R"("params":{"name":"echo","arguments":{"text":"hi"}})") != std::string::npos);
        CHECK(json.find("result") == std::string::npos);
        CHECK(json.find("error") == std::string::npos);
    }

    TEST_CASE("002: notifications carry no id", "[002][message]") {
        auto msg = make_notification("notifications/initialized");
        CHECK(msg.is_notification());
        CHECK_FALSE(msg.is_request());

        auto json = encode_message(msg);
        CHECK(json.find("\"id\"") == std::string::npos);
        CHECK(json.find("params") == std::string::npos);
    }

    TEST_CASE("002: decode success response keeps result verbatim", "[002][message]") {
        auto msg = decode_message(R"({"jsonrpc":"2.0","id":12,"result":{"content":[{"type":"text","text":"hi"}]}})");

        CHECK(msg.is_response());
        REQUIRE(msg.id.has_value());
        CHECK(*msg.id == 12);
        REQUIRE(msg.result.has_value());
        CHECK(msg.result->str == R"({"content":[{"type":"text","text":"hi"}]})");
        CHECK_FALSE(msg.error.has_value());
    }

    TEST_CASE("002: decode error response", "[002][message]") {
        auto msg = decode_message(
                R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"Method not found","data":[1,2]}})");

        REQUIRE(msg.error.has_value());
        CHECK(msg.error->code == -32601);
        CHECK(msg.error->message == "Method not found");
        REQUIRE(msg.error->data.has_value());
        CHECK(msg.error->data->str == "[1,2]");
    }

    TEST_CASE("002: non-integer ids are kept raw", "[002][message]") {
        auto string_id = decode_message(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})");
        CHECK_FALSE(string_id.id.has_value());
        REQUIRE(string_id.raw_id.has_value());
        CHECK(*string_id.raw_id == R"("abc")");
        CHECK(string_id.is_request());

        auto fractional = decode_message(R"({"jsonrpc":"2.0","id":1.5,"result":{}})");
        CHECK_FALSE(fractional.id.has_value());
        CHECK(fractional.raw_id == std::optional<std::string>{"1.5"});

        // raw ids are echoed back unchanged
        message reply{};
        reply.raw_id = string_id.raw_id;
        reply.result = glz::raw_json{"{}"};
        CHECK(encode_message(reply).find(R"("id":"abc")") != std::string::npos);
    }

    TEST_CASE("002: unknown members are ignored", "[002][message]") {
        auto msg = decode_message(R"({"jsonrpc":"2.0","method":"notifications/progress","extra":true,"params":{}})");
        CHECK(msg.is_notification());
        CHECK(*msg.method == "notifications/progress");
    }

    TEST_CASE("002: malformed lines raise parse_error", "[002][message]") {
        CHECK_THROWS_AS(decode_message("this is not json"), parse_error);
        CHECK_THROWS_AS(decode_message("[1,2,3]"), parse_error);
        CHECK_THROWS_AS(decode_message(R"({"jsonrpc":"2.0","id":)"), parse_error);

        try {
            (void)decode_message("garbage");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.line() == "garbage");
            CHECK(e.kind() == error_kind::parse);
        }
    }

    TEST_CASE("002: raw json arguments are validated", "[002][message]") {
        CHECK(parse_raw_json(R"(  {"a": [1, 2]} )").str == R"({"a": [1, 2]})");
        CHECK_THROWS_AS(parse_raw_json(R"({"a": )"), std::runtime_error);
        CHECK_THROWS_AS(parse_raw_json("   "), std::runtime_error);
    }

    TEST_CASE("002: mcp payloads decode into typed results", "[002][protocol]") {
        auto init = protocol::decode_initialize_result(glz::raw_json{
                R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{}},)"
                R"("serverInfo":{"name":"srv","version":"2"}})"});
        CHECK(init.protocolVersion == "2024-11-05");
        CHECK(init.capabilities.str == R"({"tools":{}})");
        CHECK(init.serverInfo.name == "srv");
        CHECK_FALSE(init.instructions.has_value());

        auto page = protocol::decode_tools_list_result(glz::raw_json{
                R"({"tools":[{"name":"echo","inputSchema":{"type":"object"}},{"name":"fail"}],"nextCursor":"2"})"});
        REQUIRE(page.tools.size() == 2U);
        CHECK(page.tools[0].inputSchema.str == R"({"type":"object"})");
        CHECK_FALSE(page.tools[1].description.has_value());
        CHECK(page.nextCursor == std::optional<std::string>{"2"});

        auto result = protocol::decode_tool_call_result(glz::raw_json{
                R"({"content":[{"type":"text","text":"a"},{"type":"image","data":"AAAA","mimeType":"image/png"},)"
                R"({"type":"text","text":"b"}],"isError":true})"});
        CHECK(result.isError);
        CHECK(result.content.size() == 3U);
        CHECK(result.text() == "a\nb");

        CHECK_THROWS_AS(protocol::decode_tool_call_result(glz::raw_json{"[]"}), protocol_error);
    }

}  // namespace tether::test
