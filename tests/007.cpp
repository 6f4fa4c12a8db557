#include "utils.hpp"

namespace tether::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    TEST_CASE("007: unanswered call times out and the session survives", "[007][timeout]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        auto started = std::chrono::steady_clock::now();
        try {
            (void)c.call_tool("silent", glz::raw_json{"{}"}, 200ms);
            FAIL("expected timeout_error");
        } catch (const timeout_error& e) {
            CHECK(e.timeout() == 200ms);
            CHECK(e.kind() == error_kind::timeout);
        }
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed >= 200ms);
        CHECK(elapsed < 5s);

        CHECK(c.pending_count() == 0U);
        CHECK(c.call_tool("echo", detail::echo_args("alive")).text() == "alive");
    }

    TEST_CASE("007: late responses after a timeout are orphans", "[007][timeout]") {
        client c{detail::peer_config()};
        detail::error_log errors{};
        errors.attach(c);
        c.start();
        (void)c.initialize();

        CHECK_THROWS_AS(
                c.call_tool("echo", glz::raw_json{R"({"text":"late","delay_ms":400})"}, 100ms), timeout_error);
        REQUIRE(detail::eventually([&] { return errors.count(error_kind::protocol) == 1U; }));
        CHECK(errors.contains(error_kind::protocol, "orphan"));
        CHECK(c.call_tool("echo", detail::echo_args("next")).text() == "next");
    }

    TEST_CASE("007: deadline counts from when the call was issued", "[007][timeout]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        auto pending = c.call_tool_async("silent", glz::raw_json{"{}"}, 300ms);
        std::this_thread::sleep_for(200ms);

        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(pending.wait(), timeout_error);
        CHECK(std::chrono::steady_clock::now() - started < 250ms);
    }

    TEST_CASE("007: cancelled calls release the waiter", "[007][cancel]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        auto pending = c.call_tool_async("silent");
        CHECK(c.pending_count() == 1U);

        std::atomic<bool> was_cancelled{false};
        std::thread waiter{[&] {
            try {
                (void)pending.wait();
            } catch (const cancelled_error&) {
                was_cancelled = true;
            }
        }};
        std::this_thread::sleep_for(50ms);
        CHECK(pending.cancel());
        waiter.join();
        CHECK(was_cancelled.load());

        CHECK(c.pending_count() == 0U);
        CHECK_FALSE(pending.cancel());
    }

    TEST_CASE("007: dropping a call handle releases its pending request", "[007][cancel]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        {
            auto dropped = c.call_tool_async("silent");
            CHECK(c.pending_count() == 1U);
        }
        CHECK(c.pending_count() == 0U);

        auto first = c.call_tool_async("silent");
        auto second = std::move(first);
        CHECK_FALSE(first.cancel());
        CHECK(c.pending_count() == 1U);

        // assigning over a live handle releases the call it held
        second = c.call_tool_async("silent");
        CHECK(c.pending_count() == 1U);
        CHECK(second.cancel());
        CHECK(c.pending_count() == 0U);

        CHECK(c.call_tool("echo", detail::echo_args("still here")).text() == "still here");
    }

    TEST_CASE("007: a request the peer never reads still times out", "[007][timeout]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();
        REQUIRE(c.call_tool("stall").text() == "stalled");

        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(c.call_tool("echo", detail::echo_args(std::string(1U << 20U, 'x')), 300ms), timeout_error);
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed >= 300ms);
        CHECK(elapsed < 5s);
        CHECK(c.pending_count() == 0U);

        started = std::chrono::steady_clock::now();
        c.close();
        CHECK(std::chrono::steady_clock::now() - started < 3s);
        CHECK(c.state() == session_state::closed);
    }

    TEST_CASE("007: close does not wait behind a blocked write", "[007][closed]") {
        auto cfg = detail::peer_config();
        cfg.request_timeout_ms = 60'000;
        client c{cfg};
        c.start();
        (void)c.initialize();
        REQUIRE(c.call_tool("stall").text() == "stalled");

        std::atomic<bool> caller_failed{false};
        std::thread caller{[&] {
            try {
                (void)c.call_tool("echo", detail::echo_args(std::string(1U << 20U, 'x')));
            } catch (const error&) {
                caller_failed = true;
            }
        }};
        std::this_thread::sleep_for(100ms);

        auto started = std::chrono::steady_clock::now();
        c.close();
        auto elapsed = std::chrono::steady_clock::now() - started;
        caller.join();

        CHECK(caller_failed.load());
        CHECK(elapsed < 3s);
        CHECK(c.state() == session_state::closed);
        CHECK(c.pending_count() == 0U);
    }

    TEST_CASE("007: peer exit fails every pending call", "[007][closed]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        auto a = c.call_tool_async("silent");
        auto b = c.call_tool_async("silent");
        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(c.call_tool("exit", glz::raw_json{R"({"exit_code":4})"}), session_closed_error);
        CHECK_THROWS_AS(a.wait(), session_closed_error);
        CHECK_THROWS_AS(b.wait(), session_closed_error);
        CHECK(std::chrono::steady_clock::now() - started < 5s);

        CHECK(c.pending_count() == 0U);
        CHECK_THROWS_AS(c.call("ping"), session_closed_error);
        CHECK(detail::eventually([&] { return c.state() == session_state::closed; }));
    }

    TEST_CASE("007: close fails pending calls and is idempotent", "[007][closed]") {
        client c{detail::peer_config()};
        c.start();
        (void)c.initialize();

        auto pending = c.call_tool_async("silent");
        c.close();
        CHECK(c.state() == session_state::closed);
        try {
            (void)pending.wait();
            FAIL("expected session_closed_error");
        } catch (const session_closed_error& e) {
            // a requested close is not reported as the server ending the stream
            CHECK(std::string_view{e.what()} == "session closed"sv);
        }

        c.close();
        CHECK(c.state() == session_state::closed);
        CHECK_THROWS_AS(c.call_tool("echo", detail::echo_args("x")), session_closed_error);
    }

    TEST_CASE("007: malformed output is skipped without failing calls", "[007][parse]") {
        client c{detail::peer_config()};
        detail::error_log errors{};
        errors.attach(c);
        c.start();
        (void)c.initialize();

        CHECK(c.call_tool("garbage").text() == "after garbage");
        CHECK(errors.count(error_kind::parse) == 1U);
        CHECK(c.state() == session_state::running);
    }

    TEST_CASE("007: unknown response ids are reported as orphans", "[007][parse]") {
        client c{detail::peer_config()};
        detail::error_log errors{};
        errors.attach(c);
        c.start();
        (void)c.initialize();

        CHECK(c.call_tool("orphan").text() == "after orphan");
        CHECK(errors.contains(error_kind::protocol, "987654"));
        CHECK(c.pending_count() == 0U);
    }

    TEST_CASE("007: captured stderr is logged, not parsed", "[007][stderr]") {
        detail::log_capture capture{log_level::info};
        {
            auto cfg = detail::peer_config();
            cfg.capture_stderr = true;
            client c{cfg};
            detail::error_log errors{};
            errors.attach(c);
            c.start();
            (void)c.initialize();

            CHECK(c.call_tool("stderr", detail::echo_args("disk nearly full")).text() == "after stderr");
            c.close();
            CHECK(errors.count(error_kind::parse) == 0U);
        }
        CHECK(capture.text().find("peer: diagnostic: disk nearly full") != std::string::npos);
    }

}  // namespace tether::test
