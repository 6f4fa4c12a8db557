#include "utils.hpp"

namespace tether::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {

        // collects everything a transport_session reports from its reader thread
        struct recorder {
            std::mutex mutex{};
            std::vector<message> messages{};
            std::vector<std::string> parse_errors{};
            std::vector<std::string> stderr_lines{};
            std::atomic<int> end_of_stream{0};

            transport_handlers handlers() {
                return transport_handlers{
                        .on_message =
                                [this](message msg) {
                                    std::lock_guard lock{mutex};
                                    messages.push_back(std::move(msg));
                                },
                        .on_parse_error =
                                [this](const parse_error& e) {
                                    std::lock_guard lock{mutex};
                                    parse_errors.emplace_back(e.what());
                                },
                        .on_end_of_stream = [this] { end_of_stream.fetch_add(1); },
                        .on_stderr_line =
                                [this](std::string_view line) {
                                    std::lock_guard lock{mutex};
                                    stderr_lines.emplace_back(line);
                                }};
            }

            std::size_t message_count() {
                std::lock_guard lock{mutex};
                return messages.size();
            }

            std::size_t parse_error_count() {
                std::lock_guard lock{mutex};
                return parse_errors.size();
            }
        };

        // params object whose encoded size is about `bytes`
        static glz::raw_json bulk_params(std::size_t bytes) {
            return glz::raw_json{R"({"payload":")" + std::string(bytes, 'x') + "\"}"};
        }

        static transport_options shell(std::string script) {
            return transport_options{.argv = {"/bin/sh", "-c", std::move(script)}, .stop_grace = 500ms};
        }

    }  // namespace detail

    TEST_CASE("004: transport round trip with the test peer", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{transport_options{.argv = {TETHER_TEST_PEER_PATH}}, rec.handlers()};
        CHECK(session.state() == session_state::not_started);

        session.start();
        CHECK(session.state() == session_state::running);
        CHECK(session.pid() > 0);

        session.send(make_request(1, "ping"));
        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));

        {
            std::lock_guard lock{rec.mutex};
            CHECK(rec.messages[0].id == std::optional<std::int64_t>{1});
            REQUIRE(rec.messages[0].result.has_value());
            CHECK(rec.messages[0].result->str == "{}");
        }

        session.stop();
        CHECK(session.state() == session_state::closed);
        CHECK(session.exit_code().has_value());
    }

    TEST_CASE("004: launch failure surfaces from start", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{transport_options{.argv = {"/nonexistent/tether-missing-server"}}, rec.handlers()};

        CHECK_THROWS_AS(session.start(), launch_error);
        CHECK(session.state() == session_state::closed);
        CHECK_THROWS_AS(session.send(make_notification("x")), write_error);
        session.stop();
    }

    TEST_CASE("004: a session cannot be started twice", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{detail::shell("cat"), rec.handlers()};

        CHECK_THROWS_AS(session.send(make_notification("early")), write_error);
        session.start();
        CHECK_THROWS_AS(session.start(), launch_error);
        session.stop();
        CHECK_THROWS_AS(session.start(), launch_error);
    }

    TEST_CASE("004: malformed lines are reported and reading continues", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{
                detail::shell(R"(printf 'not json\n{"jsonrpc":"2.0","method":"hello"}\n'; sleep 5)"), rec.handlers()};
        session.start();

        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));
        CHECK(rec.parse_error_count() == 1U);
        {
            std::lock_guard lock{rec.mutex};
            CHECK(rec.messages[0].method == std::optional<std::string>{"hello"});
        }
        session.stop();
    }

    TEST_CASE("004: end of stream is signalled once with trailing bytes reported", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{
                detail::shell(R"(printf '{"jsonrpc":"2.0","method":"a"}\n{"jsonrpc":"2.0",')"), rec.handlers()};
        session.start();

        REQUIRE(detail::eventually([&] { return rec.end_of_stream.load() == 1; }));
        CHECK(rec.message_count() == 1U);
        {
            std::lock_guard lock{rec.mutex};
            REQUIRE(rec.parse_errors.size() == 1U);
            CHECK(rec.parse_errors[0].find("truncated") != std::string::npos);
        }
        CHECK_THROWS_AS(session.send(make_notification("late")), write_error);

        // the reader reaps a peer that exited on its own
        REQUIRE(detail::eventually([&] { return session.state() == session_state::closed; }));
        CHECK(session.exit_code() == std::optional<int>{0});

        session.stop();
        session.stop();
        CHECK(session.state() == session_state::closed);
        CHECK(rec.end_of_stream.load() == 1);
        CHECK(session.exit_code() == std::optional<int>{0});
    }

    TEST_CASE("004: a requested stop does not signal end of stream", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{detail::shell("cat"), rec.handlers()};
        session.start();

        session.send(make_notification("hello"));
        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));

        session.stop();
        CHECK(session.state() == session_state::closed);
        CHECK(rec.end_of_stream.load() == 0);
    }

    TEST_CASE("004: oversized messages are dropped", "[004][transport]") {
        detail::recorder rec{};
        auto opts = detail::shell(
                R"(head -c 5000 /dev/zero | tr '\0' 'x'; printf '\n{"jsonrpc":"2.0","method":"after"}\n'; sleep 5)");
        opts.max_message_bytes = 1024U;
        transport_session session{std::move(opts), rec.handlers()};
        session.start();

        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));
        CHECK(rec.parse_error_count() == 1U);
        session.stop();
    }

    TEST_CASE("004: environment, working directory and stderr capture", "[004][transport]") {
        detail::temp_dir dir{"tether_004_cwd"};
        detail::recorder rec{};
        auto opts = detail::shell(
                R"(echo "diag line" >&2; )"
                R"(printf '{"jsonrpc":"2.0","method":"env","params":{"v":"%s","cwd":"%s"}}\n' )"
                R"("$TETHER_TEST_VALUE" "$(pwd)";)"
                R"( sleep 5)");
        opts.env = {{"TETHER_TEST_VALUE", "forty-two"}};
        opts.working_dir = dir.path;
        opts.capture_stderr = true;

        transport_session session{std::move(opts), rec.handlers()};
        session.start();

        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));
        REQUIRE(detail::eventually([&] {
            std::lock_guard lock{rec.mutex};
            return !rec.stderr_lines.empty();
        }));

        {
            std::lock_guard lock{rec.mutex};
            REQUIRE(rec.messages[0].params.has_value());
            const auto& params = rec.messages[0].params->str;
            CHECK(params.find("forty-two") != std::string::npos);
            CHECK(params.find(std::filesystem::canonical(dir.path).string()) != std::string::npos);
            CHECK(rec.stderr_lines[0] == "diag line");
        }
        session.stop();
    }

    TEST_CASE("004: stop escalates to SIGKILL for a peer ignoring SIGTERM", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{
                transport_options{
                        .argv = {TETHER_TEST_PEER_PATH, "--ignore-sigterm", "--linger"}, .stop_grace = 200ms},
                rec.handlers()};
        session.start();

        // SIGTERM is only ignored once the peer is up and answering
        session.send(make_request(1, "ping"));
        REQUIRE(detail::eventually([&] { return rec.message_count() == 1U; }));

        auto started = std::chrono::steady_clock::now();
        session.stop();
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(session.state() == session_state::closed);
        CHECK(session.exit_code() == std::optional<int>{128 + SIGKILL});
        CHECK(elapsed < 5s);
    }

    TEST_CASE("004: stop does not wait behind a write the peer never reads", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{detail::shell("exec sleep 30"), rec.handlers()};
        session.start();

        std::atomic<bool> write_failed{false};
        std::thread writer{[&] {
            try {
                session.send(make_notification("bulk", detail::bulk_params(1U << 20U)));
            } catch (const write_error&) {
                write_failed = true;
            }
        }};
        // long enough for the pipe buffer to fill and the writer to wait for room
        std::this_thread::sleep_for(100ms);

        auto started = std::chrono::steady_clock::now();
        session.stop();
        auto elapsed = std::chrono::steady_clock::now() - started;
        writer.join();

        CHECK(write_failed.load());
        CHECK(session.state() == session_state::closed);
        CHECK(session.exit_code().has_value());
        CHECK(elapsed < 2s);
    }

    TEST_CASE("004: a write past its deadline fails and the session refuses further writes",
              "[004][transport]") {
        detail::recorder rec{};
        transport_session session{detail::shell("exec sleep 30"), rec.handlers()};
        session.start();

        auto started = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(
                session.send(make_notification("bulk", detail::bulk_params(1U << 20U)), started + 200ms),
                write_error);
        auto elapsed = std::chrono::steady_clock::now() - started;
        CHECK(elapsed >= 200ms);
        CHECK(elapsed < 5s);

        // part of the line is already in the pipe, nothing may follow it
        CHECK(session.state() == session_state::running);
        CHECK_THROWS_AS(session.send(make_notification("small")), write_error);
        session.stop();
    }

    TEST_CASE("004: writing to a peer that closed its input leaves SIGPIPE handling alone", "[004][transport]") {
        struct sigaction before{};
        REQUIRE(::sigaction(SIGPIPE, nullptr, &before) == 0);

        detail::recorder rec{};
        transport_session session{detail::shell("exec 0<&-; exec sleep 30"), rec.handlers()};
        session.start();

        bool failed = detail::eventually([&] {
            try {
                session.send(make_notification("ignored"));
                return false;
            } catch (const write_error&) {
                return true;
            }
        });
        CHECK(failed);

        struct sigaction after{};
        REQUIRE(::sigaction(SIGPIPE, nullptr, &after) == 0);
        CHECK(after.sa_handler == before.sa_handler);

        sigset_t pending{};
        sigemptyset(&pending);
        REQUIRE(::sigpending(&pending) == 0);
        CHECK(sigismember(&pending, SIGPIPE) == 0);
        session.stop();
    }

    TEST_CASE("004: concurrent senders never interleave frames", "[004][transport]") {
        detail::recorder rec{};
        transport_session session{detail::shell("cat"), rec.handlers()};
        session.start();

        constexpr int threads = 8;
        constexpr int per_thread = 50;
        std::vector<std::thread> senders{};
        for (int t = 0; t < threads; ++t) {
            senders.emplace_back([&session, t] {
                for (int i = 0; i < per_thread; ++i) {
                    auto payload = std::string(512, static_cast<char>('a' + t));
                    auto params = glz::raw_json{R"({"payload":")" + payload + "\"}"};
                    session.send(make_notification("n", std::move(params)));
                }
            });
        }
        for (auto& s : senders) {
            s.join();
        }

        constexpr auto expected = static_cast<std::size_t>(threads * per_thread);
        REQUIRE(detail::eventually([&] { return rec.message_count() == expected; }));
        CHECK(rec.parse_error_count() == 0U);
        session.stop();
    }

}  // namespace tether::test
