#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "message.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tether {

    namespace detail {

        // one outstanding call; destroyed once answered, timed out, cancelled or failed by closure
        struct pending_request {
            std::int64_t id{};
            std::string method{};
            std::chrono::steady_clock::time_point created_at{};
            std::promise<glz::raw_json> promise{};
        };

        /*
         * Pending requests of one session, keyed by id.
         *
         * Callers insert, the reader thread removes; both go through one mutex, which also
         * guards the id counter and the closed flag so no request is registered after the
         * table has been drained.
         */
        class call_table {
          public:
            // throws session_closed_error once closed
            std::shared_ptr<pending_request> open(std::string method);

            // nullptr when the id is not pending
            std::shared_ptr<pending_request> take(std::int64_t id);

            // marks the table closed and hands back everything still pending
            std::vector<std::shared_ptr<pending_request>> close();

            bool closed() const;
            std::size_t size() const;

          private:
            mutable std::mutex mutex_{};
            std::unordered_map<std::int64_t, std::shared_ptr<pending_request>> pending_{};
            std::int64_t next_id_{1};
            bool closed_{false};
        };

    }  // namespace detail

    /*
     * Handle to an in-flight call.
     *
     * `wait()` blocks until the response arrives, the deadline (creation time + timeout)
     * passes, the call is cancelled or the session closes. It may be called once. A handle
     * dropped without waiting releases its request; a response that still arrives is an orphan.
     */
    class pending_call {
      public:
        pending_call(
                std::shared_ptr<detail::call_table> table,
                std::shared_ptr<detail::pending_request> request,
                std::chrono::milliseconds timeout);
        ~pending_call();

        pending_call(pending_call&&) noexcept = default;
        pending_call& operator=(pending_call&& other) noexcept;

        std::int64_t id() const { return id_; }
        std::chrono::milliseconds timeout() const { return timeout_; }
        std::chrono::steady_clock::time_point deadline() const { return deadline_; }

        // result payload exactly as the peer sent it; throws remote_error, timeout_error,
        // session_closed_error or cancelled_error
        glz::raw_json wait();

        // true if this call removed the request; a response the peer still sends is an orphan
        bool cancel();

      private:
        void release() noexcept;

        std::shared_ptr<detail::call_table> table_;
        std::shared_ptr<detail::pending_request> request_;
        std::future<glz::raw_json> future_;
        std::int64_t id_;
        std::chrono::milliseconds timeout_;
        std::chrono::steady_clock::time_point deadline_;
    };

    /*
     * Request multiplexer over a transport_session.
     *
     * Any number of threads may call concurrently; each response is delivered to the call
     * that carries its id, in whatever order the peer answers.
     */
    class client {
      public:
        using notification_handler = std::function<void(const message&)>;
        using error_handler = std::function<void(const error&)>;

        explicit client(client_config cfg);
        ~client();

        client(const client&) = delete;
        client& operator=(const client&) = delete;

        // handlers are read by the reader thread; set them before start()
        void on_notification(notification_handler handler);
        void on_error(error_handler handler);

        // launches the peer; throws launch_error
        void start();

        // initialize request + initialized notification, exactly once; throws handshake_error
        const protocol::initialize_result& initialize();

        // tools/list, following pagination; caches the result
        std::vector<protocol::tool_definition> list_tools(std::optional<std::chrono::milliseconds> timeout = {});

        // snapshot of the last list_tools() result
        std::vector<protocol::tool_definition> tools() const;
        bool has_tool(std::string_view name) const;

        protocol::tool_call_result call_tool(
                std::string_view name,
                glz::raw_json arguments = glz::raw_json{"{}"},
                std::optional<std::chrono::milliseconds> timeout = {});

        // decode the result with protocol::decode_tool_call_result
        pending_call call_tool_async(
                std::string_view name,
                glz::raw_json arguments = glz::raw_json{"{}"},
                std::optional<std::chrono::milliseconds> timeout = {});

        glz::raw_json call(
                std::string_view method,
                std::optional<glz::raw_json> params = std::nullopt,
                std::optional<std::chrono::milliseconds> timeout = {});

        pending_call call_async(
                std::string_view method,
                std::optional<glz::raw_json> params = std::nullopt,
                std::optional<std::chrono::milliseconds> timeout = {});

        // throws write_error
        void notify(std::string_view method, std::optional<glz::raw_json> params = std::nullopt);

        // stops the peer and fails every pending call with session_closed_error; idempotent
        void close();

        session_state state() const { return transport_.state(); }
        bool initialized() const;
        std::size_t pending_count() const { return table_->size(); }
        const client_config& config() const { return cfg_; }
        const std::optional<protocol::initialize_result>& server() const { return server_; }

      private:
        void handle_message(message msg);
        void handle_peer_request(const message& msg);
        void handle_end_of_stream();
        void fail_pending(const std::string& reason);
        void report(const error& err);
        void require_initialized() const;
        std::chrono::steady_clock::time_point write_deadline() const;

        client_config cfg_;
        std::shared_ptr<detail::call_table> table_;
        notification_handler notification_handler_{};
        error_handler error_handler_{};

        mutable std::mutex handshake_mutex_{};
        bool initialized_{false};
        bool initialize_attempted_{false};
        std::optional<protocol::initialize_result> server_{};
        std::vector<protocol::tool_definition> tools_{};

        transport_session transport_;
    };

}  // namespace tether
