#include "tether/client.hpp"

#include "tether/format.hpp"
#include "tether/log.hpp"

#include <glaze/ext/jsonrpc.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <set>
#include <stdexcept>

using namespace tether::literals;

namespace tether {

    namespace detail {

        std::shared_ptr<pending_request> call_table::open(std::string method) {
            std::lock_guard lock{mutex_};
            if (closed_) {
                throw session_closed_error{"session closed, cannot issue '{}'"_format(method)};
            }
            auto request = std::make_shared<pending_request>();
            request->id = next_id_++;
            request->method = std::move(method);
            request->created_at = std::chrono::steady_clock::now();
            pending_.emplace(request->id, request);
            return request;
        }

        std::shared_ptr<pending_request> call_table::take(std::int64_t id) {
            std::lock_guard lock{mutex_};
            auto it = pending_.find(id);
            if (it == pending_.end()) {
                return nullptr;
            }
            auto request = std::move(it->second);
            pending_.erase(it);
            return request;
        }

        std::vector<std::shared_ptr<pending_request>> call_table::close() {
            std::lock_guard lock{mutex_};
            closed_ = true;
            std::vector<std::shared_ptr<pending_request>> drained{};
            drained.reserve(pending_.size());
            for (auto& [id, request] : pending_) {
                drained.push_back(std::move(request));
            }
            pending_.clear();
            return drained;
        }

        bool call_table::closed() const {
            std::lock_guard lock{mutex_};
            return closed_;
        }

        std::size_t call_table::size() const {
            std::lock_guard lock{mutex_};
            return pending_.size();
        }

        static constexpr auto method_not_found_code = static_cast<std::int64_t>(glz::rpc::error_e::method_not_found);

    }  // namespace detail

    // ── pending_call ────────────────────────────────────────────────

    pending_call::pending_call(
            std::shared_ptr<detail::call_table> table,
            std::shared_ptr<detail::pending_request> request,
            std::chrono::milliseconds timeout)
            : table_{std::move(table)},
              request_{std::move(request)},
              future_{request_->promise.get_future()},
              id_{request_->id},
              timeout_{timeout},
              deadline_{request_->created_at + timeout} {}

    pending_call::~pending_call() {
        release();
    }

    pending_call& pending_call::operator=(pending_call&& other) noexcept {
        if (this != &other) {
            release();
            table_ = std::move(other.table_);
            request_ = std::move(other.request_);
            future_ = std::move(other.future_);
            id_ = other.id_;
            timeout_ = other.timeout_;
            deadline_ = other.deadline_;
        }
        return *this;
    }

    // an unconsumed future means nobody has collected the outcome yet
    void pending_call::release() noexcept {
        if (table_ && future_.valid()) {
            (void)table_->take(id_);
        }
    }

    glz::raw_json pending_call::wait() {
        if (!future_.valid()) {
            throw std::logic_error("pending_call {} has already been waited on"_format(id_));
        }

        if (future_.wait_until(deadline_) == std::future_status::timeout) {
            // losing the race to the reader means the response is already in the future
            if (table_->take(id_)) {
                future_ = {};
                log_debug{"request ", id_, " (", request_->method, ") timed out"};
                throw timeout_error{id_, timeout_};
            }
        }
        return future_.get();
    }

    bool pending_call::cancel() {
        if (!table_) {
            return false;
        }
        auto request = table_->take(id_);
        if (!request) {
            return false;
        }
        request->promise.set_exception(std::make_exception_ptr(cancelled_error{id_}));
        return true;
    }

    // ── client ──────────────────────────────────────────────────────

    client::client(client_config cfg)
            : cfg_{std::move(cfg)},
              table_{std::make_shared<detail::call_table>()},
              transport_{
                      transport_options{
                              .argv = server_argv(cfg_),
                              .env = server_environment(cfg_),
                              .working_dir = cfg_.working_dir,
                              .capture_stderr = cfg_.capture_stderr,
                              .max_message_bytes = cfg_.max_message_bytes,
                              .stop_grace = std::chrono::milliseconds{cfg_.stop_grace_ms}},
                      transport_handlers{
                              .on_message = [this](message msg) { handle_message(std::move(msg)); },
                              .on_parse_error = [this](const parse_error& err) { report(err); },
                              .on_end_of_stream = [this] { handle_end_of_stream(); },
                              .on_stderr_line = {}}} {}

    client::~client() {
        close();
    }

    void client::on_notification(notification_handler handler) {
        notification_handler_ = std::move(handler);
    }

    void client::on_error(error_handler handler) {
        error_handler_ = std::move(handler);
    }

    void client::start() {
        try {
            transport_.start();
        } catch (const launch_error&) {
            (void)table_->close();
            throw;
        }
    }

    bool client::initialized() const {
        std::lock_guard lock{handshake_mutex_};
        return initialized_;
    }

    void client::require_initialized() const {
        if (!initialized()) {
            throw handshake_error{"session is not initialized, call initialize() first"};
        }
    }

    const protocol::initialize_result& client::initialize() {
        std::lock_guard lock{handshake_mutex_};
        if (initialize_attempted_) {
            throw handshake_error{
                    initialized_ ? "session is already initialized" : "initialize already failed on this session"};
        }
        initialize_attempted_ = true;

        protocol::initialize_params params{
                .protocolVersion = cfg_.protocol_version,
                .capabilities = glz::raw_json{"{}"},
                .clientInfo = protocol::implementation_info{.name = cfg_.client_name, .version = cfg_.client_version}};

        glz::raw_json raw{};
        try {
            raw = call(protocol::method::initialize,
                       to_raw_json(params),
                       std::chrono::milliseconds{cfg_.handshake_timeout_ms});
        } catch (const remote_error& e) {
            throw handshake_error{"server rejected initialize: {}"_format(e.what())};
        } catch (const error& e) {
            throw handshake_error{"initialize failed: {}"_format(e.what())};
        }

        protocol::initialize_result result{};
        try {
            result = protocol::decode_initialize_result(raw);
        } catch (const protocol_error& e) {
            throw handshake_error{"initialize failed: {}"_format(e.what())};
        }

        if (result.protocolVersion != cfg_.protocol_version) {
            log_info{"server answered with protocol version ", result.protocolVersion, " (requested ",
                     cfg_.protocol_version, ")"};
        }

        try {
            notify(protocol::method::initialized);
        } catch (const write_error& e) {
            throw handshake_error{"initialized notification failed: {}"_format(e.what())};
        }

        log_info{"connected to ", result.serverInfo.name, ' ', result.serverInfo.version};
        server_ = std::move(result);
        initialized_ = true;
        return *server_;
    }

    std::vector<protocol::tool_definition> client::list_tools(std::optional<std::chrono::milliseconds> timeout) {
        require_initialized();

        std::vector<protocol::tool_definition> all{};
        std::set<std::string> seen_cursors{};
        std::optional<std::string> cursor{};

        for (;;) {
            std::optional<glz::raw_json> params{};
            if (cursor) {
                params = to_raw_json(protocol::tools_list_params{.cursor = cursor});
            }

            auto page = protocol::decode_tools_list_result(call(protocol::method::tools_list, params, timeout));
            std::ranges::move(page.tools, std::back_inserter(all));

            if (!page.nextCursor || page.nextCursor->empty()) {
                break;
            }
            if (!seen_cursors.insert(*page.nextCursor).second) {
                throw protocol_error{"tools/list repeated cursor '{}'"_format(*page.nextCursor)};
            }
            cursor = std::move(page.nextCursor);
        }

        log_debug{"server offers ", all.size(), " tools"};
        {
            std::lock_guard lock{handshake_mutex_};
            tools_ = all;
        }
        return all;
    }

    std::vector<protocol::tool_definition> client::tools() const {
        std::lock_guard lock{handshake_mutex_};
        return tools_;
    }

    bool client::has_tool(std::string_view name) const {
        std::lock_guard lock{handshake_mutex_};
        return std::ranges::any_of(tools_, [name](const auto& tool) { return tool.name == name; });
    }

    protocol::tool_call_result client::call_tool(
            std::string_view name, glz::raw_json arguments, std::optional<std::chrono::milliseconds> timeout) {
        auto raw = call_tool_async(name, std::move(arguments), timeout).wait();
        return protocol::decode_tool_call_result(raw);
    }

    pending_call client::call_tool_async(
            std::string_view name, glz::raw_json arguments, std::optional<std::chrono::milliseconds> timeout) {
        require_initialized();
        if (utils::trim_view(arguments.str).empty()) {
            arguments = glz::raw_json{"{}"};
        }
        auto params = to_raw_json(
                protocol::tool_call_params{.name = std::string{name}, .arguments = std::move(arguments)});
        return call_async(protocol::method::tools_call, std::move(params), timeout);
    }

    glz::raw_json client::call(
            std::string_view method,
            std::optional<glz::raw_json> params,
            std::optional<std::chrono::milliseconds> timeout) {
        return call_async(method, std::move(params), timeout).wait();
    }

    pending_call client::call_async(
            std::string_view method,
            std::optional<glz::raw_json> params,
            std::optional<std::chrono::milliseconds> timeout) {
        auto effective = timeout.value_or(std::chrono::milliseconds{cfg_.request_timeout_ms});
        auto request = table_->open(std::string{method});
        pending_call handle{table_, request, effective};

        try {
            transport_.send(make_request(request->id, std::string{method}, std::move(params)), handle.deadline());
        } catch (const write_error&) {
            (void)table_->take(request->id);
            if (std::chrono::steady_clock::now() >= handle.deadline()) {
                log_debug{"request ", request->id, " (", method, ") timed out while being written"};
                throw timeout_error{request->id, effective};
            }
            throw;
        }
        return handle;
    }

    void client::notify(std::string_view method, std::optional<glz::raw_json> params) {
        transport_.send(make_notification(std::string{method}, std::move(params)), write_deadline());
    }

    std::chrono::steady_clock::time_point client::write_deadline() const {
        return std::chrono::steady_clock::now() + std::chrono::milliseconds{cfg_.request_timeout_ms};
    }

    void client::close() {
        transport_.stop();
        fail_pending("session closed");
    }

    void client::fail_pending(const std::string& reason) {
        auto pending = table_->close();
        if (pending.empty()) {
            return;
        }
        log_warn{"failing ", pending.size(), " pending request(s): ", reason};
        for (auto& request : pending) {
            request->promise.set_exception(std::make_exception_ptr(session_closed_error{reason}));
        }
    }

    void client::report(const error& err) {
        log_warn{to_string(err.kind()), " error: ", err.what()};
        if (!error_handler_) {
            return;
        }
        try {
            error_handler_(err);
        } catch (const std::exception& e) {
            log_error{"error handler threw: ", e.what()};
        }
    }

    void client::handle_end_of_stream() {
        fail_pending("session closed: server ended the stream");
    }

    void client::handle_peer_request(const message& msg) {
        message reply{};
        reply.id = msg.id;
        reply.raw_id = msg.raw_id;
        if (*msg.method == protocol::method::ping) {
            reply.result = glz::raw_json{"{}"};
        }
        else {
            reply.error =
                    rpc_error{.code = detail::method_not_found_code, .message = "Method not found: " + *msg.method};
        }

        // bounded, so a peer that is itself blocked writing cannot stall the reader for good
        try {
            transport_.send(reply, write_deadline());
        } catch (const write_error& e) {
            log_warn{"could not answer server request '", *msg.method, "': ", e.what()};
        }
    }

    void client::handle_message(message msg) {
        if (msg.jsonrpc != jsonrpc_version) {
            report(protocol_error{"unexpected jsonrpc version '{}'"_format(msg.jsonrpc)});
        }

        if (msg.method) {
            if (msg.has_id()) {
                handle_peer_request(msg);
                return;
            }
            if (!notification_handler_) {
                log_debug{"dropping notification ", *msg.method};
                return;
            }
            try {
                notification_handler_(msg);
            } catch (const std::exception& e) {
                log_error{"notification handler threw: ", e.what()};
            }
            return;
        }

        if (!msg.id) {
            if (msg.raw_id) {
                report(protocol_error{"response with non-integer id {}"_format(*msg.raw_id)});
            }
            else {
                report(protocol_error{"message has neither a method nor an id"});
            }
            return;
        }

        auto request = table_->take(*msg.id);
        if (!request) {
            report(protocol_error{"orphan response for id {}"_format(*msg.id)});
            return;
        }

        if (msg.error) {
            std::optional<std::string> data{};
            if (msg.error->data) {
                data = msg.error->data->str;
            }
            request->promise.set_exception(
                    std::make_exception_ptr(remote_error{msg.error->code, msg.error->message, std::move(data)}));
            return;
        }

        request->promise.set_value(msg.result ? std::move(*msg.result) : glz::raw_json{"null"});
    }

}  // namespace tether
