#include "vexdoc/server.hpp"
#include "vexdoc/codec.hpp"
#include "vexdoc/context.hpp"
#include "vexdoc/error.hpp"
#include "vexdoc/log.hpp"
#include "vexdoc/registry.hpp"
#include "vexdoc/router.hpp"
#include "vexdoc/schema.hpp"
#include "vexdoc/version.hpp"
#include "vexdoc/transport/stdio_transport.hpp"
#include "vexdoc/transport/http_transport.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vexdoc {

namespace {

constexpr std::string_view COMPONENT = "server";

} // anonymous namespace

std::string to_string(ServerState state) {
    switch (state) {
        case ServerState::Created:  return "created";
        case ServerState::Running:  return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Stopped:  return "stopped";
    }
    return "unknown";
}

// ----------- In-flight call -----------

struct InFlightCall {
    RequestId id;
    std::string tool;
    std::shared_ptr<CallContext> ctx;
    std::atomic<bool> answered{false};

    InFlightCall(RequestId i, std::string t, std::shared_ptr<CallContext> c)
        : id(std::move(i)), tool(std::move(t)), ctx(std::move(c)) {}
};

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    ToolRegistry registry;
    Session session;
    Router router;

    std::mutex state_mutex;
    std::atomic<ServerState> state{ServerState::Created};
    // Set while Running, guarded by state_mutex; stop() must not wait on writes.
    ITransport* interrupt_target{nullptr};

    // Transport reference for sending outbound messages
    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> write_failed{false};
    std::exception_ptr write_error;

    // Thread pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    bool pool_running{false};

    // Calls waiting for an answer, keyed by request_id_key()
    std::mutex calls_mutex;
    std::condition_variable calls_cv;
    std::unordered_map<std::string, std::shared_ptr<InFlightCall>> in_flight;
    std::thread watchdog;
    bool watchdog_running{false};

    explicit Impl(Options o) : opts(std::move(o)) {
        if (opts.server_info.name.empty()) opts.server_info.name = std::string(SERVER_NAME);
        if (opts.server_info.version.empty()) opts.server_info.version = std::string(SERVER_VERSION);
        if (opts.thread_pool_size < 1) opts.thread_pool_size = 1;
    }

    void start_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = true;
        }
        for (int i = 0; i < opts.thread_pool_size; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        if (!pool_running && task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    task();
                }
            });
        }
    }

    // Queued tasks still run; their contexts are cancelled by then.
    void stop_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = false;
        }
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
        }
        pool_cv.notify_one();
    }

    // A failed write is fatal: record it and stop reading.
    bool send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport || write_failed) return false;
        try {
            transport->write(msg);
            return true;
        } catch (const TransportError& e) {
            log_error(COMPONENT, std::string("transport write failed, shutting down: ") + e.what());
            write_failed = true;
            write_error = std::current_exception();
            transport->interrupt();
            return false;
        }
    }

    // Exactly one response per call: whoever flips `answered` first sends it.
    bool finish_call(const std::shared_ptr<InFlightCall>& call, JsonRpcResponse response) {
        if (call->answered.exchange(true)) return false;
        {
            std::lock_guard<std::mutex> lock(calls_mutex);
            auto it = in_flight.find(request_id_key(call->id));
            if (it != in_flight.end() && it->second == call) in_flight.erase(it);
        }
        calls_cv.notify_all();
        send_message(response);
        return true;
    }

    void run_call(const std::shared_ptr<InFlightCall>& call, ITool* tool,
                  const nlohmann::json& arguments) {
        if (call->ctx->cancelled()) return;

        JsonRpcResponse response;
        try {
            ToolResult result = tool->execute(*call->ctx, arguments);
            nlohmann::json j;
            to_json(j, result);
            response = JsonRpcResponse::success(call->id, std::move(j));
        } catch (const std::exception& e) {
            if (call->answered) {
                log_debug(COMPONENT, "tool '" + call->tool + "' stopped after its call was answered: " + e.what());
                return;
            }
            log_error(COMPONENT, "tool '" + call->tool + "' failed on request " +
                                 to_string(call->id) + ": " + e.what());
            response = JsonRpcResponse::failure(call->id, JsonRpcError{
                error::InternalError, "Tool execution failed", nlohmann::json{{"tool", call->tool}}});
        } catch (...) {
            log_error(COMPONENT, "tool '" + call->tool + "' threw a non-standard exception on request " +
                                 to_string(call->id));
            response = JsonRpcResponse::failure(call->id, JsonRpcError{
                error::InternalError, "Tool execution failed", nlohmann::json{{"tool", call->tool}}});
        }

        if (!finish_call(call, std::move(response))) {
            log_debug(COMPONENT, "discarding late result of '" + call->tool + "' for request " +
                                 to_string(call->id));
        }
    }

    std::optional<JsonRpcError> handle_tools_call(const RequestId& id, const nlohmann::json& params) {
        if (!params.is_object()) {
            return JsonRpcError{error::InvalidParams, "Invalid params: expected an object", std::nullopt};
        }
        auto name_it = params.find("name");
        if (name_it == params.end() || !name_it->is_string()) {
            return JsonRpcError{error::InvalidParams, "Invalid params: missing tool name", std::nullopt};
        }
        const std::string name = name_it->get<std::string>();

        ITool* tool = registry.find(name);
        if (!tool) {
            return JsonRpcError{error::InvalidParams, "Unknown tool: " + name, std::nullopt};
        }

        nlohmann::json arguments = nlohmann::json::object();
        if (auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
            if (!args_it->is_object()) {
                return JsonRpcError{error::InvalidParams,
                                    "Invalid params: arguments must be an object", std::nullopt};
            }
            arguments = *args_it;
        }

        if (auto violation = validate_schema(tool->input_schema(), arguments)) {
            return JsonRpcError{error::InvalidParams, "Invalid arguments: " + violation->describe(),
                                nlohmann::json{{"tool", name}, {"path", violation->path}}};
        }

        auto deadline = CallContext::Clock::time_point::max();
        if (opts.call_timeout.count() > 0) {
            deadline = CallContext::Clock::now() + opts.call_timeout;
        }
        auto call = std::make_shared<InFlightCall>(
            id, name, std::make_shared<CallContext>(id, name, deadline));
        {
            std::lock_guard<std::mutex> lock(calls_mutex);
            if (!in_flight.emplace(request_id_key(id), call).second) {
                return JsonRpcError{error::InvalidRequest,
                                    "Duplicate request id: " + to_string(id), std::nullopt};
            }
        }
        calls_cv.notify_all();

        dispatch_to_pool([this, call, tool, arguments = std::move(arguments)] {
            run_call(call, tool, arguments);
        });
        return std::nullopt;
    }

    void handle_cancelled(const nlohmann::json& params) {
        if (!params.is_object() || !params.contains("requestId")) {
            log_debug(COMPONENT, "cancellation without requestId ignored");
            return;
        }
        RequestId id;
        from_json(params.at("requestId"), id);
        std::string reason = params.value("reason", std::string());

        std::shared_ptr<InFlightCall> call;
        {
            std::lock_guard<std::mutex> lock(calls_mutex);
            auto it = in_flight.find(request_id_key(id));
            if (it != in_flight.end()) call = it->second;
        }
        if (!call) {
            log_debug(COMPONENT, "cancellation for unknown request " + to_string(id));
            return;
        }

        std::optional<nlohmann::json> data;
        if (!reason.empty()) data = nlohmann::json{{"reason", reason}};
        if (finish_call(call, JsonRpcResponse::failure(id, JsonRpcError{
                error::InternalError, "Request cancelled", std::move(data)}))) {
            call->ctx->cancel(CancelReason::Cancelled);
            log_info(COMPONENT, "cancelled request " + to_string(id) + " ('" + call->tool + "')");
        }
    }

    // ---- Watchdog: answers calls that outlive their deadline ----

    void start_watchdog() {
        {
            std::lock_guard<std::mutex> lock(calls_mutex);
            watchdog_running = true;
        }
        watchdog = std::thread([this] { watchdog_loop(); });
    }

    void stop_watchdog() {
        {
            std::lock_guard<std::mutex> lock(calls_mutex);
            watchdog_running = false;
        }
        calls_cv.notify_all();
        if (watchdog.joinable()) watchdog.join();
    }

    void watchdog_loop() {
        std::unique_lock<std::mutex> lock(calls_mutex);
        while (watchdog_running) {
            const auto now = CallContext::Clock::now();
            auto next = CallContext::Clock::time_point::max();
            std::vector<std::shared_ptr<InFlightCall>> expired;
            for (const auto& [key, call] : in_flight) {
                auto deadline = call->ctx->deadline();
                if (deadline <= now) {
                    expired.push_back(call);
                } else {
                    next = std::min(next, deadline);
                }
            }

            if (!expired.empty()) {
                lock.unlock();
                for (const auto& call : expired) {
                    JsonRpcError err{error::InternalError, "Tool execution timed out",
                                     nlohmann::json{{"tool", call->tool},
                                                    {"timeoutMs", opts.call_timeout.count()}}};
                    if (finish_call(call, JsonRpcResponse::failure(call->id, std::move(err)))) {
                        call->ctx->cancel(CancelReason::Timeout);
                        log_warn(COMPONENT, "tool '" + call->tool + "' timed out on request " +
                                            to_string(call->id));
                    }
                }
                lock.lock();
                continue;
            }

            if (next == CallContext::Clock::time_point::max()) {
                calls_cv.wait(lock);
            } else {
                calls_cv.wait_until(lock, next);
            }
        }
    }

    // ---- Method table ----

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object()) {
                return JsonRpcError{error::InvalidParams, "Invalid params: expected an object", std::nullopt};
            }
            InitializeParams init;
            try {
                init = params.get<InitializeParams>();
            } catch (const nlohmann::json::exception& e) {
                log_debug(COMPONENT, std::string("bad initialize params: ") + e.what());
                return JsonRpcError{error::InvalidParams, "Invalid initialize params", std::nullopt};
            }

            if (session.state() != SessionState::Uninitialized) {
                log_warn(COMPONENT, "client sent initialize more than once");
            }
            // Only one protocol revision is spoken; the client's is recorded for logs.
            session.begin(init, std::string(PROTOCOL_VERSION));
            log_info(COMPONENT, "initialize from " +
                     (init.client_info ? init.client_info->name + " " + init.client_info->version
                                       : std::string("unnamed client")) +
                     " (requested protocol " +
                     (init.protocol_version.empty() ? std::string("unspecified") : init.protocol_version) + ")");

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities.tools = nlohmann::json{{"listChanged", false}};
            result.server_info = opts.server_info;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            session.set_state(SessionState::Ready);
        });

        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            handle_cancelled(params);
        });

        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json tools = nlohmann::json::array();
            for (const auto& descriptor : registry.list()) {
                tools.push_back(descriptor);
            }
            return nlohmann::json{{"tools", std::move(tools)}};
        });

        router.on_deferred_request("tools/call", [this](const RequestId& id, const nlohmann::json& params) {
            return handle_tools_call(id, params);
        });
    }

    // ---- Serve loop ----

    void on_message(const JsonRpcMessage& msg) {
        auto response = router.dispatch(msg);
        if (response) {
            send_message(*response);
        }
    }

    void read_loop(ITransport& t) {
        while (!write_failed) {
            ReadResult next = t.read();

            if (std::holds_alternative<EndOfStream>(next)) {
                log_info(COMPONENT, "end of stream");
                return;
            }

            if (const auto* failure = std::get_if<DecodeFailure>(&next)) {
                if (failure->id) {
                    log_warn(COMPONENT, "rejecting malformed request " + to_string(*failure->id) +
                                        ": " + failure->message);
                    send_message(JsonRpcResponse::failure(*failure->id, JsonRpcError{
                        failure->code, failure->message, std::nullopt}));
                    continue;
                }
                log_error(COMPONENT, "undecodable message without an id, closing stream: " +
                                     failure->message);
                return;
            }

            on_message(std::get<JsonRpcMessage>(next));
        }
    }

    void drain() {
        std::vector<std::shared_ptr<InFlightCall>> remaining;
        {
            std::unique_lock<std::mutex> lock(calls_mutex);
            calls_cv.wait_for(lock, opts.drain_timeout, [this] { return in_flight.empty(); });
            for (const auto& [key, call] : in_flight) remaining.push_back(call);
        }
        for (const auto& call : remaining) {
            if (finish_call(call, JsonRpcResponse::failure(call->id, JsonRpcError{
                    error::InternalError, "Server shutting down", std::nullopt}))) {
                call->ctx->cancel(CancelReason::Shutdown);
            }
        }
        if (!remaining.empty()) {
            log_warn(COMPONENT, "cancelled " + std::to_string(remaining.size()) +
                                " call(s) still running at shutdown");
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer() : McpServer(Options{}) {}

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() {
    if (impl_) {
        impl_->stop_watchdog();
        impl_->stop_thread_pool();
    }
}

void McpServer::register_tool(std::unique_ptr<ITool> tool) {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->registry.add(std::move(tool));
}

std::vector<ToolDescriptor> McpServer::tools() const {
    return impl_->registry.list();
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("serve() requires a transport");
    }
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        auto current = impl_->state.load();
        if (current == ServerState::Stopped) {
            log_info(COMPONENT, "serve() after stop(), closing transport");
            transport->close();
            return;
        }
        if (current != ServerState::Created) {
            throw std::logic_error("serve() called while server is " + to_string(current));
        }
        impl_->registry.freeze();
        {
            std::lock_guard<std::mutex> tlock(impl_->transport_mutex);
            impl_->transport = transport.get();
        }
        impl_->interrupt_target = transport.get();
        impl_->state = ServerState::Running;
    }
    log_info(COMPONENT, "serving " + std::to_string(impl_->registry.size()) + " tool(s)");

    impl_->start_thread_pool();
    impl_->start_watchdog();

    std::exception_ptr read_error;
    try {
        impl_->read_loop(*transport);
    } catch (const std::exception& e) {
        log_error(COMPONENT, std::string("transport read failed: ") + e.what());
        read_error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->state = ServerState::Stopping;
        impl_->interrupt_target = nullptr;
    }
    transport->interrupt();
    impl_->drain();
    impl_->stop_watchdog();
    impl_->stop_thread_pool();

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    transport->close();
    impl_->session.set_state(SessionState::Closed);
    impl_->state = ServerState::Stopped;
    log_info(COMPONENT, "stopped");

    if (read_error) std::rethrow_exception(read_error);
    if (impl_->write_error) std::rethrow_exception(impl_->write_error);
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_http(const std::string& host, uint16_t port) {
    HttpServerTransport::Options opts;
    opts.host = host;
    opts.port = port;
    serve(std::make_unique<HttpServerTransport>(opts));
}

void McpServer::stop() {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    switch (impl_->state.load()) {
        case ServerState::Created:
            impl_->registry.freeze();
            impl_->state = ServerState::Stopped;
            return;
        case ServerState::Running: {
            log_info(COMPONENT, "stop requested");
            if (impl_->interrupt_target) impl_->interrupt_target->interrupt();
            return;
        }
        case ServerState::Stopping:
        case ServerState::Stopped:
            return;
    }
}

ServerState McpServer::state() const {
    return impl_->state.load();
}

bool McpServer::is_running() const {
    return impl_->state.load() == ServerState::Running;
}

SessionState McpServer::session_state() const {
    return impl_->session.state();
}

} // namespace vexdoc
