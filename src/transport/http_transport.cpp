#include "vexdoc/transport/http_transport.hpp"
#include "vexdoc/error.hpp"
#include "vexdoc/log.hpp"
#include "vexdoc/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace vexdoc {

namespace {

constexpr std::string_view COMPONENT = "http";

std::string error_body(const std::optional<RequestId>& id, int code, const std::string& message) {
    nlohmann::json body = {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", {{"code", code}, {"message", message}}}
    };
    if (id) to_json(body["id"], *id);
    return body.dump();
}

} // anonymous namespace

// ---------- HttpServerTransport ----------

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    server_->set_payload_max_length(opts_.max_body_bytes);
    setup_routes();

    if (opts_.port == 0) {
        int bound = server_->bind_to_any_port(opts_.host);
        if (bound < 0) {
            throw TransportError("Failed to bind HTTP server on " + opts_.host);
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            throw TransportError("Failed to bind HTTP server on " + opts_.host + ":" +
                                 std::to_string(opts_.port));
        }
        port_ = opts_.port;
    }

    listen_thread_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            log_warn(COMPONENT, "listener stopped with an error");
        }
    });
    log_info(COMPONENT, "listening on " + opts_.host + ":" + std::to_string(port_) + opts_.mcp_path);
}

HttpServerTransport::~HttpServerTransport() {
    close();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
           != opts_.allowed_origins.end();
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST");
    };
    server_->Get(path, not_allowed);
    server_->Put(path, not_allowed);
    server_->Delete(path, not_allowed);
}

int64_t HttpServerTransport::register_exchange(const RequestId& original_id,
                                               std::future<Reply>& reply) {
    std::lock_guard<std::mutex> lock(exchanges_mutex_);
    if (closed_) return 0;
    auto exchange = std::make_shared<Exchange>();
    exchange->original_id = original_id;
    reply = exchange->reply.get_future();
    int64_t internal_id = next_exchange_id_++;
    exchanges_.emplace(internal_id, std::move(exchange));
    return internal_id;
}

// Cancellations name the client's id; point them at the pending exchange.
// Returns false when no single pending exchange carries that id.
bool HttpServerTransport::translate_cancellation(JsonRpcNotification& notif) {
    if (!notif.params || !notif.params->is_object() || !notif.params->contains("requestId")) {
        return false;
    }
    RequestId target;
    try {
        from_json(notif.params->at("requestId"), target);
    } catch (const std::invalid_argument&) {
        return false;
    }

    std::lock_guard<std::mutex> lock(exchanges_mutex_);
    std::optional<int64_t> match;
    for (const auto& [internal_id, exchange] : exchanges_) {
        if (exchange->original_id != target) continue;
        if (match) {
            log_warn(COMPONENT, "ignoring cancellation of " + to_string(target) +
                                ": several pending requests use that id");
            return false;
        }
        match = internal_id;
    }
    if (!match) return false;
    (*notif.params)["requestId"] = *match;
    return true;
}

void HttpServerTransport::enqueue(ReadResult item) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(std::move(item));
    }
    inbox_cv_.notify_one();
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // Validate Origin header for DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        res.status = 403;
        res.set_content("{\"error\":\"Invalid origin\"}", "application/json");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (interrupted_) {
            res.status = 503;
            res.set_content(error_body(std::nullopt, error::InternalError, "Server shutting down"),
                            "application/json");
            return;
        }
    }

    std::optional<JsonRpcMessage> msg;
    std::optional<DecodeFailure> failure;
    try {
        msg = Codec::parse(req.body);
    } catch (const ParseError& e) {
        if (!e.id) {
            log_warn(COMPONENT, std::string("rejecting undecodable body: ") + e.what());
            res.status = 400;
            res.set_content(error_body(std::nullopt, e.code, e.what()), "application/json");
            return;
        }
        failure = DecodeFailure{e.code, e.what(), e.id};
    }

    if (msg && !std::holds_alternative<JsonRpcRequest>(*msg)) {
        // Notifications and stray responses are never answered.
        res.status = 202;
        auto* notif = std::get_if<JsonRpcNotification>(&*msg);
        if (notif && notif->method == "notifications/cancelled" && !translate_cancellation(*notif)) {
            log_debug(COMPONENT, "dropping cancellation that matches no pending request");
            return;
        }
        enqueue(std::move(*msg));
        return;
    }

    const RequestId original_id = msg ? std::get<JsonRpcRequest>(*msg).id : *failure->id;
    std::future<Reply> reply;
    int64_t internal_id = register_exchange(original_id, reply);
    if (internal_id == 0) {
        res.status = 503;
        res.set_content(error_body(original_id, error::InternalError, "Server shutting down"),
                        "application/json");
        return;
    }

    if (msg) {
        std::get<JsonRpcRequest>(*msg).id = RequestId{internal_id};
        enqueue(std::move(*msg));
    } else {
        failure->id = RequestId{internal_id};
        enqueue(std::move(*failure));
    }

    if (reply.wait_for(opts_.exchange_timeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(exchanges_mutex_);
            exchanges_.erase(internal_id);
        }
        log_warn(COMPONENT, "no response for request " + to_string(original_id) +
                            " within the exchange timeout");
        res.status = 504;
        res.set_content(error_body(original_id, error::InternalError,
                                   "Timed out waiting for response"),
                        "application/json");
        return;
    }

    Reply r = reply.get();
    res.status = r.status;
    res.set_content(r.body, "application/json");
}

ReadResult HttpServerTransport::read() {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait(lock, [this] { return interrupted_ || !inbox_.empty(); });
    if (interrupted_) return EndOfStream{};
    ReadResult item = std::move(inbox_.front());
    inbox_.pop_front();
    return item;
}

void HttpServerTransport::write(const JsonRpcMessage& msg) {
    if (closed_) {
        throw TransportError("Transport closed");
    }
    const auto* resp = std::get_if<JsonRpcResponse>(&msg);
    const auto* internal_id = resp ? std::get_if<int64_t>(&resp->id) : nullptr;
    if (!internal_id) {
        log_debug(COMPONENT, "dropping outbound message with no HTTP exchange to carry it");
        return;
    }

    std::shared_ptr<Exchange> exchange;
    {
        std::lock_guard<std::mutex> lock(exchanges_mutex_);
        auto it = exchanges_.find(*internal_id);
        if (it != exchanges_.end()) {
            exchange = std::move(it->second);
            exchanges_.erase(it);
        }
    }
    if (!exchange) {
        log_warn(COMPONENT, "response for exchange " + std::to_string(*internal_id) +
                            " arrived after its client gave up");
        return;
    }

    JsonRpcResponse out = *resp;
    out.id = exchange->original_id;
    exchange->reply.set_value(Reply{200, Codec::serialize(out)});
}

void HttpServerTransport::interrupt() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        interrupted_ = true;
    }
    inbox_cv_.notify_all();
}

void HttpServerTransport::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true)) return;
    interrupt();

    // Release handler threads before stopping: httplib joins them on stop.
    std::unordered_map<int64_t, std::shared_ptr<Exchange>> pending;
    {
        std::lock_guard<std::mutex> ex_lock(exchanges_mutex_);
        pending.swap(exchanges_);
    }
    for (auto& [internal_id, exchange] : pending) {
        exchange->reply.set_value(Reply{503, error_body(exchange->original_id,
                                                        error::InternalError,
                                                        "Server shutting down")});
    }

    server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
}

bool HttpServerTransport::is_open() const {
    return !closed_;
}

} // namespace vexdoc
