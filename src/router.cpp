#include "vexdoc/router.hpp"
#include "vexdoc/error.hpp"
#include "vexdoc/log.hpp"

namespace vexdoc {

namespace {

constexpr std::string_view COMPONENT = "router";

} // anonymous namespace

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = AnyRequestHandler{std::in_place_type<RequestHandler>, std::move(handler)};
}

void Router::on_deferred_request(const std::string& method, DeferredHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = AnyRequestHandler{std::in_place_type<DeferredHandler>, std::move(handler)};
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        AnyRequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                return JsonRpcResponse::failure(req->id, JsonRpcError{
                    error::MethodNotFound, "Method not found: " + req->method, std::nullopt});
            }
            handler = it->second;
        }
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        // Call handler WITHOUT holding the lock
        try {
            if (auto* deferred = std::get_if<DeferredHandler>(&handler)) {
                auto rejected = (*deferred)(req->id, params);
                if (rejected) return JsonRpcResponse::failure(req->id, std::move(*rejected));
                return std::nullopt;
            }
            auto result = std::get<RequestHandler>(handler)(params);
            if (auto* err = std::get_if<JsonRpcError>(&result)) {
                return JsonRpcResponse::failure(req->id, std::move(*err));
            }
            return JsonRpcResponse::success(req->id, std::move(std::get<nlohmann::json>(result)));
        } catch (const ProtocolError& e) {
            return JsonRpcResponse::failure(req->id, JsonRpcError{e.code, e.what(), e.data});
        } catch (const std::exception& e) {
            log_error(COMPONENT, "handler for '" + req->method + "' failed: " + e.what());
            return JsonRpcResponse::failure(req->id, JsonRpcError{
                error::InternalError, "Internal error", std::nullopt});
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) {
                log_debug(COMPONENT, "ignoring notification '" + notif->method + "'");
                return std::nullopt;
            }
            handler = it->second;
        }
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            handler(params);
        } catch (const std::exception& e) {
            // Notifications never produce output.
            log_warn(COMPONENT, "notification '" + notif->method + "' failed: " + e.what());
        }
        return std::nullopt;
    }

    // Responses are never routed; this server issues no requests of its own.
    log_debug(COMPONENT, "ignoring unsolicited response");
    return std::nullopt;
}

} // namespace vexdoc
