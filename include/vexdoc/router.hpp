#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace vexdoc {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// A handler that answers later. Returns an error to answer immediately,
/// std::nullopt once it has taken over responsibility for the response.
using DeferredHandler = std::function<std::optional<JsonRpcError>(const RequestId& id,
                                                                  const nlohmann::json& params)>;

using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Static method-name -> handler table. Unknown requests get MethodNotFound,
/// unknown notifications are dropped.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a handler that sends its own response later.
    void on_deferred_request(const std::string& method, DeferredHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns the response to send, if any.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    using AnyRequestHandler = std::variant<RequestHandler, DeferredHandler>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AnyRequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace vexdoc
