#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace vexdoc {

/// HTTP server transport: one JSON-RPC message per POST body.
///
/// A request is answered in its own HTTP response (200). A notification gets
/// 202 with no body. A body that cannot be decoded and has no readable id is
/// answered here with 400 and never reaches read(). Request ids are replaced
/// by transport-unique ids on the way in and restored on the way out, so
/// clients that reuse ids do not collide. A notifications/cancelled is
/// forwarded only when exactly one pending request carries the id it names.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;          // 0 binds an ephemeral port
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
        std::chrono::milliseconds exchange_timeout{60000};
        size_t max_body_bytes = 1024 * 1024;
    };

    /// Binds and starts accepting. Throws TransportError if the bind fails.
    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    ReadResult read() override;
    void write(const JsonRpcMessage& msg) override;
    void interrupt() override;
    void close() override;
    bool is_open() const override;

    /// Port actually bound.
    [[nodiscard]] uint16_t port() const { return port_; }

private:
    struct Reply {
        int status;
        std::string body;
    };

    struct Exchange {
        RequestId original_id;
        std::promise<Reply> reply;
    };

    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    bool validate_origin(const std::string& origin) const;
    int64_t register_exchange(const RequestId& original_id, std::future<Reply>& reply);
    bool translate_cancellation(JsonRpcNotification& notif);
    void enqueue(ReadResult item);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    uint16_t port_{0};
    std::thread listen_thread_;

    std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<ReadResult> inbox_;
    bool interrupted_{false};

    std::mutex exchanges_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<Exchange>> exchanges_;
    int64_t next_exchange_id_{1};

    std::atomic<bool> closed_{false};
    std::mutex close_mutex_;
};

} // namespace vexdoc
