/// vexdoc MCP server: OpenVEX document tools over stdio or HTTP.
/// Usage: ./vexdoc-mcp-server [--transport stdio|http] [--config file.yaml] ...
/// Logs go to stderr; stdout carries the protocol in stdio mode.

#include <vexdoc/vexdoc.hpp>
#include <vexdoc/config.hpp>
#include <vexdoc/tools/vex_tools.hpp>
#include <vexdoc/vex/client.hpp>

#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>

namespace {

constexpr std::string_view COMPONENT = "main";

void init_logging(const vexdoc::ServerConfig& config) {
    std::unique_ptr<vexdoc::ILogSink> sink;
    if (config.log_format == vexdoc::LogFormat::Json) {
        sink = std::make_unique<vexdoc::JsonSink>();
    } else {
        sink = std::make_unique<vexdoc::ConsoleSink>();
    }
    vexdoc::init_global_logger(std::move(sink), config.log_level);
}

// SIGINT/SIGTERM are blocked in every thread and collected here, so stop()
// runs in ordinary thread context.
class SignalWatcher {
public:
    explicit SignalWatcher(vexdoc::McpServer& server) : server_(server) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);
        thread_ = std::thread([this] { run(); });
    }

    ~SignalWatcher() {
        done_ = true;
        if (thread_.joinable()) thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run() {
        const timespec poll_interval{0, 200 * 1000 * 1000};
        while (!done_) {
            int sig = sigtimedwait(&set_, nullptr, &poll_interval);
            if (sig == SIGINT || sig == SIGTERM) {
                vexdoc::log_info(COMPONENT, std::string("received ") +
                                 (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
                server_.stop();
            }
        }
    }

    vexdoc::McpServer& server_;
    sigset_t set_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    vexdoc::ServerConfig config;
    try {
        config = vexdoc::load_config(argc, argv, vexdoc::process_env());
    } catch (const vexdoc::ConfigError& e) {
        std::cerr << "vexdoc-mcp-server: " << e.what() << std::endl;
        return 2;
    }

    init_logging(config);
    // A vanished peer must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    vexdoc::McpServer::Options opts;
    opts.server_info = {std::string(vexdoc::SERVER_NAME), std::string(vexdoc::SERVER_VERSION)};
    opts.thread_pool_size = config.worker_threads;
    opts.call_timeout = std::chrono::milliseconds(config.call_timeout_ms);
    opts.drain_timeout = std::chrono::milliseconds(config.drain_timeout_ms);

    vexdoc::McpServer server{std::move(opts)};

    try {
        auto client = std::make_shared<const vexdoc::vex::VexClient>(config.default_author);
        vexdoc::tools::register_vex_tools(server, client);

        SignalWatcher watcher(server);

        if (config.transport == vexdoc::TransportKind::Http) {
            vexdoc::HttpServerTransport::Options http;
            http.host = config.http_host;
            http.port = config.http_port;
            http.mcp_path = config.http_path;
            http.allowed_origins = config.allowed_origins;
            auto transport = std::make_unique<vexdoc::HttpServerTransport>(http);
            vexdoc::log_info(COMPONENT, "listening on http://" + config.http_host + ":" +
                             std::to_string(transport->port()) + config.http_path);
            server.serve(std::move(transport));
        } else {
            vexdoc::log_info(COMPONENT, "serving on stdio");
            server.serve_stdio();
        }
    } catch (const std::exception& e) {
        vexdoc::log_error(COMPONENT, std::string("fatal: ") + e.what());
        return 1;
    }

    return 0;
}
