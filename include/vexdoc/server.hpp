#pragma once
#include "session.hpp"
#include "tool.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vexdoc {

/// One-way lifecycle: Created -> Running -> Stopping -> Stopped.
enum class ServerState {
    Created,    // registry open for registration
    Running,    // registry frozen, serve loop active
    Stopping,   // reads stopped, draining in-flight calls
    Stopped     // transport closed
};

std::string to_string(ServerState state);

/// Tool-dispatching JSON-RPC server.
///
/// Reads one message at a time from its transport. initialize, ping and
/// tools/list are answered on the reader thread; every tools/call runs on a
/// worker pool and is answered when it finishes, so responses can leave out
/// of request order. All writes to the transport are serialized.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        int thread_pool_size = 4;
        /// Per tools/call bound. Zero or negative disables it.
        std::chrono::milliseconds call_timeout{30000};
        /// How long stop waits for in-flight calls before cancelling them.
        std::chrono::milliseconds drain_timeout{5000};
    };

    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----

    /// Only valid while Created. Throws DuplicateToolError or
    /// RegistryFrozenError; the catalog is unchanged on failure.
    void register_tool(std::unique_ptr<ITool> tool);

    [[nodiscard]] std::vector<ToolDescriptor> tools() const;

    // ---- Transport ----

    /// Blocks until end-of-stream, stop(), an undecodable frame without an
    /// id, or a transport failure. Transport failures are rethrown as
    /// TransportError after the orderly shutdown has completed.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void serve_http(const std::string& host, uint16_t port);

    /// Request orderly termination. Safe from any thread; makes serve() return.
    void stop();

    [[nodiscard]] ServerState state() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] SessionState session_state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vexdoc
