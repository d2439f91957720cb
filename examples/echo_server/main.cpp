/// Echo server: minimal tool server demonstrating tool registration.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <vexdoc/vexdoc.hpp>
#include <iostream>

int main() {
    vexdoc::init_global_logger(std::make_unique<vexdoc::ConsoleSink>(), vexdoc::LogLevel::Info);

    vexdoc::McpServer::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};

    vexdoc::McpServer server{std::move(opts)};

    server.register_tool(std::make_unique<vexdoc::FunctionTool>(
        "echo",
        "Echo the input text back to the caller",
        nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"text", {{"type", "string"}, {"description", "The text to echo"}}}
            }},
            {"required", nlohmann::json::array({"text"})}
        },
        [](const vexdoc::CallContext&, const nlohmann::json& args) {
            return vexdoc::ToolResult::text(args.at("text").get<std::string>());
        }));

    // Serve over stdio; blocks until the client closes stdin
    try {
        server.serve_stdio();
    } catch (const std::exception& e) {
        std::cerr << "echo_server: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
