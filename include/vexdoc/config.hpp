#pragma once
#include "error.hpp"
#include "log.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

namespace vexdoc {

enum class TransportKind { Stdio, Http };
enum class LogFormat { Text, Json };

[[nodiscard]] std::string_view to_string(TransportKind kind);
[[nodiscard]] std::string_view to_string(LogFormat format);
[[nodiscard]] std::optional<TransportKind> parse_transport_kind(std::string_view text);
[[nodiscard]] std::optional<LogFormat> parse_log_format(std::string_view text);

/// Everything the executable needs to start.
struct ServerConfig {
    TransportKind transport = TransportKind::Stdio;
    std::string http_host = "127.0.0.1";
    uint16_t http_port = 8080;
    std::string http_path = "/mcp";
    std::vector<std::string> allowed_origins;

    int call_timeout_ms = 30000;
    int drain_timeout_ms = 5000;
    int worker_threads = 4;

    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Text;

    std::string default_author = "vexdoc-mcp-server";
};

class ConfigError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

// ---------- Sources, lowest precedence first ----------

/// Overlay keys present in a YAML mapping. Unknown keys are ignored.
void apply_yaml(ServerConfig& config, const YAML::Node& root);
void apply_yaml_file(ServerConfig& config, const std::string& path);

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the real process environment.
EnvLookup process_env();

/// Overlay VEXDOC_* variables: TRANSPORT, HOST, PORT, HTTP_PATH,
/// ALLOWED_ORIGINS (comma separated), CALL_TIMEOUT_MS, DRAIN_TIMEOUT_MS,
/// WORKERS, LOG_LEVEL, LOG_FORMAT, AUTHOR.
void apply_env(ServerConfig& config, const EnvLookup& env);

/// Command-line values; only flags actually given are set.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> transport;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> http_path;
    std::vector<std::string> allowed_origins;
    std::optional<int> call_timeout_ms;
    std::optional<int> drain_timeout_ms;
    std::optional<int> workers;
    std::optional<std::string> log_level;
    std::optional<std::string> log_format;
    std::optional<std::string> author;
};

/// Throws ConfigError on unknown flags or malformed values.
CliOptions parse_cli(int argc, const char* const* argv);
void apply_cli(ServerConfig& config, const CliOptions& cli);

/// Throws ConfigError describing the first bad value.
void validate_config(const ServerConfig& config);

/// defaults < YAML file (--config or VEXDOC_CONFIG) < environment < command line.
ServerConfig load_config(int argc, const char* const* argv, const EnvLookup& env);

} // namespace vexdoc
