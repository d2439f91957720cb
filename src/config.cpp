#include "vexdoc/config.hpp"
#include "vexdoc/version.hpp"

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace vexdoc {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

int parse_int(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    return result;
}

uint16_t to_port(const std::string& name, int value) {
    if (value < 0 || value > 65535) {
        throw ConfigError(name + " out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

TransportKind require_transport(const std::string& name, const std::string& value) {
    auto kind = parse_transport_kind(value);
    if (!kind) throw ConfigError("Invalid " + name + ": '" + value + "' (expected stdio or http)");
    return *kind;
}

LogLevel require_log_level(const std::string& name, const std::string& value) {
    auto level = parse_log_level(value);
    if (!level) throw ConfigError("Invalid " + name + ": '" + value + "'");
    return *level;
}

LogFormat require_log_format(const std::string& name, const std::string& value) {
    auto format = parse_log_format(value);
    if (!format) throw ConfigError("Invalid " + name + ": '" + value + "' (expected text or json)");
    return *format;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // anonymous namespace

std::string_view to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "unknown";
}

std::string_view to_string(LogFormat format) {
    switch (format) {
        case LogFormat::Text: return "text";
        case LogFormat::Json: return "json";
    }
    return "unknown";
}

std::optional<TransportKind> parse_transport_kind(std::string_view text) {
    auto lower = lowercase(text);
    if (lower == "stdio") return TransportKind::Stdio;
    if (lower == "http") return TransportKind::Http;
    return std::nullopt;
}

std::optional<LogFormat> parse_log_format(std::string_view text) {
    auto lower = lowercase(text);
    if (lower == "text") return LogFormat::Text;
    if (lower == "json") return LogFormat::Json;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// YAML
// ---------------------------------------------------------------------------
void apply_yaml(ServerConfig& config, const YAML::Node& root) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw ConfigError("Config file must contain a YAML mapping");
    }

    try {
        if (root["transport"]) {
            config.transport = require_transport("transport", root["transport"].as<std::string>());
        }

        // -- HTTP --
        if (const auto http = root["http"]) {
            if (http["host"]) config.http_host = http["host"].as<std::string>();
            if (http["port"]) config.http_port = to_port("http.port", http["port"].as<int>());
            if (http["path"]) config.http_path = http["path"].as<std::string>();
            if (http["allowed_origins"]) {
                config.allowed_origins.clear();
                for (const auto& origin : http["allowed_origins"]) {
                    config.allowed_origins.push_back(origin.as<std::string>());
                }
            }
        }

        // -- Dispatch --
        if (root["call_timeout_ms"]) config.call_timeout_ms = root["call_timeout_ms"].as<int>();
        if (root["drain_timeout_ms"]) config.drain_timeout_ms = root["drain_timeout_ms"].as<int>();
        if (root["worker_threads"]) config.worker_threads = root["worker_threads"].as<int>();

        // -- Logging --
        if (const auto log = root["log"]) {
            if (log["level"]) config.log_level = require_log_level("log.level", log["level"].as<std::string>());
            if (log["format"]) config.log_format = require_log_format("log.format", log["format"].as<std::string>());
        }

        if (root["default_author"]) config.default_author = root["default_author"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config value: " + std::string(e.what()));
    }
}

void apply_yaml_file(ServerConfig& config, const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + path + "': " + std::string(e.what()));
    }
    apply_yaml(config, root);
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------
EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

void apply_env(ServerConfig& config, const EnvLookup& env) {
    if (auto v = env("VEXDOC_TRANSPORT")) config.transport = require_transport("VEXDOC_TRANSPORT", *v);
    if (auto v = env("VEXDOC_HOST")) config.http_host = *v;
    if (auto v = env("VEXDOC_PORT")) config.http_port = to_port("VEXDOC_PORT", parse_int("VEXDOC_PORT", *v));
    if (auto v = env("VEXDOC_HTTP_PATH")) config.http_path = *v;
    if (auto v = env("VEXDOC_ALLOWED_ORIGINS")) config.allowed_origins = split_list(*v);
    if (auto v = env("VEXDOC_CALL_TIMEOUT_MS")) config.call_timeout_ms = parse_int("VEXDOC_CALL_TIMEOUT_MS", *v);
    if (auto v = env("VEXDOC_DRAIN_TIMEOUT_MS")) config.drain_timeout_ms = parse_int("VEXDOC_DRAIN_TIMEOUT_MS", *v);
    if (auto v = env("VEXDOC_WORKERS")) config.worker_threads = parse_int("VEXDOC_WORKERS", *v);
    if (auto v = env("VEXDOC_LOG_LEVEL")) config.log_level = require_log_level("VEXDOC_LOG_LEVEL", *v);
    if (auto v = env("VEXDOC_LOG_FORMAT")) config.log_format = require_log_format("VEXDOC_LOG_FORMAT", *v);
    if (auto v = env("VEXDOC_AUTHOR")) config.default_author = *v;
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------
CliOptions parse_cli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(std::string(SERVER_NAME), std::string(SERVER_VERSION));

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("stdio or http");
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port, 0 for an ephemeral port")
        .scan<'i', int>();
    program.add_argument("--http-path")
        .help("HTTP endpoint path");
    program.add_argument("--allowed-origin")
        .help("Accepted Origin header value (repeatable)")
        .append();
    program.add_argument("--call-timeout-ms")
        .help("Per tool call timeout, 0 disables")
        .scan<'i', int>();
    program.add_argument("--drain-timeout-ms")
        .help("Grace period for in-flight calls at shutdown")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("Tool worker threads")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-format")
        .help("text or json");
    program.add_argument("--author")
        .help("Default author for created VEX documents");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        throw ConfigError("CLI parse error: " + std::string(e.what()));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.transport = program.present("--transport");
    cli.host = program.present("--host");
    cli.port = program.present<int>("--port");
    cli.http_path = program.present("--http-path");
    if (auto origins = program.present<std::vector<std::string>>("--allowed-origin")) {
        cli.allowed_origins = *origins;
    }
    cli.call_timeout_ms = program.present<int>("--call-timeout-ms");
    cli.drain_timeout_ms = program.present<int>("--drain-timeout-ms");
    cli.workers = program.present<int>("--workers");
    cli.log_level = program.present("--log-level");
    cli.log_format = program.present("--log-format");
    cli.author = program.present("--author");
    return cli;
}

void apply_cli(ServerConfig& config, const CliOptions& cli) {
    if (cli.transport) config.transport = require_transport("--transport", *cli.transport);
    if (cli.host) config.http_host = *cli.host;
    if (cli.port) config.http_port = to_port("--port", *cli.port);
    if (cli.http_path) config.http_path = *cli.http_path;
    if (!cli.allowed_origins.empty()) config.allowed_origins = cli.allowed_origins;
    if (cli.call_timeout_ms) config.call_timeout_ms = *cli.call_timeout_ms;
    if (cli.drain_timeout_ms) config.drain_timeout_ms = *cli.drain_timeout_ms;
    if (cli.workers) config.worker_threads = *cli.workers;
    if (cli.log_level) config.log_level = require_log_level("--log-level", *cli.log_level);
    if (cli.log_format) config.log_format = require_log_format("--log-format", *cli.log_format);
    if (cli.author) config.default_author = *cli.author;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
void validate_config(const ServerConfig& config) {
    if (config.worker_threads < 1) {
        throw ConfigError("worker_threads must be at least 1");
    }
    if (config.call_timeout_ms < 0) {
        throw ConfigError("call_timeout_ms must not be negative");
    }
    if (config.drain_timeout_ms < 0) {
        throw ConfigError("drain_timeout_ms must not be negative");
    }
    if (config.default_author.empty()) {
        throw ConfigError("default_author must not be empty");
    }
    if (config.transport == TransportKind::Http) {
        if (config.http_host.empty()) {
            throw ConfigError("http.host must not be empty");
        }
        if (config.http_path.empty() || config.http_path.front() != '/') {
            throw ConfigError("http.path must start with '/'");
        }
    }
}

ServerConfig load_config(int argc, const char* const* argv, const EnvLookup& env) {
    // The command line is parsed first so --config can name the file.
    CliOptions cli = parse_cli(argc, argv);

    ServerConfig config;
    std::optional<std::string> path = cli.config_path;
    if (!path) path = env("VEXDOC_CONFIG");
    if (path) apply_yaml_file(config, *path);

    apply_env(config, env);
    apply_cli(config, cli);
    validate_config(config);
    return config;
}

} // namespace vexdoc
