#include <gtest/gtest.h>
#include "vexdoc/config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>

using namespace vexdoc;

namespace {

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

ServerConfig load(std::vector<const char*> args, std::map<std::string, std::string> env = {}) {
    args.insert(args.begin(), "vexdoc-mcp-server");
    return load_config(static_cast<int>(args.size()), args.data(), env_from(std::move(env)));
}

// Writes a config file under the system temp dir; removed on destruction.
class TempYamlFile {
public:
    explicit TempYamlFile(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("vexdoc_config_" + std::to_string(reinterpret_cast<uintptr_t>(this)) + ".yaml");
        std::ofstream out(path_);
        out << content;
    }
    ~TempYamlFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // anonymous namespace

TEST(Config, Defaults) {
    auto config = load({});
    EXPECT_EQ(config.transport, TransportKind::Stdio);
    EXPECT_EQ(config.http_host, "127.0.0.1");
    EXPECT_EQ(config.http_port, 8080);
    EXPECT_EQ(config.http_path, "/mcp");
    EXPECT_TRUE(config.allowed_origins.empty());
    EXPECT_EQ(config.call_timeout_ms, 30000);
    EXPECT_EQ(config.drain_timeout_ms, 5000);
    EXPECT_EQ(config.worker_threads, 4);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.log_format, LogFormat::Text);
    EXPECT_EQ(config.default_author, "vexdoc-mcp-server");
}

TEST(Config, ParseEnums) {
    EXPECT_EQ(parse_transport_kind("HTTP"), TransportKind::Http);
    EXPECT_EQ(parse_transport_kind("stdio"), TransportKind::Stdio);
    EXPECT_FALSE(parse_transport_kind("grpc").has_value());
    EXPECT_EQ(parse_log_format("Json"), LogFormat::Json);
    EXPECT_FALSE(parse_log_format("xml").has_value());
    EXPECT_EQ(to_string(TransportKind::Http), "http");
    EXPECT_EQ(to_string(LogFormat::Text), "text");
}

// ---------- YAML ----------

TEST(Config, ApplyYaml) {
    ServerConfig config;
    apply_yaml(config, YAML::Load(R"(
transport: http
http:
  host: 0.0.0.0
  port: 9090
  path: /rpc
  allowed_origins:
    - http://localhost:3000
    - https://example.com
call_timeout_ms: 1000
drain_timeout_ms: 250
worker_threads: 8
log:
  level: debug
  format: json
default_author: security-team
unknown_key: ignored
)"));

    EXPECT_EQ(config.transport, TransportKind::Http);
    EXPECT_EQ(config.http_host, "0.0.0.0");
    EXPECT_EQ(config.http_port, 9090);
    EXPECT_EQ(config.http_path, "/rpc");
    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[1], "https://example.com");
    EXPECT_EQ(config.call_timeout_ms, 1000);
    EXPECT_EQ(config.drain_timeout_ms, 250);
    EXPECT_EQ(config.worker_threads, 8);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.log_format, LogFormat::Json);
    EXPECT_EQ(config.default_author, "security-team");
}

TEST(Config, PartialYamlKeepsOtherValues) {
    ServerConfig config;
    apply_yaml(config, YAML::Load("http:\n  port: 1234\n"));
    EXPECT_EQ(config.http_port, 1234);
    EXPECT_EQ(config.http_host, "127.0.0.1");
    EXPECT_EQ(config.transport, TransportKind::Stdio);
}

TEST(Config, EmptyYamlIsNoOp) {
    ServerConfig config;
    EXPECT_NO_THROW(apply_yaml(config, YAML::Load("")));
    EXPECT_EQ(config.worker_threads, 4);
}

TEST(Config, YamlErrors) {
    ServerConfig config;
    EXPECT_THROW(apply_yaml(config, YAML::Load("- a\n- b\n")), ConfigError);
    EXPECT_THROW(apply_yaml(config, YAML::Load("worker_threads: many\n")), ConfigError);
    EXPECT_THROW(apply_yaml(config, YAML::Load("transport: carrier-pigeon\n")), ConfigError);
    EXPECT_THROW(apply_yaml(config, YAML::Load("http:\n  port: 70000\n")), ConfigError);
}

TEST(Config, YamlFile) {
    TempYamlFile file("worker_threads: 2\nlog:\n  level: warn\n");
    ServerConfig config;
    apply_yaml_file(config, file.path());
    EXPECT_EQ(config.worker_threads, 2);
    EXPECT_EQ(config.log_level, LogLevel::Warn);
}

TEST(Config, MissingYamlFile) {
    ServerConfig config;
    try {
        apply_yaml_file(config, "/nonexistent/vexdoc.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/vexdoc.yaml"), std::string::npos);
    }
}

// ---------- Environment ----------

TEST(Config, ApplyEnv) {
    ServerConfig config;
    apply_env(config, env_from({
        {"VEXDOC_TRANSPORT", "http"},
        {"VEXDOC_HOST", "localhost"},
        {"VEXDOC_PORT", "0"},
        {"VEXDOC_HTTP_PATH", "/v1/mcp"},
        {"VEXDOC_ALLOWED_ORIGINS", "http://a.test, http://b.test,,"},
        {"VEXDOC_CALL_TIMEOUT_MS", "0"},
        {"VEXDOC_WORKERS", "16"},
        {"VEXDOC_LOG_LEVEL", "ERROR"},
        {"VEXDOC_AUTHOR", "ci-bot"},
    }));

    EXPECT_EQ(config.transport, TransportKind::Http);
    EXPECT_EQ(config.http_host, "localhost");
    EXPECT_EQ(config.http_port, 0);
    EXPECT_EQ(config.http_path, "/v1/mcp");
    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[0], "http://a.test");
    EXPECT_EQ(config.allowed_origins[1], "http://b.test");
    EXPECT_EQ(config.call_timeout_ms, 0);
    EXPECT_EQ(config.worker_threads, 16);
    EXPECT_EQ(config.log_level, LogLevel::Error);
    EXPECT_EQ(config.default_author, "ci-bot");
}

TEST(Config, EnvRejectsNonIntegers) {
    ServerConfig config;
    try {
        apply_env(config, env_from({{"VEXDOC_WORKERS", "4x"}}));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "VEXDOC_WORKERS must be an integer, got '4x'");
    }
    EXPECT_THROW(apply_env(config, env_from({{"VEXDOC_PORT", ""}})), ConfigError);
    EXPECT_THROW(apply_env(config, env_from({{"VEXDOC_LOG_FORMAT", "xml"}})), ConfigError);
}

// ---------- Command line ----------

TEST(Config, ParseCli) {
    std::vector<const char*> argv = {
        "vexdoc-mcp-server", "--transport", "http", "--port", "9000",
        "--allowed-origin", "http://a.test", "--allowed-origin", "http://b.test",
        "--workers", "3", "--log-format", "json", "--author", "me"};
    auto cli = parse_cli(static_cast<int>(argv.size()), argv.data());

    EXPECT_EQ(cli.transport, "http");
    EXPECT_EQ(cli.port, 9000);
    ASSERT_EQ(cli.allowed_origins.size(), 2u);
    EXPECT_EQ(cli.allowed_origins[0], "http://a.test");
    EXPECT_EQ(cli.workers, 3);
    EXPECT_EQ(cli.log_format, "json");
    EXPECT_EQ(cli.author, "me");
    EXPECT_FALSE(cli.host.has_value());
    EXPECT_FALSE(cli.config_path.has_value());
}

TEST(Config, CliRejectsUnknownFlags) {
    std::vector<const char*> argv = {"vexdoc-mcp-server", "--frobnicate"};
    EXPECT_THROW(parse_cli(static_cast<int>(argv.size()), argv.data()), ConfigError);

    std::vector<const char*> bad_int = {"vexdoc-mcp-server", "--port", "eighty"};
    EXPECT_THROW(parse_cli(static_cast<int>(bad_int.size()), bad_int.data()), ConfigError);
}

// ---------- Precedence and validation ----------

TEST(Config, PrecedenceDefaultsYamlEnvCli) {
    TempYamlFile file("worker_threads: 2\ncall_timeout_ms: 100\ndrain_timeout_ms: 10\n"
                      "default_author: from-yaml\n");

    auto config = load({"--config", file.path().c_str(), "--workers", "6"},
                       {{"VEXDOC_WORKERS", "5"}, {"VEXDOC_CALL_TIMEOUT_MS", "200"}});

    EXPECT_EQ(config.worker_threads, 6);        // command line
    EXPECT_EQ(config.call_timeout_ms, 200);     // environment
    EXPECT_EQ(config.drain_timeout_ms, 10);     // file
    EXPECT_EQ(config.default_author, "from-yaml");
    EXPECT_EQ(config.http_port, 8080);          // default
}

TEST(Config, ConfigPathFromEnvironment) {
    TempYamlFile file("worker_threads: 7\n");
    auto config = load({}, {{"VEXDOC_CONFIG", file.path()}});
    EXPECT_EQ(config.worker_threads, 7);
}

TEST(Config, Validation) {
    ServerConfig ok;
    EXPECT_NO_THROW(validate_config(ok));

    ServerConfig no_workers;
    no_workers.worker_threads = 0;
    EXPECT_THROW(validate_config(no_workers), ConfigError);

    ServerConfig negative_timeout;
    negative_timeout.call_timeout_ms = -1;
    EXPECT_THROW(validate_config(negative_timeout), ConfigError);

    ServerConfig no_author;
    no_author.default_author.clear();
    EXPECT_THROW(validate_config(no_author), ConfigError);

    ServerConfig bad_path;
    bad_path.transport = TransportKind::Http;
    bad_path.http_path = "mcp";
    EXPECT_THROW(validate_config(bad_path), ConfigError);

    // The HTTP path is only checked when HTTP is selected.
    ServerConfig stdio_bad_path;
    stdio_bad_path.http_path = "mcp";
    EXPECT_NO_THROW(validate_config(stdio_bad_path));
}

TEST(Config, LoadConfigValidates) {
    EXPECT_THROW(load({"--workers", "0"}), ConfigError);
    EXPECT_THROW(load({}, {{"VEXDOC_DRAIN_TIMEOUT_MS", "-5"}}), ConfigError);
}
