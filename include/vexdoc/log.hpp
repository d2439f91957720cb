#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace vexdoc {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

[[nodiscard]] std::string_view to_string(LogLevel level);

/// Accepts "debug", "info", "warn"/"warning", "error" in any case.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// Abstract log sink. Implementations decide where and how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines. Defaults to stderr: stdout carries the protocol.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// JSON lines: {"ts","level","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warn(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

private:
    void log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger, set once at startup and used by all components.
// ---------------------------------------------------------------------------

/// Replace the process-wide logger.
void init_global_logger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// The process-wide logger. Discards everything until initialized.
Logger& global_logger();

void log_debug(std::string_view component, std::string_view message);
void log_info(std::string_view component, std::string_view message);
void log_warn(std::string_view component, std::string_view message);
void log_error(std::string_view component, std::string_view message);

} // namespace vexdoc
