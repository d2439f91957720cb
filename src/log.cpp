#include "vexdoc/log.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vexdoc {

namespace {

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& global_logger_instance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::write(LogLevel level, std::string_view component,
                        std::string_view message) {
    out_ << iso8601_now()
         << " [" << to_string(level) << "] "
         << "[" << component << "] "
         << message << std::endl;
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", iso8601_now()},
        {"level", std::string(to_string(level))},
        {"component", std::string(component)},
        {"message", std::string(message)}
    };
    // Invalid UTF-8 in a message must not take the logger down.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

void Logger::warn(std::string_view component, std::string_view message) {
    log(LogLevel::Warn, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

void Logger::log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void init_global_logger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    global_logger_instance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& global_logger() {
    return *global_logger_instance();
}

void log_debug(std::string_view component, std::string_view message) {
    global_logger().debug(component, message);
}

void log_info(std::string_view component, std::string_view message) {
    global_logger().info(component, message);
}

void log_warn(std::string_view component, std::string_view message) {
    global_logger().warn(component, message);
}

void log_error(std::string_view component, std::string_view message) {
    global_logger().error(component, message);
}

} // namespace vexdoc
