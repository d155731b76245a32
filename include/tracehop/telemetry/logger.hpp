#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tracehop {
namespace telemetry {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

// "debug" | "info" | "warn" | "error" (case-insensitive); unknown -> info
LogLevel parse_log_level(const std::string& value);
const char* to_string(LogLevel level);

// ISO 8601 UTC timestamp with microseconds, e.g. 2025-01-01T12:00:00.123456Z
std::string iso8601_timestamp();

/**
 * Structured JSON-lines logger.
 *
 * Every line carries timestamp, level, component and message. trace_id and
 * span_id of the thread's active context are added when one is active, so
 * log lines correlate with spans. Context keys that look like credentials or
 * PII are redacted. Logging never throws: invalid UTF-8 is replaced and a
 * line whose stream fails is dropped and counted.
 */
class Logger {
public:
    explicit Logger(std::string component, LogLevel min_level = LogLevel::info);

    void log_debug(const std::string& message,
                   const std::unordered_map<std::string, std::string>& context = {});
    void log_info(const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void log_warn(const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void log_error(const std::string& message,
                   const std::unordered_map<std::string, std::string>& context = {});

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Redirects output (tests). Passing nullptr restores stdout/stderr.
    void set_streams(std::ostream* out, std::ostream* err);

    uint64_t dropped_lines() const;

    std::string format_json_log(LogLevel level,
                                const std::string& message,
                                const std::unordered_map<std::string, std::string>& context) const;

private:
    void write(LogLevel level, const std::string& message,
               const std::unordered_map<std::string, std::string>& context);

    std::string component_;
    LogLevel min_level_;
    std::ostream* out_ = nullptr;
    std::ostream* err_ = nullptr;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace telemetry
} // namespace tracehop
