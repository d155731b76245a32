#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/context_scope.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iostream>
#include <vector>

namespace tracehop {
namespace telemetry {

using json = nlohmann::json;

// PII/Secret fields to filter
static const std::vector<std::string> PII_FIELDS = {
    "password", "api_key", "secret", "token", "access_token",
    "refresh_token", "authorization", "cookie", "credit_card", "ssn",
    "email", "phone"
};

// Case-insensitive substring match against PII_FIELDS
static bool is_pii_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& pii_field : PII_FIELDS) {
        if (lower_field.find(pii_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

LogLevel parse_log_level(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "debug") {
        return LogLevel::debug;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::warn;
    }
    if (lower == "error") {
        return LogLevel::error;
    }
    return LogLevel::info;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

std::string iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Logger::Logger(std::string component, LogLevel min_level)
    : component_(std::move(component)), min_level_(min_level) {}

void Logger::log_debug(const std::string& message,
                       const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::debug, message, context);
}

void Logger::log_info(const std::string& message,
                      const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::info, message, context);
}

void Logger::log_warn(const std::string& message,
                      const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::warn, message, context);
}

void Logger::log_error(const std::string& message,
                       const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::error, message, context);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::set_streams(std::ostream* out, std::ostream* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
    err_ = err;
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::unordered_map<std::string, std::string>& context) {
    if (!enabled(level)) {
        return;
    }
    // A log line that cannot be formatted or written is dropped; logging
    // never fails the caller.
    try {
        std::string line = format_json_log(level, message, context);

        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LogLevel::error) {
            std::ostream& err = err_ != nullptr ? *err_ : std::cerr;
            err << line << std::endl;
        } else {
            std::ostream& out = out_ != nullptr ? *out_ : std::cout;
            out << line << std::endl;
        }
    } catch (const std::exception&) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

uint64_t Logger::dropped_lines() const {
    return dropped_.load(std::memory_order_relaxed);
}

std::string Logger::format_json_log(LogLevel level,
                                    const std::string& message,
                                    const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    log_entry["timestamp"] = iso8601_timestamp();
    log_entry["level"] = to_string(level);
    log_entry["component"] = component_;
    log_entry["message"] = message;

    // Correlate with the active span, if any
    if (auto active = current_context()) {
        if (active->is_valid()) {
            log_entry["trace_id"] = active->trace_id_hex();
            log_entry["span_id"] = active->span_id_hex();
        }
    }

    if (!context.empty()) {
        json context_obj = json::object();
        for (const auto& [key, value] : context) {
            context_obj[key] = is_pii_field(key) ? std::string("[REDACTED]") : value;
        }
        log_entry["context"] = context_obj;
    }

    // Invalid UTF-8 in messages or context values is replaced, not thrown
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace telemetry
} // namespace tracehop
