#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace tracehop {
namespace telemetry {

/**
 * Environment variable accessors used by TelemetryConfig::from_env().
 *
 * Every accessor returns `default_value` when the variable is unset, empty
 * or cannot be parsed.
 */
class Env {
public:
    /**
     * Returns `true` for "true", "1", "yes" (case-insensitive) and `false`
     * for "false", "0", "no".
     */
    static bool get_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        if (str_value == "true" || str_value == "1" || str_value == "yes") {
            return true;
        }
        if (str_value == "false" || str_value == "0" || str_value == "no") {
            return false;
        }
        return default_value;
    }

    static int64_t get_int(const char* env_var, int64_t default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }
        char* end = nullptr;
        long long parsed = std::strtoll(value, &end, 10);
        if (end == value || *end != '\0') {
            return default_value;
        }
        return static_cast<int64_t>(parsed);
    }

    static double get_double(const char* env_var, double default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }
        char* end = nullptr;
        double parsed = std::strtod(value, &end);
        if (end == value || *end != '\0') {
            return default_value;
        }
        return parsed;
    }

    static std::string get_string(const char* env_var, const std::string& default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }
        return std::string(value);
    }
};

} // namespace telemetry
} // namespace tracehop
