#include "tracehop/telemetry/core.hpp"
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <iomanip>
#include <sstream>
#include <typeinfo>

namespace tracehop {
namespace telemetry {

std::string to_hex(const uint8_t* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool TraceContext::is_valid() const {
    auto non_zero = [](uint8_t b) { return b != 0; };
    return std::any_of(trace_id_.begin(), trace_id_.end(), non_zero) &&
           std::any_of(span_id_.begin(), span_id_.end(), non_zero);
}

Baggage::Baggage() : entries_(std::make_shared<const std::map<std::string, std::string>>()) {}

std::optional<std::string> Baggage::get(const std::string& key) const {
    auto it = entries_->find(key);
    if (it == entries_->end()) {
        return std::nullopt;
    }
    return it->second;
}

Baggage Baggage::set(const std::string& key, const std::string& value) const {
    auto copy = std::make_shared<std::map<std::string, std::string>>(*entries_);
    (*copy)[key] = value;
    return Baggage(std::move(copy));
}

Baggage Baggage::remove(const std::string& key) const {
    if (entries_->count(key) == 0) {
        return *this;
    }
    auto copy = std::make_shared<std::map<std::string, std::string>>(*entries_);
    copy->erase(key);
    return Baggage(std::move(copy));
}

const char* to_string(SpanKind kind) {
    switch (kind) {
        case SpanKind::internal:
            return "INTERNAL";
        case SpanKind::client:
            return "CLIENT";
        case SpanKind::server:
            return "SERVER";
        case SpanKind::producer:
            return "PRODUCER";
        case SpanKind::consumer:
            return "CONSUMER";
    }
    return "INTERNAL";
}

const char* to_string(StatusCode status) {
    switch (status) {
        case StatusCode::unset:
            return "UNSET";
        case StatusCode::ok:
            return "OK";
        case StatusCode::error:
            return "ERROR";
    }
    return "UNSET";
}

static std::string demangle(const char* mangled) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr) {
        return mangled;
    }
    std::string result(demangled);
    std::free(demangled);
    return result;
}

ExceptionInfo describe_exception(const std::exception& e) {
    return ExceptionInfo{demangle(typeid(e).name()), e.what()};
}

ExceptionInfo describe_unknown_exception() {
    return ExceptionInfo{"unknown", "non-standard exception"};
}

} // namespace telemetry
} // namespace tracehop
