#pragma once

#include "tracehop/telemetry/core.hpp"
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/nostd/string_view.h>

namespace tracehop {
namespace telemetry {

// W3C carrier keys
constexpr const char* kTraceparentHeader = "traceparent";
constexpr const char* kTracestateHeader = "tracestate";
constexpr const char* kBaggageHeader = "baggage";

/**
 * TextMapCarrier over a Headers map.
 *
 * Get() tries the exact key first and then falls back to a case-insensitive
 * match, since HTTP header names arrive in any case. The const overload is
 * read-only; Set() on a carrier built from a const map is a no-op.
 */
class HeaderCarrier : public opentelemetry::context::propagation::TextMapCarrier {
public:
    explicit HeaderCarrier(Headers& headers) : headers_(&headers), readonly_(&headers) {}
    explicit HeaderCarrier(const Headers& headers) : headers_(nullptr), readonly_(&headers) {}

    opentelemetry::nostd::string_view Get(opentelemetry::nostd::string_view key) const noexcept override;
    void Set(opentelemetry::nostd::string_view key, opentelemetry::nostd::string_view value) noexcept override;

private:
    Headers* headers_;
    const Headers* readonly_;
};

struct ExtractedContext {
    TraceContext context;   // invalid + unsampled when the carrier has none
    Baggage baggage;
};

// Removes any existing traceparent, tracestate and baggage keys (any case),
// then writes traceparent (valid contexts only) and baggage (non-empty only).
// Other keys of the carrier are left as they are.
void inject(const TraceContext& context, const Baggage& baggage, Headers& carrier);

// Never throws; missing or malformed keys degrade to an invalid context
// and/or empty baggage.
ExtractedContext extract(const Headers& carrier);

} // namespace telemetry
} // namespace tracehop
