#include "tracehop/telemetry/context_codec.hpp"
#include <opentelemetry/baggage/baggage.h>
#include <opentelemetry/baggage/baggage_context.h>
#include <opentelemetry/baggage/propagation/baggage_propagator.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/default_span.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/span_context.h>
#include <algorithm>
#include <cctype>

namespace tracehop {
namespace telemetry {

namespace otel = opentelemetry;
namespace nostd = opentelemetry::nostd;

namespace {

bool iequals(nostd::string_view a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

otel::trace::SpanContext to_otel(const TraceContext& context) {
    otel::trace::TraceId trace_id(nostd::span<const uint8_t, 16>(context.trace_id().data(), 16));
    otel::trace::SpanId span_id(nostd::span<const uint8_t, 8>(context.span_id().data(), 8));
    otel::trace::TraceFlags flags(context.sampled() ? otel::trace::TraceFlags::kIsSampled : 0);
    return otel::trace::SpanContext(trace_id, span_id, flags, true);
}

TraceContext from_otel(const otel::trace::SpanContext& span_context) {
    if (!span_context.IsValid()) {
        return TraceContext();
    }
    TraceId trace_id{};
    SpanId span_id{};
    auto trace_bytes = span_context.trace_id().Id();
    auto span_bytes = span_context.span_id().Id();
    std::copy(trace_bytes.begin(), trace_bytes.end(), trace_id.begin());
    std::copy(span_bytes.begin(), span_bytes.end(), span_id.begin());
    return TraceContext(trace_id, span_id, span_context.IsSampled());
}

} // namespace

nostd::string_view HeaderCarrier::Get(nostd::string_view key) const noexcept {
    auto it = readonly_->find(std::string(key.data(), key.size()));
    if (it != readonly_->end()) {
        return nostd::string_view(it->second.data(), it->second.size());
    }
    for (const auto& [name, value] : *readonly_) {
        if (iequals(key, name)) {
            return nostd::string_view(value.data(), value.size());
        }
    }
    return "";
}

void HeaderCarrier::Set(nostd::string_view key, nostd::string_view value) noexcept {
    if (headers_ == nullptr) {
        return;
    }
    (*headers_)[std::string(key.data(), key.size())] = std::string(value.data(), value.size());
}

void inject(const TraceContext& context, const Baggage& baggage, Headers& carrier) {
    // Previous propagation headers never outlive a re-inject
    for (auto it = carrier.begin(); it != carrier.end();) {
        nostd::string_view name(it->first.data(), it->first.size());
        if (iequals(name, kTraceparentHeader) || iequals(name, kTracestateHeader) ||
            iequals(name, kBaggageHeader)) {
            it = carrier.erase(it);
        } else {
            ++it;
        }
    }

    HeaderCarrier header_carrier(carrier);
    otel::context::Context otel_context;

    if (context.is_valid()) {
        nostd::shared_ptr<otel::trace::Span> span(new otel::trace::DefaultSpan(to_otel(context)));
        otel_context = otel::trace::SetSpan(otel_context, span);
        otel::trace::propagation::HttpTraceContext().Inject(header_carrier, otel_context);
    }

    if (!baggage.empty()) {
        auto otel_baggage = otel::baggage::Baggage::GetDefault();
        for (const auto& [key, value] : baggage.entries()) {
            otel_baggage = otel_baggage->Set(key, value);
        }
        otel_context = otel::baggage::SetBaggage(otel_context, otel_baggage);
        otel::baggage::propagation::BaggagePropagator().Inject(header_carrier, otel_context);
    }
}

ExtractedContext extract(const Headers& carrier) {
    HeaderCarrier header_carrier(carrier);
    otel::context::Context otel_context;

    otel_context = otel::trace::propagation::HttpTraceContext().Extract(header_carrier, otel_context);
    otel_context = otel::baggage::propagation::BaggagePropagator().Extract(header_carrier, otel_context);

    ExtractedContext result;
    result.context = from_otel(otel::trace::GetSpan(otel_context)->GetContext());

    auto otel_baggage = otel::baggage::GetBaggage(otel_context);
    Baggage baggage;
    if (otel_baggage) {
        otel_baggage->GetAllEntries([&baggage](nostd::string_view key, nostd::string_view value) {
            baggage = baggage.set(std::string(key.data(), key.size()), std::string(value.data(), value.size()));
            return true;
        });
    }
    result.baggage = baggage;
    return result;
}

} // namespace telemetry
} // namespace tracehop
