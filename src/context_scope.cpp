#include "tracehop/telemetry/context_scope.hpp"
#include <vector>

namespace tracehop {
namespace telemetry {

namespace {

thread_local std::vector<ActiveContext> context_stack;

} // namespace

std::optional<ActiveContext> current_active_context() {
    if (context_stack.empty()) {
        return std::nullopt;
    }
    return context_stack.back();
}

std::optional<TraceContext> current_context() {
    if (context_stack.empty()) {
        return std::nullopt;
    }
    return context_stack.back().trace;
}

Baggage current_baggage() {
    if (context_stack.empty()) {
        return Baggage();
    }
    return context_stack.back().baggage;
}

ContextScope::ContextScope(const TraceContext& context, const Baggage& baggage) {
    context_stack.push_back(ActiveContext{context, baggage});
}

ContextScope::~ContextScope() {
    detach();
}

void ContextScope::detach() {
    if (!attached_) {
        return;
    }
    attached_ = false;
    if (!context_stack.empty()) {
        context_stack.pop_back();
    }
}

} // namespace telemetry
} // namespace tracehop
