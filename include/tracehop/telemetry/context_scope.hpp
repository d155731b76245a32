#pragma once

#include "tracehop/telemetry/core.hpp"
#include <optional>

namespace tracehop {
namespace telemetry {

// Context + baggage of the innermost active scope on the calling thread
struct ActiveContext {
    TraceContext trace;
    Baggage baggage;
};

std::optional<ActiveContext> current_active_context();

// Trace context of the innermost active scope, if any
std::optional<TraceContext> current_context();

// Baggage of the innermost active scope, empty when none is active
Baggage current_baggage();

/**
 * Makes a context current on this thread for the lifetime of the object.
 * Scopes nest and must be destroyed in reverse order of creation.
 */
class ContextScope {
public:
    ContextScope(const TraceContext& context, const Baggage& baggage);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

    // Pops early; the destructor then does nothing
    void detach();

private:
    bool attached_ = true;
};

} // namespace telemetry
} // namespace tracehop
