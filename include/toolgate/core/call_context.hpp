/*
 * ToolGate C++ - Per-call context
 *
 * The dispatcher creates one CallContext per execute() call and hands it
 * to the handler by const reference. The override flag lives only here:
 * there is no process-wide override state, so concurrent calls can never
 * observe each other's elevation.
 */
#ifndef toolgate_CORE_CALL_CONTEXT_HPP
#define toolgate_CORE_CALL_CONTEXT_HPP

#include "types.hpp"
#include <string>

namespace toolgate {

struct CallContext {
    std::string call_id;
    std::string action;
    Source source;
    Tier tier;
    bool override_active;

    CallContext()
        : source(Source::API)
        , tier(Tier::BLOCKED)
        , override_active(false) {}
};

// Raises the override flag of one context for the guard's lifetime and
// clears it on every exit path, exceptions included.
class ScopedOverride {
public:
    ScopedOverride(CallContext& ctx, bool active) : ctx_(ctx) {
        ctx_.override_active = active;
    }
    ~ScopedOverride() {
        ctx_.override_active = false;
    }

private:
    ScopedOverride(const ScopedOverride&);
    ScopedOverride& operator=(const ScopedOverride&);

    CallContext& ctx_;
};

} // namespace toolgate

#endif // toolgate_CORE_CALL_CONTEXT_HPP
