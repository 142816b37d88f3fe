#include <cinttypes>
#include <cstdio>
#include <dragkit/drag_state.hpp>
#include <dragkit/lifecycle_guard.hpp>
#include <dragkit/logger.hpp>

namespace dragkit
{

namespace
{

std::string describe(Id context)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%016" PRIx64, context.value());
    return buf;
}

}   // namespace

LifecycleError::LifecycleError(Id context, const std::string& what)
    : std::logic_error("Dnd " + describe(context) + ": " + what), context_(context)
{
}

void raise_lifecycle_guard(DragStateStore& store, Id context)
{
    if (!store.raise_marker(context))
        return;

    // The previous instance never reached finish(). Drop what it left so the
    // identity restarts from Idle.
    store.lower_marker(context);
    store.clear(context);

    DRAGKIT_LOG_CRITICAL("dnd.guard",
                         "Context {} was dropped without calling finish()",
                         describe(context));
    throw LifecycleError(context,
                         "dropped without calling finish(); call allow_unfinished() if this is "
                         "intentional");
}

void lower_lifecycle_guard(DragStateStore& store, Id context)
{
    store.lower_marker(context);
}

}   // namespace dragkit
