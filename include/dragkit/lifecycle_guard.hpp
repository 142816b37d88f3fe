#pragma once

#include <dragkit/id.hpp>
#include <stdexcept>
#include <string>

namespace dragkit
{

class DragStateStore;

// Thrown when a drag-and-drop context is used against its per-frame
// contract: not finished before the next one with the same identity is
// constructed, finished twice, or registered into after finish().
class LifecycleError : public std::logic_error
{
   public:
    LifecycleError(Id context, const std::string& what);

    Id context() const { return context_; }

   private:
    Id context_;
};

// Leaves the "not finished" marker for `context`. If the previous context
// with this identity left its marker behind, the stale marker and drag state
// are scrubbed from `store` and LifecycleError is thrown.
void raise_lifecycle_guard(DragStateStore& store, Id context);

// Removes the marker. Safe to call more than once.
void lower_lifecycle_guard(DragStateStore& store, Id context);

}   // namespace dragkit
