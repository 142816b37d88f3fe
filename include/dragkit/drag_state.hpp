#pragma once

#include <cstddef>
#include <dragkit/geometry.hpp>
#include <dragkit/id.hpp>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace dragkit
{

// Per-context state carried from one frame to the next while a drag is in
// progress. Exists for a context iff that context is dragging.
struct DragState
{
    Id   payload_id;      // identity of the grasped element
    Vec2 cursor_offset;   // element top-left minus pointer position at drag start
    Vec2 drop_pos;        // centre of the dragged element, tested against drop zones

    bool operator==(const DragState&) const = default;
};

// Keyed storage scoped to the lifetime of a UI. Holds the drag state of
// every context plus the "not yet finished" markers of the lifecycle guard.
// Entries never expire; the engine removes them when a drag ends.
class DragStateStore
{
   public:
    DragStateStore() = default;

    DragStateStore(const DragStateStore&)            = delete;
    DragStateStore& operator=(const DragStateStore&) = delete;

    // ─── Drag state ─────────────────────────────────────────────────────

    std::optional<DragState> load(Id context) const;
    void                     store(Id context, const DragState& state);
    void                     clear(Id context);

    // load() followed by clear().
    std::optional<DragState> take(Id context);

    bool   contains(Id context) const { return states_.count(context) != 0; }
    size_t active_drags() const { return states_.size(); }

    // ─── Lifecycle markers ──────────────────────────────────────────────

    // Sets the marker for `context`. Returns true if it was already set.
    bool raise_marker(Id context);
    void lower_marker(Id context);
    bool has_marker(Id context) const { return unfinished_.count(context) != 0; }

    // Drops every entry, e.g. when the owning UI is torn down.
    void reset();

   private:
    std::unordered_map<Id, DragState> states_;
    std::unordered_set<Id>            unfinished_;
};

}   // namespace dragkit
