#pragma once

#include <cstddef>
#include <dragkit/drag_state.hpp>
#include <dragkit/geometry.hpp>
#include <dragkit/id.hpp>
#include <dragkit/style.hpp>
#include <dragkit/ui.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace dragkit
{

// Result of rendering a draggable element.
struct DraggableResponse
{
    Response response;   // the whole element
    Response handle;     // the part that starts drags
};

namespace detail
{

// Reorder boundary registered during one frame.
struct ReorderZone
{
    LineSegment line;
    Rect        clip_rect;
    Direction   direction;
};

// Type-independent half of Dnd: drag state, lifecycle guard, geometry and
// painting. Dnd<Payload, Target> adds the payload/target bookkeeping.
class DndCore
{
   public:
    using HandleContents = std::function<Response(Ui&)>;

    DndCore(Ui& ui, Id id);
    ~DndCore() = default;

    DndCore(const DndCore&)            = delete;
    DndCore& operator=(const DndCore&) = delete;

    Id id() const { return id_; }

    const DndStyle& style() const { return style_; }
    void            set_style(const DndStyle& style) { style_ = style; }

    bool is_dragging() const { return current_drag_.has_value(); }

    // Identity of the element being dragged, if any.
    std::optional<Id> payload_id() const;

    // Allows this context to go out of scope without finish(). Safe to call
    // more than once. The drag in progress, if any, ends with it.
    void allow_unfinished();

   protected:
    // Renders a draggable element. Returns true if the element carries the
    // payload this frame, either because it is being dragged or because a
    // drag started on its handle.
    bool show_draggable(Ui& ui, Id id, const HandleContents& contents, DraggableResponse& out);

    // Paints the drop zone outline. Returns true if the dragged element's
    // centre is inside `response`.
    bool hit_drop_zone(Ui& ui, const Response& response);

    void push_reorder_zone_at_cursor(Ui& ui);

    // Registers the Before and After boundaries of `response`. Returns false
    // (registering nothing) when no drag is in progress.
    bool push_before_after_zones(Ui& ui, const Response& response);

    // Nearest reorder boundary to the pointer, highlighted when found.
    std::optional<size_t> closest_reorder_zone(Ui& ui);

    // Lowers the lifecycle guard. Returns true if a drag is in progress.
    bool close();

    // Ends the drag in progress. `reason` is only logged.
    void end_drag(const char* reason);

    // Keeps the drag in progress alive into the next frame.
    void persist();

    void ensure_open(const char* operation) const;

    Id                       id_;
    DragStateStore&          store_;
    DndStyle                 style_;
    std::optional<DragState> current_drag_;
    std::vector<ReorderZone> reorder_zones_;
    bool                     finished_ = false;
};

}   // namespace detail

}   // namespace dragkit
