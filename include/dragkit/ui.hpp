#pragma once

#include <dragkit/geometry.hpp>
#include <dragkit/id.hpp>
#include <dragkit/style.hpp>
#include <functional>
#include <optional>

namespace dragkit
{

class DragStateStore;

// What kind of pointer interaction an element listens for.
enum class Sense
{
    Hover,
    Click,
    Drag,
    ClickAndDrag,
};

enum class CursorIcon
{
    Default,
    Grab,
    Grabbing,
};

// Rendering layer for a scope. Overlay content is painted above the normal
// flow and can be moved with Ui::translate_layer().
enum class Layer
{
    Normal,
    Overlay,
};

// Interaction result of an element for the current frame.
struct Response
{
    Id    id;
    Rect  rect;            // where the element was laid out
    Rect  interact_rect;   // part of `rect` that accepts the pointer (clipped)
    Sense sense = Sense::Hover;

    bool hovered      = false;
    bool dragged      = false;   // being dragged this frame
    bool drag_started = false;   // pointer moved past the drag threshold this frame
    bool has_focus    = false;

    std::optional<Vec2> interact_pointer_pos;

    bool senses_click() const { return sense == Sense::Click || sense == Sense::ClickAndDrag; }
    bool senses_drag() const { return sense == Sense::Drag || sense == Sense::ClickAndDrag; }
};

struct PointerState
{
    std::optional<Vec2> interact_pos;   // unset while the pointer is outside the UI
    bool                any_down     = false;
    bool                any_released = false;
};

// Render, layout and input collaborator used by the drag-and-drop engine.
// One Ui lives as long as the application's UI; the engine is rebuilt on top
// of it every frame. Implementations: ImGuiUi (Dear ImGui), FakeUi (tests).
class Ui
{
   public:
    using Contents = std::function<void(Ui&)>;

    virtual ~Ui() = default;

    // ─── Input ──────────────────────────────────────────────────────────

    virtual PointerState pointer() const = 0;

    // ─── Layout ─────────────────────────────────────────────────────────

    // True while the UI only measures its contents; nothing is interactive.
    virtual bool      is_sizing_pass() const = 0;
    virtual Direction direction() const      = 0;
    virtual Rect      clip_rect() const      = 0;
    // Space where the next element will be placed.
    virtual Rect cursor() const       = 0;
    virtual Vec2 item_spacing() const = 0;

    // Reserves `size` at the cursor and reports how the pointer interacts
    // with it.
    virtual Response allocate(Id id, Vec2 size, Sense sense) = 0;

    // Re-evaluates interaction for an existing element with `sense` added.
    virtual Response interact(const Response& response, Sense sense) = 0;

    // Lays out `contents` as one element in `layer`, drawn at `opacity`.
    virtual Response scope(Id id, Layer layer, float opacity, const Contents& contents) = 0;

    // Lays out `contents` left to right. With `fill_width` the row spans the
    // remaining width of the parent.
    virtual Response horizontal(Id id, bool fill_width, const Contents& contents) = 0;

    // Moves everything painted this frame in the overlay scope `layer_id`.
    virtual void translate_layer(Id layer_id, Vec2 delta) = 0;

    // ─── Painting ───────────────────────────────────────────────────────

    virtual void rect_filled(const Rect& rect, float rounding, Color color)          = 0;
    virtual void rect_stroke(const Rect& rect, float rounding, const Stroke& stroke) = 0;
    virtual void line_segment(const LineSegment& line, const Stroke& stroke, const Rect& clip) = 0;
    virtual void circle_filled(Vec2 center, float radius, Color color)                        = 0;

    virtual void           set_cursor_icon(CursorIcon icon) = 0;
    virtual const Visuals& visuals() const                  = 0;

    // ─── Storage ────────────────────────────────────────────────────────

    virtual DragStateStore& store() = 0;
};

}   // namespace dragkit
