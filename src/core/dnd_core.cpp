#include <dragkit/dnd_core.hpp>
#include <dragkit/lifecycle_guard.hpp>
#include <dragkit/logger.hpp>

namespace dragkit::detail
{

DndCore::DndCore(Ui& ui, Id id) : id_(id), store_(ui.store())
{
    raise_lifecycle_guard(store_, id_);

    // The state is taken out of the store and only written back by finish(),
    // so a context that is never finished also ends its drag.
    current_drag_ = store_.take(id_);

    PointerState pointer = ui.pointer();
    if (current_drag_ && !(pointer.any_down || pointer.any_released))
    {
        // Button went up without a release event reaching us (focus loss,
        // skipped frames). Treat as a cancelled drag.
        DRAGKIT_LOG_WARN("dnd", "Discarding interrupted drag in context {}", id_.value());
        current_drag_.reset();
    }
}

std::optional<Id> DndCore::payload_id() const
{
    if (!current_drag_)
        return std::nullopt;
    return current_drag_->payload_id;
}

void DndCore::allow_unfinished()
{
    lower_lifecycle_guard(store_, id_);
}

// ─── Draggables ──────────────────────────────────────────────────────────────

bool DndCore::show_draggable(Ui& ui, Id id, const HandleContents& contents, DraggableResponse& out)
{
    ensure_open("draggable");

    Response handle;
    auto     run = [&](Ui& inner) { handle = contents(inner); };

    if (ui.is_sizing_pass())
    {
        out.response = ui.scope(id, Layer::Normal, 1.0f, run);
        out.handle   = handle;
        return false;
    }

    if (current_drag_ && current_drag_->payload_id == id)
    {
        ui.set_cursor_icon(CursorIcon::Grabbing);

        // Painted in its own layer so it can follow the pointer; the normal
        // flow keeps a hole of the same size.
        Response r = ui.scope(id, Layer::Overlay, style_.payload_opacity, run);
        ui.rect_filled(r.rect,
                       style_.payload_hole_rounding,
                       ui.visuals().hovered_bg_fill.faded(style_.payload_hole_opacity));

        if (auto pointer = ui.pointer().interact_pos)
        {
            Vec2 delta = *pointer + current_drag_->cursor_offset - r.rect.left_top();
            ui.translate_layer(id, delta);
            current_drag_->drop_pos = r.rect.center() + delta;
        }

        out.response = r;
        out.handle   = handle;
        return true;
    }

    Response r = ui.scope(id, Layer::Normal, 1.0f, run);
    handle     = ui.interact(handle, Sense::Drag);

    if (!is_dragging() && !handle.senses_click() && handle.hovered)
        ui.set_cursor_icon(CursorIcon::Grab);

    bool started = false;
    if (handle.drag_started && handle.interact_pointer_pos)
    {
        current_drag_ = DragState{.payload_id    = id,
                                  .cursor_offset = r.rect.left_top() - *handle.interact_pointer_pos,
                                  .drop_pos      = r.rect.center()};
        DRAGKIT_LOG_DEBUG("dnd", "Context {}: drag started on element {}", id_.value(), id.value());
        started = true;
    }

    out.response = r;
    out.handle   = handle;
    return started;
}

// ─── Drop zones ──────────────────────────────────────────────────────────────

bool DndCore::hit_drop_zone(Ui& ui, const Response& response)
{
    ensure_open("drop_zone");

    if (ui.is_sizing_pass() || !current_drag_)
        return false;

    const Visuals& visuals = ui.visuals();
    const bool     active  = point_in_rect(current_drag_->drop_pos, response.interact_rect);

    Stroke stroke{style_.drop_zone_stroke_width,
                  active ? visuals.active_stroke : visuals.inactive_stroke};
    // Stroke sits outside the element.
    ui.rect_stroke(expand_rect(response.rect, stroke.width * 0.5f), style_.drop_zone_rounding, stroke);
    return active;
}

void DndCore::push_reorder_zone_at_cursor(Ui& ui)
{
    ensure_open("reorder_drop_zone");

    const Direction dir = ui.direction();
    reorder_zones_.push_back(ReorderZone{leading_edge(ui.cursor(), dir), ui.clip_rect(), dir});
}

bool DndCore::push_before_after_zones(Ui& ui, const Response& response)
{
    ensure_open("reorder_drop_zone_before_after");

    if (!is_dragging())
        return false;

    // Boundaries sit halfway into the spacing between neighbours.
    const Vec2 expansion = ui.item_spacing() / 2.0f;
    const Rect rect      = expand_rect(response.rect, expansion);
    const Rect clip      = expand_rect(ui.clip_rect(), expansion);

    const Direction dir   = ui.direction();
    const bool      horiz = is_horizontal(dir);

    reorder_zones_.push_back(
        ReorderZone{{rect.left_top(), horiz ? rect.left_bottom() : rect.right_top()}, clip, dir});
    reorder_zones_.push_back(
        ReorderZone{{horiz ? rect.right_top() : rect.left_bottom(), rect.right_bottom()}, clip, dir});
    return true;
}

std::optional<size_t> DndCore::closest_reorder_zone(Ui& ui)
{
    if (!current_drag_)
        return std::nullopt;

    auto cursor = ui.pointer().interact_pos;
    if (!cursor)
        return std::nullopt;

    const Vec2 drop = current_drag_->drop_pos;
    const Rect clip = ui.clip_rect();
    if (!point_in_rect({drop.x, cursor->y}, clip) && !point_in_rect({cursor->x, drop.y}, clip))
        return std::nullopt;   // pointer is outside this part of the UI

    std::optional<size_t> best;
    float                 best_distance = 0.0f;
    for (size_t i = 0; i < reorder_zones_.size(); ++i)
    {
        const ReorderZone& zone = reorder_zones_[i];

        // The extent is tested with the dragged element's centre, the
        // distance is measured from the pointer.
        Vec2 sample = is_horizontal(zone.direction) ? Vec2{cursor->x, drop.y} : Vec2{drop.x, cursor->y};
        auto distance = axis_distance(sample, zone.line, main_axis(zone.direction));
        if (distance && (!best || *distance < best_distance))
        {
            best          = i;
            best_distance = *distance;
        }
    }

    if (best)
    {
        const ReorderZone& zone = reorder_zones_[*best];
        Stroke             stroke{style_.reorder_stroke_width, ui.visuals().active_stroke};
        ui.line_segment(zone.line, stroke, expand_rect(zone.clip_rect, style_.reorder_stroke_width));
    }
    return best;
}

// ─── Finish ──────────────────────────────────────────────────────────────────

bool DndCore::close()
{
    ensure_open("finish");
    finished_ = true;
    allow_unfinished();
    return current_drag_.has_value();
}

void DndCore::end_drag(const char* reason)
{
    DRAGKIT_LOG_DEBUG("dnd", "Context {}: drag ended ({})", id_.value(), reason);
    current_drag_.reset();
    store_.clear(id_);
}

void DndCore::persist()
{
    if (current_drag_)
        store_.store(id_, *current_drag_);
}

void DndCore::ensure_open(const char* operation) const
{
    if (finished_)
        throw LifecycleError(id_, std::string(operation) + "() called after finish()");
}

}   // namespace dragkit::detail
