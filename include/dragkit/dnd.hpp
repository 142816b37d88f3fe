#pragma once

#include <cstddef>
#include <dragkit/dnd_core.hpp>
#include <dragkit/lifecycle_guard.hpp>
#include <dragkit/reorder.hpp>
#include <dragkit/reorder_handle.hpp>
#include <dragkit/response.hpp>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace dragkit
{

// Drag-and-drop context for one frame.
//
// - `Payload` identifies what is being dragged. Element identities are
//   derived from it through KeyHash<Payload>, so payloads must be unique
//   within a context.
// - `Target` identifies where it can be dropped.
//
// Construct one per frame with a stable `id`, register draggables and drop
// zones, then call finish(). A context that goes out of scope without
// finish() or allow_unfinished() makes the next construction with the same
// id throw LifecycleError.
//
//   ReorderDnd<> dnd(ui, Id::from("layers"));
//   for (size_t i = 0; i < layers.size(); ++i)
//       dnd.reorderable_with_handle(ui, i, [&](Ui& ui, Id) { draw_layer(ui, layers[i]); });
//   if (auto move = dnd.finish(ui).if_done_dragging())
//       reorder(*move, layers);
template <typename Payload, typename Target>
class Dnd : public detail::DndCore
{
   public:
    using Result = DndResponse<Payload, Target>;

    Dnd(Ui& ui, Id id) : DndCore(ui, id) {}

    Dnd& with_style(const DndStyle& style)
    {
        set_style(style);
        return *this;
    }

    // ─── Draggables ─────────────────────────────────────────────────────

    // `contents(ui)` renders the element and returns the response of its
    // drag handle, which may be any widget that does not use drags itself.
    template <typename Contents>
    DraggableResponse draggable_with_id(Ui& ui, Id id, Payload payload, Contents&& contents)
    {
        DraggableResponse out;
        if (show_draggable(ui, id, HandleContents(std::forward<Contents>(contents)), out))
            payload_ = std::move(payload);
        return out;
    }

    // Like draggable_with_id() with the id derived from `payload`.
    // `contents(ui, id)` receives that id.
    template <typename Contents>
    DraggableResponse draggable(Ui& ui, Payload payload, Contents&& contents)
    {
        const Id id = id_.with(payload);
        return draggable_with_id(ui,
                                 id,
                                 std::move(payload),
                                 [&contents, id](Ui& inner) { return contents(inner, id); });
    }

    // ─── Drop zones ─────────────────────────────────────────────────────

    // Makes an existing element a drop target. When zones overlap the last
    // one registered wins.
    void drop_zone(Ui& ui, const Response& response, Target target)
    {
        if (hit_drop_zone(ui, response))
            target_ = std::move(target);
    }

    // Reorder boundary at the layout cursor, e.g. after the last element.
    void reorder_drop_zone(Ui& ui, Target target)
    {
        push_reorder_zone_at_cursor(ui);
        zone_targets_.push_back(std::move(target));
    }

    // Reorder boundaries before and after `response`.
    template <typename T>
    void reorder_drop_zone_before_after(Ui& ui, const Response& response, T target)
    {
        static_assert(std::is_same_v<Target, Placed<T>>,
                      "before/after zones need a Dnd whose Target is Placed<T>");
        if (!push_before_after_zones(ui, response))
            return;
        zone_targets_.push_back(Target{target, Placement::Before});
        zone_targets_.push_back(Target{std::move(target), Placement::After});
    }

    // ─── Reordering ─────────────────────────────────────────────────────

    // Draggable element that is also a reorder target for its own index.
    template <typename Contents>
    DraggableResponse reorderable(Ui& ui, Payload index, Contents&& contents)
    {
        static_assert(std::is_same_v<Target, Placed<Payload>>,
                      "reorderable() needs a Dnd<I, Placed<I>>");
        DraggableResponse r = draggable(ui, index, std::forward<Contents>(contents));
        reorder_drop_zone_before_after(ui, r.response, std::move(index));
        return r;
    }

    // reorderable() with a ReorderHandle in front of the contents. The whole
    // row is the element; only the handle starts drags.
    template <typename Contents>
    DraggableResponse reorderable_with_handle(Ui& ui, Payload index, Contents&& contents)
    {
        return reorderable(ui,
                           std::move(index),
                           [&contents](Ui& inner, Id id)
                           {
                               Response   handle;
                               const bool fill = !is_horizontal(inner.direction());
                               inner.horizontal(id.with("row"),
                                                fill,
                                                [&](Ui& row)
                                                {
                                                    handle = ReorderHandle{}.show(row, id.with("handle"));
                                                    contents(row, id);
                                                });
                               return handle;
                           });
    }

    // ─── Finish ─────────────────────────────────────────────────────────

    // Resolves the target and ends the frame for this context. Must be the
    // last call on the context.
    Result finish(Ui& ui)
    {
        if (!close())
            return Inactive{};

        if (!payload_)
        {
            // The dragged element was not rendered this frame.
            end_drag("payload no longer rendered");
            return Inactive{};
        }

        std::optional<size_t> zone = closest_reorder_zone(ui);
        if (!target_ && zone)
            target_ = zone_targets_[*zone];

        if (ui.pointer().any_released)
        {
            if (target_)
            {
                end_drag("dropped");
                return DoneDragging<Payload, Target>{{std::move(*payload_), std::move(*target_)}};
            }
            end_drag("released over no target");
            return Inactive{};
        }

        persist();
        return MidDrag<Payload, Target>{{std::move(*payload_), std::move(target_)}};
    }

   private:
    std::optional<Payload> payload_;
    std::optional<Target>  target_;
    std::vector<Target>    zone_targets_;   // parallel to reorder_zones_
};

// Context for reordering a flat sequence by index.
template <typename I = size_t>
using ReorderDnd = Dnd<I, Placed<I>>;

}   // namespace dragkit
