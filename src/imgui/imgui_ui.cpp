#ifdef DRAGKIT_USE_IMGUI

    #include "imgui_ui.hpp"

    #include <algorithm>
    #include <cstdint>
    #include <dragkit/logger.hpp>
    #include <imgui.h>
    #include <imgui_internal.h>

namespace dragkit
{

namespace
{

ImVec2 to_im(Vec2 v)
{
    return ImVec2(v.x, v.y);
}

Vec2 from_im(const ImVec2& v)
{
    return Vec2{v.x, v.y};
}

ImU32 to_im(Color c)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4(c.r, c.g, c.b, c.a));
}

Color from_im(const ImVec4& c)
{
    return Color{c.x, c.y, c.z, c.w};
}

const void* id_ptr(Id id)
{
    return reinterpret_cast<const void*>(static_cast<uintptr_t>(id.value()));
}

Rect intersect(const Rect& a, const Rect& b)
{
    Vec2 min{std::max(a.left(), b.left()), std::max(a.top(), b.top())};
    Vec2 max{std::min(a.right(), b.right()), std::min(a.bottom(), b.bottom())};
    max = Vec2{std::max(max.x, min.x), std::max(max.y, min.y)};
    return Rect::from_min_max(min, max);
}

}   // namespace

void ImGuiUi::new_frame()
{
    if (!layout_.empty())
    {
        DRAGKIT_LOG_WARN("imgui", "Unbalanced layout stack ({} frames) at new_frame()", layout_.size());
        layout_.clear();
    }
    overlays_.clear();
    if (!ImGui::IsMouseDown(ImGuiMouseButton_Left))
        drag_reported_ = Id::null();
}

// ─── Input ───────────────────────────────────────────────────────────────────

PointerState ImGuiUi::pointer() const
{
    PointerState state;
    if (ImGui::IsMousePosValid())
        state.interact_pos = from_im(ImGui::GetIO().MousePos);
    for (int button = 0; button < ImGuiMouseButton_COUNT; ++button)
    {
        state.any_down     = state.any_down || ImGui::IsMouseDown(button);
        state.any_released = state.any_released || ImGui::IsMouseReleased(button);
    }
    return state;
}

// ─── Layout ──────────────────────────────────────────────────────────────────

bool ImGuiUi::is_sizing_pass() const
{
    // Auto-resizing windows lay out hidden for a frame to measure themselves.
    const ImGuiWindow* window = ImGui::GetCurrentWindowRead();
    return window && window->HiddenFramesCannotSkipItems > 0;
}

Direction ImGuiUi::direction() const
{
    return layout_.empty() ? Direction::TopDown : layout_.back().direction;
}

Rect ImGuiUi::clip_rect() const
{
    ImDrawList* dl = ImGui::GetWindowDrawList();
    return Rect::from_min_max(from_im(dl->GetClipRectMin()), from_im(dl->GetClipRectMax()));
}

Rect ImGuiUi::cursor() const
{
    Vec2 pos   = from_im(ImGui::GetCursorScreenPos());
    Vec2 avail = from_im(ImGui::GetContentRegionAvail());
    return Rect{pos.x, pos.y, std::max(avail.x, 0.0f), std::max(avail.y, 0.0f)};
}

Vec2 ImGuiUi::item_spacing() const
{
    return from_im(ImGui::GetStyle().ItemSpacing);
}

void ImGuiUi::pre_item()
{
    if (layout_.empty())
        return;
    LayoutFrame& frame = layout_.back();
    if (is_horizontal(frame.direction) && !frame.first)
        ImGui::SameLine();
    frame.first = false;
}

Response ImGuiUi::allocate(Id id, Vec2 size, Sense sense)
{
    pre_item();
    Vec2 pos  = from_im(ImGui::GetCursorScreenPos());
    Rect rect = Rect{pos.x, pos.y, size.x, size.y};
    ImGui::ItemSize(ImRect(to_im(rect.left_top()), to_im(rect.right_bottom())));
    return item_response(id, rect, sense);
}

Response ImGuiUi::interact(const Response& response, Sense sense)
{
    const bool wants_drag = sense == Sense::Drag || sense == Sense::ClickAndDrag;
    if (!wants_drag || response.senses_drag())
    {
        // Already evaluated with drag sensing this frame.
        Response r = response;
        if (wants_drag)
            r.sense = response.senses_click() ? Sense::ClickAndDrag : Sense::Drag;
        return r;
    }

    Sense combined = response.senses_click() ? Sense::ClickAndDrag : Sense::Drag;
    return item_response(response.id.with("interact"), response.rect, combined);
}

Response ImGuiUi::item_response(Id id, const Rect& rect, Sense sense)
{
    Response r;
    r.id            = id;
    r.rect          = rect;
    r.interact_rect = intersect(rect, clip_rect());
    r.sense         = sense;

    const ImGuiID iid = ImGui::GetID(id_ptr(id));
    const ImRect  bb(to_im(rect.left_top()), to_im(rect.right_bottom()));
    if (!ImGui::ItemAdd(bb, iid))
        return r;

    if (sense == Sense::Hover)
    {
        r.hovered = ImGui::IsItemHovered();
        return r;
    }

    bool hovered = false;
    bool held    = false;
    ImGui::ButtonBehavior(bb, iid, &hovered, &held);

    const ImGuiIO& io = ImGui::GetIO();
    r.hovered         = hovered;
    r.has_focus       = ImGui::IsItemFocused();
    if (held || hovered)
        r.interact_pointer_pos = from_im(io.MousePos);

    if (r.senses_drag() && held
        && ImGui::IsMouseDragging(ImGuiMouseButton_Left, io.MouseDragThreshold))
    {
        r.dragged = true;
        if (drag_reported_ != id)
        {
            r.drag_started = true;
            drag_reported_ = id;
        }
    }
    return r;
}

Response ImGuiUi::last_item_response(Id id, Sense sense) const
{
    Response r;
    r.id            = id;
    r.rect          = Rect::from_min_max(from_im(ImGui::GetItemRectMin()), from_im(ImGui::GetItemRectMax()));
    r.interact_rect = intersect(r.rect, clip_rect());
    r.sense         = sense;
    r.hovered       = ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenBlockedByActiveItem);
    if (r.hovered)
        r.interact_pointer_pos = from_im(ImGui::GetIO().MousePos);
    return r;
}

Response ImGuiUi::scope(Id id, Layer layer, float opacity, const Contents& contents)
{
    pre_item();
    ImGui::PushID(id_ptr(id));
    ImGui::PushStyleVar(ImGuiStyleVar_Alpha, ImGui::GetStyle().Alpha * opacity);

    // Overlay contents are laid out in the window but painted into the
    // foreground draw list, above every window and every later item.
    ImGuiWindow* window      = ImGui::GetCurrentWindow();
    ImDrawList*  window_list = window->DrawList;
    ImDrawList*  dl          = window_list;
    const ImRect window_clip = window->ClipRect;
    if (layer == Layer::Overlay)
    {
        dl               = ImGui::GetForegroundDrawList();
        window->DrawList = dl;
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::PushClipRect(vp->Pos, ImVec2(vp->Pos.x + vp->Size.x, vp->Pos.y + vp->Size.y), false);
    }
    const int vtx_begin = dl->VtxBuffer.Size;

    layout_.push_back(LayoutFrame{direction(), true});
    ImGui::BeginGroup();
    contents(*this);
    ImGui::EndGroup();
    layout_.pop_back();

    if (layer == Layer::Overlay)
    {
        overlays_[id] = OverlayRange{dl, vtx_begin, dl->VtxBuffer.Size};
        ImGui::PopClipRect();
        window->DrawList = window_list;
        window->ClipRect = window_clip;
    }

    ImGui::PopStyleVar();
    ImGui::PopID();
    return last_item_response(id, Sense::Hover);
}

Response ImGuiUi::horizontal(Id id, bool fill_width, const Contents& contents)
{
    pre_item();
    ImGui::PushID(id_ptr(id));

    layout_.push_back(LayoutFrame{Direction::LeftToRight, true});
    ImGui::BeginGroup();
    contents(*this);
    if (fill_width)
    {
        ImGui::SameLine(0.0f, 0.0f);
        const float remaining = ImGui::GetContentRegionAvail().x;
        if (remaining > 0.0f)
            ImGui::Dummy(ImVec2(remaining, 0.0f));
    }
    ImGui::EndGroup();
    layout_.pop_back();

    ImGui::PopID();
    return last_item_response(id, Sense::Hover);
}

void ImGuiUi::translate_layer(Id layer_id, Vec2 delta)
{
    auto it = overlays_.find(layer_id);
    if (it == overlays_.end())
        return;

    const OverlayRange& range = it->second;
    for (int i = range.vtx_begin; i < range.vtx_end; ++i)
    {
        range.draw_list->VtxBuffer[i].pos.x += delta.x;
        range.draw_list->VtxBuffer[i].pos.y += delta.y;
    }
    overlays_.erase(it);
}

// ─── Painting ────────────────────────────────────────────────────────────────

void ImGuiUi::rect_filled(const Rect& rect, float rounding, Color color)
{
    ImGui::GetWindowDrawList()->AddRectFilled(to_im(rect.left_top()),
                                              to_im(rect.right_bottom()),
                                              to_im(color),
                                              rounding);
}

void ImGuiUi::rect_stroke(const Rect& rect, float rounding, const Stroke& stroke)
{
    ImGui::GetWindowDrawList()->AddRect(to_im(rect.left_top()),
                                        to_im(rect.right_bottom()),
                                        to_im(stroke.color),
                                        rounding,
                                        0,
                                        stroke.width);
}

void ImGuiUi::line_segment(const LineSegment& line, const Stroke& stroke, const Rect& clip)
{
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->PushClipRect(to_im(clip.left_top()), to_im(clip.right_bottom()), true);
    dl->AddLine(to_im(line.a), to_im(line.b), to_im(stroke.color), stroke.width);
    dl->PopClipRect();
}

void ImGuiUi::circle_filled(Vec2 center, float radius, Color color)
{
    ImGui::GetWindowDrawList()->AddCircleFilled(to_im(center), radius, to_im(color));
}

void ImGuiUi::set_cursor_icon(CursorIcon icon)
{
    switch (icon)
    {
        case CursorIcon::Default:
            ImGui::SetMouseCursor(ImGuiMouseCursor_Arrow);
            break;
        case CursorIcon::Grab:
            ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
            break;
        case CursorIcon::Grabbing:
            ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeAll);
            break;
    }
}

const Visuals& ImGuiUi::visuals() const
{
    const ImGuiStyle& style = ImGui::GetStyle();

    visuals_.hovered_bg_fill = from_im(style.Colors[ImGuiCol_ButtonHovered]);
    visuals_.active_stroke   = from_im(style.Colors[ImGuiCol_DragDropTarget]);
    visuals_.inactive_stroke = from_im(style.Colors[ImGuiCol_Border]);
    visuals_.strong_text     = from_im(style.Colors[ImGuiCol_Text]);
    visuals_.text            = from_im(style.Colors[ImGuiCol_Text]).faded(0.85f);
    visuals_.weak_text       = from_im(style.Colors[ImGuiCol_TextDisabled]);
    visuals_.button_padding  = from_im(style.FramePadding);
    visuals_.drag_threshold  = ImGui::GetIO().MouseDragThreshold;
    return visuals_;
}

}   // namespace dragkit

#endif   // DRAGKIT_USE_IMGUI
