#include <dragkit/reorder_handle.hpp>

namespace dragkit
{

Response ReorderHandle::show(Ui& ui, Id id) const
{
    Response r = ui.allocate(id, Vec2{tokens::HANDLE_WIDTH, tokens::HANDLE_HEIGHT}, Sense::Drag);
    if (ui.is_sizing_pass())
        return r;

    const Visuals& visuals = ui.visuals();
    Color          color   = visuals.weak_text;
    if (r.has_focus || r.dragged)
        color = visuals.strong_text;
    else if (r.hovered)
        color = visuals.text;

    const float  spacing = visuals.button_padding.x / 2.0f;
    const Vec2   center  = r.rect.center();
    const float  dys[]   = {-2.0f, 0.0f, 2.0f};
    const float  dxs[]   = {-1.0f, 1.0f};
    for (float dy : dys)
    {
        for (float dx : dxs)
        {
            ui.circle_filled(center + Vec2{dx, dy} * spacing, tokens::HANDLE_DOT_RADIUS, color);
        }
    }
    return r;
}

}   // namespace dragkit
