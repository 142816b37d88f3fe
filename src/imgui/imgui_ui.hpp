#pragma once

#ifdef DRAGKIT_USE_IMGUI

    #include <dragkit/drag_state.hpp>
    #include <dragkit/ui.hpp>
    #include <unordered_map>
    #include <vector>

struct ImDrawList;

namespace dragkit
{

// Ui backend on top of Dear ImGui. Lives as long as the ImGui context; call
// new_frame() after ImGui::NewFrame() and use it from inside a window.
//
// Overlay scopes take part in the current window's layout but are painted
// into the foreground draw list with a viewport-sized clip rect, and are
// moved by translating their vertices.
class ImGuiUi : public Ui
{
   public:
    ImGuiUi() = default;

    ImGuiUi(const ImGuiUi&)            = delete;
    ImGuiUi& operator=(const ImGuiUi&) = delete;

    void new_frame();

    // ─── Ui ─────────────────────────────────────────────────────────────

    PointerState pointer() const override;

    bool      is_sizing_pass() const override;
    Direction direction() const override;
    Rect      clip_rect() const override;
    Rect      cursor() const override;
    Vec2      item_spacing() const override;

    Response allocate(Id id, Vec2 size, Sense sense) override;
    Response interact(const Response& response, Sense sense) override;
    Response scope(Id id, Layer layer, float opacity, const Contents& contents) override;
    Response horizontal(Id id, bool fill_width, const Contents& contents) override;
    void     translate_layer(Id layer_id, Vec2 delta) override;

    void rect_filled(const Rect& rect, float rounding, Color color) override;
    void rect_stroke(const Rect& rect, float rounding, const Stroke& stroke) override;
    void line_segment(const LineSegment& line, const Stroke& stroke, const Rect& clip) override;
    void circle_filled(Vec2 center, float radius, Color color) override;

    void           set_cursor_icon(CursorIcon icon) override;
    const Visuals& visuals() const override;

    DragStateStore& store() override { return store_; }

   private:
    struct LayoutFrame
    {
        Direction direction = Direction::TopDown;
        bool      first     = true;
    };

    struct OverlayRange
    {
        ImDrawList* draw_list = nullptr;
        int         vtx_begin = 0;
        int         vtx_end   = 0;
    };

    // Places the next item according to the innermost layout frame.
    void pre_item();

    Response item_response(Id id, const Rect& rect, Sense sense);
    Response last_item_response(Id id, Sense sense) const;

    DragStateStore                         store_;
    std::vector<LayoutFrame>               layout_;
    std::unordered_map<Id, OverlayRange>   overlays_;
    Id                                     drag_reported_;   // element whose drag start was reported
    mutable Visuals                        visuals_;
};

}   // namespace dragkit

#endif   // DRAGKIT_USE_IMGUI
