#pragma once

#include <dragkit/geometry.hpp>

namespace dragkit
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // Same colour with its alpha scaled by `opacity`.
    constexpr Color faded(float opacity) const { return Color{r, g, b, a * opacity}; }

    constexpr bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

struct Stroke
{
    float width = 1.0f;
    Color color;

    constexpr bool operator==(const Stroke&) const = default;
};

namespace tokens
{

// Drag-and-drop defaults
constexpr float PAYLOAD_HOLE_ROUNDING  = 3.0f;
constexpr float PAYLOAD_HOLE_OPACITY   = 0.25f;
constexpr float PAYLOAD_OPACITY        = 1.0f;
constexpr float DROP_ZONE_STROKE_WIDTH = 2.0f;
constexpr float DROP_ZONE_ROUNDING     = 3.0f;
constexpr float REORDER_STROKE_WIDTH   = 2.0f;

// Reorder grab handle
constexpr float HANDLE_WIDTH      = 12.0f;
constexpr float HANDLE_HEIGHT     = 20.0f;
constexpr float HANDLE_DOT_RADIUS = 1.0f;

// Input
constexpr float DRAG_THRESHOLD = 6.0f;   // px of pointer travel before a press becomes a drag

}   // namespace tokens

// Styling for a drag-and-drop context.
struct DndStyle
{
    float payload_hole_rounding  = tokens::PAYLOAD_HOLE_ROUNDING;    // hole left behind by the payload
    float payload_hole_opacity   = tokens::PAYLOAD_HOLE_OPACITY;     // opacity of the hole fill
    float payload_opacity        = tokens::PAYLOAD_OPACITY;          // opacity of the dragged payload
    float drop_zone_stroke_width = tokens::DROP_ZONE_STROKE_WIDTH;   // explicit drop zone outline
    float drop_zone_rounding     = tokens::DROP_ZONE_ROUNDING;
    float reorder_stroke_width   = tokens::REORDER_STROKE_WIDTH;     // highlighted reorder line
};

// Colours and metrics supplied by the UI backend.
struct Visuals
{
    Color hovered_bg_fill = rgb(0.27f, 0.27f, 0.30f);
    Color active_stroke   = rgb(1.00f, 1.00f, 1.00f);
    Color inactive_stroke = rgb(0.38f, 0.38f, 0.42f);

    Color strong_text = rgb(1.00f, 1.00f, 1.00f);
    Color text        = rgb(0.80f, 0.80f, 0.82f);
    Color weak_text   = rgb(0.55f, 0.55f, 0.58f);

    Vec2  button_padding{4.0f, 1.0f};
    float drag_threshold = tokens::DRAG_THRESHOLD;
};

}   // namespace dragkit
