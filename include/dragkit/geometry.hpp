#pragma once

#include <optional>

namespace dragkit
{

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    constexpr bool operator==(const Vec2&) const = default;
};

inline constexpr Vec2 operator+(Vec2 a, Vec2 b)
{
    return {a.x + b.x, a.y + b.y};
}

inline constexpr Vec2 operator-(Vec2 a, Vec2 b)
{
    return {a.x - b.x, a.y - b.y};
}

inline constexpr Vec2 operator*(Vec2 v, float s)
{
    return {v.x * s, v.y * s};
}

inline constexpr Vec2 operator/(Vec2 v, float s)
{
    return {v.x / s, v.y / s};
}

// Axis-aligned rectangle in screen space (y grows downwards).
struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    static constexpr Rect from_min_max(Vec2 min, Vec2 max)
    {
        return Rect{min.x, min.y, max.x - min.x, max.y - min.y};
    }

    constexpr float left() const { return x; }
    constexpr float right() const { return x + w; }
    constexpr float top() const { return y; }
    constexpr float bottom() const { return y + h; }

    constexpr Vec2 left_top() const { return {left(), top()}; }
    constexpr Vec2 right_top() const { return {right(), top()}; }
    constexpr Vec2 left_bottom() const { return {left(), bottom()}; }
    constexpr Vec2 right_bottom() const { return {right(), bottom()}; }
    constexpr Vec2 center() const { return {x + w * 0.5f, y + h * 0.5f}; }
    constexpr Vec2 size() const { return {w, h}; }

    constexpr bool operator==(const Rect&) const = default;
};

// Main direction of a layout. Reorder boundaries run perpendicular to it.
enum class Direction
{
    LeftToRight,
    RightToLeft,
    TopDown,
    BottomUp,
};

enum class Axis
{
    Horizontal,
    Vertical,
};

inline constexpr bool is_horizontal(Direction d)
{
    return d == Direction::LeftToRight || d == Direction::RightToLeft;
}

inline constexpr Axis main_axis(Direction d)
{
    return is_horizontal(d) ? Axis::Horizontal : Axis::Vertical;
}

struct LineSegment
{
    Vec2 a;
    Vec2 b;

    constexpr bool operator==(const LineSegment&) const = default;
};

// Inclusive on all four edges.
bool point_in_rect(Vec2 point, const Rect& rect);

// Distance from `point` to the line of a boundary segment laid out along
// `axis`. For a horizontal layout the segment is vertical: the result is the
// x distance, and only if point.y lies within the segment's y extent.
// Vertical layouts are the transpose. Returns nullopt outside the extent.
std::optional<float> axis_distance(Vec2 point, const LineSegment& segment, Axis axis);

Rect expand_rect(const Rect& rect, float amount);
Rect expand_rect(const Rect& rect, Vec2 amount);

// The edge a new element would be placed against in a layout running in
// `direction`, e.g. the top edge for TopDown.
LineSegment leading_edge(const Rect& rect, Direction direction);

Rect union_rect(const Rect& a, const Rect& b);

}   // namespace dragkit
