#include <algorithm>
#include <cmath>
#include <dragkit/geometry.hpp>

namespace dragkit
{

bool point_in_rect(Vec2 point, const Rect& rect)
{
    return rect.left() <= point.x && point.x <= rect.right() && rect.top() <= point.y
           && point.y <= rect.bottom();
}

std::optional<float> axis_distance(Vec2 point, const LineSegment& segment, Axis axis)
{
    const Vec2& a = segment.a;
    const Vec2& b = segment.b;

    if (axis == Axis::Horizontal)
    {
        if (point.y < std::min(a.y, b.y) || point.y > std::max(a.y, b.y))
            return std::nullopt;
        return std::abs(a.x - point.x);
    }

    if (point.x < std::min(a.x, b.x) || point.x > std::max(a.x, b.x))
        return std::nullopt;
    return std::abs(a.y - point.y);
}

Rect expand_rect(const Rect& rect, float amount)
{
    return expand_rect(rect, Vec2{amount, amount});
}

Rect expand_rect(const Rect& rect, Vec2 amount)
{
    return Rect{rect.x - amount.x, rect.y - amount.y, rect.w + 2.0f * amount.x,
                rect.h + 2.0f * amount.y};
}

LineSegment leading_edge(const Rect& rect, Direction direction)
{
    switch (direction)
    {
        case Direction::LeftToRight:
            return {rect.left_top(), rect.left_bottom()};
        case Direction::RightToLeft:
            return {rect.right_top(), rect.right_bottom()};
        case Direction::TopDown:
            return {rect.left_top(), rect.right_top()};
        case Direction::BottomUp:
            return {rect.left_bottom(), rect.right_bottom()};
    }
    return {rect.left_top(), rect.right_top()};
}

Rect union_rect(const Rect& a, const Rect& b)
{
    Vec2 min{std::min(a.left(), b.left()), std::min(a.top(), b.top())};
    Vec2 max{std::max(a.right(), b.right()), std::max(a.bottom(), b.bottom())};
    return Rect::from_min_max(min, max);
}

}   // namespace dragkit
