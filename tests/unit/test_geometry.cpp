#include <dragkit/geometry.hpp>
#include <gtest/gtest.h>

using namespace dragkit;

// ─── point_in_rect ───────────────────────────────────────────────────────────

TEST(Geometry, PointInRectInclusiveEdges)
{
    Rect r{10.0f, 20.0f, 100.0f, 50.0f};
    EXPECT_TRUE(point_in_rect({10.0f, 20.0f}, r));
    EXPECT_TRUE(point_in_rect({110.0f, 70.0f}, r));
    EXPECT_TRUE(point_in_rect({60.0f, 45.0f}, r));
    EXPECT_FALSE(point_in_rect({9.9f, 45.0f}, r));
    EXPECT_FALSE(point_in_rect({60.0f, 70.1f}, r));
}

TEST(Geometry, EmptyRectContainsOnlyItsCorner)
{
    Rect r{5.0f, 5.0f, 0.0f, 0.0f};
    EXPECT_TRUE(point_in_rect({5.0f, 5.0f}, r));
    EXPECT_FALSE(point_in_rect({5.0f, 5.1f}, r));
}

// ─── axis_distance ───────────────────────────────────────────────────────────

TEST(Geometry, VerticalAxisMeasuresAlongY)
{
    // Horizontal boundary line at y = 50 spanning x in [0, 100]
    LineSegment line{{0.0f, 50.0f}, {100.0f, 50.0f}};

    auto d = axis_distance({40.0f, 20.0f}, line, Axis::Vertical);
    ASSERT_TRUE(d.has_value());
    EXPECT_FLOAT_EQ(*d, 30.0f);

    d = axis_distance({40.0f, 65.0f}, line, Axis::Vertical);
    ASSERT_TRUE(d.has_value());
    EXPECT_FLOAT_EQ(*d, 15.0f);
}

TEST(Geometry, VerticalAxisOutsideExtent)
{
    LineSegment line{{0.0f, 50.0f}, {100.0f, 50.0f}};
    EXPECT_FALSE(axis_distance({-1.0f, 50.0f}, line, Axis::Vertical).has_value());
    EXPECT_FALSE(axis_distance({101.0f, 50.0f}, line, Axis::Vertical).has_value());
    EXPECT_TRUE(axis_distance({100.0f, 0.0f}, line, Axis::Vertical).has_value());
}

TEST(Geometry, HorizontalAxisMeasuresAlongX)
{
    // Vertical boundary at x = 30 spanning y in [0, 20]
    LineSegment line{{30.0f, 0.0f}, {30.0f, 20.0f}};

    auto d = axis_distance({10.0f, 5.0f}, line, Axis::Horizontal);
    ASSERT_TRUE(d.has_value());
    EXPECT_FLOAT_EQ(*d, 20.0f);
    EXPECT_FALSE(axis_distance({10.0f, 25.0f}, line, Axis::Horizontal).has_value());
}

TEST(Geometry, ReversedSegmentEndpoints)
{
    LineSegment line{{100.0f, 50.0f}, {0.0f, 50.0f}};
    auto        d = axis_distance({40.0f, 60.0f}, line, Axis::Vertical);
    ASSERT_TRUE(d.has_value());
    EXPECT_FLOAT_EQ(*d, 10.0f);
}

// ─── Rect helpers ────────────────────────────────────────────────────────────

TEST(Geometry, ExpandRectUniform)
{
    Rect r = expand_rect(Rect{10.0f, 10.0f, 20.0f, 20.0f}, 2.0f);
    EXPECT_EQ(r, (Rect{8.0f, 8.0f, 24.0f, 24.0f}));
}

TEST(Geometry, ExpandRectPerAxis)
{
    Rect r = expand_rect(Rect{0.0f, 0.0f, 100.0f, 20.0f}, Vec2{1.0f, 3.0f});
    EXPECT_EQ(r, (Rect{-1.0f, -3.0f, 102.0f, 26.0f}));
}

TEST(Geometry, LeadingEdgePerDirection)
{
    Rect r{0.0f, 0.0f, 10.0f, 20.0f};
    EXPECT_EQ(leading_edge(r, Direction::TopDown), (LineSegment{{0.0f, 0.0f}, {10.0f, 0.0f}}));
    EXPECT_EQ(leading_edge(r, Direction::BottomUp), (LineSegment{{0.0f, 20.0f}, {10.0f, 20.0f}}));
    EXPECT_EQ(leading_edge(r, Direction::LeftToRight), (LineSegment{{0.0f, 0.0f}, {0.0f, 20.0f}}));
    EXPECT_EQ(leading_edge(r, Direction::RightToLeft), (LineSegment{{10.0f, 0.0f}, {10.0f, 20.0f}}));
}

TEST(Geometry, UnionRect)
{
    Rect u = union_rect(Rect{0.0f, 0.0f, 10.0f, 10.0f}, Rect{20.0f, 5.0f, 10.0f, 10.0f});
    EXPECT_EQ(u, (Rect{0.0f, 0.0f, 30.0f, 15.0f}));
}

TEST(Geometry, DirectionAxes)
{
    EXPECT_TRUE(is_horizontal(Direction::LeftToRight));
    EXPECT_TRUE(is_horizontal(Direction::RightToLeft));
    EXPECT_FALSE(is_horizontal(Direction::TopDown));
    EXPECT_EQ(main_axis(Direction::BottomUp), Axis::Vertical);
    EXPECT_EQ(main_axis(Direction::LeftToRight), Axis::Horizontal);
}
