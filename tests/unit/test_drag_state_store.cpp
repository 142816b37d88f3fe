#include <dragkit/drag_state.hpp>
#include <gtest/gtest.h>

using namespace dragkit;

namespace
{

DragState sample_state()
{
    return DragState{.payload_id    = Id::from("item"),
                     .cursor_offset = {-10.0f, -15.0f},
                     .drop_pos      = {50.0f, 10.0f}};
}

}   // namespace

TEST(DragStateStore, StoreAndLoad)
{
    DragStateStore store;
    Id             ctx = Id::from("ctx");

    EXPECT_FALSE(store.load(ctx).has_value());
    store.store(ctx, sample_state());
    ASSERT_TRUE(store.load(ctx).has_value());
    EXPECT_EQ(*store.load(ctx), sample_state());
    EXPECT_TRUE(store.contains(ctx));
}

TEST(DragStateStore, TakeRemoves)
{
    DragStateStore store;
    Id             ctx = Id::from("ctx");
    store.store(ctx, sample_state());

    auto taken = store.take(ctx);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(*taken, sample_state());
    EXPECT_FALSE(store.contains(ctx));
    EXPECT_FALSE(store.take(ctx).has_value());
}

TEST(DragStateStore, ContextsAreIndependent)
{
    DragStateStore store;
    store.store(Id::from("a"), sample_state());
    store.store(Id::from("b"), sample_state());
    EXPECT_EQ(store.active_drags(), 2u);

    store.clear(Id::from("a"));
    EXPECT_FALSE(store.contains(Id::from("a")));
    EXPECT_TRUE(store.contains(Id::from("b")));
    EXPECT_EQ(store.active_drags(), 1u);
}

TEST(DragStateStore, Markers)
{
    DragStateStore store;
    Id             ctx = Id::from("ctx");

    EXPECT_FALSE(store.raise_marker(ctx));
    EXPECT_TRUE(store.has_marker(ctx));
    EXPECT_TRUE(store.raise_marker(ctx));

    store.lower_marker(ctx);
    EXPECT_FALSE(store.has_marker(ctx));
    store.lower_marker(ctx);   // no-op
    EXPECT_FALSE(store.has_marker(ctx));
}

TEST(DragStateStore, Reset)
{
    DragStateStore store;
    store.store(Id::from("a"), sample_state());
    store.raise_marker(Id::from("a"));

    store.reset();
    EXPECT_EQ(store.active_drags(), 0u);
    EXPECT_FALSE(store.has_marker(Id::from("a")));
}
