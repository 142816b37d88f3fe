#include <dragkit/id.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

using namespace dragkit;

TEST(Id, NullByDefault)
{
    Id id;
    EXPECT_TRUE(id.is_null());
    EXPECT_EQ(id, Id::null());
}

TEST(Id, FromNameIsStable)
{
    constexpr Id a = Id::from("layers");
    EXPECT_EQ(a, Id::from("layers"));
    EXPECT_NE(a, Id::from("layer"));
    EXPECT_FALSE(a.is_null());
}

TEST(Id, ChildIdsDependOnParentAndValue)
{
    Id list_a = Id::from("a");
    Id list_b = Id::from("b");

    EXPECT_EQ(list_a.with(size_t{3}), list_a.with(size_t{3}));
    EXPECT_NE(list_a.with(size_t{3}), list_a.with(size_t{4}));
    EXPECT_NE(list_a.with(size_t{3}), list_b.with(size_t{3}));
}

TEST(Id, StringOverloadsAgree)
{
    Id         base = Id::from("root");
    std::string name = "handle";
    EXPECT_EQ(base.with("handle"), base.with(name));
    EXPECT_EQ(base.with(std::string_view("handle")), base.with(name));
}

TEST(Id, CompositePayloads)
{
    Id base = Id::from("nested");
    EXPECT_NE(base.with(std::pair<size_t, size_t>{0, 1}), base.with(std::pair<size_t, size_t>{1, 0}));
    EXPECT_NE(base.with(std::optional<size_t>{}), base.with(std::optional<size_t>{0}));
}

TEST(Id, DistinctChildrenOfOneContext)
{
    Id                     base = Id::from("list");
    std::unordered_set<Id> seen;
    for (size_t i = 0; i < 1000; ++i)
        seen.insert(base.with(i));
    EXPECT_EQ(seen.size(), 1000u);
}
