#include "kviz/Utils/UID.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

TEST(UID, DefaultConstructedIDsAreUniqueAndValid)
{
    kviz::UID const a;
    kviz::UID const b;

    ASSERT_NE(a, b);
    ASSERT_TRUE(static_cast<bool>(a));
    ASSERT_TRUE(static_cast<bool>(b));
}

TEST(UID, CopiesShareTheirID)
{
    kviz::UID const a;
    kviz::UID const b = a;

    ASSERT_EQ(a, b);
}

TEST(UID, ResetFetchesANewID)
{
    kviz::UID id;
    kviz::UID const before = id;

    id.reset();

    ASSERT_NE(id, before);
}

TEST(UID, InvalidAndEmptyAreFalsey)
{
    ASSERT_FALSE(static_cast<bool>(kviz::UID::invalid()));
    ASSERT_FALSE(static_cast<bool>(kviz::UID::empty()));
}

TEST(UID, CanBeUsedAsAHashKey)
{
    kviz::UID const a;
    kviz::UID const b;
    std::unordered_set<kviz::UID> const ids = {a, b, a};

    ASSERT_EQ(ids.size(), 2);
}
