#include "leastrecent/key_index.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

namespace leastrecent {
namespace {

TEST(KeyIndexTest, StringKeys) {
    KeyIndex<std::string> index(4);
    EXPECT_FALSE(index.Lookup("one"));

    index.Insert("one", 0);
    index.Insert("two", 1);
    ASSERT_TRUE(index.Lookup("one"));
    EXPECT_EQ(*index.Lookup("one"), 0u);
    EXPECT_EQ(*index.Lookup("two"), 1u);
    EXPECT_EQ(index.Size(), 2u);

    EXPECT_TRUE(index.Remove("one"));
    EXPECT_FALSE(index.Remove("one"));
    EXPECT_FALSE(index.Contains("one"));
    EXPECT_TRUE(index.Contains("two"));
}

TEST(KeyIndexTest, NumericKeys) {
    KeyIndex<std::int64_t> index(2);
    index.Insert(-7, 1);
    index.Insert(42, 0);
    EXPECT_EQ(*index.Lookup(-7), 1u);
    EXPECT_EQ(*index.Lookup(42), 0u);
    EXPECT_FALSE(index.Lookup(7));
}

TEST(KeyIndexTest, InsertOverwritesSlot) {
    KeyIndex<std::string> index(2);
    index.Insert("k", 0);
    index.Insert("k", 1);
    EXPECT_EQ(*index.Lookup("k"), 1u);
    EXPECT_EQ(index.Size(), 1u);
}

TEST(KeyIndexTest, ClearForgetsEveryKey) {
    KeyIndex<std::string> index(2);
    index.Insert("a", 0);
    index.Insert("b", 1);
    index.Clear();
    EXPECT_EQ(index.Size(), 0u);
    EXPECT_FALSE(index.Contains("a"));
}

} // namespace
} // namespace leastrecent
