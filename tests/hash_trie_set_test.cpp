#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>
#include "hash_trie_set.hpp"
#include "test_hashers.hpp"

using rpds::HashTrieSet;
using rpds::KeyNotFound;

namespace {

using StringSet = HashTrieSet<std::string>;
using IntSet = HashTrieSet<int>;

IntSet rangeSet(int first, int last) {
    IntSet s;
    for (int i = first; i < last; ++i) {
        s = s.insert(i);
    }
    return s;
}

}  // namespace

TEST(HashTrieSetTest, InsertAddsElement) {
    StringSet s{"foo", "bar", "baz", "quux"};
    EXPECT_EQ(s.insert("spam"), (StringSet{"foo", "bar", "baz", "quux", "spam"}));
    EXPECT_EQ(s.size(), 4u);
}

TEST(HashTrieSetTest, RemoveDropsElement) {
    StringSet s{"foo", "bar", "baz", "quux"};
    EXPECT_EQ(s.remove("foo"), (StringSet{"bar", "baz", "quux"}));
    EXPECT_TRUE(s.contains("foo"));
}

TEST(HashTrieSetTest, RemoveMissingThrowsKeyNotFound) {
    StringSet s{"foo"};
    EXPECT_THROW(s.remove("bar"), KeyNotFound);
    EXPECT_EQ(s.discard("bar"), s);
    EXPECT_TRUE(s.discard("foo").empty());
}

TEST(HashTrieSetTest, InsertIsIdempotent) {
    StringSet s{"a", "b"};
    EXPECT_EQ(s.insert("c").insert("c"), s.insert("c"));
    EXPECT_EQ(s.insert("c").insert("c").size(), 3u);
    EXPECT_EQ(s.insert("a").getMap().root(), s.getMap().root());
}

TEST(HashTrieSetTest, DuplicatesInConstructionCollapse) {
    IntSet s{1, 2, 2, 3, 3, 3};
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s, (IntSet{3, 2, 1}));
}

TEST(HashTrieSetTest, IterationYieldsEachElement) {
    IntSet s = rangeSet(0, 1000);
    std::set<int> seen(s.begin(), s.end());
    EXPECT_EQ(seen.size(), 1000u);
    EXPECT_EQ(*seen.begin(), 0);
    EXPECT_EQ(*seen.rbegin(), 999);

    int count = 0;
    s.forEach([&](const int&) { ++count; });
    EXPECT_EQ(count, 1000);
}

TEST(HashTrieSetTest, Union) {
    IntSet a = rangeSet(0, 10);
    IntSet b = rangeSet(5, 20);
    EXPECT_EQ(a.unionWith(b), rangeSet(0, 20));
    EXPECT_EQ(b.unionWith(a), rangeSet(0, 20));
    EXPECT_EQ(a.unionWith(IntSet()), a);
}

TEST(HashTrieSetTest, Intersection) {
    IntSet a = rangeSet(0, 10);
    IntSet b = rangeSet(5, 20);
    EXPECT_EQ(a.intersection(b), rangeSet(5, 10));
    EXPECT_EQ(b.intersection(a), rangeSet(5, 10));
    EXPECT_TRUE(a.intersection(rangeSet(100, 110)).empty());
}

TEST(HashTrieSetTest, Difference) {
    IntSet a = rangeSet(0, 10);
    IntSet b = rangeSet(5, 20);
    EXPECT_EQ(a.difference(b), rangeSet(0, 5));
    EXPECT_EQ(b.difference(a), rangeSet(10, 20));
    EXPECT_EQ(a.difference(IntSet()), a);
}

TEST(HashTrieSetTest, SymmetricDifference) {
    IntSet a = rangeSet(0, 10);
    IntSet b = rangeSet(5, 20);
    EXPECT_EQ(a.symmetricDifference(b), rangeSet(0, 5).unionWith(rangeSet(10, 20)));
    EXPECT_TRUE(a.symmetricDifference(a).empty());
}

TEST(HashTrieSetTest, Predicates) {
    IntSet small = rangeSet(0, 5);
    IntSet large = rangeSet(0, 10);
    IntSet other = rangeSet(50, 60);

    EXPECT_TRUE(small.isSubset(large));
    EXPECT_FALSE(large.isSubset(small));
    EXPECT_TRUE(large.isSuperset(small));
    EXPECT_TRUE(small.isDisjoint(other));
    EXPECT_FALSE(small.isDisjoint(large));
    EXPECT_TRUE(IntSet().isSubset(small));
}

TEST(HashTrieSetTest, EqualSetsHashEqual) {
    IntSet a = rangeSet(0, 300);
    IntSet b;
    for (int i = 299; i >= 0; --i) {
        b = b.insert(i);
    }
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_NE(a, b.remove(0));
}

TEST(HashTrieSetTest, CollidingElements) {
    using CollidingSet = HashTrieSet<std::string, ConstantHash>;
    CollidingSet s{"x", "y", "z"};

    EXPECT_EQ(s.size(), 3u);
    EXPECT_TRUE(s.contains("x"));
    EXPECT_TRUE(s.contains("y"));
    EXPECT_TRUE(s.contains("z"));
    EXPECT_EQ(s.remove("y"), (CollidingSet{"z", "x"}));
}

TEST(HashTrieSetTest, SetsNestAsElements) {
    HashTrieSet<IntSet> family;
    family = family.insert(rangeSet(0, 3)).insert(IntSet{2, 1, 0}).insert(IntSet{7});
    EXPECT_EQ(family.size(), 2u);
    EXPECT_TRUE(family.contains(IntSet{0, 1, 2}));
}
