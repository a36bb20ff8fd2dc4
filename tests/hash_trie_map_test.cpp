#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <variant>
#include <vector>
#include "hash_trie_map.hpp"

using rpds::HashTrieMap;
using rpds::KeyNotFound;

namespace {

using Value = std::variant<std::string, int>;
using StringMap = HashTrieMap<std::string, Value>;
using IntMap = HashTrieMap<int, int>;

IntMap buildIntMap(const std::vector<int>& keys) {
    IntMap m;
    for (int k : keys) {
        m = m.insert(k, k * 2);
    }
    return m;
}

std::vector<int> shuffledKeys(int n, unsigned seed) {
    std::vector<int> keys;
    for (int i = 0; i < n; ++i) {
        keys.push_back(i * 7919);
    }
    std::mt19937 rng(seed);
    std::shuffle(keys.begin(), keys.end(), rng);
    return keys;
}

}  // namespace

TEST(HashTrieMapTest, EmptyMap) {
    IntMap m;
    EXPECT_EQ(m.size(), 0u);
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.get(1), nullptr);
    EXPECT_FALSE(m.contains(1));
    EXPECT_TRUE(m.begin() == m.end());
    EXPECT_EQ(m.root(), nullptr);
    EXPECT_EQ(m, IntMap());
}

TEST(HashTrieMapTest, InitializationWithOneElement) {
    StringMap m{{"a", 2}};
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at("a"), Value(2));
    EXPECT_TRUE(m.contains("a"));

    StringMap empty = m.remove("a");
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_FALSE(empty.contains("a"));
    EXPECT_EQ(empty.root(), nullptr);
}

TEST(HashTrieMapTest, InsertAddsEntry) {
    StringMap m{{"foo", "bar"}, {"baz", "quux"}};
    StringMap expected{{"foo", "bar"}, {"baz", "quux"}, {"spam", 37}};

    EXPECT_EQ(m.insert("spam", 37), expected);
    EXPECT_EQ(m.size(), 2u);
}

TEST(HashTrieMapTest, RemoveDropsEntry) {
    StringMap m{{"foo", "bar"}, {"baz", "quux"}};
    EXPECT_EQ(m.remove("foo"), (StringMap{{"baz", "quux"}}));
}

TEST(HashTrieMapTest, RemoveMissingKeyThrowsKeyNotFound) {
    StringMap m{{"foo", "bar"}, {"baz", "quux"}};
    EXPECT_THROW(m.remove("missing"), KeyNotFound);
    EXPECT_THROW(StringMap().remove("missing"), KeyNotFound);
    EXPECT_EQ(m.size(), 2u);
}

TEST(HashTrieMapTest, DiscardMissingKeyIsNoOp) {
    StringMap m{{"foo", "bar"}};
    EXPECT_EQ(m.discard("missing").root(), m.root());
    EXPECT_EQ(m.discard("foo").size(), 0u);
}

TEST(HashTrieMapTest, GetVariants) {
    IntMap m = buildIntMap({1, 2, 3});

    ASSERT_NE(m.get(2), nullptr);
    EXPECT_EQ(*m.get(2), 4);
    EXPECT_EQ(m.get(5), nullptr);
    EXPECT_EQ(m.get(5, -1), -1);
    EXPECT_EQ(m.get(3, -1), 6);
    EXPECT_EQ(m.at(1), 2);
    EXPECT_THROW(m.at(5), KeyNotFound);
}

TEST(HashTrieMapTest, InsertThenGetReturnsValue) {
    IntMap m = buildIntMap(shuffledKeys(500, 1));
    for (int k : shuffledKeys(50, 2)) {
        EXPECT_EQ(m.insert(k, -k).at(k), -k);
    }
    EXPECT_EQ(m.insert(123456789, 5).at(123456789), 5);
}

TEST(HashTrieMapTest, InsertThenRemoveRestoresMap) {
    IntMap m = buildIntMap(shuffledKeys(1000, 3));
    for (int k = 1; k < 200; ++k) {
        int absent = -k;
        ASSERT_FALSE(m.contains(absent));
        EXPECT_EQ(m.insert(absent, k).remove(absent), m);
    }
}

TEST(HashTrieMapTest, OverwriteKeepsSize) {
    IntMap m = buildIntMap({1, 2, 3});
    IntMap updated = m.insert(2, 100);

    EXPECT_EQ(updated.size(), 3u);
    EXPECT_EQ(updated.at(2), 100);
    EXPECT_EQ(m.at(2), 4);
    EXPECT_NE(updated, m);
}

TEST(HashTrieMapTest, OldVersionsAreUnchanged) {
    std::vector<IntMap> versions{IntMap()};
    for (int i = 0; i < 300; ++i) {
        versions.push_back(versions.back().insert(i, i));
    }
    for (int i = 0; i <= 300; ++i) {
        EXPECT_EQ(versions[i].size(), static_cast<size_t>(i));
        EXPECT_FALSE(versions[i].contains(i));
        if (i > 0) {
            EXPECT_TRUE(versions[i].contains(i - 1));
        }
    }
}

TEST(HashTrieMapTest, InsertionOrderDoesNotAffectEquality) {
    IntMap a = buildIntMap(shuffledKeys(2000, 10));
    IntMap b = buildIntMap(shuffledKeys(2000, 11));

    EXPECT_NE(a.root(), b.root());
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(HashTrieMapTest, DifferentValuesAreNotEqual) {
    IntMap a = buildIntMap({1, 2, 3});
    IntMap b = a.insert(3, 7);
    IntMap c = buildIntMap({1, 2, 4});

    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, a.remove(3));
}

TEST(HashTrieMapTest, IterationVisitsEveryEntryOnce) {
    std::vector<int> keys = shuffledKeys(3000, 4);
    IntMap m = buildIntMap(keys);

    std::map<int, int> seen;
    for (const auto& entry : m) {
        EXPECT_EQ(entry.value, entry.key * 2);
        ++seen[entry.key];
    }
    EXPECT_EQ(seen.size(), keys.size());
    for (const auto& [key, count] : seen) {
        EXPECT_EQ(count, 1) << key;
    }
}

TEST(HashTrieMapTest, IterationIsRestartableAndStable) {
    IntMap m = buildIntMap(shuffledKeys(400, 5));

    std::vector<int> first;
    for (auto it = m.begin(); it != m.end(); ++it) {
        first.push_back(it->key);
    }
    std::vector<int> second = m.keys();
    EXPECT_EQ(first, second);

    std::vector<int> values = m.values();
    ASSERT_EQ(values.size(), first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(values[i], first[i] * 2);
    }
}

TEST(HashTrieMapTest, ForEachMatchesIteration) {
    IntMap m = buildIntMap({5, 10, 15, 20});
    int sum = 0;
    m.forEach([&](const int& k, const int& v) { sum += k + v; });
    EXPECT_EQ(sum, 150);
}

TEST(HashTrieMapTest, UpdateLetsOtherWin) {
    IntMap a = buildIntMap({1, 2, 3});
    IntMap b = IntMap().insert(3, 30).insert(4, 40);
    IntMap merged = a.update(b);

    EXPECT_EQ(merged.size(), 4u);
    EXPECT_EQ(merged.at(1), 2);
    EXPECT_EQ(merged.at(3), 30);
    EXPECT_EQ(merged.at(4), 40);
    EXPECT_EQ(IntMap().update(b).root(), b.root());
}

TEST(HashTrieMapTest, RemovingEverythingEmptiesMap) {
    std::vector<int> keys = shuffledKeys(5000, 6);
    IntMap m = buildIntMap(keys);
    ASSERT_EQ(m.size(), keys.size());

    std::mt19937 rng(7);
    std::shuffle(keys.begin(), keys.end(), rng);
    for (int k : keys) {
        m = m.remove(k);
    }
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.root(), nullptr);
}

TEST(HashTrieMapTest, NestedContainersAsKeys) {
    HashTrieMap<std::vector<std::string>, int> paths;
    paths = paths.insert({"usr", "lib"}, 1).insert({"usr", "bin"}, 2);
    EXPECT_EQ(paths.at({"usr", "lib"}), 1);
    EXPECT_EQ(paths.at({"usr", "bin"}), 2);
    EXPECT_FALSE(paths.contains({"lib", "usr"}));

    using Inner = HashTrieMap<std::string, int>;
    HashTrieMap<Inner, std::string> byMap;
    Inner x = Inner().insert("a", 1).insert("b", 2);
    Inner y = Inner().insert("b", 2).insert("a", 1);
    byMap = byMap.insert(x, "first");

    // y is a different version with the same contents
    EXPECT_EQ(byMap.at(y), "first");
    EXPECT_EQ(byMap.insert(y, "second").size(), 1u);
    EXPECT_FALSE(byMap.contains(x.insert("c", 3)));
}

TEST(HashTrieMapTest, CopiesShareRoot) {
    IntMap m = buildIntMap({1, 2, 3});
    IntMap copy = m;
    EXPECT_EQ(copy.root(), m.root());

    IntMap moved = std::move(copy);
    EXPECT_EQ(moved.root(), m.root());
    EXPECT_EQ(moved, m);
}
