#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <vector>
#include "hash_trie_map.hpp"

namespace rpds {

// Placeholder value for set entries
struct Unit {
    bool operator==(const Unit&) const { return true; }
    bool operator!=(const Unit&) const { return false; }
    uint64_t hash() const { return 0; }
};

// Iterator over set elements (just wraps the map iterator)
template <typename K, typename KeyEqual>
class SetIterator {
private:
    MapIterator<K, Unit, KeyEqual> iter_;

public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = K;
    using difference_type = std::ptrdiff_t;
    using pointer = const K*;
    using reference = const K&;

    SetIterator() = default;
    explicit SetIterator(const MapIterator<K, Unit, KeyEqual>& iter) : iter_(iter) {}

    reference operator*() const { return iter_->key; }
    pointer operator->() const { return &iter_->key; }

    SetIterator& operator++() {
        ++iter_;
        return *this;
    }

    SetIterator operator++(int) {
        SetIterator tmp = *this;
        ++iter_;
        return tmp;
    }

    bool operator==(const SetIterator& other) const { return iter_ == other.iter_; }
    bool operator!=(const SetIterator& other) const { return iter_ != other.iter_; }
};

/**
 * HashTrieSet - Immutable set implementation
 *
 * A persistent hash set implemented as a wrapper around HashTrieMap, where
 * keys are set elements and all values are Unit. Inherits the map's
 * structural sharing and O(log32 n) insert/remove/contains.
 */
template <typename K, typename Hash = Hasher<K>, typename KeyEqual = Equal<K>>
class HashTrieSet {
public:
    using Map = HashTrieMap<K, Unit, Hash, KeyEqual>;
    using const_iterator = SetIterator<K, KeyEqual>;
    using iterator = const_iterator;

private:
    Map map_;

    explicit HashTrieSet(const Map& map) : map_(map) {}

public:
    HashTrieSet() = default;

    HashTrieSet(std::initializer_list<K> elems) : HashTrieSet(elems.begin(), elems.end()) {}

    template <typename InputIt>
    HashTrieSet(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            map_ = map_.insert(*first, Unit{});
        }
    }

    // Core operations (functional style)
    HashTrieSet insert(const K& elem) const {
        if (map_.contains(elem)) {
            return *this;
        }
        return HashTrieSet(map_.insert(elem, Unit{}));
    }

    // Throws KeyNotFound when elem is absent
    HashTrieSet remove(const K& elem) const {
        return HashTrieSet(map_.remove(elem));
    }

    HashTrieSet discard(const K& elem) const {
        return HashTrieSet(map_.discard(elem));
    }

    bool contains(const K& elem) const {
        return map_.contains(elem);
    }

    // Set operations
    HashTrieSet unionWith(const HashTrieSet& other) const {
        // Grow the larger set
        const HashTrieSet& larger = (size() >= other.size()) ? *this : other;
        const HashTrieSet& smaller = (size() >= other.size()) ? other : *this;
        return HashTrieSet(larger.map_.update(smaller.map_));
    }

    HashTrieSet intersection(const HashTrieSet& other) const {
        // Iterate smaller set, check containment in larger
        const HashTrieSet& smaller = (size() <= other.size()) ? *this : other;
        const HashTrieSet& larger = (size() <= other.size()) ? other : *this;

        HashTrieSet result = smaller;
        for (const auto& elem : smaller) {
            if (!larger.contains(elem)) {
                result = result.discard(elem);
            }
        }
        return result;
    }

    HashTrieSet difference(const HashTrieSet& other) const {
        HashTrieSet result = *this;
        if (size() <= other.size()) {
            for (const auto& elem : *this) {
                if (other.contains(elem)) {
                    result = result.discard(elem);
                }
            }
        } else {
            for (const auto& elem : other) {
                result = result.discard(elem);
            }
        }
        return result;
    }

    HashTrieSet symmetricDifference(const HashTrieSet& other) const {
        // (A - B) ∪ (B - A)
        return difference(other).unionWith(other.difference(*this));
    }

    // Set predicates
    bool isSubset(const HashTrieSet& other) const {
        if (size() > other.size()) return false;

        for (const auto& elem : *this) {
            if (!other.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    bool isSuperset(const HashTrieSet& other) const {
        return other.isSubset(*this);
    }

    bool isDisjoint(const HashTrieSet& other) const {
        const HashTrieSet& smaller = (size() <= other.size()) ? *this : other;
        const HashTrieSet& larger = (size() <= other.size()) ? other : *this;

        for (const auto& elem : smaller) {
            if (larger.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    const_iterator begin() const { return const_iterator(map_.begin()); }
    const_iterator end() const { return const_iterator(map_.end()); }

    void forEach(const std::function<void(const K&)>& callback) const {
        map_.forEach([&](const K& key, const Unit&) { callback(key); });
    }

    bool operator==(const HashTrieSet& other) const {
        return map_ == other.map_;
    }

    bool operator!=(const HashTrieSet& other) const { return !(*this == other); }

    uint64_t hash() const { return map_.hash(); }

    const Map& getMap() const { return map_; }
};

}  // namespace rpds
