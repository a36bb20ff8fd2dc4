#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "hash_trie_node.hpp"
#include "hash_utils.hpp"

namespace rpds {

/**
 * MapIterator - depth-first walk over the trie
 *
 * Holds one stack frame per trie level (O(log n) memory). Valid while any
 * map sharing the root it was created from is alive.
 */
template <typename K, typename V, typename KeyEqual>
class MapIterator {
public:
    using Node = NodeBase<K, V, KeyEqual>;
    using Bitmap = BitmapNode<K, V, KeyEqual>;
    using Collision = CollisionNode<K, V, KeyEqual>;
    using EntryT = Entry<K, V>;
    using EntryPtr = typename Node::EntryPtr;

    using iterator_category = std::forward_iterator_tag;
    using value_type = EntryT;
    using difference_type = std::ptrdiff_t;
    using pointer = const EntryT*;
    using reference = const EntryT&;

private:
    struct StackFrame {
        const Node* node;
        size_t index;
    };
    std::vector<StackFrame> stack_;
    const EntryPtr* current_;

    void advance() {
        while (!stack_.empty()) {
            // Don't hold references to frames across push_back
            const Node* node = stack_.back().node;
            size_t idx = stack_.back().index;

            if (auto* bitmapNode = dynamic_cast<const Bitmap*>(node)) {
                const auto& array = bitmapNode->getArray();
                if (idx >= array.size()) {
                    stack_.pop_back();
                    continue;
                }

                stack_.back().index = idx + 1;
                const auto& elem = array[idx];
                if (std::holds_alternative<EntryPtr>(elem)) {
                    current_ = &std::get<EntryPtr>(elem);
                    return;
                }
                stack_.push_back({std::get<Node*>(elem), 0});
            } else {
                const auto& entries = static_cast<const Collision*>(node)->getEntries();
                if (idx >= entries.size()) {
                    stack_.pop_back();
                    continue;
                }

                stack_.back().index = idx + 1;
                current_ = &entries[idx];
                return;
            }
        }

        current_ = nullptr;
    }

public:
    MapIterator() : current_(nullptr) {}

    explicit MapIterator(const Node* root) : current_(nullptr) {
        if (root) {
            stack_.push_back({root, 0});
            advance();
        }
    }

    reference operator*() const { return **current_; }
    pointer operator->() const { return current_->get(); }

    // Owning handle to the current entry
    const EntryPtr& shared() const { return *current_; }

    MapIterator& operator++() {
        advance();
        return *this;
    }

    MapIterator operator++(int) {
        MapIterator tmp = *this;
        advance();
        return tmp;
    }

    bool operator==(const MapIterator& other) const { return current_ == other.current_; }
    bool operator!=(const MapIterator& other) const { return current_ != other.current_; }
};

/**
 * HashTrieMap - persistent hash array mapped trie
 *
 * Every update returns a new map that shares all untouched subtrees with
 * the map it was derived from. Keys need a Hash functor returning uint64_t
 * and a KeyEqual consistent with it; both must be default-constructible.
 *
 * Complexity:
 * - insert/remove/get: O(log32 n), collisions past the full hash are scanned
 * - size: O(1)
 * - copy: O(1) (one reference count)
 */
template <typename K, typename V, typename Hash = Hasher<K>, typename KeyEqual = Equal<K>>
class HashTrieMap {
public:
    using key_type = K;
    using mapped_type = V;
    using Node = NodeBase<K, V, KeyEqual>;
    using EntryT = Entry<K, V>;
    using EntryPtr = typename Node::EntryPtr;
    using const_iterator = MapIterator<K, V, KeyEqual>;
    using iterator = const_iterator;

private:
    using Bitmap = BitmapNode<K, V, KeyEqual>;

    Node* root_;
    size_t count_;

    HashTrieMap(Node* root, size_t count) : root_(root), count_(count) {
        if (root_) root_->addRef();
    }

    HashTrieMap insertEntry(const EntryPtr& entry) const {
        if (root_ == nullptr) {
            return HashTrieMap(Bitmap::single(entry), 1);
        }

        bool addedLeaf = false;
        Node* newRoot = root_->assoc(0, entry, addedLeaf);

        if (newRoot == root_) {
            // No change
            return *this;
        }
        return HashTrieMap(newRoot, addedLeaf ? count_ + 1 : count_);
    }

public:
    HashTrieMap() : root_(nullptr), count_(0) {}

    HashTrieMap(std::initializer_list<std::pair<K, V>> items) : HashTrieMap(items.begin(), items.end()) {}

    // Later duplicates win
    template <typename InputIt>
    HashTrieMap(InputIt first, InputIt last) : root_(nullptr), count_(0) {
        for (; first != last; ++first) {
            *this = insert(first->first, first->second);
        }
    }

    // Copy constructor
    HashTrieMap(const HashTrieMap& other) : root_(other.root_), count_(other.count_) {
        if (root_) root_->addRef();
    }

    // Move constructor
    HashTrieMap(HashTrieMap&& other) noexcept
        : root_(other.root_), count_(other.count_) {
        other.root_ = nullptr;
        other.count_ = 0;
    }

    ~HashTrieMap() {
        if (root_) root_->release();
    }

    HashTrieMap& operator=(const HashTrieMap& other) {
        if (this != &other) {
            if (other.root_) other.root_->addRef();
            if (root_) root_->release();
            root_ = other.root_;
            count_ = other.count_;
        }
        return *this;
    }

    HashTrieMap& operator=(HashTrieMap&& other) noexcept {
        if (this != &other) {
            if (root_) root_->release();
            root_ = other.root_;
            count_ = other.count_;
            other.root_ = nullptr;
            other.count_ = 0;
        }
        return *this;
    }

    // Core operations (functional style)
    HashTrieMap insert(const K& key, const V& value) const {
        return insertEntry(std::make_shared<const EntryT>(key, value, Hash{}(key)));
    }

    // Throws KeyNotFound when key is absent
    HashTrieMap remove(const K& key) const {
        if (root_ == nullptr) {
            throw KeyNotFound();
        }

        Node* newRoot = root_->dissoc(0, Hash{}(key), key);
        if (newRoot == root_) {
            throw KeyNotFound();
        }
        return HashTrieMap(newRoot, count_ - 1);
    }

    // Like remove(), but an absent key returns this map unchanged
    HashTrieMap discard(const K& key) const {
        if (root_ == nullptr) {
            return *this;
        }

        Node* newRoot = root_->dissoc(0, Hash{}(key), key);
        if (newRoot == root_) {
            return *this;
        }
        return HashTrieMap(newRoot, count_ - 1);
    }

    const V* get(const K& key) const {
        if (root_ == nullptr) {
            return nullptr;
        }
        const EntryT* entry = root_->get(0, Hash{}(key), key);
        return entry ? &entry->value : nullptr;
    }

    V get(const K& key, const V& defaultValue) const {
        const V* value = get(key);
        return value ? *value : defaultValue;
    }

    const V& at(const K& key) const {
        const V* value = get(key);
        if (value == nullptr) {
            throw KeyNotFound();
        }
        return *value;
    }

    bool contains(const K& key) const {
        return get(key) != nullptr;
    }

    // Entries of other replace entries of this map with equal keys
    HashTrieMap update(const HashTrieMap& other) const {
        if (root_ == nullptr) {
            return other;
        }

        HashTrieMap result = *this;
        for (auto it = other.begin(); it != other.end(); ++it) {
            // Reuse other's entry objects instead of copying them
            result = result.insertEntry(it.shared());
        }
        return result;
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    const_iterator begin() const { return const_iterator(root_); }
    const_iterator end() const { return const_iterator(); }

    void forEach(const std::function<void(const K&, const V&)>& callback) const {
        if (root_) {
            root_->forEach([&](const EntryT& entry) { callback(entry.key, entry.value); });
        }
    }

    std::vector<K> keys() const {
        std::vector<K> result;
        result.reserve(count_);
        for (const auto& entry : *this) {
            result.push_back(entry.key);
        }
        return result;
    }

    std::vector<V> values() const {
        std::vector<V> result;
        result.reserve(count_);
        for (const auto& entry : *this) {
            result.push_back(entry.value);
        }
        return result;
    }

    // Same key set with pairwise-equal values, independent of layout
    bool operator==(const HashTrieMap& other) const {
        if (count_ != other.count_) {
            return false;
        }
        if (root_ == other.root_) {
            return true;
        }

        for (const auto& entry : *this) {
            const V* otherValue = other.get(entry.key);
            if (otherValue == nullptr || !Equal<V>{}(entry.value, *otherValue)) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const HashTrieMap& other) const { return !(*this == other); }

    // Order-independent, so equal maps hash equal whatever their layout
    uint64_t hash() const {
        uint64_t sum = 0;
        for (const auto& entry : *this) {
            sum += hashutils::combine(entry.hash, Hasher<V>{}(entry.value));
        }
        return hashutils::combine(sum, count_);
    }

    // Root node, for inspecting structural sharing between versions
    const Node* root() const { return root_; }
};

}  // namespace rpds
