#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <variant>
#include <vector>
#include "hash_utils.hpp"

namespace rpds {

// Key/value pair stored in the trie, with the full hash of the key cached
template <typename K, typename V>
struct Entry {
    K key;
    V value;
    uint64_t hash;

    Entry(const K& k, const V& v, uint64_t h) : key(k), value(v), hash(h) {}
};

/**
 * NodeBase - abstract trie node with intrusive reference counting
 *
 * Nodes are immutable once published. A node returned by assoc()/dissoc()
 * starts with a zero count; whoever stores it takes a reference. Returning
 * the receiver itself means "no change".
 */
template <typename K, typename V, typename KeyEqual>
class NodeBase {
protected:
    mutable std::atomic<uint32_t> refcount_;

public:
    using EntryT = Entry<K, V>;
    using EntryPtr = std::shared_ptr<const EntryT>;

    NodeBase() : refcount_(0) {}
    virtual ~NodeBase() = default;

    NodeBase(const NodeBase&) = delete;
    NodeBase& operator=(const NodeBase&) = delete;

    // Reference counting
    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_relaxed);
    }

    // Entry for key, or nullptr
    virtual const EntryT* get(uint32_t shift, uint64_t hash, const K& key) const = 0;

    // Sets addedLeaf when the entry's key was not present before
    virtual NodeBase* assoc(uint32_t shift, const EntryPtr& entry, bool& addedLeaf) const = 0;

    // nullptr when the node becomes empty
    virtual NodeBase* dissoc(uint32_t shift, uint64_t hash, const K& key) const = 0;

    virtual void forEach(const std::function<void(const EntryT&)>& callback) const = 0;

    // The only entry when this node holds exactly one entry and no children
    virtual const EntryPtr* soleEntry() const = 0;
};

template <typename K, typename V, typename KeyEqual>
class CollisionNode;

// BitmapNode: Main HAMT node using bitmap indexing
template <typename K, typename V, typename KeyEqual>
class BitmapNode : public NodeBase<K, V, KeyEqual> {
public:
    using Base = NodeBase<K, V, KeyEqual>;
    using EntryT = typename Base::EntryT;
    using EntryPtr = typename Base::EntryPtr;
    using Slot = std::variant<EntryPtr, Base*>;
    using Array = std::vector<Slot>;

private:
    uint32_t bitmap_;
    Array array_;  // shared_ptr<Entry> OR child node (holding one reference)

    uint32_t index(uint32_t bit) const {
        return popcount(bitmap_ & (bit - 1));
    }

    static void retain(const Slot& slot) {
        if (std::holds_alternative<Base*>(slot)) {
            std::get<Base*>(slot)->addRef();
        }
    }

    // Copy of this node with slot idx replaced
    BitmapNode* withSlot(uint32_t idx, const Slot& slot) const {
        Array newArray;
        newArray.reserve(array_.size());
        for (size_t i = 0; i < array_.size(); ++i) {
            const Slot& e = (i == idx) ? slot : array_[i];
            retain(e);
            newArray.push_back(e);
        }
        return new BitmapNode(bitmap_, std::move(newArray));
    }

    BitmapNode* withInserted(uint32_t bit, uint32_t idx, const Slot& slot) const {
        Array newArray;
        newArray.reserve(array_.size() + 1);
        for (size_t i = 0; i < idx; ++i) {
            retain(array_[i]);
            newArray.push_back(array_[i]);
        }
        retain(slot);
        newArray.push_back(slot);
        for (size_t i = idx; i < array_.size(); ++i) {
            retain(array_[i]);
            newArray.push_back(array_[i]);
        }
        return new BitmapNode(bitmap_ | bit, std::move(newArray));
    }

    BitmapNode* withRemoved(uint32_t bit, uint32_t idx) const {
        Array newArray;
        newArray.reserve(array_.size() - 1);
        for (size_t i = 0; i < array_.size(); ++i) {
            if (i == idx) {
                continue;
            }
            retain(array_[i]);
            newArray.push_back(array_[i]);
        }
        return new BitmapNode(bitmap_ & ~bit, std::move(newArray));
    }

public:
    BitmapNode(uint32_t bitmap, Array&& array)
        : bitmap_(bitmap), array_(std::move(array)) {}

    ~BitmapNode() override {
        for (const auto& elem : array_) {
            if (std::holds_alternative<Base*>(elem)) {
                std::get<Base*>(elem)->release();
            }
        }
    }

    // Node holding a single entry, as the root of a one-element map
    static BitmapNode* single(const EntryPtr& entry) {
        Array array;
        array.push_back(entry);
        return new BitmapNode(bitpos(entry->hash, 0), std::move(array));
    }

    // Smallest subtree holding two entries whose hashes agree below shift
    static Base* createNode(uint32_t shift, const EntryPtr& e1, const EntryPtr& e2) {
        if (shift >= HASH_WIDTH) {
            // Every hash bit consumed, the hashes are identical
            std::vector<EntryPtr> entries{e1, e2};
            return new CollisionNode<K, V, KeyEqual>(e1->hash, std::move(entries));
        }

        uint32_t idx1 = static_cast<uint32_t>((e1->hash >> shift) & HASH_MASK);
        uint32_t idx2 = static_cast<uint32_t>((e2->hash >> shift) & HASH_MASK);

        Array array;
        if (idx1 == idx2) {
            Base* child = createNode(shift + HASH_BITS, e1, e2);
            child->addRef();
            array.push_back(child);
            return new BitmapNode(1u << idx1, std::move(array));
        }

        if (idx1 < idx2) {
            array.push_back(e1);
            array.push_back(e2);
        } else {
            array.push_back(e2);
            array.push_back(e1);
        }
        return new BitmapNode((1u << idx1) | (1u << idx2), std::move(array));
    }

    const EntryT* get(uint32_t shift, uint64_t hash, const K& key) const override {
        uint32_t bit = bitpos(hash, shift);
        if ((bitmap_ & bit) == 0) {
            return nullptr;
        }

        const auto& elem = array_[index(bit)];
        if (std::holds_alternative<EntryPtr>(elem)) {
            const auto& entry = std::get<EntryPtr>(elem);
            return KeyEqual{}(entry->key, key) ? entry.get() : nullptr;
        }
        return std::get<Base*>(elem)->get(shift + HASH_BITS, hash, key);
    }

    Base* assoc(uint32_t shift, const EntryPtr& entry, bool& addedLeaf) const override {
        uint32_t bit = bitpos(entry->hash, shift);
        uint32_t idx = index(bit);

        if ((bitmap_ & bit) == 0) {
            addedLeaf = true;
            return withInserted(bit, idx, entry);
        }

        const auto& elem = array_[idx];
        if (std::holds_alternative<EntryPtr>(elem)) {
            const auto& existing = std::get<EntryPtr>(elem);
            if (existing == entry) {
                return const_cast<BitmapNode*>(this);
            }
            if (KeyEqual{}(existing->key, entry->key)) {
                return withSlot(idx, entry);
            }

            // Different key in the same slot, push both one level down
            addedLeaf = true;
            return withSlot(idx, createNode(shift + HASH_BITS, existing, entry));
        }

        Base* child = std::get<Base*>(elem);
        Base* newChild = child->assoc(shift + HASH_BITS, entry, addedLeaf);
        if (newChild == child) {
            return const_cast<BitmapNode*>(this);
        }
        return withSlot(idx, newChild);
    }

    Base* dissoc(uint32_t shift, uint64_t hash, const K& key) const override {
        uint32_t bit = bitpos(hash, shift);
        if ((bitmap_ & bit) == 0) {
            return const_cast<BitmapNode*>(this);
        }

        uint32_t idx = index(bit);
        const auto& elem = array_[idx];

        if (std::holds_alternative<EntryPtr>(elem)) {
            if (!KeyEqual{}(std::get<EntryPtr>(elem)->key, key)) {
                return const_cast<BitmapNode*>(this);
            }
            if (array_.size() == 1) {
                return nullptr;
            }
            return withRemoved(bit, idx);
        }

        Base* child = std::get<Base*>(elem);
        Base* newChild = child->dissoc(shift + HASH_BITS, hash, key);

        if (newChild == child) {
            return const_cast<BitmapNode*>(this);
        }

        if (newChild == nullptr) {
            if (array_.size() == 1) {
                return nullptr;
            }
            return withRemoved(bit, idx);
        }

        // A child left with a single entry is spliced into this node
        if (const EntryPtr* sole = newChild->soleEntry()) {
            EntryPtr entry = *sole;
            newChild->addRef();
            newChild->release();
            return withSlot(idx, entry);
        }

        return withSlot(idx, newChild);
    }

    void forEach(const std::function<void(const EntryT&)>& callback) const override {
        for (const auto& elem : array_) {
            if (std::holds_alternative<EntryPtr>(elem)) {
                callback(*std::get<EntryPtr>(elem));
            } else {
                std::get<Base*>(elem)->forEach(callback);
            }
        }
    }

    const EntryPtr* soleEntry() const override {
        if (array_.size() == 1 && std::holds_alternative<EntryPtr>(array_[0])) {
            return &std::get<EntryPtr>(array_[0]);
        }
        return nullptr;
    }

    uint32_t getBitmap() const { return bitmap_; }
    const Array& getArray() const { return array_; }
};

// CollisionNode: Handles keys whose full 64-bit hashes coincide
template <typename K, typename V, typename KeyEqual>
class CollisionNode : public NodeBase<K, V, KeyEqual> {
public:
    using Base = NodeBase<K, V, KeyEqual>;
    using EntryT = typename Base::EntryT;
    using EntryPtr = typename Base::EntryPtr;

private:
    uint64_t hash_;
    std::vector<EntryPtr> entries_;

    size_t find(const K& key) const {
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (KeyEqual{}(entries_[i]->key, key)) {
                return i;
            }
        }
        return entries_.size();
    }

public:
    CollisionNode(uint64_t hash, std::vector<EntryPtr>&& entries)
        : hash_(hash), entries_(std::move(entries)) {}

    const EntryT* get(uint32_t, uint64_t, const K& key) const override {
        size_t i = find(key);
        return i < entries_.size() ? entries_[i].get() : nullptr;
    }

    Base* assoc(uint32_t, const EntryPtr& entry, bool& addedLeaf) const override {
        size_t i = find(entry->key);
        std::vector<EntryPtr> newEntries = entries_;

        if (i < entries_.size()) {
            if (entries_[i] == entry) {
                return const_cast<CollisionNode*>(this);
            }
            newEntries[i] = entry;
        } else {
            addedLeaf = true;
            newEntries.push_back(entry);
        }
        return new CollisionNode(hash_, std::move(newEntries));
    }

    Base* dissoc(uint32_t, uint64_t, const K& key) const override {
        size_t i = find(key);
        if (i == entries_.size()) {
            return const_cast<CollisionNode*>(this);
        }
        if (entries_.size() == 1) {
            return nullptr;
        }

        std::vector<EntryPtr> newEntries;
        newEntries.reserve(entries_.size() - 1);
        for (size_t j = 0; j < entries_.size(); ++j) {
            if (j != i) {
                newEntries.push_back(entries_[j]);
            }
        }
        return new CollisionNode(hash_, std::move(newEntries));
    }

    void forEach(const std::function<void(const EntryT&)>& callback) const override {
        for (const auto& entry : entries_) {
            callback(*entry);
        }
    }

    const EntryPtr* soleEntry() const override {
        return entries_.size() == 1 ? &entries_[0] : nullptr;
    }

    uint64_t getHash() const { return hash_; }
    const std::vector<EntryPtr>& getEntries() const { return entries_; }
};

}  // namespace rpds
