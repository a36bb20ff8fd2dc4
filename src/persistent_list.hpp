#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <vector>
#include "errors.hpp"
#include "hash_utils.hpp"

namespace rpds {

/**
 * ConsCell - one link of a List
 *
 * Holds a reference on its tail. Cells never change after construction;
 * the length of the list a cell heads is stored so size() is O(1).
 */
template <typename T>
class ConsCell {
private:
    mutable std::atomic<uint32_t> refcount_;
    T head_;
    const ConsCell* tail_;
    size_t length_;

public:
    ConsCell(const T& head, const ConsCell* tail)
        : refcount_(0), head_(head), tail_(tail), length_(tail ? tail->length_ + 1 : 1) {
        if (tail_) tail_->addRef();
    }

    // No copy/move (managed by refcounting)
    ConsCell(const ConsCell&) = delete;
    ConsCell& operator=(const ConsCell&) = delete;

    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    // True when the last reference was dropped; the caller deletes the cell
    bool release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            return true;
        }
        return false;
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_relaxed);
    }

    const T& head() const { return head_; }
    const ConsCell* tail() const { return tail_; }
    size_t length() const { return length_; }

    // Drop one reference to cell, freeing every cell that becomes unreachable.
    // Iterative so that long lists don't exhaust the stack.
    static void releaseChain(const ConsCell* cell) {
        while (cell && cell->release()) {
            const ConsCell* next = cell->tail_;
            delete cell;
            cell = next;
        }
    }
};

template <typename T>
class ListIterator {
private:
    const ConsCell<T>* cell_;

public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    explicit ListIterator(const ConsCell<T>* cell = nullptr) : cell_(cell) {}

    reference operator*() const { return cell_->head(); }
    pointer operator->() const { return &cell_->head(); }

    ListIterator& operator++() {
        cell_ = cell_->tail();
        return *this;
    }

    ListIterator operator++(int) {
        ListIterator tmp = *this;
        cell_ = cell_->tail();
        return tmp;
    }

    bool operator==(const ListIterator& other) const { return cell_ == other.cell_; }
    bool operator!=(const ListIterator& other) const { return cell_ != other.cell_; }
};

/**
 * List - persistent singly-linked list
 *
 * push_front() and rest() are O(1) and never copy: a new list links to the
 * cells of the old one, which stays valid and unchanged.
 */
template <typename T>
class List {
public:
    using value_type = T;
    using Cell = ConsCell<T>;
    using const_iterator = ListIterator<T>;
    using iterator = const_iterator;

private:
    const Cell* head_;

    explicit List(const Cell* head) : head_(head) {
        if (head_) head_->addRef();
    }

public:
    List() : head_(nullptr) {}

    List(std::initializer_list<T> elems) : List(elems.begin(), elems.end()) {}

    // Elements keep their input order
    template <typename InputIt>
    List(InputIt first, InputIt last) : head_(nullptr) {
        std::vector<T> items(first, last);
        for (auto it = items.rbegin(); it != items.rend(); ++it) {
            *this = pushFront(*it);
        }
    }

    List(const List& other) : head_(other.head_) {
        if (head_) head_->addRef();
    }

    List(List&& other) noexcept : head_(other.head_) {
        other.head_ = nullptr;
    }

    ~List() {
        Cell::releaseChain(head_);
    }

    List& operator=(const List& other) {
        if (this != &other) {
            if (other.head_) other.head_->addRef();
            Cell::releaseChain(head_);
            head_ = other.head_;
        }
        return *this;
    }

    List& operator=(List&& other) noexcept {
        if (this != &other) {
            Cell::releaseChain(head_);
            head_ = other.head_;
            other.head_ = nullptr;
        }
        return *this;
    }

    // Core operations (functional style)
    List pushFront(const T& value) const {
        return List(new Cell(value, head_));
    }

    const T& first() const {
        if (head_ == nullptr) {
            throw EmptyCollectionAccess("first of empty list");
        }
        return head_->head();
    }

    List rest() const {
        if (head_ == nullptr) {
            throw EmptyCollectionAccess("rest of empty list");
        }
        return List(head_->tail());
    }

    List reverse() const {
        List result;
        for (const auto& value : *this) {
            result = result.pushFront(value);
        }
        return result;
    }

    size_t size() const { return head_ ? head_->length() : 0; }
    bool empty() const { return head_ == nullptr; }

    const_iterator begin() const { return const_iterator(head_); }
    const_iterator end() const { return const_iterator(); }

    void forEach(const std::function<void(const T&)>& callback) const {
        for (const Cell* cell = head_; cell; cell = cell->tail()) {
            callback(cell->head());
        }
    }

    bool operator==(const List& other) const {
        if (size() != other.size()) {
            return false;
        }

        const Cell* a = head_;
        const Cell* b = other.head_;
        // Stops early once both lists reach a shared tail
        while (a != b) {
            if (!Equal<T>{}(a->head(), b->head())) {
                return false;
            }
            a = a->tail();
            b = b->tail();
        }
        return true;
    }

    bool operator!=(const List& other) const { return !(*this == other); }

    uint64_t hash() const {
        uint64_t h = hashutils::combine(hashutils::SEED, size());
        for (const auto& value : *this) {
            h = hashutils::combine(h, Hasher<T>{}(value));
        }
        return h;
    }

    // First cell, for inspecting structural sharing between versions
    const Cell* headCell() const { return head_; }
};

}  // namespace rpds
