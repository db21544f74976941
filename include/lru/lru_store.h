#pragma once
#ifndef LRU_STORE_H
#define LRU_STORE_H

#include "lru/errors.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <ostream>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace lru {

/**
 * Bounded associative container with LRU eviction:
 * - put/get refresh recency, peek and traversal never do
 * - at most one eviction per put, batch eviction on resize
 * - O(1) average complexity for put/get/peek/erase/contains
 * - keys()/values()/items() iterate from least to most recently used
 *
 * Not thread-safe. Callers sharing a store across threads must lock around it.
 *
 * @tparam Key      Hashable, equality-comparable key type
 * @tparam Value    Stored value type
 * @tparam Hash     Hash function for Key
 * @tparam KeyEqual Equality predicate for Key
 */
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class LruStore {
    using order_list = std::list<Key>;
    using order_iterator = typename order_list::const_iterator;

    struct Entry {
        Value value;                                ///< Stored value
        typename order_list::iterator order_it;     ///< Node of this key in order_
    };

    using table_type = std::unordered_map<Key, Entry, Hash, KeyEqual>;

    enum class view_kind { keys, values, items };

public:
    using key_type = Key;
    using mapped_type = Value;
    using value_type = std::pair<Key, Value>;
    using size_type = std::size_t;
    using capacity_type = long long;    ///< Signed so negative requests can be rejected
    using hasher = Hash;
    using key_equal = KeyEqual;

    // ---------------- Views ----------------

    /**
     * Iterator over the recency order. Dereferencing reads the table directly,
     * so advancing through a view never touches recency.
     */
    template <view_kind Kind>
    class view_iterator {
    public:
        using iterator_category = std::conditional_t<Kind == view_kind::items,
                                                     std::input_iterator_tag,
                                                     std::forward_iterator_tag>;
        using difference_type = std::ptrdiff_t;
        using value_type = std::conditional_t<Kind == view_kind::keys, Key,
                           std::conditional_t<Kind == view_kind::values, Value,
                                              std::pair<Key, Value>>>;
        using reference = std::conditional_t<Kind == view_kind::keys, const Key&,
                          std::conditional_t<Kind == view_kind::values, const Value&,
                                             std::pair<const Key&, const Value&>>>;
        using pointer = void;

        view_iterator() = default;

        view_iterator(order_iterator pos, const table_type* table) : pos_(pos), table_(table) {}

        reference operator*() const {
            if constexpr (Kind == view_kind::keys) {
                return *pos_;
            } else {
                const Value& value = table_->find(*pos_)->second.value;
                if constexpr (Kind == view_kind::values) {
                    return value;
                } else {
                    return reference(*pos_, value);
                }
            }
        }

        view_iterator& operator++() {
            ++pos_;
            return *this;
        }

        view_iterator operator++(int) {
            view_iterator previous = *this;
            ++pos_;
            return previous;
        }

        friend bool operator==(const view_iterator& lhs, const view_iterator& rhs) {
            return lhs.pos_ == rhs.pos_;
        }

        friend bool operator!=(const view_iterator& lhs, const view_iterator& rhs) {
            return !(lhs == rhs);
        }

    private:
        order_iterator pos_{};
        const table_type* table_ = nullptr;
    };

    /**
     * Lazy view over a live store. Each begin() starts a fresh traversal.
     * Structural changes to the store while a traversal is in progress are undefined.
     */
    template <view_kind Kind>
    class view {
    public:
        using iterator = view_iterator<Kind>;
        using const_iterator = iterator;

        iterator begin() const { return iterator(store_->order_.begin(), &store_->table_); }
        iterator end() const { return iterator(store_->order_.end(), &store_->table_); }
        size_type size() const { return store_->filled(); }
        bool empty() const { return store_->empty(); }

    private:
        friend class LruStore;

        explicit view(const LruStore* store) : store_(store) {}

        const LruStore* store_;
    };

    using key_view = view<view_kind::keys>;
    using value_view = view<view_kind::values>;
    using item_view = view<view_kind::items>;
    using const_iterator = typename item_view::iterator;
    using iterator = const_iterator;

    // ---------------- Construction ----------------

    /**
     * @param capacity Maximum number of entries, must be >= 1
     * @throws InvalidCapacity if capacity is below 1
     */
    explicit LruStore(capacity_type capacity) : capacity_(checked_capacity(capacity)) {}

    /**
     * Builds a store and writes [first, last) in order, evicting on overflow
     * exactly as sequential put() calls would.
     */
    template <typename InputIt>
    LruStore(capacity_type capacity, InputIt first, InputIt last) : LruStore(capacity) {
        for (; first != last; ++first) {
            put(first->first, first->second);
        }
    }

    LruStore(capacity_type capacity, std::initializer_list<value_type> initial) : LruStore(capacity) {
        update(initial);
    }

    /**
     * Builds a store from any range of key/value pairs (vector of pairs, std::map, ...).
     * Unordered sources are written in their own iteration order.
     */
    template <typename Range,
              typename = decltype(std::begin(std::declval<const Range&>()))>
    LruStore(capacity_type capacity, const Range& initial) : LruStore(capacity) {
        update(initial);
    }

    // Entries point into order_, so copies rebuild both structures.
    LruStore(const LruStore& other)
        : capacity_(other.capacity_),
          table_(other.table_.bucket_count(), other.table_.hash_function(), other.table_.key_eq()) {
        for (const auto& key : other.order_) {
            append(key, other.table_.find(key)->second.value);
        }
    }

    LruStore(LruStore&&) = default;

    LruStore& operator=(const LruStore& other) {
        if (this != &other) {
            LruStore copy(other);
            swap(copy);
        }
        return *this;
    }

    LruStore& operator=(LruStore&&) = default;

    ~LruStore() = default;

    // ---------------- Public API ----------------

    /**
     * Insert or update a key. The key becomes the most recently used entry.
     * Evicts the least recently used entry if the store overflows.
     */
    void put(const Key& key, Value value) {
        auto it = table_.find(key);
        if (it != table_.end()) {
            it->second.value = std::move(value);
            touch(it);
            return;
        }

        append(key, std::move(value));
        evict_if_needed();
    }

    /**
     * Write every pair of a range, in order.
     */
    template <typename Range>
    void update(const Range& entries) {
        for (const auto& entry : entries) {
            put(entry.first, entry.second);
        }
    }

    void update(std::initializer_list<value_type> entries) {
        for (const auto& entry : entries) {
            put(entry.first, entry.second);
        }
    }

    /**
     * Read a value and make its key the most recently used entry.
     * @throws KeyNotFound if key is absent; order is left unchanged
     */
    Value& get(const Key& key) {
        auto it = find_or_throw(key, "get");
        touch(it);
        return it->second.value;
    }

    /**
     * Like get(), but returns fallback instead of throwing when key is absent.
     */
    Value get_or(const Key& key, Value fallback) {
        auto it = table_.find(key);
        if (it == table_.end()) {
            return fallback;
        }
        touch(it);
        return it->second.value;
    }

    /**
     * Return the value for key, writing fallback first if key is absent.
     * Either way the key ends up most recently used.
     */
    Value& setdefault(const Key& key, Value fallback) {
        auto it = table_.find(key);
        if (it == table_.end()) {
            put(key, std::move(fallback));
            it = table_.find(key);
        } else {
            touch(it);
        }
        return it->second.value;
    }

    /**
     * Read a value without affecting recency order.
     * @throws KeyNotFound if key is absent
     */
    const Value& peek(const Key& key) const {
        auto it = table_.find(key);
        if (it == table_.end()) {
            throw KeyNotFound("peek");
        }
        return it->second.value;
    }

    /**
     * Remove a key. Relative order of the remaining entries is kept.
     * @throws KeyNotFound if key is absent
     */
    void erase(const Key& key) {
        auto it = find_or_throw(key, "erase");
        order_.erase(it->second.order_it);
        table_.erase(it);
    }

    /**
     * Remove a key and return its value.
     * @throws KeyNotFound if key is absent
     */
    Value pop(const Key& key) {
        auto it = find_or_throw(key, "pop");
        Value value = std::move(it->second.value);
        order_.erase(it->second.order_it);
        table_.erase(it);
        return value;
    }

    /**
     * Like pop(), but returns fallback instead of throwing when key is absent.
     */
    Value pop(const Key& key, Value fallback) {
        auto it = table_.find(key);
        if (it == table_.end()) {
            return fallback;
        }
        Value value = std::move(it->second.value);
        order_.erase(it->second.order_it);
        table_.erase(it);
        return value;
    }

    /**
     * Remove and return the least recently used entry.
     * @throws EmptyStore if there are no entries
     */
    value_type pop_least_recently_used() {
        if (order_.empty()) {
            throw EmptyStore("pop_least_recently_used");
        }
        auto it = table_.find(order_.front());
        value_type entry{std::move(order_.front()), std::move(it->second.value)};
        table_.erase(it);
        order_.pop_front();
        return entry;
    }

    /**
     * Raw membership test, never affects order.
     */
    bool contains(const Key& key) const {
        return table_.find(key) != table_.end();
    }

    /**
     * Change the capacity. Shrinking below the current fill drops the oldest
     * surplus entries in a single pass.
     * @throws InvalidCapacity if new_capacity is below 1; the store is unchanged
     */
    void resize(capacity_type new_capacity) {
        capacity_ = checked_capacity(new_capacity);
        if (order_.size() <= capacity_) {
            return;
        }

        auto surplus = static_cast<typename order_list::difference_type>(order_.size() - capacity_);
        auto first_survivor = std::next(order_.begin(), surplus);
        for (auto it = order_.begin(); it != first_survivor; ++it) {
            table_.erase(*it);
        }
        order_.erase(order_.begin(), first_survivor);
    }

    /**
     * Drop every entry. Capacity is unchanged.
     */
    void clear() noexcept {
        table_.clear();
        order_.clear();
    }

    /**
     * @throws EmptyStore if there are no entries
     */
    const Key& least_recently_used() const {
        if (order_.empty()) {
            throw EmptyStore("least_recently_used");
        }
        return order_.front();
    }

    /**
     * @throws EmptyStore if there are no entries
     */
    const Key& most_recently_used() const {
        if (order_.empty()) {
            throw EmptyStore("most_recently_used");
        }
        return order_.back();
    }

    /**
     * @return Number of entries currently stored
     */
    size_type filled() const noexcept { return table_.size(); }

    size_type size() const noexcept { return table_.size(); }

    bool empty() const noexcept { return table_.empty(); }

    /**
     * @return Maximum number of entries; only resize() changes it
     */
    size_type capacity() const noexcept { return capacity_; }

    key_view keys() const { return key_view(this); }
    value_view values() const { return value_view(this); }
    item_view items() const { return item_view(this); }

    const_iterator begin() const { return items().begin(); }
    const_iterator end() const { return items().end(); }

    void swap(LruStore& other) noexcept {
        using std::swap;
        swap(capacity_, other.capacity_);
        swap(table_, other.table_);
        swap(order_, other.order_);
    }

    /**
     * Equal iff capacities and fill match and the entries are equal pairwise
     * in recency order.
     */
    friend bool operator==(const LruStore& lhs, const LruStore& rhs) {
        if (lhs.capacity_ != rhs.capacity_ || lhs.filled() != rhs.filled()) {
            return false;
        }
        auto left = lhs.items();
        auto right = rhs.items();
        return std::equal(left.begin(), left.end(), right.begin(), right.end());
    }

    friend bool operator!=(const LruStore& lhs, const LruStore& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const LruStore& store) {
        return os << "<LruStore capacity=" << store.capacity_ << " filled=" << store.filled() << ">";
    }

private:
    // ---------------- Internal helpers ----------------

    static size_type checked_capacity(capacity_type capacity) {
        if (capacity < 1) {
            throw InvalidCapacity(capacity);
        }
        return static_cast<size_type>(capacity);
    }

    typename table_type::iterator find_or_throw(const Key& key, const char* operation) {
        auto it = table_.find(key);
        if (it == table_.end()) {
            throw KeyNotFound(operation);
        }
        return it;
    }

    /// Move an existing key to the most recently used end of order_.
    void touch(typename table_type::iterator it) {
        order_.splice(order_.end(), order_, it->second.order_it);
    }

    /// Add a new key as most recently used without checking capacity.
    void append(const Key& key, Value value) {
        order_.push_back(key);
        try {
            table_.emplace(key, Entry{std::move(value), std::prev(order_.end())});
        } catch (...) {
            order_.pop_back();
            throw;
        }
    }

    /// Remove the least recently used key if capacity is exceeded by one.
    void evict_if_needed() {
        if (table_.size() <= capacity_) {
            return;
        }
        table_.erase(order_.front());
        order_.pop_front();
    }

    // ---------------- Data members ----------------
    size_type capacity_;    ///< Max allowed entries
    table_type table_;      ///< key -> Entry
    order_list order_;      ///< Keys in LRU -> MRU order
};

template <typename Key, typename Value, typename Hash, typename KeyEqual>
void swap(LruStore<Key, Value, Hash, KeyEqual>& lhs,
          LruStore<Key, Value, Hash, KeyEqual>& rhs) noexcept {
    lhs.swap(rhs);
}

} // namespace lru

#endif // LRU_STORE_H
