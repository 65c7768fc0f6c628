#pragma once

#include "capacity.hpp"
#include "eviction_notifier.hpp"
#include "hash.hpp"
#include "key_index.hpp"
#include "recency_list.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace leastrecent {

namespace detail {

template <typename Range, typename = void>
struct has_size : std::false_type {};

template <typename Range>
struct has_size<Range, std::void_t<decltype(std::size(std::declval<const Range&>()))>>
    : std::true_type {};

// Length of a range when it can be known without walking it, otherwise 0.
template <typename Range>
std::size_t KnownLength(const Range& range) {
    if constexpr (has_size<Range>::value) {
        return static_cast<std::size_t>(std::size(range));
    } else {
        return 0;
    }
}

} // namespace detail

/**
 * @class LRUCache
 * @brief Fixed-capacity key-value cache that evicts the least recently used entry.
 *
 * All storage (keys, values and the recency links) is allocated once, in the
 * constructor, and reused for the lifetime of the cache. Set() and Get()
 * promote an entry to most recently used; Peek() and Has() do not.
 *
 * Entries are visited most recently used first by Keys(), Values(),
 * Entries() and range-for over the cache. The cache must not be modified
 * while such a traversal is in progress.
 *
 * K and V must be default-constructible and copy-assignable.
 *
 * This class is not thread-safe. External synchronization is required if it
 * is shared between threads.
 *
 * Options left unset are filled from the environment (see settings.hpp); an
 * unrecognised LEAST_RECENT_HANDLER_POLICY is reported on std::cerr and the
 * default policy is used.
 */
template <typename K, typename V, typename Hash = KeyHash>
class LRUCache {
    struct KeyOf {
        K operator()(const LRUCache& c, std::uint32_t slot) const { return c.keys_[slot]; }
    };
    struct ValueOf {
        V operator()(const LRUCache& c, std::uint32_t slot) const { return c.values_[slot]; }
    };
    struct EntryOf {
        std::pair<K, V> operator()(const LRUCache& c, std::uint32_t slot) const {
            return {c.keys_[slot], c.values_[slot]};
        }
    };

public:
    using key_type = K;
    using mapped_type = V;
    using Handler = typename EvictionNotifier<K, V>::Handler;
    using Outcome = SetOutcome<K, V>;

    /**
     * @class Sequence
     * @brief Single-pass, pull-based walk over the live entries.
     *
     * The entry count and starting slot are captured when the sequence is
     * created. Draining it (through Next() or a range-for) consumes it; a
     * second loop resumes where the first stopped. Ask the cache for a new
     * sequence to start over.
     */
    template <typename Projection>
    class Sequence {
    public:
        using value_type = decltype(Projection{}(std::declval<const LRUCache&>(), std::uint32_t{}));

        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = typename Sequence::value_type;
            using difference_type = std::ptrdiff_t;
            using pointer = const value_type*;
            using reference = const value_type&;

            iterator() = default;
            explicit iterator(Sequence* sequence) : sequence_(sequence) { Fetch(); }

            reference operator*() const { return *current_; }
            pointer operator->() const { return &*current_; }

            iterator& operator++() {
                Fetch();
                return *this;
            }
            void operator++(int) { Fetch(); }

            bool operator==(const iterator& other) const { return sequence_ == other.sequence_; }
            bool operator!=(const iterator& other) const { return sequence_ != other.sequence_; }

        private:
            void Fetch() {
                current_ = sequence_->Next();
                if (!current_) {
                    sequence_ = nullptr;
                }
            }

            Sequence* sequence_ = nullptr;
            std::optional<value_type> current_;
        };

        std::optional<value_type> Next() {
            if (visited_ >= length_) {
                return std::nullopt;
            }
            value_type item = Projection{}(*cache_, slot_);
            ++visited_;
            if (visited_ < length_) {
                slot_ = cache_->order_.Next(slot_);
            }
            return item;
        }

        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

        std::size_t Remaining() const { return length_ - visited_; }

    private:
        friend class LRUCache;

        explicit Sequence(const LRUCache* cache)
            : cache_(cache), length_(cache->order_.Size()), slot_(cache->order_.Head()) {}

        const LRUCache* cache_;
        std::size_t length_;
        std::size_t visited_ = 0;
        std::uint32_t slot_;
    };

    using KeySequence = Sequence<KeyOf>;
    using ValueSequence = Sequence<ValueOf>;
    using EntrySequence = Sequence<EntryOf>;

    // Iterator for range-for over the cache itself; yields (key, value)
    // references, most recently used first.
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::pair<K, V>;
        using difference_type = std::ptrdiff_t;
        using reference = std::pair<const K&, const V&>;
        using pointer = void;

        const_iterator() = default;

        reference operator*() const { return {cache_->keys_[slot_], cache_->values_[slot_]}; }

        const_iterator& operator++() {
            if (--remaining_ > 0) {
                slot_ = cache_->order_.Next(slot_);
            }
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator before = *this;
            ++*this;
            return before;
        }

        bool operator==(const const_iterator& other) const { return remaining_ == other.remaining_; }
        bool operator!=(const const_iterator& other) const { return remaining_ != other.remaining_; }

    private:
        friend class LRUCache;

        const_iterator(const LRUCache* cache, std::size_t remaining)
            : cache_(cache), slot_(cache->order_.Head()), remaining_(remaining) {}

        const LRUCache* cache_ = nullptr;
        std::uint32_t slot_ = 0;
        std::size_t remaining_ = 0;
    };

    /**
     * @brief Creates a cache holding at most capacity entries.
     * @param capacity Any arithmetic value that is a finite positive integer.
     * @throws InvalidCapacityError for zero, negative, fractional, infinite,
     *         NaN or boolean capacities.
     * @throws CapacityUnsupportedError when capacity exceeds 2^32 slots.
     */
    template <typename N, typename = std::enable_if_t<std::is_arithmetic<N>::value>>
    explicit LRUCache(N capacity, Options options = {})
        : LRUCache(ParseCapacity(capacity), std::move(options), Validated{}) {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;
    LRUCache(LRUCache&&) = default;
    LRUCache& operator=(LRUCache&&) = default;

    /**
     * @brief Builds a cache from (key, value) pairs, inserted in order.
     *
     * Later pairs are more recent, and the last value of a repeated key wins.
     * Without an explicit capacity the range's size is used; a range whose
     * size is unknown yields 0 and construction fails. An explicit capacity
     * is checked exactly as the constructor checks it.
     */
    template <typename Range>
    static LRUCache From(const Range& pairs) {
        return From(pairs, detail::KnownLength(pairs));
    }

    template <typename Range, typename N, typename = std::enable_if_t<std::is_arithmetic<N>::value>>
    static LRUCache From(const Range& pairs, N capacity) {
        return From(std::begin(pairs), std::end(pairs), capacity);
    }

    template <typename InputIt, typename N, typename = std::enable_if_t<std::is_arithmetic<N>::value>>
    static LRUCache From(InputIt first, InputIt last, N capacity) {
        LRUCache cache(capacity);
        for (; first != last; ++first) {
            const auto& [key, value] = *first;
            cache.Set(key, value);
        }
        return cache;
    }

    static LRUCache From(std::initializer_list<std::pair<K, V>> pairs) {
        return From(pairs.begin(), pairs.end(), pairs.size());
    }

    template <typename N, typename = std::enable_if_t<std::is_arithmetic<N>::value>>
    static LRUCache From(std::initializer_list<std::pair<K, V>> pairs, N capacity) {
        return From(pairs.begin(), pairs.end(), capacity);
    }

    /**
     * @brief Inserts or updates key and makes it the most recently used entry.
     *
     * When the cache is full and key is new, the least recently used entry is
     * evicted and the eviction handlers are called with it, after the new
     * entry is in place.
     */
    void Set(const K& key, const V& value) {
        Store(key, value, nullptr);
    }

    /**
     * @brief Same as Set(), but reports what was displaced.
     * @return std::nullopt when the key was new and there was room;
     *         kOverwritten with the previous value when the key existed;
     *         kEvicted with the evicted entry otherwise.
     */
    std::optional<Outcome> SetWithOutcome(const K& key, const V& value) {
        std::optional<Outcome> outcome;
        Store(key, value, &outcome);
        return outcome;
    }

    // Returns the value for key and marks it most recently used.
    std::optional<V> Get(const K& key) {
        auto slot = index_.Lookup(key);
        if (!slot) {
            return std::nullopt;
        }
        order_.MoveToFront(*slot);
        return values_[*slot];
    }

    // Returns the value for key without touching the recency order.
    std::optional<V> Peek(const K& key) const {
        auto slot = index_.Lookup(key);
        if (!slot) {
            return std::nullopt;
        }
        return values_[*slot];
    }

    bool Has(const K& key) const {
        return index_.Contains(key);
    }

    // Drops every entry without notifying handlers. Storage is kept.
    void Clear() {
        order_.Clear();
        index_.Clear();
    }

    std::size_t Size() const { return order_.Size(); }
    std::size_t Capacity() const { return order_.Capacity(); }
    bool Empty() const { return order_.Empty(); }

    // Bytes taken by the recency links.
    std::size_t Footprint() const { return order_.Footprint(); }

    HandlerFailurePolicy FailurePolicy() const { return *options_.handler_failure_policy; }

    /**
     * @brief Registers a handler called as handler(key, value) for every
     * entry evicted to make room. Handlers run in subscription order.
     */
    Subscription OnEvicted(Handler handler) {
        return notifier_.Subscribe(std::move(handler));
    }

    KeySequence Keys() const { return KeySequence(this); }
    ValueSequence Values() const { return ValueSequence(this); }
    EntrySequence Entries() const { return EntrySequence(this); }

    const_iterator begin() const { return const_iterator(this, order_.Size()); }
    const_iterator end() const { return const_iterator(this, 0); }

    template <class Stream>
    void ToStream(Stream& s) const {
        s << "LRUCache(capacity=" << Capacity() << ",size=" << Size() << ")" << std::endl;
        for (const auto& [key, value] : *this) {
            s << "> " << key << ": " << value << std::endl;
        }
    }

    // Walks the whole structure and checks that the chain and the key index
    // agree. Linear in Size().
    bool Validate() const {
        if (!order_.Validate() || index_.Size() != order_.Size()) {
            return false;
        }
        std::uint32_t slot = order_.Head();
        for (std::size_t i = 0; i < order_.Size(); ++i) {
            auto indexed = index_.Lookup(keys_[slot]);
            if (!indexed || *indexed != slot) {
                return false;
            }
            slot = order_.Next(slot);
        }
        return true;
    }

private:
    struct Validated {};

    LRUCache(std::size_t capacity, Options options, Validated)
        : options_(std::move(options)),
          order_(capacity),
          keys_(capacity),
          values_(capacity),
          index_(capacity) {
        ApplyOptionDefaults(options_);
    }

    void Store(const K& key, const V& value, std::optional<Outcome>* outcome) {
        if (auto slot = index_.Lookup(key)) {
            order_.MoveToFront(*slot);
            if (outcome) {
                *outcome = Outcome{OutcomeKind::kOverwritten, key, values_[*slot]};
            }
            values_[*slot] = value;
            return;
        }

        if (!order_.Full()) {
            Commit(order_.ClaimSlot(), key, value);
            return;
        }

        const std::uint32_t slot = order_.EvictTail();
        index_.Remove(keys_[slot]);
        K evicted_key = std::move(keys_[slot]);
        V evicted_value = std::move(values_[slot]);
        Commit(slot, key, value);

        // The new entry is committed; a throwing handler does not undo it.
        notifier_.Notify(evicted_key, evicted_value, *options_.handler_failure_policy);
        if (outcome) {
            *outcome = Outcome{OutcomeKind::kEvicted, std::move(evicted_key), std::move(evicted_value)};
        }
    }

    void Commit(std::uint32_t slot, const K& key, const V& value) {
        keys_[slot] = key;
        values_[slot] = value;
        index_.Insert(key, slot);
        order_.PushFront(slot);
    }

    Options options_;
    RecencyList order_;
    std::vector<K> keys_;
    std::vector<V> values_;
    KeyIndex<K, Hash> index_;
    EvictionNotifier<K, V> notifier_;
};

} // namespace leastrecent
