#pragma once

#include "hash.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace leastrecent {

/**
 * @class KeyIndex
 * @brief Maps every live key to the slot that stores it.
 *
 * This is the single source of truth for membership: a key is in the cache
 * exactly when Lookup() finds it. No ordering is kept here.
 */
template <typename K, typename Hash = KeyHash>
class KeyIndex {
public:
    explicit KeyIndex(std::size_t expected_keys) {
        slots_.reserve(expected_keys);
    }

    std::optional<std::uint32_t> Lookup(const K& key) const {
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Contains(const K& key) const {
        return slots_.find(key) != slots_.end();
    }

    // Overwrites any slot previously recorded for key.
    void Insert(const K& key, std::uint32_t slot) {
        slots_[key] = slot;
    }

    bool Remove(const K& key) {
        return slots_.erase(key) > 0;
    }

    // Keeps the bucket array so a refill does not rehash.
    void Clear() {
        slots_.clear();
    }

    std::size_t Size() const { return slots_.size(); }

private:
    std::unordered_map<K, std::uint32_t, Hash> slots_;
};

} // namespace leastrecent
