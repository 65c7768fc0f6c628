#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace leastrecent {

// XXH3-64 of a byte range.
std::uint64_t HashBytes(const void* data, std::size_t len);

// Default hasher for the key index. Strings go through XXH3; every other
// key type uses std::hash.
struct KeyHash {
    std::size_t operator()(const std::string& key) const {
        return static_cast<std::size_t>(HashBytes(key.data(), key.size()));
    }

    std::size_t operator()(std::string_view key) const {
        return static_cast<std::size_t>(HashBytes(key.data(), key.size()));
    }

    template <typename T>
    std::size_t operator()(const T& key) const {
        return std::hash<T>{}(key);
    }
};

} // namespace leastrecent
