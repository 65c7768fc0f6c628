#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace leastrecent {

// Cell width of a slot pointer array.
enum class PointerWidth : std::uint8_t {
    k8 = 1,
    k16 = 2,
    k32 = 4,
};

/**
 * @brief Picks the narrowest unsigned width able to index capacity slots.
 *
 * @param capacity Number of slots; must be positive.
 * @return k8 when capacity - 1 <= 255, k16 up to 65535, k32 up to 4294967295.
 * @throws CapacityUnsupportedError when capacity - 1 needs more than 32 bits.
 */
PointerWidth SelectPointerWidth(std::uint64_t capacity);

/**
 * @class PointerArray
 * @brief Fixed-length array of slot indices stored at a chosen cell width.
 *
 * The buffer is allocated once in the constructor. Get() and Set() never
 * allocate. Values passed to Set() must fit the width; the cache only
 * stores slot numbers below its capacity, which SelectPointerWidth()
 * guarantees.
 */
class PointerArray {
public:
    PointerArray(PointerWidth width, std::size_t length);

    std::uint32_t Get(std::size_t index) const;
    void Set(std::size_t index, std::uint32_t value);

    std::size_t Length() const { return length_; }
    PointerWidth Width() const { return width_; }

    // Bytes held by the cells.
    std::size_t Bytes() const { return cells_.size(); }

private:
    PointerWidth width_;
    std::size_t length_;
    std::vector<std::uint8_t> cells_;
};

} // namespace leastrecent
