#include "leastrecent/pointer_array.hpp"
#include "leastrecent/errors.hpp"

#include <cstring>
#include <limits>

namespace leastrecent {

namespace {

constexpr std::uint64_t kMax8 = std::numeric_limits<std::uint8_t>::max();
constexpr std::uint64_t kMax16 = std::numeric_limits<std::uint16_t>::max();
constexpr std::uint64_t kMax32 = std::numeric_limits<std::uint32_t>::max();

} // namespace

PointerWidth SelectPointerWidth(std::uint64_t capacity) {
    if (capacity == 0) {
        throw InvalidCapacityError("capacity is not positive");
    }
    const std::uint64_t max_index = capacity - 1;

    if (max_index <= kMax8) return PointerWidth::k8;
    if (max_index <= kMax16) return PointerWidth::k16;
    if (max_index <= kMax32) return PointerWidth::k32;

    throw CapacityUnsupportedError(capacity);
}

PointerArray::PointerArray(PointerWidth width, std::size_t length)
    : width_(width),
      length_(length),
      cells_(length * static_cast<std::size_t>(width), 0) {}

std::uint32_t PointerArray::Get(std::size_t index) const {
    switch (width_) {
    case PointerWidth::k8:
        return cells_[index];
    case PointerWidth::k16: {
        std::uint16_t v;
        std::memcpy(&v, &cells_[index * 2], sizeof(v));
        return v;
    }
    case PointerWidth::k32: {
        std::uint32_t v;
        std::memcpy(&v, &cells_[index * 4], sizeof(v));
        return v;
    }
    }
    return 0;
}

void PointerArray::Set(std::size_t index, std::uint32_t value) {
    switch (width_) {
    case PointerWidth::k8:
        cells_[index] = static_cast<std::uint8_t>(value);
        break;
    case PointerWidth::k16: {
        auto v = static_cast<std::uint16_t>(value);
        std::memcpy(&cells_[index * 2], &v, sizeof(v));
        break;
    }
    case PointerWidth::k32:
        std::memcpy(&cells_[index * 4], &value, sizeof(value));
        break;
    }
}

} // namespace leastrecent
