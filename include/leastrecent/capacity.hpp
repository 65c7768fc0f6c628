#pragma once

#include "errors.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace leastrecent {

// Largest capacity a cache can be built with: slot pointers are at most
// 32 bits wide, so capacity - 1 must fit in a uint32_t.
constexpr std::uint64_t kMaxCapacity = std::uint64_t{std::numeric_limits<std::uint32_t>::max()} + 1;

/**
 * @brief Converts a loosely typed capacity into a slot count.
 *
 * Accepts only finite positive integers. Booleans, zero, negative numbers,
 * fractions, infinities and NaN all throw InvalidCapacityError. Values past
 * kMaxCapacity throw CapacityUnsupportedError.
 */
template <typename N>
std::size_t ParseCapacity(N value) {
    static_assert(std::is_arithmetic<N>::value, "capacity must be numeric");

    if constexpr (std::is_same<N, bool>::value) {
        throw InvalidCapacityError("boolean is not a capacity");
    } else if constexpr (std::is_floating_point<N>::value) {
        if (!std::isfinite(value)) {
            throw InvalidCapacityError("capacity is not finite");
        }
        if (std::floor(value) != value) {
            throw InvalidCapacityError("capacity is not an integer");
        }
        if (value <= 0) {
            throw InvalidCapacityError("capacity is not positive");
        }
        if (value > static_cast<N>(kMaxCapacity)) {
            // 2^64 as a float; anything at or past it saturates.
            constexpr long double kUint64Limit = 18446744073709551616.0L;
            if (static_cast<long double>(value) < kUint64Limit) {
                throw CapacityUnsupportedError(static_cast<std::uint64_t>(value));
            }
            throw CapacityUnsupportedError(std::numeric_limits<std::uint64_t>::max());
        }
        return static_cast<std::size_t>(value);
    } else {
        if (value <= 0) {
            throw InvalidCapacityError("capacity is not positive");
        }
        auto wide = static_cast<std::uint64_t>(value);
        if (wide > kMaxCapacity) {
            throw CapacityUnsupportedError(wide);
        }
        return static_cast<std::size_t>(wide);
    }
}

// Parses a capacity from configuration text ("128", "1e3"). Anything that
// is not entirely a number is rejected.
std::size_t ParseCapacity(const std::string& text);

inline std::size_t ParseCapacity(const char* text) {
    if (text == nullptr) {
        throw InvalidCapacityError("capacity is missing");
    }
    return ParseCapacity(std::string(text));
}

} // namespace leastrecent
