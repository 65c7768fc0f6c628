#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace leastrecent {

// Thrown when a capacity is not a finite positive integer.
class InvalidCapacityError : public std::runtime_error {
public:
    explicit InvalidCapacityError(const std::string& detail);
};

// Thrown when capacity - 1 does not fit a 32-bit slot pointer.
class CapacityUnsupportedError : public std::runtime_error {
public:
    explicit CapacityUnsupportedError(std::uint64_t capacity);

    std::uint64_t capacity() const { return capacity_; }

private:
    std::uint64_t capacity_;
};

} // namespace leastrecent
