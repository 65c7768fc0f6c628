#include "leastrecent/errors.hpp"

namespace leastrecent {

InvalidCapacityError::InvalidCapacityError(const std::string& detail)
    : std::runtime_error("Capacity should be a finite positive integer (" + detail + ").") {}

CapacityUnsupportedError::CapacityUnsupportedError(std::uint64_t capacity)
    : std::runtime_error("Pointer array of size " + std::to_string(capacity) +
                         " is not supported; capacity - 1 must not exceed 4294967295."),
      capacity_(capacity) {}

} // namespace leastrecent
