#include "leastrecent/hash.hpp"
#include <xxhash.h>

namespace leastrecent {

std::uint64_t HashBytes(const void* data, std::size_t len) {
    return XXH3_64bits(data, len);
}

} // namespace leastrecent
