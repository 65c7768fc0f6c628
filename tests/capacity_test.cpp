#include "leastrecent/capacity.hpp"
#include "leastrecent/errors.hpp"
#include "leastrecent/lru_cache.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace leastrecent {
namespace {

TEST(ParseCapacityTest, AcceptsPositiveIntegersOfAnyArithmeticType) {
    EXPECT_EQ(ParseCapacity(3), 3u);
    EXPECT_EQ(ParseCapacity(std::uint8_t{200}), 200u);
    EXPECT_EQ(ParseCapacity(std::int64_t{70000}), 70000u);
    EXPECT_EQ(ParseCapacity(3.0), 3u);
    EXPECT_EQ(ParseCapacity(1.0f), 1u);
}

TEST(ParseCapacityTest, RejectsNonPositive) {
    EXPECT_THROW(ParseCapacity(0), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(-1), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(0u), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(-0.0), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(-3.0), InvalidCapacityError);
}

TEST(ParseCapacityTest, RejectsFractionalInfiniteAndNaN) {
    EXPECT_THROW(ParseCapacity(1.01), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(0.5), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(std::numeric_limits<double>::infinity()), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(-std::numeric_limits<double>::infinity()), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(std::numeric_limits<double>::quiet_NaN()), InvalidCapacityError);
}

TEST(ParseCapacityTest, RejectsBooleans) {
    EXPECT_THROW(ParseCapacity(true), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(false), InvalidCapacityError);
}

TEST(ParseCapacityTest, RejectsCapacitiesPastThirtyTwoBitSlots) {
    EXPECT_EQ(ParseCapacity(std::uint64_t{4294967296ull}), 4294967296ull);
    EXPECT_THROW(ParseCapacity(std::uint64_t{4294967297ull}), CapacityUnsupportedError);
    EXPECT_THROW(ParseCapacity(1e12), CapacityUnsupportedError);
}

TEST(ParseCapacityTest, OversizedFloatingCapacityReportsItsValue) {
    try {
        ParseCapacity(1e12);
        FAIL() << "expected CapacityUnsupportedError";
    } catch (const CapacityUnsupportedError& e) {
        EXPECT_EQ(e.capacity(), 1000000000000ull);
    }
    try {
        ParseCapacity(1e30);
        FAIL() << "expected CapacityUnsupportedError";
    } catch (const CapacityUnsupportedError& e) {
        EXPECT_EQ(e.capacity(), std::numeric_limits<std::uint64_t>::max());
    }
}

TEST(ParseCapacityTest, ParsesText) {
    EXPECT_EQ(ParseCapacity(std::string("128")), 128u);
    EXPECT_EQ(ParseCapacity(" 42 "), 42u);
    EXPECT_EQ(ParseCapacity("1e3"), 1000u);
}

TEST(ParseCapacityTest, RejectsNonNumericText) {
    EXPECT_THROW(ParseCapacity(""), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("   "), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("abc"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("12abc"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("true"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("1.01"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("-1"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("inf"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("nan"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity("1e400"), InvalidCapacityError);
    EXPECT_THROW(ParseCapacity(static_cast<const char*>(nullptr)), InvalidCapacityError);
}

TEST(ParseCapacityTest, ErrorMessageNamesTheRule) {
    try {
        ParseCapacity(-1);
        FAIL() << "expected InvalidCapacityError";
    } catch (const InvalidCapacityError& e) {
        EXPECT_NE(std::string(e.what()).find("finite positive integer"), std::string::npos);
    }
}

using Cache = LRUCache<std::string, int>;

TEST(CacheConstructionTest, RejectsInvalidCapacities) {
    EXPECT_THROW(Cache(0), InvalidCapacityError);
    EXPECT_THROW(Cache(-1), InvalidCapacityError);
    EXPECT_THROW(Cache(true), InvalidCapacityError);
    EXPECT_THROW(Cache(1.01), InvalidCapacityError);
    EXPECT_THROW(Cache(std::numeric_limits<double>::infinity()), InvalidCapacityError);
    EXPECT_THROW(Cache(std::numeric_limits<double>::quiet_NaN()), InvalidCapacityError);
}

TEST(CacheConstructionTest, RejectsUnsupportedCapacityBeforeAllocating) {
    EXPECT_THROW(Cache(std::uint64_t{4294967297ull}), CapacityUnsupportedError);
}

TEST(CacheConstructionTest, AcceptsIntegralDouble) {
    Cache cache(3.0);
    EXPECT_EQ(cache.Capacity(), 3u);
    EXPECT_EQ(cache.Size(), 0u);
}

} // namespace
} // namespace leastrecent
