// =============================================================================
// checked_arithmetic_test.cpp
// =============================================================================
// Unit tests for eclear::math::checked_add.
//
// Validates:
//   - In-range results are exact
//   - Results one step past INT64_MAX / INT64_MIN are reported as nullopt
// =============================================================================

#include "eclear/math/checked_arithmetic.hpp"

#include <gtest/gtest.h>

#include <limits>

using eclear::math::checked_add;

namespace {
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
}  // namespace

TEST(CheckedArithmeticTest, AddInRange) {
  EXPECT_EQ(checked_add(2, 3), 5);
  EXPECT_EQ(checked_add(-7, 3), -4);
  EXPECT_EQ(checked_add(kMax - 1, 1), kMax);
  EXPECT_EQ(checked_add(kMin + 1, -1), kMin);
}

TEST(CheckedArithmeticTest, AddOverflowIsReported) {
  EXPECT_FALSE(checked_add(kMax, 1).has_value());
  EXPECT_FALSE(checked_add(kMin, -1).has_value());
  EXPECT_FALSE(checked_add(kMax / 2 + 1, kMax / 2 + 1).has_value());
}
