#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace eclear {
namespace math {

// -----------------------------------------------------------------------------
// Checked int64 addition
// -----------------------------------------------------------------------------
//
// @brief  Addition on fixed-point amounts that reports overflow instead of
//         wrapping.
//
// @details
// Signed overflow is undefined behaviour in C++, so the range check happens
// before the operation. checked_add returns std::nullopt when the exact
// result does not fit in std::int64_t; callers translate that into
// ClearingErrorKind::ArithmeticOverflow.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------

inline std::optional<std::int64_t> checked_add(std::int64_t a, std::int64_t b) {
  if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
    return std::nullopt;
  }
  if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) {
    return std::nullopt;
  }
  return a + b;
}

}  // namespace math
}  // namespace eclear
