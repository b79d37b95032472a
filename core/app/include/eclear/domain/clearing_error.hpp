#pragma once

#include "eclear/domain/clearing_outcome.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace eclear {
namespace domain {

// -----------------------------------------------------------------------------
// ClearingErrorKind
// -----------------------------------------------------------------------------
//
// InvalidInput        Malformed participant record (negative price,
//                     non-positive quantity). Raised by CurveBuilder before
//                     any external effect.
// ArithmeticOverflow  A checked fixed-point sum left the int64 range.
// NoMarketClearing    No bids, no supply, or the curves never cross. A normal
//                     outcome; the caller may retry once more participants
//                     commit.
// AllocationMismatch  The allocator's two walks disagree with the solver.
//                     Indicates a bug; never reconciled.
// RecordStoreError    Load or commit failed in the external record store
//                     (including a missed deadline). Nothing was committed.
// TimeslotNotSealed   Commit guard: the timeslot is Open or already Settled.
// -----------------------------------------------------------------------------
enum class ClearingErrorKind {
  InvalidInput,
  ArithmeticOverflow,
  NoMarketClearing,
  AllocationMismatch,
  RecordStoreError,
  TimeslotNotSealed,
};

inline const char* clearingErrorKindToString(ClearingErrorKind k) {
  switch (k) {
    case ClearingErrorKind::InvalidInput:       return "InvalidInput";
    case ClearingErrorKind::ArithmeticOverflow: return "ArithmeticOverflow";
    case ClearingErrorKind::NoMarketClearing:   return "NoMarketClearing";
    case ClearingErrorKind::AllocationMismatch: return "AllocationMismatch";
    case ClearingErrorKind::RecordStoreError:   return "RecordStoreError";
    case ClearingErrorKind::TimeslotNotSealed:  return "TimeslotNotSealed";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// ClearingError
// -----------------------------------------------------------------------------
//
// @brief  Typed failure value returned by the clearing pipeline.
//
// @details
// `outcome` is populated only for NoMarketClearing reported by
// executeClearing(): it carries the zero-volume outcome (full unmet totals)
// so the caller can report depth without recomputing.
// -----------------------------------------------------------------------------
struct ClearingError {
  ClearingErrorKind kind{ClearingErrorKind::InvalidInput};
  std::string message;
  std::optional<ClearingOutcome> outcome;
};

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
// Value-or-error return used across the pure pipeline. Inspect with
// std::get_if<T> / std::get_if<ClearingError>; no exception crosses it.
// -----------------------------------------------------------------------------
template <typename T>
using Result = std::variant<T, ClearingError>;

inline ClearingError makeError(ClearingErrorKind kind, std::string message) {
  ClearingError e;
  e.kind = kind;
  e.message = std::move(message);
  return e;
}

}  // namespace domain
}  // namespace eclear
