#pragma once

namespace eclear {
namespace domain {

// -----------------------------------------------------------------------------
// TimeslotStatus: auction round lifecycle as seen by the record store
// -----------------------------------------------------------------------------
//
//   Open ──> Sealed ──> Settled
//
// Open:    participants may still commit or cancel bids/supplies.
// Sealed:  the window closed; participant lists are frozen. The only state
//          from which a clearing run may commit.
// Settled: a clearing run committed its outcome. Terminal; a second commit
//          attempt is rejected.
//
// The engine never moves Open -> Sealed (closing a timeslot is the caller's
// job). It moves Sealed -> Settled as part of the commit transaction.
// -----------------------------------------------------------------------------
enum class TimeslotStatus {
  Open,
  Sealed,
  Settled,
};

inline const char* timeslotStatusToString(TimeslotStatus s) {
  switch (s) {
    case TimeslotStatus::Open:    return "OPEN";
    case TimeslotStatus::Sealed:  return "SEALED";
    case TimeslotStatus::Settled: return "SETTLED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace eclear
