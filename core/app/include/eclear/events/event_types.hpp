#pragma once

#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace eclear {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event. Populated from an ITimeProvider via
// ms_to_timestamp() so that tests can pin it with SimulationTimeProvider.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ClearingCompletedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces that a timeslot was cleared and its outcome was
// committed to the record store (timeslot is now Settled).
//
// Published exactly once per committed run, after the per-participant
// BidMatchedEvent / SupplyAllocatedEvent of the same run.
// -----------------------------------------------------------------------------
struct ClearingCompletedEvent {
  domain::TimeslotId timeslot_id;
  domain::Price clearing_price{0};
  domain::Quantity cleared_quantity{0};
  std::size_t matched_bid_count{0};
  std::size_t matched_supply_count{0};
  domain::Quantity unmet_demand{0};
  domain::Quantity unmet_supply{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// BidMatchedEvent
// -----------------------------------------------------------------------------
// One per matched bid of a committed run. The buyer pays `clearing_price`
// per unit, not their own limit.
// -----------------------------------------------------------------------------
struct BidMatchedEvent {
  domain::TimeslotId timeslot_id;
  domain::BidId bid_id;
  domain::ParticipantId bidder_id;
  domain::Quantity allocated_quantity{0};
  domain::Price clearing_price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// One per allocated supply offer of a committed run.
struct SupplyAllocatedEvent {
  domain::TimeslotId timeslot_id;
  domain::SupplyId supply_id;
  domain::ParticipantId supplier_id;
  domain::Quantity allocated_quantity{0};
  domain::Price clearing_price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ClearingFailedEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports a run that ended in Failed. Nothing was written to
// the record store. NoMarketClearing is reported here too; consumers that
// only care about bugs should filter on `kind`.
// -----------------------------------------------------------------------------
struct ClearingFailedEvent {
  domain::TimeslotId timeslot_id;
  domain::ClearingErrorKind kind{domain::ClearingErrorKind::InvalidInput};
  std::string message;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace eclear
