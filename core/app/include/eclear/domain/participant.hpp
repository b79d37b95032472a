#pragma once

#include "eclear/domain/types.hpp"

namespace eclear {
namespace domain {

// -----------------------------------------------------------------------------
// Bid
// -----------------------------------------------------------------------------
// Responsibility: A buyer's offer to purchase up to `quantity` energy units
// for a timeslot, paying at most `price` per unit.
//
// @details
// Bids arrive from the record store already filtered to active (non-cancelled)
// records. Once handed to a clearing run they are treated as immutable
// snapshots: the pipeline copies and sorts them but never edits a field.
//
// Validity (checked by CurveBuilder, not here): price >= 0, quantity > 0.
// -----------------------------------------------------------------------------
struct Bid {
  BidId id;                    // Record id issued by the record store
  ParticipantId bidder_id;     // Wallet / account of the buyer
  Price price{0};              // Maximum price per unit (fixed-point)
  Quantity quantity{0};        // Requested energy (fixed-point)
  SubmissionTime submitted_at{0};  // First tie-break key on equal price
};

// -----------------------------------------------------------------------------
// SupplyOffer
// -----------------------------------------------------------------------------
// Responsibility: A seller's commitment to deliver up to `quantity` energy
// units for a timeslot, accepting no less than `reserve_price` per unit.
//
// Same immutability and validity rules as Bid.
// -----------------------------------------------------------------------------
struct SupplyOffer {
  SupplyId id;
  ParticipantId supplier_id;
  Price reserve_price{0};
  Quantity quantity{0};
  SubmissionTime submitted_at{0};
};

}  // namespace domain
}  // namespace eclear
