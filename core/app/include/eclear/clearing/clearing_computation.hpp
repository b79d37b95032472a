#pragma once

#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/clearing_outcome.hpp"
#include "eclear/domain/participant.hpp"

#include <vector>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// computeClearing(bids, supplies)
// -----------------------------------------------------------------------------
//
// @brief  Runs the pure clearing pipeline for one timeslot:
//         CurveBuilder -> IntersectionSolver -> Allocator.
//
// @param  bids      Active bids, any order.
// @param  supplies  Active supply offers, any order.
//
// @return ClearingOutcome on success. A market that does not clear is a
//         success too: market_cleared == false, clearing_price == 0,
//         cleared_quantity == 0, empty matched lists, unmet_* == the full
//         totals of each side.
//
//         ClearingError with kind InvalidInput, ArithmeticOverflow or
//         AllocationMismatch otherwise.
//
// @details
// Deterministic: input order does not matter and the same inputs always give
// an equal outcome. No I/O, no shared state; safe to call from any thread.
// -----------------------------------------------------------------------------
domain::Result<domain::ClearingOutcome> computeClearing(
    const std::vector<domain::Bid>& bids,
    const std::vector<domain::SupplyOffer>& supplies);

}  // namespace clearing
}  // namespace eclear
