#pragma once

#include "eclear/clearing/curve_builder.hpp"
#include "eclear/clearing/intersection_solver.hpp"
#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/clearing_outcome.hpp"

#include <vector>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// Allocation
// -----------------------------------------------------------------------------
// Per-participant fills for one clearing point. Only participants with a
// non-zero fill appear in the matched lists.
// -----------------------------------------------------------------------------
struct Allocation {
  std::vector<domain::MatchedBid> matched_bids;
  std::vector<domain::MatchedSupply> matched_supplies;
  domain::Quantity unmet_demand{0};
  domain::Quantity unmet_supply{0};
};

// -----------------------------------------------------------------------------
// allocate(demand, supply, point)
// -----------------------------------------------------------------------------
//
// @brief  Distributes point.quantity across both sides in merit order.
//
// @details
// Demand walk: each bid with price >= point.price receives
// min(remaining, quantity); once remaining reaches zero every further bid
// receives zero. Supply walk is the mirror with reserve_price <= point.price.
// Only the marginal participant on each side can end up partially filled.
//
// unmet_demand / unmet_supply are the sum over each side of
// (original quantity - allocated quantity).
//
// @return Allocation, or ClearingError:
//           AllocationMismatch  a walk could not place the full quantity
//                               (or placed a different total than the other
//                               side). Never reconciled; the run fails.
//           ArithmeticOverflow  an unmet sum left the int64 range.
//
// On AllocationMismatch both curves and the partial fills are written to
// std::cerr.
// -----------------------------------------------------------------------------
domain::Result<Allocation> allocate(const DemandCurve& demand,
                                    const SupplyCurve& supply,
                                    const ClearingPoint& point);

}  // namespace clearing
}  // namespace eclear
