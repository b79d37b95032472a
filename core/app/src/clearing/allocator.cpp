#include "eclear/clearing/allocator.hpp"

#include "eclear/math/checked_arithmetic.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace eclear {
namespace clearing {

namespace {

using domain::ClearingErrorKind;
using domain::makeError;

void dumpCurve(const char* label, const std::vector<CurvePoint>& points) {
  std::cerr << "[Allocator]   " << label << ":";
  for (const auto& p : points) {
    std::cerr << " (" << p.price << ", " << p.cumulative_quantity << ")";
  }
  std::cerr << "\n";
}

// Full state dump for a failed allocation. This is a bug path; the output
// is meant to be enough to reproduce the run offline.
void reportMismatch(const DemandCurve& demand, const SupplyCurve& supply,
                    const ClearingPoint& point, domain::Quantity bid_total,
                    domain::Quantity supply_total) {
  std::cerr << "[Allocator] Allocation mismatch at price " << point.price
            << ": cleared=" << point.quantity << " bids=" << bid_total
            << " supplies=" << supply_total << "\n";
  dumpCurve("demand", demand.points);
  dumpCurve("supply", supply.points);
}

}  // namespace

domain::Result<Allocation> allocate(const DemandCurve& demand,
                                    const SupplyCurve& supply,
                                    const ClearingPoint& point) {
  Allocation result;
  domain::Quantity bid_total = 0;
  domain::Quantity supply_total = 0;

  // --- Demand walk -----------------------------------------------------------
  domain::Quantity remaining = point.quantity;
  for (const auto& bid : demand.bids) {
    domain::Quantity filled = 0;
    if (remaining > 0 && bid.price >= point.price) {
      filled = std::min(remaining, bid.quantity);
      remaining -= filled;
      bid_total += filled;
      result.matched_bids.push_back(
          domain::MatchedBid{bid.id, bid.bidder_id, filled, bid.price});
    }
    auto unmet = math::checked_add(result.unmet_demand, bid.quantity - filled);
    if (!unmet) {
      return makeError(ClearingErrorKind::ArithmeticOverflow,
                       "unmet demand overflows at bid " + bid.id);
    }
    result.unmet_demand = *unmet;
  }

  // --- Supply walk -----------------------------------------------------------
  remaining = point.quantity;
  for (const auto& offer : supply.supplies) {
    domain::Quantity filled = 0;
    if (remaining > 0 && offer.reserve_price <= point.price) {
      filled = std::min(remaining, offer.quantity);
      remaining -= filled;
      supply_total += filled;
      result.matched_supplies.push_back(domain::MatchedSupply{
          offer.id, offer.supplier_id, filled, offer.reserve_price});
    }
    auto unmet =
        math::checked_add(result.unmet_supply, offer.quantity - filled);
    if (!unmet) {
      return makeError(ClearingErrorKind::ArithmeticOverflow,
                       "unmet supply overflows at supply " + offer.id);
    }
    result.unmet_supply = *unmet;
  }

  if (bid_total != point.quantity || supply_total != point.quantity) {
    reportMismatch(demand, supply, point, bid_total, supply_total);
    return makeError(ClearingErrorKind::AllocationMismatch,
                     "allocated bids=" + std::to_string(bid_total) +
                         " supplies=" + std::to_string(supply_total) +
                         " but cleared quantity is " +
                         std::to_string(point.quantity));
  }

  return result;
}

}  // namespace clearing
}  // namespace eclear
