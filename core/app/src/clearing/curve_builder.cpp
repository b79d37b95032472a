#include "eclear/clearing/curve_builder.hpp"

#include "eclear/math/checked_arithmetic.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace eclear {
namespace clearing {

using domain::ClearingErrorKind;
using domain::makeError;

bool bidMeritLess(const domain::Bid& a, const domain::Bid& b) {
  if (a.price != b.price) {
    return a.price > b.price;
  }
  if (a.submitted_at != b.submitted_at) {
    return a.submitted_at < b.submitted_at;
  }
  return a.id < b.id;
}

bool supplyMeritLess(const domain::SupplyOffer& a,
                     const domain::SupplyOffer& b) {
  if (a.reserve_price != b.reserve_price) {
    return a.reserve_price < b.reserve_price;
  }
  if (a.submitted_at != b.submitted_at) {
    return a.submitted_at < b.submitted_at;
  }
  return a.id < b.id;
}

domain::Result<DemandCurve> buildDemandCurve(std::vector<domain::Bid> bids) {
  // Validate everything before sorting so the first bad record reported is
  // the first one the store handed us. Ids must be unique or the merit order
  // is no longer total.
  std::set<domain::BidId> seen;
  for (const auto& bid : bids) {
    if (!seen.insert(bid.id).second) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "duplicate bid id " + bid.id);
    }
    if (bid.price < 0) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "bid " + bid.id + " has negative price " +
                           std::to_string(bid.price));
    }
    if (bid.quantity <= 0) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "bid " + bid.id + " has non-positive quantity " +
                           std::to_string(bid.quantity));
    }
  }

  std::stable_sort(bids.begin(), bids.end(), bidMeritLess);

  DemandCurve curve;
  curve.points.reserve(bids.size());
  domain::Quantity cumulative = 0;
  for (const auto& bid : bids) {
    auto next = math::checked_add(cumulative, bid.quantity);
    if (!next) {
      return makeError(ClearingErrorKind::ArithmeticOverflow,
                       "cumulative demand overflows at bid " + bid.id);
    }
    cumulative = *next;
    curve.points.push_back(CurvePoint{bid.price, cumulative});
  }
  curve.total_quantity = cumulative;
  curve.bids = std::move(bids);
  return curve;
}

domain::Result<SupplyCurve> buildSupplyCurve(
    std::vector<domain::SupplyOffer> supplies) {
  std::set<domain::SupplyId> seen;
  for (const auto& supply : supplies) {
    if (!seen.insert(supply.id).second) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "duplicate supply id " + supply.id);
    }
    if (supply.reserve_price < 0) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "supply " + supply.id + " has negative reserve price " +
                           std::to_string(supply.reserve_price));
    }
    if (supply.quantity <= 0) {
      return makeError(ClearingErrorKind::InvalidInput,
                       "supply " + supply.id + " has non-positive quantity " +
                           std::to_string(supply.quantity));
    }
  }

  std::stable_sort(supplies.begin(), supplies.end(), supplyMeritLess);

  SupplyCurve curve;
  curve.points.reserve(supplies.size());
  domain::Quantity cumulative = 0;
  for (const auto& supply : supplies) {
    auto next = math::checked_add(cumulative, supply.quantity);
    if (!next) {
      return makeError(ClearingErrorKind::ArithmeticOverflow,
                       "cumulative supply overflows at supply " + supply.id);
    }
    cumulative = *next;
    curve.points.push_back(CurvePoint{supply.reserve_price, cumulative});
  }
  curve.total_quantity = cumulative;
  curve.supplies = std::move(supplies);
  return curve;
}

}  // namespace clearing
}  // namespace eclear
