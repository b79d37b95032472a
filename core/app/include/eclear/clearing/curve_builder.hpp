#pragma once

#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/participant.hpp"

#include <vector>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// CurvePoint
// -----------------------------------------------------------------------------
// One step of a cumulative step curve: after every participant up to and
// including this one is filled, `cumulative_quantity` units have traded.
// `price` is the limit of the participant that contributed this step.
// Ephemeral; lives only for one clearing run.
// -----------------------------------------------------------------------------
struct CurvePoint {
  domain::Price price{0};
  domain::Quantity cumulative_quantity{0};
};

// -----------------------------------------------------------------------------
// DemandCurve / SupplyCurve
// -----------------------------------------------------------------------------
// A curve keeps the participants in the exact order it was built from, so the
// allocator walks the same merit order the solver saw. points[i] belongs to
// bids[i] (resp. supplies[i]).
// -----------------------------------------------------------------------------
struct DemandCurve {
  std::vector<domain::Bid> bids;
  std::vector<CurvePoint> points;
  domain::Quantity total_quantity{0};
};

struct SupplyCurve {
  std::vector<domain::SupplyOffer> supplies;
  std::vector<CurvePoint> points;
  domain::Quantity total_quantity{0};
};

// -----------------------------------------------------------------------------
// Merit order comparators
// -----------------------------------------------------------------------------
// Demand: price descending. Supply: reserve price ascending. Equal prices are
// ordered by earliest submitted_at, then by id, so the order is total and the
// same input always yields the same curve.
// -----------------------------------------------------------------------------
bool bidMeritLess(const domain::Bid& a, const domain::Bid& b);
bool supplyMeritLess(const domain::SupplyOffer& a,
                     const domain::SupplyOffer& b);

// -----------------------------------------------------------------------------
// buildDemandCurve(bids)
// -----------------------------------------------------------------------------
//
// @brief  Sorts bids into merit order and accumulates quantities.
//
// @param  bids  Active bids for one timeslot, any order. Copied.
// @return DemandCurve, or ClearingError:
//           InvalidInput        price < 0 or quantity <= 0 on any entry
//           ArithmeticOverflow  cumulative quantity exceeds int64
//
// @details
// Invalid entries abort the build; nothing is ever dropped silently.
// An empty input yields an empty curve (not an error); the solver decides
// what an empty side means.
//
// Pure: no I/O, no shared state.
// -----------------------------------------------------------------------------
domain::Result<DemandCurve> buildDemandCurve(std::vector<domain::Bid> bids);

// Mirror of buildDemandCurve for supply offers (reserve price ascending).
domain::Result<SupplyCurve> buildSupplyCurve(
    std::vector<domain::SupplyOffer> supplies);

}  // namespace clearing
}  // namespace eclear
