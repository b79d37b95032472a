#pragma once

#include "eclear/clearing/curve_builder.hpp"
#include "eclear/domain/types.hpp"

#include <optional>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// ClearingPoint
// -----------------------------------------------------------------------------
// The price/quantity pair where the two curves meet. `quantity` is always
// > 0; a market with no tradable volume is represented by std::nullopt.
// -----------------------------------------------------------------------------
struct ClearingPoint {
  domain::Price price{0};
  domain::Quantity quantity{0};
};

// -----------------------------------------------------------------------------
// solveIntersection(demand, supply)
// -----------------------------------------------------------------------------
//
// @brief  Finds the volume-maximizing crossing of the demand and supply step
//         curves.
//
// @return ClearingPoint, or std::nullopt when the market does not clear
//         (either curve empty, or highest bid < lowest reserve).
//
// @details
// Merge walk, O(n + m). Index i walks demand from its highest price, j walks
// supply from its lowest reserve:
//
//   while i < n and j < m and demand[i].price >= supply[j].price:
//     volume = min(demand[i].cum, supply[j].cum)
//     price  = supply[j].price            (marginal accepted seller)
//     advance whichever side has the smaller cumulative quantity
//     (both when equal)
//
// Every accepted step strictly increases volume because quantities are
// positive, so the last accepted step is the maximum tradable volume. The
// marginal supply price never decreases along the walk, and every demand
// step visited so far is priced at or above it, so an allocation at that
// price can always fill `volume` on both sides.
//
// Pure.
// -----------------------------------------------------------------------------
std::optional<ClearingPoint> solveIntersection(const DemandCurve& demand,
                                               const SupplyCurve& supply);

}  // namespace clearing
}  // namespace eclear
