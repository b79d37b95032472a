#include "eclear/clearing/clearing_computation.hpp"

#include "eclear/clearing/allocator.hpp"
#include "eclear/clearing/curve_builder.hpp"
#include "eclear/clearing/intersection_solver.hpp"

namespace eclear {
namespace clearing {

domain::Result<domain::ClearingOutcome> computeClearing(
    const std::vector<domain::Bid>& bids,
    const std::vector<domain::SupplyOffer>& supplies) {
  auto demand_result = buildDemandCurve(bids);
  if (auto* err = std::get_if<domain::ClearingError>(&demand_result)) {
    return *err;
  }
  auto supply_result = buildSupplyCurve(supplies);
  if (auto* err = std::get_if<domain::ClearingError>(&supply_result)) {
    return *err;
  }
  const auto& demand = std::get<DemandCurve>(demand_result);
  const auto& supply = std::get<SupplyCurve>(supply_result);

  domain::ClearingOutcome outcome;

  auto point = solveIntersection(demand, supply);
  if (!point) {
    outcome.unmet_demand = demand.total_quantity;
    outcome.unmet_supply = supply.total_quantity;
    return outcome;
  }

  auto allocation_result = allocate(demand, supply, *point);
  if (auto* err = std::get_if<domain::ClearingError>(&allocation_result)) {
    return *err;
  }
  auto& allocation = std::get<Allocation>(allocation_result);

  outcome.clearing_price = point->price;
  outcome.cleared_quantity = point->quantity;
  outcome.matched_bids = std::move(allocation.matched_bids);
  outcome.matched_supplies = std::move(allocation.matched_supplies);
  outcome.unmet_demand = allocation.unmet_demand;
  outcome.unmet_supply = allocation.unmet_supply;
  outcome.market_cleared = true;
  return outcome;
}

}  // namespace clearing
}  // namespace eclear
