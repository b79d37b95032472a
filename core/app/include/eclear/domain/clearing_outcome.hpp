#pragma once

#include "eclear/domain/types.hpp"

#include <vector>

namespace eclear {
namespace domain {

// -----------------------------------------------------------------------------
// MatchedBid / MatchedSupply
// -----------------------------------------------------------------------------
// One entry per participant that received a non-zero allocation. `price` and
// `reserve_price` echo the participant's own limit, not the clearing price;
// every matched participant settles at ClearingOutcome::clearing_price.
// -----------------------------------------------------------------------------
struct MatchedBid {
  BidId bid_id;
  ParticipantId bidder_id;
  Quantity allocated_quantity{0};
  Price price{0};
};

struct MatchedSupply {
  SupplyId supply_id;
  ParticipantId supplier_id;
  Quantity allocated_quantity{0};
  Price reserve_price{0};
};

// -----------------------------------------------------------------------------
// ClearingOutcome
// -----------------------------------------------------------------------------
//
// @brief  Result of one clearing run for one timeslot.
//
// @details
// Produced fresh by computeClearing() and never mutated afterwards; a rerun
// produces a new outcome. When market_cleared is false the curves never
// crossed: clearing_price and cleared_quantity are 0, both matched lists are
// empty, and unmet_demand / unmet_supply hold the full submitted totals.
//
// Invariants when cleared_quantity > 0:
//   cleared_quantity == sum(matched_bids.allocated_quantity)
//                    == sum(matched_supplies.allocated_quantity)
//   matched bid price >= clearing_price >= matched supply reserve_price
//   unmet_demand == total demand - cleared_quantity (same for supply)
//
// Matched lists are in merit order (the order the allocator walked them).
// -----------------------------------------------------------------------------
struct ClearingOutcome {
  Price clearing_price{0};
  Quantity cleared_quantity{0};
  std::vector<MatchedBid> matched_bids;
  std::vector<MatchedSupply> matched_supplies;
  Quantity unmet_demand{0};
  Quantity unmet_supply{0};
  bool market_cleared{false};
};

inline bool operator==(const MatchedBid& a, const MatchedBid& b) {
  return a.bid_id == b.bid_id && a.bidder_id == b.bidder_id &&
         a.allocated_quantity == b.allocated_quantity && a.price == b.price;
}

inline bool operator==(const MatchedSupply& a, const MatchedSupply& b) {
  return a.supply_id == b.supply_id && a.supplier_id == b.supplier_id &&
         a.allocated_quantity == b.allocated_quantity &&
         a.reserve_price == b.reserve_price;
}

inline bool operator==(const ClearingOutcome& a, const ClearingOutcome& b) {
  return a.clearing_price == b.clearing_price &&
         a.cleared_quantity == b.cleared_quantity &&
         a.matched_bids == b.matched_bids &&
         a.matched_supplies == b.matched_supplies &&
         a.unmet_demand == b.unmet_demand &&
         a.unmet_supply == b.unmet_supply &&
         a.market_cleared == b.market_cleared;
}

}  // namespace domain
}  // namespace eclear
