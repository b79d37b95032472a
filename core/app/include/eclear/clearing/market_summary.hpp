#pragma once

#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/participant.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// MarketSummary
// -----------------------------------------------------------------------------
// Depth snapshot of one timeslot's order book, reported by the STATUS command
// and logged before each clearing run. highest_bid / lowest_reserve are empty
// when the respective side has no participants.
// -----------------------------------------------------------------------------
struct MarketSummary {
  std::size_t bid_count{0};
  std::size_t supply_count{0};
  domain::Quantity total_demand{0};
  domain::Quantity total_supply{0};
  std::optional<domain::Price> highest_bid;
  std::optional<domain::Price> lowest_reserve;
};

// Returns ArithmeticOverflow if a total leaves the int64 range. Records are
// summarized as given; validation is CurveBuilder's job.
domain::Result<MarketSummary> summarizeMarket(
    const std::vector<domain::Bid>& bids,
    const std::vector<domain::SupplyOffer>& supplies);

}  // namespace clearing
}  // namespace eclear
