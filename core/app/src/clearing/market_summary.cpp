#include "eclear/clearing/market_summary.hpp"

#include "eclear/math/checked_arithmetic.hpp"

namespace eclear {
namespace clearing {

domain::Result<MarketSummary> summarizeMarket(
    const std::vector<domain::Bid>& bids,
    const std::vector<domain::SupplyOffer>& supplies) {
  MarketSummary summary;
  summary.bid_count = bids.size();
  summary.supply_count = supplies.size();

  for (const auto& bid : bids) {
    auto total = math::checked_add(summary.total_demand, bid.quantity);
    if (!total) {
      return domain::makeError(domain::ClearingErrorKind::ArithmeticOverflow,
                               "total demand overflows");
    }
    summary.total_demand = *total;
    if (!summary.highest_bid || bid.price > *summary.highest_bid) {
      summary.highest_bid = bid.price;
    }
  }

  for (const auto& supply : supplies) {
    auto total = math::checked_add(summary.total_supply, supply.quantity);
    if (!total) {
      return domain::makeError(domain::ClearingErrorKind::ArithmeticOverflow,
                               "total supply overflows");
    }
    summary.total_supply = *total;
    if (!summary.lowest_reserve ||
        supply.reserve_price < *summary.lowest_reserve) {
      summary.lowest_reserve = supply.reserve_price;
    }
  }

  return summary;
}

}  // namespace clearing
}  // namespace eclear
