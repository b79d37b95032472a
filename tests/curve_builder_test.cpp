// =============================================================================
// curve_builder_test.cpp
// =============================================================================
// Unit tests for eclear::clearing::buildDemandCurve / buildSupplyCurve.
//
// Validates:
//   - Merit order: demand price descending, supply reserve ascending
//   - Tie-break on equal price: earliest submitted_at, then id
//   - Cumulative quantities and totals
//   - InvalidInput for negative price / non-positive quantity, never dropped
//   - InvalidInput for a repeated id on either side
//   - ArithmeticOverflow when the cumulative sum leaves int64
// =============================================================================

#include "eclear/clearing/curve_builder.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using eclear::clearing::buildDemandCurve;
using eclear::clearing::buildSupplyCurve;
using eclear::clearing::DemandCurve;
using eclear::clearing::SupplyCurve;
using eclear::domain::Bid;
using eclear::domain::ClearingError;
using eclear::domain::ClearingErrorKind;
using eclear::domain::SupplyOffer;

namespace {

Bid bid(const std::string& id, std::int64_t price, std::int64_t qty,
        std::int64_t at = 0) {
  return Bid{id, "buyer-" + id, price, qty, at};
}

SupplyOffer supply(const std::string& id, std::int64_t reserve,
                   std::int64_t qty, std::int64_t at = 0) {
  return SupplyOffer{id, "seller-" + id, reserve, qty, at};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Demand curve: highest price first, cumulative quantities accumulate.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, DemandSortedByPriceDescending) {
  auto result = buildDemandCurve({bid("a", 8, 5), bid("b", 10, 5),
                                  bid("c", 9, 2)});
  const auto* curve = std::get_if<DemandCurve>(&result);
  ASSERT_NE(curve, nullptr);

  ASSERT_EQ(curve->points.size(), 3u);
  EXPECT_EQ(curve->bids[0].id, "b");
  EXPECT_EQ(curve->bids[1].id, "c");
  EXPECT_EQ(curve->bids[2].id, "a");
  EXPECT_EQ(curve->points[0].price, 10);
  EXPECT_EQ(curve->points[0].cumulative_quantity, 5);
  EXPECT_EQ(curve->points[1].cumulative_quantity, 7);
  EXPECT_EQ(curve->points[2].cumulative_quantity, 12);
  EXPECT_EQ(curve->total_quantity, 12);
}

// -----------------------------------------------------------------------------
// 2. Supply curve: lowest reserve first.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, SupplySortedByReserveAscending) {
  auto result = buildSupplyCurve({supply("x", 9, 6), supply("y", 6, 4)});
  const auto* curve = std::get_if<SupplyCurve>(&result);
  ASSERT_NE(curve, nullptr);

  EXPECT_EQ(curve->supplies[0].id, "y");
  EXPECT_EQ(curve->supplies[1].id, "x");
  EXPECT_EQ(curve->points[0].cumulative_quantity, 4);
  EXPECT_EQ(curve->points[1].cumulative_quantity, 10);
  EXPECT_EQ(curve->total_quantity, 10);
}

// -----------------------------------------------------------------------------
// 3. Equal prices: earlier submission wins, then the smaller id.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, TieBreakBySubmissionTimeThenId) {
  auto result = buildDemandCurve({bid("z", 10, 1, 200), bid("m", 10, 1, 100),
                                  bid("a", 10, 1, 200)});
  const auto& curve = std::get<DemandCurve>(result);
  EXPECT_EQ(curve.bids[0].id, "m");
  EXPECT_EQ(curve.bids[1].id, "a");
  EXPECT_EQ(curve.bids[2].id, "z");

  auto sresult = buildSupplyCurve({supply("q", 5, 1, 50), supply("p", 5, 1, 50),
                                   supply("r", 5, 1, 10)});
  const auto& scurve = std::get<SupplyCurve>(sresult);
  EXPECT_EQ(scurve.supplies[0].id, "r");
  EXPECT_EQ(scurve.supplies[1].id, "p");
  EXPECT_EQ(scurve.supplies[2].id, "q");
}

// -----------------------------------------------------------------------------
// 4. The curve does not depend on input order.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, InputOrderIrrelevant) {
  std::vector<Bid> forward{bid("a", 3, 1, 1), bid("b", 7, 2, 2),
                           bid("c", 7, 3, 1), bid("d", 1, 4, 0)};
  std::vector<Bid> reversed(forward.rbegin(), forward.rend());

  const auto a = std::get<DemandCurve>(buildDemandCurve(forward));
  const auto b = std::get<DemandCurve>(buildDemandCurve(reversed));
  ASSERT_EQ(a.bids.size(), b.bids.size());
  for (std::size_t i = 0; i < a.bids.size(); ++i) {
    EXPECT_EQ(a.bids[i].id, b.bids[i].id);
    EXPECT_EQ(a.points[i].cumulative_quantity, b.points[i].cumulative_quantity);
  }
}

// -----------------------------------------------------------------------------
// 5. Empty input builds an empty curve.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, EmptyInputYieldsEmptyCurve) {
  const auto curve = std::get<DemandCurve>(buildDemandCurve({}));
  EXPECT_TRUE(curve.points.empty());
  EXPECT_EQ(curve.total_quantity, 0);
}

// -----------------------------------------------------------------------------
// 6. Malformed records reject the whole build with InvalidInput.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, RejectsInvalidRecords) {
  auto negative_price = buildDemandCurve({bid("ok", 5, 1), bid("bad", -1, 1)});
  const auto* e1 = std::get_if<ClearingError>(&negative_price);
  ASSERT_NE(e1, nullptr);
  EXPECT_EQ(e1->kind, ClearingErrorKind::InvalidInput);
  EXPECT_NE(e1->message.find("bad"), std::string::npos);

  auto zero_qty = buildDemandCurve({bid("zero", 5, 0)});
  ASSERT_NE(std::get_if<ClearingError>(&zero_qty), nullptr);
  EXPECT_EQ(std::get<ClearingError>(zero_qty).kind,
            ClearingErrorKind::InvalidInput);

  auto negative_supply = buildSupplyCurve({supply("neg", 5, -3)});
  ASSERT_NE(std::get_if<ClearingError>(&negative_supply), nullptr);

  auto negative_reserve = buildSupplyCurve({supply("neg", -5, 3)});
  ASSERT_NE(std::get_if<ClearingError>(&negative_reserve), nullptr);
  EXPECT_EQ(std::get<ClearingError>(negative_reserve).kind,
            ClearingErrorKind::InvalidInput);
}

// -----------------------------------------------------------------------------
// 7. Zero price is valid (free energy is still a price).
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, ZeroPriceAccepted) {
  auto result = buildSupplyCurve({supply("free", 0, 5)});
  EXPECT_NE(std::get_if<SupplyCurve>(&result), nullptr);
}

// -----------------------------------------------------------------------------
// 8. Cumulative overflow is reported, not wrapped.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, CumulativeOverflowReported) {
  const auto big = std::numeric_limits<std::int64_t>::max() / 2 + 1;
  auto result = buildDemandCurve({bid("a", 5, big), bid("b", 4, big)});
  const auto* err = std::get_if<ClearingError>(&result);
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->kind, ClearingErrorKind::ArithmeticOverflow);
}

// -----------------------------------------------------------------------------
// 9. A repeated id is rejected whatever order the records arrive in.
// -----------------------------------------------------------------------------
TEST(CurveBuilderTest, DuplicateIdsRejected) {
  const Bid first{"dup", "alice", 10, 3, 0};
  const Bid second{"dup", "bob", 10, 4, 0};

  for (const auto& bids : {std::vector<Bid>{first, second},
                           std::vector<Bid>{second, first}}) {
    auto result = buildDemandCurve(bids);
    const auto* err = std::get_if<ClearingError>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, ClearingErrorKind::InvalidInput);
    EXPECT_NE(err->message.find("dup"), std::string::npos);
  }

  auto supplies = buildSupplyCurve(
      {supply("s1", 1, 5), supply("s2", 2, 5), supply("s1", 3, 1)});
  const auto* err = std::get_if<ClearingError>(&supplies);
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->kind, ClearingErrorKind::InvalidInput);
  EXPECT_NE(err->message.find("s1"), std::string::npos);

  // The same id on opposite sides is two different records.
  auto demand = buildDemandCurve({bid("x", 5, 1)});
  auto offer = buildSupplyCurve({supply("x", 4, 1)});
  EXPECT_NE(std::get_if<DemandCurve>(&demand), nullptr);
  EXPECT_NE(std::get_if<SupplyCurve>(&offer), nullptr);
}
