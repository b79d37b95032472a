// =============================================================================
// allocator_test.cpp
// =============================================================================
// Unit tests for eclear::clearing::allocate.
//
// Validates:
//   - Merit-order fills; only the marginal participant is partial
//   - Participants priced out of the clearing point receive nothing
//   - unmet_* equals the sum of (original - allocated) on each side
//   - A clearing point the curves cannot support yields AllocationMismatch
// =============================================================================

#include "eclear/clearing/allocator.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace eclear::clearing;
using eclear::domain::Bid;
using eclear::domain::ClearingError;
using eclear::domain::ClearingErrorKind;
using eclear::domain::SupplyOffer;

class AllocatorTest : public ::testing::Test {
 protected:
  DemandCurve demand;
  SupplyCurve supply;

  void SetUp() override {
    demand = std::get<DemandCurve>(buildDemandCurve({
        Bid{"b-high", "alice", 12, 3, 10},
        Bid{"b-mid", "bob", 10, 4, 20},
        Bid{"b-low", "carol", 5, 6, 30},
    }));
    supply = std::get<SupplyCurve>(buildSupplyCurve({
        SupplyOffer{"s-cheap", "farm", 2, 5, 10},
        SupplyOffer{"s-mid", "plant", 8, 5, 20},
        SupplyOffer{"s-dear", "peaker", 15, 5, 30},
    }));
  }
};

TEST_F(AllocatorTest, FillsInMeritOrder) {
  auto result = allocate(demand, supply, ClearingPoint{8, 6});
  const auto* alloc = std::get_if<Allocation>(&result);
  ASSERT_NE(alloc, nullptr);

  ASSERT_EQ(alloc->matched_bids.size(), 2u);
  EXPECT_EQ(alloc->matched_bids[0].bid_id, "b-high");
  EXPECT_EQ(alloc->matched_bids[0].allocated_quantity, 3);
  EXPECT_EQ(alloc->matched_bids[1].bid_id, "b-mid");
  EXPECT_EQ(alloc->matched_bids[1].allocated_quantity, 3);

  ASSERT_EQ(alloc->matched_supplies.size(), 2u);
  EXPECT_EQ(alloc->matched_supplies[0].supply_id, "s-cheap");
  EXPECT_EQ(alloc->matched_supplies[0].allocated_quantity, 5);
  EXPECT_EQ(alloc->matched_supplies[1].supply_id, "s-mid");
  EXPECT_EQ(alloc->matched_supplies[1].allocated_quantity, 1);
}

TEST_F(AllocatorTest, UnmetIsOriginalMinusAllocated) {
  auto result = allocate(demand, supply, ClearingPoint{8, 6});
  const auto& alloc = std::get<Allocation>(result);
  // Demand 13 total, 6 filled. Supply 15 total, 6 filled.
  EXPECT_EQ(alloc.unmet_demand, 7);
  EXPECT_EQ(alloc.unmet_supply, 9);
}

TEST_F(AllocatorTest, PricedOutParticipantsGetNothing) {
  auto result = allocate(demand, supply, ClearingPoint{8, 6});
  const auto& alloc = std::get<Allocation>(result);
  for (const auto& m : alloc.matched_bids) {
    EXPECT_NE(m.bid_id, "b-low");
  }
  for (const auto& m : alloc.matched_supplies) {
    EXPECT_NE(m.supply_id, "s-dear");
  }
}

TEST_F(AllocatorTest, UnsupportedQuantityIsMismatch) {
  // At price 8 only 7 units of demand are eligible.
  auto result = allocate(demand, supply, ClearingPoint{8, 9});
  const auto* err = std::get_if<ClearingError>(&result);
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->kind, ClearingErrorKind::AllocationMismatch);
}
