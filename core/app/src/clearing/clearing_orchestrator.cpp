#include "eclear/clearing/clearing_orchestrator.hpp"

#include "eclear/clearing/clearing_computation.hpp"
#include "eclear/time/time_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace eclear {
namespace clearing {

using domain::ClearingError;
using domain::ClearingErrorKind;
using domain::makeError;

namespace {

using SteadyClock = std::chrono::steady_clock;

bool deadlinePassed(store::Deadline deadline) {
  return SteadyClock::now() >= deadline;
}

// Stage at which a pure-pipeline error stops the run.
RunStage stageReachedBefore(ClearingErrorKind kind) {
  switch (kind) {
    case ClearingErrorKind::NoMarketClearing:
      return RunStage::Curved;
    case ClearingErrorKind::AllocationMismatch:
      return RunStage::Solved;
    default:
      return RunStage::Loaded;
  }
}

}  // namespace

const char* runStageToString(RunStage stage) {
  switch (stage) {
    case RunStage::Loaded:    return "Loaded";
    case RunStage::Curved:    return "Curved";
    case RunStage::Solved:    return "Solved";
    case RunStage::Allocated: return "Allocated";
    case RunStage::Committed: return "Committed";
    case RunStage::Failed:    return "Failed";
  }
  return "Unknown";
}

ClearingOrchestrator::ClearingOrchestrator(store::IRecordStore& store,
                                           TimeslotLockRegistry& locks,
                                           const ITimeProvider& time_provider,
                                           EventSink sink)
    : store_(store),
      locks_(locks),
      time_provider_(time_provider),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// executeClearing
// -----------------------------------------------------------------------------
domain::Result<domain::ClearingOutcome> ClearingOrchestrator::executeClearing(
    const domain::TimeslotId& timeslot_id, std::chrono::milliseconds timeout) {
  const store::Deadline deadline = SteadyClock::now() + timeout;

  // Held until this function returns, commit and event emission included.
  auto guard = locks_.acquire(timeslot_id, deadline);
  if (!guard || deadlinePassed(deadline)) {
    return fail(timeslot_id, RunStage::Loaded,
                makeError(ClearingErrorKind::RecordStoreError,
                          "deadline exceeded waiting for timeslot lock"));
  }

  // Only record store calls sit inside the try blocks: anything else that
  // throws is not a store failure and propagates to the caller.
  std::vector<domain::Bid> bids;
  std::vector<domain::SupplyOffer> supplies;

  // --- Loaded ----------------------------------------------------------------
  domain::TimeslotStatus status = domain::TimeslotStatus::Open;
  try {
    status = store_.getTimeslotStatus(timeslot_id, deadline);
    if (status == domain::TimeslotStatus::Sealed) {
      bids = store_.loadBids(timeslot_id, deadline);
      supplies = store_.loadSupplies(timeslot_id, deadline);
    }
  } catch (const std::exception& e) {
    return fail(timeslot_id, RunStage::Loaded,
                makeError(ClearingErrorKind::RecordStoreError, e.what()));
  }
  if (status != domain::TimeslotStatus::Sealed) {
    return fail(timeslot_id, RunStage::Loaded,
                makeError(ClearingErrorKind::TimeslotNotSealed,
                          "timeslot " + timeslot_id + " is " +
                              domain::timeslotStatusToString(status)));
  }
  std::cout << "[ClearingOrchestrator] " << timeslot_id << " loaded "
            << bids.size() << " bids, " << supplies.size() << " supplies\n";

  // --- Curved / Solved / Allocated ------------------------------------------
  auto computed = computeClearing(bids, supplies);
  if (auto* err = std::get_if<ClearingError>(&computed)) {
    return fail(timeslot_id, stageReachedBefore(err->kind), *err);
  }
  domain::ClearingOutcome outcome =
      std::move(std::get<domain::ClearingOutcome>(computed));

  if (!outcome.market_cleared) {
    auto err = makeError(ClearingErrorKind::NoMarketClearing,
                         "demand and supply curves do not cross");
    err.outcome = outcome;
    return fail(timeslot_id, RunStage::Curved, std::move(err));
  }

  // --- Committed -------------------------------------------------------------
  if (deadlinePassed(deadline)) {
    return fail(timeslot_id, RunStage::Allocated,
                makeError(ClearingErrorKind::RecordStoreError,
                          "deadline exceeded before commit"));
  }

  try {
    auto txn = store_.beginTransaction(timeslot_id);
    for (const auto& bid : outcome.matched_bids) {
      txn->markBidMatched(bid.bid_id, bid.allocated_quantity);
    }
    for (const auto& supply : outcome.matched_supplies) {
      txn->markSupplyAllocated(supply.supply_id, supply.allocated_quantity,
                               outcome.clearing_price);
    }
    txn->setTimeslotClearingPrice(outcome.clearing_price,
                                  outcome.cleared_quantity);
    txn->commit(deadline);
  } catch (const std::exception& e) {
    return fail(timeslot_id, RunStage::Allocated,
                makeError(ClearingErrorKind::RecordStoreError, e.what()));
  }

  std::cout << "[ClearingOrchestrator] " << timeslot_id
            << " committed: price=" << outcome.clearing_price
            << " quantity=" << outcome.cleared_quantity
            << " bids=" << outcome.matched_bids.size()
            << " supplies=" << outcome.matched_supplies.size()
            << " unmet_demand=" << outcome.unmet_demand
            << " unmet_supply=" << outcome.unmet_supply << "\n";

  publishCommitted(timeslot_id, outcome);
  return outcome;
}

// -----------------------------------------------------------------------------
// previewClearing
// -----------------------------------------------------------------------------
domain::Result<domain::ClearingOutcome> ClearingOrchestrator::previewClearing(
    const domain::TimeslotId& timeslot_id, std::chrono::milliseconds timeout) {
  const store::Deadline deadline = SteadyClock::now() + timeout;
  std::vector<domain::Bid> bids;
  std::vector<domain::SupplyOffer> supplies;
  try {
    bids = store_.loadBids(timeslot_id, deadline);
    supplies = store_.loadSupplies(timeslot_id, deadline);
  } catch (const std::exception& e) {
    return makeError(ClearingErrorKind::RecordStoreError, e.what());
  }
  return computeClearing(bids, supplies);
}

// -----------------------------------------------------------------------------
// inspectTimeslot
// -----------------------------------------------------------------------------
domain::Result<TimeslotReport> ClearingOrchestrator::inspectTimeslot(
    const domain::TimeslotId& timeslot_id, std::chrono::milliseconds timeout) {
  const store::Deadline deadline = SteadyClock::now() + timeout;
  TimeslotReport report;
  report.timeslot_id = timeslot_id;
  try {
    report.status = store_.getTimeslotStatus(timeslot_id, deadline);
    const auto bids = store_.loadBids(timeslot_id, deadline);
    const auto supplies = store_.loadSupplies(timeslot_id, deadline);
    auto summary = summarizeMarket(bids, supplies);
    if (auto* err = std::get_if<ClearingError>(&summary)) {
      return *err;
    }
    report.summary = std::get<MarketSummary>(summary);
  } catch (const std::exception& e) {
    return makeError(ClearingErrorKind::RecordStoreError, e.what());
  }
  return report;
}

// -----------------------------------------------------------------------------
// fail(): terminal Failed transition
// -----------------------------------------------------------------------------
ClearingError ClearingOrchestrator::fail(const domain::TimeslotId& timeslot_id,
                                         RunStage reached,
                                         ClearingError error) {
  std::cerr << "[ClearingOrchestrator] " << timeslot_id << " failed after "
            << runStageToString(reached) << ": "
            << domain::clearingErrorKindToString(error.kind) << " - "
            << error.message << "\n";

  if (sink_) {
    ClearingFailedEvent event;
    event.timeslot_id = timeslot_id;
    event.kind = error.kind;
    event.message = error.message;
    event.timestamp = now();
    event.sequence_id = next_sequence_id_++;
    sink_(std::move(event));
  }
  return error;
}

void ClearingOrchestrator::publishCommitted(
    const domain::TimeslotId& timeslot_id,
    const domain::ClearingOutcome& outcome) {
  if (!sink_) {
    return;
  }
  const Timestamp ts = now();

  for (const auto& bid : outcome.matched_bids) {
    BidMatchedEvent event;
    event.timeslot_id = timeslot_id;
    event.bid_id = bid.bid_id;
    event.bidder_id = bid.bidder_id;
    event.allocated_quantity = bid.allocated_quantity;
    event.clearing_price = outcome.clearing_price;
    event.timestamp = ts;
    event.sequence_id = next_sequence_id_++;
    sink_(std::move(event));
  }

  for (const auto& supply : outcome.matched_supplies) {
    SupplyAllocatedEvent event;
    event.timeslot_id = timeslot_id;
    event.supply_id = supply.supply_id;
    event.supplier_id = supply.supplier_id;
    event.allocated_quantity = supply.allocated_quantity;
    event.clearing_price = outcome.clearing_price;
    event.timestamp = ts;
    event.sequence_id = next_sequence_id_++;
    sink_(std::move(event));
  }

  ClearingCompletedEvent completed;
  completed.timeslot_id = timeslot_id;
  completed.clearing_price = outcome.clearing_price;
  completed.cleared_quantity = outcome.cleared_quantity;
  completed.matched_bid_count = outcome.matched_bids.size();
  completed.matched_supply_count = outcome.matched_supplies.size();
  completed.unmet_demand = outcome.unmet_demand;
  completed.unmet_supply = outcome.unmet_supply;
  completed.timestamp = ts;
  completed.sequence_id = next_sequence_id_++;
  sink_(std::move(completed));
}

Timestamp ClearingOrchestrator::now() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

}  // namespace clearing
}  // namespace eclear
