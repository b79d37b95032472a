#pragma once

#include "eclear/clearing/market_summary.hpp"
#include "eclear/concurrent/timeslot_lock_registry.hpp"
#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/clearing_outcome.hpp"
#include "eclear/domain/timeslot_status.hpp"
#include "eclear/events/event.hpp"
#include "eclear/store/i_record_store.hpp"
#include "eclear/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace eclear {
namespace clearing {

// -----------------------------------------------------------------------------
// RunStage
// -----------------------------------------------------------------------------
//
//   Loaded -> Curved -> Solved -> Allocated -> Committed
//
//   any stage before Committed (or the commit itself) -> Failed
//
// Loaded:    timeslot status checked (Sealed only), participants fetched.
// Curved:    both merit-order curves built.
// Solved:    clearing point found.
// Allocated: per-participant fills computed.
// Committed: outcome written through one record store transaction.
// Failed:    nothing written. Terminal; no retry.
// -----------------------------------------------------------------------------
enum class RunStage {
  Loaded,
  Curved,
  Solved,
  Allocated,
  Committed,
  Failed,
};

const char* runStageToString(RunStage stage);

// Status and depth of one timeslot, as reported by inspectTimeslot().
struct TimeslotReport {
  domain::TimeslotId timeslot_id;
  domain::TimeslotStatus status{domain::TimeslotStatus::Open};
  MarketSummary summary;
};

// -----------------------------------------------------------------------------
// ClearingOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Drives one clearing run per call: load -> compute -> guarded
//         commit -> publish.
//
// @details
// The orchestrator itself holds no per-run state. Everything a run needs is
// loaded fresh from the record store, so running the same sealed timeslot
// twice computes the same outcome (and the second commit is rejected by the
// Settled guard).
//
// Error handling:
//   - The pure pipeline returns ClearingError values.
//   - Record store implementations throw; every exception is caught here and
//     turned into ClearingErrorKind::RecordStoreError with the original
//     message. No exception escapes executeClearing().
//   - Any failure happens before IRecordTransaction::commit() or inside it,
//     and an uncommitted transaction is rolled back on destruction, so a
//     failed run never leaves a partial update.
//
// Events (through the sink, after the run reaches a terminal stage):
//   Committed: one BidMatchedEvent per matched bid, one SupplyAllocatedEvent
//              per matched supply, then one ClearingCompletedEvent.
//   Failed:    one ClearingFailedEvent.
//
// Thread model:
//   executeClearing() may be called from any number of threads. Runs for the
//   same timeslot are serialized by TimeslotLockRegistry for the whole run;
//   runs for different timeslots overlap freely. The sink is invoked on the
//   calling thread and must be thread-safe (ClearingEngine passes
//   EventLoopThread::push).
//
// Ownership:
//   Store, lock registry and time provider are borrowed by reference and
//   must outlive the orchestrator.
// -----------------------------------------------------------------------------
class ClearingOrchestrator {
 public:
  using EventSink = std::function<void(Event)>;

  ClearingOrchestrator(store::IRecordStore& store,
                       TimeslotLockRegistry& locks,
                       const ITimeProvider& time_provider,
                       EventSink sink);

  ClearingOrchestrator(const ClearingOrchestrator&) = delete;
  ClearingOrchestrator& operator=(const ClearingOrchestrator&) = delete;

  // -------------------------------------------------------------------------
  // executeClearing(timeslot_id, timeout)
  // -------------------------------------------------------------------------
  //
  // @brief  Clears a Sealed timeslot and commits the outcome.
  //
  // @param  timeout  Budget for the whole run measured from the call,
  //                  including the wait for the timeslot lock. Every record
  //                  store call receives the resulting deadline; a run whose
  //                  deadline passes before commit fails with
  //                  RecordStoreError.
  //
  // @return The committed ClearingOutcome, or ClearingError:
  //           TimeslotNotSealed   status is Open or already Settled
  //           InvalidInput / ArithmeticOverflow / AllocationMismatch
  //           NoMarketClearing    curves never cross; error.outcome holds the
  //                               zero-volume outcome; timeslot stays Sealed
  //           RecordStoreError    load, commit or deadline failure
  // -------------------------------------------------------------------------
  domain::Result<domain::ClearingOutcome> executeClearing(
      const domain::TimeslotId& timeslot_id,
      std::chrono::milliseconds timeout);

  // Loads the timeslot's participants and runs computeClearing() without
  // taking the timeslot lock, committing or publishing. Works in any status.
  domain::Result<domain::ClearingOutcome> previewClearing(
      const domain::TimeslotId& timeslot_id,
      std::chrono::milliseconds timeout);

  // Status plus market depth. Read-only.
  domain::Result<TimeslotReport> inspectTimeslot(
      const domain::TimeslotId& timeslot_id,
      std::chrono::milliseconds timeout);

 private:
  domain::ClearingError fail(const domain::TimeslotId& timeslot_id,
                             RunStage reached, domain::ClearingError error);

  void publishCommitted(const domain::TimeslotId& timeslot_id,
                        const domain::ClearingOutcome& outcome);

  Timestamp now() const;

  store::IRecordStore& store_;
  TimeslotLockRegistry& locks_;
  const ITimeProvider& time_provider_;
  EventSink sink_;
  std::atomic<std::uint64_t> next_sequence_id_{1};
};

}  // namespace clearing
}  // namespace eclear
