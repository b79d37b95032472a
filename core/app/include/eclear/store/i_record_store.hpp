#pragma once

#include "eclear/domain/participant.hpp"
#include "eclear/domain/timeslot_status.hpp"
#include "eclear/domain/types.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace eclear {
namespace store {

// Absolute point in time after which a record store call must give up.
using Deadline = std::chrono::steady_clock::time_point;

// -----------------------------------------------------------------------------
// RecordStoreError
// -----------------------------------------------------------------------------
// Thrown by record store implementations for any load or commit failure,
// including a missed deadline. The message is surfaced unchanged to the
// caller of executeClearing().
// -----------------------------------------------------------------------------
class RecordStoreError : public std::runtime_error {
 public:
  explicit RecordStoreError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// IRecordTransaction: staged write set for one clearing run
// -----------------------------------------------------------------------------
//
// @brief  Collects the writes of a successful run and applies them all at
//         once on commit().
//
// @details
// The mark/set calls only stage; nothing is visible in the store until
// commit() returns. Destroying a transaction that was never committed
// discards every staged write (RAII rollback), so an exception or an early
// return anywhere in the orchestrator cannot leave a partial update.
//
// commit() also moves the timeslot from Sealed to Settled. If the timeslot is
// no longer Sealed at that point, commit() throws and applies nothing.
//
// Thread model: A transaction is used by exactly one thread (the one running
// the clearing) and must not outlive the store that created it.
// -----------------------------------------------------------------------------
class IRecordTransaction {
 public:
  virtual ~IRecordTransaction() = default;

  virtual void markBidMatched(const domain::BidId& bid_id,
                              domain::Quantity allocated_quantity) = 0;

  virtual void markSupplyAllocated(const domain::SupplyId& supply_id,
                                   domain::Quantity allocated_quantity,
                                   domain::Price allocation_price) = 0;

  virtual void setTimeslotClearingPrice(domain::Price price,
                                        domain::Quantity quantity) = 0;

  // @throws RecordStoreError on any failure; nothing is applied in that case.
  virtual void commit(Deadline deadline) = 0;
};

// -----------------------------------------------------------------------------
// IRecordStore: external persistence of bids, supplies and timeslots
// -----------------------------------------------------------------------------
//
// @brief  The only path by which the clearing engine reads participant
//         records and writes settlement results.
//
// @details
// The engine never owns the records: it reads a snapshot of the active
// (non-cancelled) bids and supplies of one timeslot, computes, and writes the
// outcome back through a transaction. Every call honours the caller's
// deadline and throws RecordStoreError once it has passed.
//
// Ownership:
//   ClearingEngine / ClearingOrchestrator hold a non-owning reference. The
//   caller (main() or a test fixture) owns the store and keeps it alive for
//   the engine's lifetime.
//
// Thread model:
//   Implementations must be safe to call from several threads at once;
//   clearing runs for different timeslots may overlap.
// -----------------------------------------------------------------------------
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  // Active bids of the timeslot, in no particular order.
  virtual std::vector<domain::Bid> loadBids(const domain::TimeslotId& timeslot_id,
                                            Deadline deadline) = 0;

  virtual std::vector<domain::SupplyOffer> loadSupplies(
      const domain::TimeslotId& timeslot_id, Deadline deadline) = 0;

  // @throws RecordStoreError if the timeslot is unknown.
  virtual domain::TimeslotStatus getTimeslotStatus(
      const domain::TimeslotId& timeslot_id, Deadline deadline) = 0;

  virtual std::unique_ptr<IRecordTransaction> beginTransaction(
      const domain::TimeslotId& timeslot_id) = 0;
};

}  // namespace store
}  // namespace eclear
