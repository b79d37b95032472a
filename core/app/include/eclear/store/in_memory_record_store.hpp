#pragma once

#include "eclear/store/i_record_store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace eclear {
namespace store {

// -----------------------------------------------------------------------------
// InMemoryRecordStore
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe IRecordStore backed by in-process maps. Used by the
//         engine executable (seeded from a JSON market snapshot) and by
//         tests.
//
// @details
// Records are grouped per timeslot. Cancelled records stay in the store but
// are filtered out of loadBids() / loadSupplies(), mirroring what a
// persistent store returns as "active" records.
//
// Transactions stage their writes locally and apply them under the store
// mutex in commit(), after checking that:
//   - the deadline has not passed,
//   - the timeslot is still Sealed,
//   - every staged bid / supply id belongs to the timeslot.
// Any failed check throws RecordStoreError and applies nothing.
//
// Thread model: every public method locks mutex_. Transactions take the same
// mutex only inside commit().
// -----------------------------------------------------------------------------
class InMemoryRecordStore final : public IRecordStore {
 public:
  // Result of a committed clearing run for one timeslot.
  struct TimeslotSettlement {
    domain::Price clearing_price{0};
    domain::Quantity cleared_quantity{0};
  };

  struct SupplyAllocation {
    domain::Quantity allocated_quantity{0};
    domain::Price allocation_price{0};
  };

  InMemoryRecordStore() = default;

  InMemoryRecordStore(const InMemoryRecordStore&) = delete;
  InMemoryRecordStore& operator=(const InMemoryRecordStore&) = delete;

  // --- Seeding --------------------------------------------------------------
  // Creates the timeslot if needed and sets its status.
  void upsertTimeslot(const domain::TimeslotId& timeslot_id,
                      domain::TimeslotStatus status);

  // @throws RecordStoreError if the timeslot does not exist.
  void addBid(const domain::TimeslotId& timeslot_id, domain::Bid bid,
              bool cancelled = false);
  void addSupply(const domain::TimeslotId& timeslot_id,
                 domain::SupplyOffer supply, bool cancelled = false);

  // --- IRecordStore ---------------------------------------------------------
  std::vector<domain::Bid> loadBids(const domain::TimeslotId& timeslot_id,
                                    Deadline deadline) override;
  std::vector<domain::SupplyOffer> loadSupplies(
      const domain::TimeslotId& timeslot_id, Deadline deadline) override;
  domain::TimeslotStatus getTimeslotStatus(
      const domain::TimeslotId& timeslot_id, Deadline deadline) override;
  std::unique_ptr<IRecordTransaction> beginTransaction(
      const domain::TimeslotId& timeslot_id) override;

  // --- Inspection -----------------------------------------------------------
  std::optional<domain::Quantity> bidAllocation(const domain::BidId& bid_id) const;
  std::optional<SupplyAllocation> supplyAllocation(
      const domain::SupplyId& supply_id) const;
  std::optional<TimeslotSettlement> settlement(
      const domain::TimeslotId& timeslot_id) const;
  std::size_t timeslotCount() const;

 private:
  class Transaction;

  template <typename Record>
  struct Entry {
    Record record;
    bool cancelled{false};
  };

  struct TimeslotRecord {
    domain::TimeslotStatus status{domain::TimeslotStatus::Open};
    std::vector<Entry<domain::Bid>> bids;
    std::vector<Entry<domain::SupplyOffer>> supplies;
    std::optional<TimeslotSettlement> settlement;
  };

  // Called by Transaction::commit().
  void apply(const domain::TimeslotId& timeslot_id,
             const std::vector<std::pair<domain::BidId, domain::Quantity>>& bids,
             const std::vector<std::pair<domain::SupplyId, SupplyAllocation>>&
                 supplies,
             const std::optional<TimeslotSettlement>& settlement,
             Deadline deadline);

  // Requires mutex_ held.
  TimeslotRecord& findTimeslot(const domain::TimeslotId& timeslot_id);
  const TimeslotRecord& findTimeslot(const domain::TimeslotId& timeslot_id) const;

  mutable std::mutex mutex_;
  std::map<domain::TimeslotId, TimeslotRecord> timeslots_;
  std::unordered_map<domain::BidId, domain::Quantity> bid_allocations_;
  std::unordered_map<domain::SupplyId, SupplyAllocation> supply_allocations_;
};

}  // namespace store
}  // namespace eclear
