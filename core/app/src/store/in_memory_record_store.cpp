#include "eclear/store/in_memory_record_store.hpp"

#include <algorithm>

namespace eclear {
namespace store {

namespace {

void checkDeadline(Deadline deadline, const char* operation) {
  if (std::chrono::steady_clock::now() >= deadline) {
    throw RecordStoreError(std::string("deadline exceeded during ") +
                           operation);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
// Stages writes in plain vectors. Only commit() touches the store. If the
// object dies uncommitted the staged vectors are simply dropped.
// -----------------------------------------------------------------------------
class InMemoryRecordStore::Transaction final : public IRecordTransaction {
 public:
  Transaction(InMemoryRecordStore& store, domain::TimeslotId timeslot_id)
      : store_(store), timeslot_id_(std::move(timeslot_id)) {}

  void markBidMatched(const domain::BidId& bid_id,
                      domain::Quantity allocated_quantity) override {
    bids_.emplace_back(bid_id, allocated_quantity);
  }

  void markSupplyAllocated(const domain::SupplyId& supply_id,
                           domain::Quantity allocated_quantity,
                           domain::Price allocation_price) override {
    supplies_.emplace_back(
        supply_id, SupplyAllocation{allocated_quantity, allocation_price});
  }

  void setTimeslotClearingPrice(domain::Price price,
                                domain::Quantity quantity) override {
    settlement_ = TimeslotSettlement{price, quantity};
  }

  void commit(Deadline deadline) override {
    if (committed_) {
      throw RecordStoreError("transaction for timeslot " + timeslot_id_ +
                             " already committed");
    }
    store_.apply(timeslot_id_, bids_, supplies_, settlement_, deadline);
    committed_ = true;
  }

 private:
  InMemoryRecordStore& store_;
  domain::TimeslotId timeslot_id_;
  std::vector<std::pair<domain::BidId, domain::Quantity>> bids_;
  std::vector<std::pair<domain::SupplyId, SupplyAllocation>> supplies_;
  std::optional<TimeslotSettlement> settlement_;
  bool committed_{false};
};

// -----------------------------------------------------------------------------
// Seeding
// -----------------------------------------------------------------------------
void InMemoryRecordStore::upsertTimeslot(const domain::TimeslotId& timeslot_id,
                                         domain::TimeslotStatus status) {
  std::lock_guard lock(mutex_);
  timeslots_[timeslot_id].status = status;
}

void InMemoryRecordStore::addBid(const domain::TimeslotId& timeslot_id,
                                 domain::Bid bid, bool cancelled) {
  std::lock_guard lock(mutex_);
  findTimeslot(timeslot_id).bids.push_back({std::move(bid), cancelled});
}

void InMemoryRecordStore::addSupply(const domain::TimeslotId& timeslot_id,
                                    domain::SupplyOffer supply,
                                    bool cancelled) {
  std::lock_guard lock(mutex_);
  findTimeslot(timeslot_id).supplies.push_back({std::move(supply), cancelled});
}

// -----------------------------------------------------------------------------
// IRecordStore
// -----------------------------------------------------------------------------
std::vector<domain::Bid> InMemoryRecordStore::loadBids(
    const domain::TimeslotId& timeslot_id, Deadline deadline) {
  checkDeadline(deadline, "loadBids");
  std::lock_guard lock(mutex_);
  std::vector<domain::Bid> result;
  for (const auto& entry : findTimeslot(timeslot_id).bids) {
    if (!entry.cancelled) {
      result.push_back(entry.record);
    }
  }
  return result;
}

std::vector<domain::SupplyOffer> InMemoryRecordStore::loadSupplies(
    const domain::TimeslotId& timeslot_id, Deadline deadline) {
  checkDeadline(deadline, "loadSupplies");
  std::lock_guard lock(mutex_);
  std::vector<domain::SupplyOffer> result;
  for (const auto& entry : findTimeslot(timeslot_id).supplies) {
    if (!entry.cancelled) {
      result.push_back(entry.record);
    }
  }
  return result;
}

domain::TimeslotStatus InMemoryRecordStore::getTimeslotStatus(
    const domain::TimeslotId& timeslot_id, Deadline deadline) {
  checkDeadline(deadline, "getTimeslotStatus");
  std::lock_guard lock(mutex_);
  return findTimeslot(timeslot_id).status;
}

std::unique_ptr<IRecordTransaction> InMemoryRecordStore::beginTransaction(
    const domain::TimeslotId& timeslot_id) {
  return std::make_unique<Transaction>(*this, timeslot_id);
}

// -----------------------------------------------------------------------------
// apply(): the commit point
// -----------------------------------------------------------------------------
// Every check runs before the first write, so a throw leaves the store
// exactly as it was.
// -----------------------------------------------------------------------------
void InMemoryRecordStore::apply(
    const domain::TimeslotId& timeslot_id,
    const std::vector<std::pair<domain::BidId, domain::Quantity>>& bids,
    const std::vector<std::pair<domain::SupplyId, SupplyAllocation>>& supplies,
    const std::optional<TimeslotSettlement>& settlement, Deadline deadline) {
  checkDeadline(deadline, "commit");
  std::lock_guard lock(mutex_);

  TimeslotRecord& slot = findTimeslot(timeslot_id);
  if (slot.status != domain::TimeslotStatus::Sealed) {
    throw RecordStoreError("timeslot " + timeslot_id + " is " +
                           domain::timeslotStatusToString(slot.status) +
                           ", expected SEALED at commit");
  }

  for (const auto& [bid_id, qty] : bids) {
    auto it = std::find_if(slot.bids.begin(), slot.bids.end(),
                           [&](const Entry<domain::Bid>& e) {
                             return e.record.id == bid_id && !e.cancelled;
                           });
    if (it == slot.bids.end()) {
      throw RecordStoreError("bid " + bid_id + " is not active in timeslot " +
                             timeslot_id);
    }
  }
  for (const auto& [supply_id, allocation] : supplies) {
    auto it = std::find_if(slot.supplies.begin(), slot.supplies.end(),
                           [&](const Entry<domain::SupplyOffer>& e) {
                             return e.record.id == supply_id && !e.cancelled;
                           });
    if (it == slot.supplies.end()) {
      throw RecordStoreError("supply " + supply_id +
                             " is not active in timeslot " + timeslot_id);
    }
  }

  for (const auto& [bid_id, qty] : bids) {
    bid_allocations_[bid_id] = qty;
  }
  for (const auto& [supply_id, allocation] : supplies) {
    supply_allocations_[supply_id] = allocation;
  }
  slot.settlement = settlement;
  slot.status = domain::TimeslotStatus::Settled;
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::optional<domain::Quantity> InMemoryRecordStore::bidAllocation(
    const domain::BidId& bid_id) const {
  std::lock_guard lock(mutex_);
  auto it = bid_allocations_.find(bid_id);
  if (it == bid_allocations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<InMemoryRecordStore::SupplyAllocation>
InMemoryRecordStore::supplyAllocation(const domain::SupplyId& supply_id) const {
  std::lock_guard lock(mutex_);
  auto it = supply_allocations_.find(supply_id);
  if (it == supply_allocations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<InMemoryRecordStore::TimeslotSettlement>
InMemoryRecordStore::settlement(const domain::TimeslotId& timeslot_id) const {
  std::lock_guard lock(mutex_);
  auto it = timeslots_.find(timeslot_id);
  if (it == timeslots_.end()) {
    return std::nullopt;
  }
  return it->second.settlement;
}

std::size_t InMemoryRecordStore::timeslotCount() const {
  std::lock_guard lock(mutex_);
  return timeslots_.size();
}

InMemoryRecordStore::TimeslotRecord& InMemoryRecordStore::findTimeslot(
    const domain::TimeslotId& timeslot_id) {
  auto it = timeslots_.find(timeslot_id);
  if (it == timeslots_.end()) {
    throw RecordStoreError("unknown timeslot " + timeslot_id);
  }
  return it->second;
}

const InMemoryRecordStore::TimeslotRecord& InMemoryRecordStore::findTimeslot(
    const domain::TimeslotId& timeslot_id) const {
  auto it = timeslots_.find(timeslot_id);
  if (it == timeslots_.end()) {
    throw RecordStoreError("unknown timeslot " + timeslot_id);
  }
  return it->second;
}

}  // namespace store
}  // namespace eclear
