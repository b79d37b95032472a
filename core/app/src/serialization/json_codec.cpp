#include "eclear/serialization/json_codec.hpp"

#include "eclear/time/time_utils.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>

namespace eclear {
namespace serialization {

using nlohmann::json;

namespace {

// Wraps field access so a missing key or a wrong type names the field.
template <typename T>
T field(const json& j, const char* key, const char* what) {
  if (!j.is_object() || !j.contains(key)) {
    throw CodecError(std::string(what) + ": missing field '" + key + "'");
  }
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw CodecError(std::string(what) + ": field '" + key + "' " + e.what());
  }
}

// Integers only: a price of 10.5 must not be truncated to 10.
std::int64_t integerField(const json& j, const char* key, const char* what) {
  if (!j.is_object() || !j.contains(key)) {
    throw CodecError(std::string(what) + ": missing field '" + key + "'");
  }
  const auto& v = j.at(key);
  if (!v.is_number_integer()) {
    throw CodecError(std::string(what) + ": field '" + key +
                     "' must be an integer");
  }
  if (v.is_number_unsigned() &&
      v.get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw CodecError(std::string(what) + ": field '" + key +
                     "' is out of range");
  }
  return v.get<std::int64_t>();
}

bool cancelledFlag(const json& j) {
  if (!j.contains("cancelled")) {
    return false;
  }
  if (!j.at("cancelled").is_boolean()) {
    throw CodecError("field 'cancelled' must be a boolean");
  }
  return j.at("cancelled").get<bool>();
}

const json& arrayField(const json& j, const char* key, const char* what) {
  static const json kEmpty = json::array();
  if (!j.contains(key)) {
    return kEmpty;
  }
  const auto& v = j.at(key);
  if (!v.is_array()) {
    throw CodecError(std::string(what) + ": field '" + key +
                     "' must be an array");
  }
  return v;
}

json optionalPrice(const std::optional<domain::Price>& p) {
  if (!p) {
    return nullptr;
  }
  return *p;
}

}  // namespace

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------
json toJson(const domain::ClearingOutcome& outcome) {
  json j;
  j["market_cleared"] = outcome.market_cleared;
  j["clearing_price"] = outcome.clearing_price;
  j["cleared_quantity"] = outcome.cleared_quantity;
  j["unmet_demand"] = outcome.unmet_demand;
  j["unmet_supply"] = outcome.unmet_supply;

  json bids = json::array();
  for (const auto& b : outcome.matched_bids) {
    bids.push_back({{"bid_id", b.bid_id},
                    {"bidder_id", b.bidder_id},
                    {"allocated_quantity", b.allocated_quantity},
                    {"price", b.price}});
  }
  j["matched_bids"] = std::move(bids);

  json supplies = json::array();
  for (const auto& s : outcome.matched_supplies) {
    supplies.push_back({{"supply_id", s.supply_id},
                        {"supplier_id", s.supplier_id},
                        {"allocated_quantity", s.allocated_quantity},
                        {"reserve_price", s.reserve_price}});
  }
  j["matched_supplies"] = std::move(supplies);
  return j;
}

json toJson(const domain::ClearingError& error) {
  json j;
  j["kind"] = domain::clearingErrorKindToString(error.kind);
  j["message"] = error.message;
  if (error.outcome) {
    j["outcome"] = toJson(*error.outcome);
  }
  return j;
}

json toJson(const clearing::MarketSummary& summary) {
  json j;
  j["bid_count"] = summary.bid_count;
  j["supply_count"] = summary.supply_count;
  j["total_demand"] = summary.total_demand;
  j["total_supply"] = summary.total_supply;
  j["highest_bid"] = optionalPrice(summary.highest_bid);
  j["lowest_reserve"] = optionalPrice(summary.lowest_reserve);
  return j;
}

json toJson(const clearing::TimeslotReport& report) {
  json j;
  j["timeslot_id"] = report.timeslot_id;
  j["status"] = domain::timeslotStatusToString(report.status);
  j["summary"] = toJson(report.summary);
  return j;
}

json eventToJson(const Event& event) {
  json j;
  if (auto* e = std::get_if<ClearingCompletedEvent>(&event)) {
    j["type"] = "clearing_completed";
    j["timeslot_id"] = e->timeslot_id;
    j["clearing_price"] = e->clearing_price;
    j["cleared_quantity"] = e->cleared_quantity;
    j["matched_bid_count"] = e->matched_bid_count;
    j["matched_supply_count"] = e->matched_supply_count;
    j["unmet_demand"] = e->unmet_demand;
    j["unmet_supply"] = e->unmet_supply;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<BidMatchedEvent>(&event)) {
    j["type"] = "bid_matched";
    j["timeslot_id"] = e->timeslot_id;
    j["bid_id"] = e->bid_id;
    j["bidder_id"] = e->bidder_id;
    j["allocated_quantity"] = e->allocated_quantity;
    j["clearing_price"] = e->clearing_price;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<SupplyAllocatedEvent>(&event)) {
    j["type"] = "supply_allocated";
    j["timeslot_id"] = e->timeslot_id;
    j["supply_id"] = e->supply_id;
    j["supplier_id"] = e->supplier_id;
    j["allocated_quantity"] = e->allocated_quantity;
    j["clearing_price"] = e->clearing_price;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (auto* e = std::get_if<ClearingFailedEvent>(&event)) {
    j["type"] = "clearing_failed";
    j["timeslot_id"] = e->timeslot_id;
    j["kind"] = domain::clearingErrorKindToString(e->kind);
    j["message"] = e->message;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  }
  return j;
}

std::string telemetryTopic(const Event& event) {
  const char* type = std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ClearingCompletedEvent>) {
          return "clearing_completed";
        } else if constexpr (std::is_same_v<T, BidMatchedEvent>) {
          return "bid_matched";
        } else if constexpr (std::is_same_v<T, SupplyAllocatedEvent>) {
          return "supply_allocated";
        } else {
          return "clearing_failed";
        }
      },
      event);
  return std::string("eclear.") + type + "." + eventTimeslot(event);
}

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------
domain::Bid bidFromJson(const json& j) {
  domain::Bid bid;
  bid.id = field<std::string>(j, "id", "bid");
  bid.bidder_id = field<std::string>(j, "bidder_id", "bid");
  bid.price = integerField(j, "price", "bid");
  bid.quantity = integerField(j, "quantity", "bid");
  bid.submitted_at = integerField(j, "submitted_at", "bid");
  return bid;
}

domain::SupplyOffer supplyFromJson(const json& j) {
  domain::SupplyOffer supply;
  supply.id = field<std::string>(j, "id", "supply");
  supply.supplier_id = field<std::string>(j, "supplier_id", "supply");
  supply.reserve_price = integerField(j, "reserve_price", "supply");
  supply.quantity = integerField(j, "quantity", "supply");
  supply.submitted_at = integerField(j, "submitted_at", "supply");
  return supply;
}

domain::TimeslotStatus timeslotStatusFromString(const std::string& s) {
  if (s == "OPEN") return domain::TimeslotStatus::Open;
  if (s == "SEALED") return domain::TimeslotStatus::Sealed;
  if (s == "SETTLED") return domain::TimeslotStatus::Settled;
  throw CodecError("unknown timeslot status '" + s + "'");
}

// -----------------------------------------------------------------------------
// Market snapshot
// -----------------------------------------------------------------------------
void loadMarketSnapshot(const json& snapshot,
                        store::InMemoryRecordStore& store) {
  for (const auto& slot : arrayField(snapshot, "timeslots", "snapshot")) {
    const auto id = field<std::string>(slot, "id", "timeslot");
    const auto status =
        timeslotStatusFromString(field<std::string>(slot, "status", "timeslot"));

    store.upsertTimeslot(id, status);
    for (const auto& b : arrayField(slot, "bids", "timeslot")) {
      store.addBid(id, bidFromJson(b), cancelledFlag(b));
    }
    for (const auto& s : arrayField(slot, "supplies", "timeslot")) {
      store.addSupply(id, supplyFromJson(s), cancelledFlag(s));
    }
  }
}

SnapshotMarket marketFromSnapshotTimeslot(const json& timeslot) {
  SnapshotMarket market;
  for (const auto& b : arrayField(timeslot, "bids", "timeslot")) {
    if (!cancelledFlag(b)) {
      market.bids.push_back(bidFromJson(b));
    }
  }
  for (const auto& s : arrayField(timeslot, "supplies", "timeslot")) {
    if (!cancelledFlag(s)) {
      market.supplies.push_back(supplyFromJson(s));
    }
  }
  return market;
}

json readJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw CodecError("cannot open " + path);
  }
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw CodecError(path + ": " + e.what());
  }
}

}  // namespace serialization
}  // namespace eclear
