#pragma once

#include "eclear/clearing/clearing_orchestrator.hpp"
#include "eclear/clearing/market_summary.hpp"
#include "eclear/domain/clearing_error.hpp"
#include "eclear/domain/clearing_outcome.hpp"
#include "eclear/domain/participant.hpp"
#include "eclear/domain/timeslot_status.hpp"
#include "eclear/events/event.hpp"
#include "eclear/store/in_memory_record_store.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace eclear {
namespace serialization {

// -----------------------------------------------------------------------------
// CodecError
// -----------------------------------------------------------------------------
// Thrown when a JSON document is structurally valid JSON but does not
// describe what it should (missing field, wrong type, unknown enum string).
// nlohmann::json::exception from the parser is translated into this type so
// callers only have one exception to handle.
// -----------------------------------------------------------------------------
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Conversions between domain values and nlohmann::json, shared by
//         the IPC command replies, the PUB telemetry stream, the market
//         snapshot loader and the --preview dry run.
//
// @details
// Field names are snake_case. Prices and quantities are written as JSON
// integers (the fixed-point int64 value, never a float). Timestamps are
// written as epoch milliseconds.
// -----------------------------------------------------------------------------

// --- Encoding ----------------------------------------------------------------
nlohmann::json toJson(const domain::ClearingOutcome& outcome);
nlohmann::json toJson(const domain::ClearingError& error);
nlohmann::json toJson(const clearing::MarketSummary& summary);
nlohmann::json toJson(const clearing::TimeslotReport& report);

// Telemetry message for one event; always carries a "type" field
// ("clearing_completed", "bid_matched", "supply_allocated",
// "clearing_failed").
nlohmann::json eventToJson(const Event& event);

// PUB topic frame for an event: "eclear.<type>.<timeslot id>", where <type>
// is the same string as eventToJson()'s "type" field.
std::string telemetryTopic(const Event& event);

// --- Decoding ----------------------------------------------------------------
// @throws CodecError
domain::Bid bidFromJson(const nlohmann::json& j);
domain::SupplyOffer supplyFromJson(const nlohmann::json& j);
domain::TimeslotStatus timeslotStatusFromString(const std::string& s);

// -----------------------------------------------------------------------------
// Market snapshot
// -----------------------------------------------------------------------------
//
// Document shape:
//   {
//     "timeslots": [
//       { "id": "ts-1", "status": "SEALED",
//         "bids":     [ {"id", "bidder_id", "price", "quantity",
//                        "submitted_at", "cancelled"?} ... ],
//         "supplies": [ {"id", "supplier_id", "reserve_price", "quantity",
//                        "submitted_at", "cancelled"?} ... ] }
//     ]
//   }
//
// loadMarketSnapshot() seeds every timeslot into the store. Records are not
// validated here; a negative price is loaded as-is and rejected later by the
// clearing run, exactly as it would be if it came from a real store.
//
// @throws CodecError
// -----------------------------------------------------------------------------
void loadMarketSnapshot(const nlohmann::json& snapshot,
                        store::InMemoryRecordStore& store);

// Reads and parses a snapshot file. @throws CodecError
nlohmann::json readJsonFile(const std::string& path);

// Active (non-cancelled) participants of one timeslot object of a snapshot.
struct SnapshotMarket {
  std::vector<domain::Bid> bids;
  std::vector<domain::SupplyOffer> supplies;
};
SnapshotMarket marketFromSnapshotTimeslot(const nlohmann::json& timeslot);

}  // namespace serialization
}  // namespace eclear
