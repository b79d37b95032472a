// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for eclear::serialization (nlohmann::json codec).
//
// Validates:
//   - Outcome / error / report encoding: field names and integer values
//   - Event telemetry carries "type", timestamp_ms and sequence_id, and its
//     PUB topic is "eclear.<type>.<timeslot>"
//   - Participant decoding rejects missing fields, non-integer prices and
//     integers that do not fit in int64
//   - Snapshot loading seeds the store, cancelled records included
// =============================================================================

#include "eclear/serialization/json_codec.hpp"
#include "eclear/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace eclear;
using nlohmann::json;
using serialization::CodecError;

namespace {

domain::ClearingOutcome sampleOutcome() {
  domain::ClearingOutcome o;
  o.clearing_price = 9;
  o.cleared_quantity = 5;
  o.matched_bids = {{"b1", "alice", 5, 10}};
  o.matched_supplies = {{"s1", "farm", 4, 6}, {"s2", "plant", 1, 9}};
  o.unmet_demand = 5;
  o.unmet_supply = 5;
  o.market_cleared = true;
  return o;
}

store::Deadline later() {
  return std::chrono::steady_clock::now() + std::chrono::seconds(5);
}

}  // namespace

TEST(JsonCodecTest, OutcomeEncoding) {
  const json j = serialization::toJson(sampleOutcome());
  EXPECT_TRUE(j.at("market_cleared").get<bool>());
  EXPECT_EQ(j.at("clearing_price").get<std::int64_t>(), 9);
  EXPECT_TRUE(j.at("cleared_quantity").is_number_integer());
  ASSERT_EQ(j.at("matched_bids").size(), 1u);
  EXPECT_EQ(j.at("matched_bids").at(0).at("bid_id"), "b1");
  EXPECT_EQ(j.at("matched_bids").at(0).at("allocated_quantity"), 5);
  ASSERT_EQ(j.at("matched_supplies").size(), 2u);
  EXPECT_EQ(j.at("matched_supplies").at(1).at("supplier_id"), "plant");
  EXPECT_EQ(j.at("unmet_supply"), 5);
}

TEST(JsonCodecTest, ErrorEncodingIncludesOutcomeOnlyWhenPresent) {
  auto err = domain::makeError(domain::ClearingErrorKind::InvalidInput, "bad");
  json j = serialization::toJson(err);
  EXPECT_EQ(j.at("kind"), "InvalidInput");
  EXPECT_EQ(j.at("message"), "bad");
  EXPECT_FALSE(j.contains("outcome"));

  err.kind = domain::ClearingErrorKind::NoMarketClearing;
  err.outcome = domain::ClearingOutcome{};
  j = serialization::toJson(err);
  EXPECT_EQ(j.at("kind"), "NoMarketClearing");
  ASSERT_TRUE(j.contains("outcome"));
  EXPECT_FALSE(j.at("outcome").at("market_cleared").get<bool>());
}

TEST(JsonCodecTest, ReportEncodingUsesNullForMissingSide) {
  clearing::TimeslotReport report;
  report.timeslot_id = "ts-1";
  report.status = domain::TimeslotStatus::Sealed;
  report.summary.supply_count = 1;
  report.summary.total_supply = 10;
  report.summary.lowest_reserve = 3;

  const json j = serialization::toJson(report);
  EXPECT_EQ(j.at("status"), "SEALED");
  EXPECT_TRUE(j.at("summary").at("highest_bid").is_null());
  EXPECT_EQ(j.at("summary").at("lowest_reserve"), 3);
}

TEST(JsonCodecTest, EventTelemetry) {
  ClearingFailedEvent failed;
  failed.timeslot_id = "ts-2";
  failed.kind = domain::ClearingErrorKind::TimeslotNotSealed;
  failed.message = "timeslot ts-2 is OPEN";
  failed.timestamp = ms_to_timestamp(1234);
  failed.sequence_id = 42;

  json j = serialization::eventToJson(failed);
  EXPECT_EQ(j.at("type"), "clearing_failed");
  EXPECT_EQ(j.at("kind"), "TimeslotNotSealed");
  EXPECT_EQ(j.at("timestamp_ms"), 1234);
  EXPECT_EQ(j.at("sequence_id"), 42);

  SupplyAllocatedEvent alloc;
  alloc.supply_id = "s1";
  alloc.allocated_quantity = 4;
  j = serialization::eventToJson(alloc);
  EXPECT_EQ(j.at("type"), "supply_allocated");
  EXPECT_EQ(j.at("supply_id"), "s1");
  EXPECT_EQ(j.at("allocated_quantity"), 4);

  EXPECT_EQ(serialization::eventToJson(BidMatchedEvent{}).at("type"),
            "bid_matched");
  EXPECT_EQ(serialization::eventToJson(ClearingCompletedEvent{}).at("type"),
            "clearing_completed");
}

TEST(JsonCodecTest, TelemetryTopic) {
  ClearingCompletedEvent completed;
  completed.timeslot_id = "2026-10-17T12:00";
  EXPECT_EQ(serialization::telemetryTopic(completed),
            "eclear.clearing_completed.2026-10-17T12:00");

  BidMatchedEvent matched;
  matched.timeslot_id = "ts-1";
  EXPECT_EQ(serialization::telemetryTopic(matched), "eclear.bid_matched.ts-1");

  ClearingFailedEvent failed;
  failed.timeslot_id = "ts-1";
  const Event event = failed;
  EXPECT_EQ(serialization::telemetryTopic(event),
            "eclear." + serialization::eventToJson(event)
                            .at("type")
                            .get<std::string>() +
                ".ts-1");
}

TEST(JsonCodecTest, ParticipantDecoding) {
  const auto bid = serialization::bidFromJson(
      json{{"id", "b1"}, {"bidder_id", "alice"}, {"price", 10},
           {"quantity", 5}, {"submitted_at", 7}});
  EXPECT_EQ(bid.id, "b1");
  EXPECT_EQ(bid.price, 10);
  EXPECT_EQ(bid.submitted_at, 7);

  const auto supply = serialization::supplyFromJson(
      json{{"id", "s1"}, {"supplier_id", "farm"}, {"reserve_price", 6},
           {"quantity", 4}, {"submitted_at", 1}});
  EXPECT_EQ(supply.reserve_price, 6);

  EXPECT_THROW(serialization::bidFromJson(json{{"id", "b1"}}), CodecError);
  EXPECT_THROW(serialization::bidFromJson(
                   json{{"id", "b1"}, {"bidder_id", "alice"}, {"price", 10.5},
                        {"quantity", 5}, {"submitted_at", 7}}),
               CodecError);

  // 2^63 arrives as an unsigned JSON number and must not wrap negative.
  const auto kTooBig =
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
  try {
    serialization::bidFromJson(
        json::parse("{\"id\":\"b1\",\"bidder_id\":\"alice\","
                    "\"price\":" + std::to_string(kTooBig) +
                    ",\"quantity\":5,\"submitted_at\":7}"));
    ADD_FAILURE() << "expected CodecError";
  } catch (const CodecError& e) {
    EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos);
  }

  const auto max_price = serialization::bidFromJson(
      json{{"id", "b1"}, {"bidder_id", "alice"},
           {"price", std::numeric_limits<std::int64_t>::max()},
           {"quantity", 5}, {"submitted_at", 7}});
  EXPECT_EQ(max_price.price, std::numeric_limits<std::int64_t>::max());

  EXPECT_THROW(serialization::supplyFromJson(
                   json{{"id", 3}, {"supplier_id", "farm"},
                        {"reserve_price", 6}, {"quantity", 4},
                        {"submitted_at", 1}}),
               CodecError);
}

TEST(JsonCodecTest, TimeslotStatusStrings) {
  EXPECT_EQ(serialization::timeslotStatusFromString("OPEN"),
            domain::TimeslotStatus::Open);
  EXPECT_EQ(serialization::timeslotStatusFromString("SETTLED"),
            domain::TimeslotStatus::Settled);
  EXPECT_THROW(serialization::timeslotStatusFromString("sealed"), CodecError);
}

TEST(JsonCodecTest, SnapshotSeedsStore) {
  const json snapshot = json::parse(R"({
    "timeslots": [
      { "id": "ts-1", "status": "SEALED",
        "bids": [
          {"id": "b1", "bidder_id": "alice", "price": 10, "quantity": 5, "submitted_at": 1},
          {"id": "b2", "bidder_id": "bob", "price": 12, "quantity": 5, "submitted_at": 2,
           "cancelled": true}
        ],
        "supplies": [
          {"id": "s1", "supplier_id": "farm", "reserve_price": 6, "quantity": 4, "submitted_at": 1}
        ] },
      { "id": "ts-2", "status": "OPEN" }
    ]
  })");

  store::InMemoryRecordStore store;
  serialization::loadMarketSnapshot(snapshot, store);

  EXPECT_EQ(store.timeslotCount(), 2u);
  EXPECT_EQ(store.getTimeslotStatus("ts-1", later()),
            domain::TimeslotStatus::Sealed);
  ASSERT_EQ(store.loadBids("ts-1", later()).size(), 1u);
  EXPECT_EQ(store.loadBids("ts-1", later())[0].id, "b1");
  EXPECT_TRUE(store.loadSupplies("ts-2", later()).empty());

  const auto market =
      serialization::marketFromSnapshotTimeslot(snapshot.at("timeslots").at(0));
  EXPECT_EQ(market.bids.size(), 1u);
  EXPECT_EQ(market.supplies.size(), 1u);
}

TEST(JsonCodecTest, SnapshotWithBadStatusThrows) {
  store::InMemoryRecordStore store;
  const json snapshot = json::parse(
      R"({"timeslots": [{"id": "ts-1", "status": "DONE"}]})");
  EXPECT_THROW(serialization::loadMarketSnapshot(snapshot, store), CodecError);
}

TEST(JsonCodecTest, MissingFileThrows) {
  EXPECT_THROW(serialization::readJsonFile("/nonexistent/eclear/market.json"),
               CodecError);
}
