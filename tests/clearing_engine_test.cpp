// =============================================================================
// clearing_engine_test.cpp
// =============================================================================
// Tests for eclear::ClearingEngine: lifecycle, command dispatch and event
// delivery through the publication loop.
//
// Validates:
//   - PING / CLEAR / PREVIEW / STATUS replies and their JSON shape
//   - Unknown commands and a missing timeslot argument answer an error
//   - CLEAR settles the timeslot; a second CLEAR reports TimeslotNotSealed
//   - NoMarketClearing replies carry the zero-volume outcome
//   - ClearingCompletedEvent reaches a subscriber on the publication thread
//   - start() / stop() are idempotent
//
// Both IPC endpoints are left empty so no ZeroMQ socket is bound.
// =============================================================================

#include "eclear/engine/clearing_engine.hpp"
#include "eclear/store/in_memory_record_store.hpp"
#include "eclear/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

using namespace eclear;
using domain::Bid;
using domain::SupplyOffer;
using domain::TimeslotStatus;
using nlohmann::json;

namespace {

EngineConfig offlineConfig() {
  EngineConfig config;
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  config.record_store_timeout = std::chrono::milliseconds(2000);
  return config;
}

}  // namespace

class ClearingEngineTest : public ::testing::Test {
 protected:
  store::InMemoryRecordStore store;
  SimulationTimeProvider clock{1'000};
  std::unique_ptr<ClearingEngine> engine;

  void SetUp() override {
    store.upsertTimeslot("ts-sealed", TimeslotStatus::Sealed);
    store.addBid("ts-sealed", Bid{"b1", "alice", 10, 5, 1});
    store.addBid("ts-sealed", Bid{"b2", "bob", 8, 5, 2});
    store.addSupply("ts-sealed", SupplyOffer{"s1", "farm", 6, 4, 1});
    store.addSupply("ts-sealed", SupplyOffer{"s2", "plant", 9, 6, 2});

    store.upsertTimeslot("ts-dry", TimeslotStatus::Sealed);
    store.addBid("ts-dry", Bid{"d1", "alice", 5, 10, 1});
    store.addSupply("ts-dry", SupplyOffer{"d2", "farm", 7, 10, 1});

    engine = std::make_unique<ClearingEngine>(store, clock, offlineConfig());
  }

  void TearDown() override { engine->stop(); }

  json command(const std::string& cmd) {
    return json::parse(engine->executeCommand(cmd));
  }
};

TEST_F(ClearingEngineTest, Ping) {
  const json reply = command("PING");
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("response"), "PONG");
}

TEST_F(ClearingEngineTest, UnknownAndIncompleteCommands) {
  json reply = command("SETTLE ts-sealed");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("response"), "Unknown command: SETTLE ts-sealed");

  reply = command("CLEAR");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("response"), "Missing timeslot id for CLEAR");

  reply = command("STATUS   ");
  EXPECT_EQ(reply.at("status"), "error");
}

TEST_F(ClearingEngineTest, ClearCommandSettlesOnce) {
  engine->start();

  json reply = command("CLEAR ts-sealed");
  ASSERT_EQ(reply.at("status"), "ok") << reply.dump();
  EXPECT_EQ(reply.at("timeslot_id"), "ts-sealed");
  EXPECT_EQ(reply.at("outcome").at("clearing_price"), 9);
  EXPECT_EQ(reply.at("outcome").at("cleared_quantity"), 5);

  reply = command("CLEAR ts-sealed");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error").at("kind"), "TimeslotNotSealed");

  reply = command("STATUS ts-sealed");
  EXPECT_EQ(reply.at("report").at("status"), "SETTLED");
}

TEST_F(ClearingEngineTest, NoCrossingReplyCarriesOutcome) {
  const json reply = command("CLEAR ts-dry");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error").at("kind"), "NoMarketClearing");
  EXPECT_EQ(reply.at("error").at("outcome").at("unmet_demand"), 10);
  EXPECT_EQ(reply.at("error").at("outcome").at("unmet_supply"), 10);
}

TEST_F(ClearingEngineTest, PreviewAndStatusAreReadOnly) {
  json reply = command("PREVIEW ts-sealed");
  ASSERT_EQ(reply.at("status"), "ok");
  EXPECT_TRUE(reply.at("outcome").at("market_cleared").get<bool>());

  reply = command("STATUS ts-sealed");
  ASSERT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("report").at("status"), "SEALED");
  EXPECT_EQ(reply.at("report").at("summary").at("bid_count"), 2);
  EXPECT_EQ(reply.at("report").at("summary").at("lowest_reserve"), 6);

  reply = command("STATUS ts-missing");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error").at("kind"), "RecordStoreError");
}

TEST_F(ClearingEngineTest, CompletedEventReachesSubscriber) {
  std::promise<std::pair<ClearingCompletedEvent, std::thread::id>> promise;
  auto future = promise.get_future();
  engine->eventBus().subscribe<ClearingCompletedEvent>(
      [&promise](const ClearingCompletedEvent& e) {
        promise.set_value(std::make_pair(e, std::this_thread::get_id()));
      });
  engine->start();

  auto result = engine->executeClearing("ts-sealed");
  ASSERT_NE(std::get_if<domain::ClearingOutcome>(&result), nullptr);

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  const auto [event, thread_id] = future.get();
  EXPECT_EQ(event.timeslot_id, "ts-sealed");
  EXPECT_EQ(event.clearing_price, 9);
  EXPECT_EQ(event.cleared_quantity, 5);
  EXPECT_NE(thread_id, std::this_thread::get_id());
}

TEST_F(ClearingEngineTest, EventsBeforeStartAreDeliveredOnStart) {
  int failures = 0;
  engine->eventBus().subscribe<ClearingFailedEvent>(
      [&failures](const ClearingFailedEvent&) { ++failures; });

  auto result = engine->executeClearing("ts-dry");
  ASSERT_NE(std::get_if<domain::ClearingError>(&result), nullptr);

  engine->start();
  engine->stop();
  EXPECT_EQ(failures, 1);
}

TEST_F(ClearingEngineTest, IdempotentLifecycle) {
  engine->start();
  engine->start();
  engine->stop();
  engine->stop();
  EXPECT_EQ(engine->config().record_store_timeout.count(), 2000);
}
