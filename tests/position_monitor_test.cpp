// =============================================================================
// position_monitor_test.cpp
// =============================================================================
// Tests for micro::PositionMonitor against MockMarketGateway.
//
// Validates:
//   - Exit priority: forced close > stop-loss > take-profit > time stop
//   - Stop-loss / take-profit / time stop close with the right reason/price
//   - A missing price never triggers a time stop, but a forced close still
//     goes out
//   - A failed close returns the position to Open and is retried with the
//     reason that fired first
//   - AlreadyClosed at the venue is booked at the last observed price
//   - A balance sync landing between the venue close and the booking does
//     not count the close twice
// =============================================================================

#include "micro/concurrent/id_generator.hpp"
#include "micro/config/engine_config.hpp"
#include "micro/eventbus/event_bus.hpp"
#include "micro/execution/execution_coordinator.hpp"
#include "micro/gateway/mock_market_gateway.hpp"
#include "micro/monitor/position_monitor.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using micro::domain::CloseReason;
using micro::domain::Direction;

namespace {

constexpr std::int64_t kStartMs = 1'700'000'000'000;

// Forwards to the mock, and right after each venue close lets another
// worker sync the account from the venue balance.
class BalanceSyncOnClose : public micro::IMarketGateway {
 public:
  BalanceSyncOnClose(micro::MockMarketGateway& venue, micro::RiskManager& risk)
      : venue_(venue), risk_(risk) {}

  std::vector<micro::domain::Instrument> listInstruments() override {
    return venue_.listInstruments();
  }
  micro::domain::MarketSnapshot getMarketData(
      const std::string& instrument_id) override {
    return venue_.getMarketData(instrument_id);
  }
  micro::OrderAck placeOrder(const micro::OrderRequest& request) override {
    return venue_.placeOrder(request);
  }
  micro::CloseConfirmation closePosition(
      const std::string& order_id, const std::string& instrument_id) override {
    auto confirmation = venue_.closePosition(order_id, instrument_id);
    synced = risk_.updateBalance(venue_.getBalance());
    return confirmation;
  }
  double getBalance() override { return venue_.getBalance(); }

  bool synced{true};

 private:
  micro::MockMarketGateway& venue_;
  micro::RiskManager& risk_;
};

}  // namespace

// =============================================================================
// Test fixture: one listed instrument "AAA" at 1.0. Positions are opened
// through the ExecutionCoordinator so they exist at the venue too.
// =============================================================================
class PositionMonitorTest : public ::testing::Test {
 protected:
  PositionMonitorTest() {
    config.retry_backoff_ms = 0;
    risk = std::make_unique<micro::RiskManager>(bus, clock, config.limits,
                                                100.0);
    coordinator = std::make_unique<micro::ExecutionCoordinator>(
        gateway, *risk, bus, ids, clock, config);
    monitor = std::make_unique<micro::PositionMonitor>(gateway, *risk, clock,
                                                       config);

    micro::domain::Instrument inst;
    inst.id = "AAA";
    inst.volume_24h = 5'000'000.0;
    gateway.addInstrument(inst, 1.0);

    bus.subscribe<micro::PositionClosedEvent>(
        [this](const micro::PositionClosedEvent& e) {
          closed.push_back(e.trade);
        });
  }

  micro::domain::Position openAAA(Direction dir = Direction::Long) {
    micro::domain::Opportunity opp;
    opp.instrument.id = "AAA";
    opp.direction = dir;
    opp.score = 0.9;
    opp.confidence = 0.9;
    opp.entry_price = 1.0;
    coordinator->executeRanked({opp}, clock.now_ms());
    auto open = risk->openPositions();
    EXPECT_EQ(open.size(), 1u);
    return open.empty() ? micro::domain::Position{} : open.front();
  }

  micro::SimulationTimeProvider clock{kStartMs};
  micro::EventBus bus;
  micro::IdGenerator ids;
  micro::EngineConfig config;
  micro::MockMarketGateway gateway{clock, 1'000.0};
  std::unique_ptr<micro::RiskManager> risk;
  std::unique_ptr<micro::ExecutionCoordinator> coordinator;
  std::unique_ptr<micro::PositionMonitor> monitor;
  std::vector<micro::domain::ClosedTrade> closed;
};

// -----------------------------------------------------------------------------
// 1. Price through take-profit closes with TakeProfit at the fill.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, TakeProfitCloses) {
  auto pos = openAAA();
  gateway.setPrice("AAA", 1.02);

  EXPECT_EQ(monitor->poll(), 1u);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].position_id, pos.id);
  EXPECT_EQ(closed[0].reason, CloseReason::TakeProfit);
  EXPECT_DOUBLE_EQ(closed[0].exit_price, 1.02);
  EXPECT_NEAR(closed[0].realized_pnl, pos.size * 0.02, 1e-9);
  EXPECT_TRUE(risk->openPositions().empty());
  EXPECT_TRUE(gateway.openVenuePositions().empty());
}

TEST_F(PositionMonitorTest, StopLossCloses) {
  auto pos = openAAA();
  gateway.setPrice("AAA", 0.98);

  EXPECT_EQ(monitor->poll(), 1u);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, CloseReason::StopLoss);
  EXPECT_NEAR(closed[0].realized_pnl, -pos.size * 0.02, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A short position mirrors the levels.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, ShortTakeProfitIsBelowEntry) {
  openAAA(Direction::Short);

  gateway.setPrice("AAA", 1.005);
  EXPECT_EQ(monitor->poll(), 0u);

  gateway.setPrice("AAA", 0.98);
  EXPECT_EQ(monitor->poll(), 1u);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, CloseReason::TakeProfit);
  EXPECT_GT(closed[0].realized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Holding past maxHoldTime closes at the current price.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, TimeStopCloses) {
  openAAA();

  clock.advance_by(config.limits.max_hold_time_ms - 1);
  EXPECT_EQ(monitor->poll(), 0u);

  clock.advance_by(1);
  EXPECT_EQ(monitor->poll(), 1u);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, CloseReason::TimeStop);
}

// -----------------------------------------------------------------------------
// 4. No price, no time stop.
// Why: Closing blind on a timer could exit at any price. Only a forced
//      close (halt or shutdown) is allowed without a price.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, NoPriceNoTimeStop) {
  openAAA();
  clock.advance_by(config.limits.max_hold_time_ms * 2);
  gateway.failNext(micro::MockMarketGateway::Operation::GetMarketData,
                   micro::GatewayErrorKind::NotFound, /*count=*/-1);

  EXPECT_EQ(monitor->poll(), 0u);
  EXPECT_EQ(risk->openPositions().size(), 1u);
}

TEST_F(PositionMonitorTest, ForcedCloseNeedsNoPrice) {
  auto pos = openAAA();
  gateway.failNext(micro::MockMarketGateway::Operation::GetMarketData,
                   micro::GatewayErrorKind::NotFound, /*count=*/-1);
  risk->forceCloseAll();

  EXPECT_EQ(monitor->poll(), 1u);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, CloseReason::ForcedClose);
  EXPECT_DOUBLE_EQ(closed[0].exit_price, pos.entry_price);
}

// -----------------------------------------------------------------------------
// 5. A rejected close goes back to Open and is retried with its first reason.
// Why: The take-profit fired, the venue refused, then price slipped back
//      inside the band. The position must still close as TakeProfit rather
//      than sit open until the next trigger.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, FailedCloseIsRetriedWithOriginalReason) {
  auto pos = openAAA();
  gateway.setPrice("AAA", 1.02);
  gateway.failNext(micro::MockMarketGateway::Operation::ClosePosition,
                   micro::GatewayErrorKind::Rejected);

  EXPECT_EQ(monitor->poll(), 0u);
  auto still_open = risk->position(pos.id);
  ASSERT_TRUE(still_open.has_value());
  EXPECT_EQ(still_open->status, micro::domain::PositionStatus::Open);
  EXPECT_EQ(still_open->close_reason, CloseReason::TakeProfit);

  gateway.setPrice("AAA", 1.0);
  EXPECT_EQ(monitor->poll(), 1u);
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].reason, CloseReason::TakeProfit);
  EXPECT_EQ(gateway.closeAttempts().size(), 2u);
}

// -----------------------------------------------------------------------------
// 6. Closed at the venue behind our back: book it, don't loop forever.
// -----------------------------------------------------------------------------
TEST_F(PositionMonitorTest, AlreadyClosedIsBookedAtLastObservedPrice) {
  auto pos = openAAA();
  gateway.closePosition(pos.order_id, "AAA");
  gateway.setPrice("AAA", 1.02);

  EXPECT_EQ(monitor->poll(), 1u);

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_DOUBLE_EQ(closed[0].exit_price, 1.02);
  EXPECT_TRUE(risk->openPositions().empty());
}

// -----------------------------------------------------------------------------
// 7. The venue credits a loss before the monitor books it; a balance sync in
//    between must not apply it a second time.
// Why: 100 - 10.5 booked twice is a 21% drawdown and a permanent halt. The
//      real account is 10.5% down.
// -----------------------------------------------------------------------------
TEST(PositionMonitorBalanceSyncTest, SyncDuringCloseCountsOnce) {
  micro::SimulationTimeProvider clock{kStartMs};
  micro::EventBus bus;
  micro::IdGenerator ids;
  micro::EngineConfig config;
  config.retry_backoff_ms = 0;
  micro::MockMarketGateway venue{clock, 100.0};
  micro::RiskManager risk{bus, clock, config.limits, 100.0};
  micro::ExecutionCoordinator coordinator{venue, risk, bus, ids, clock, config};

  micro::domain::Instrument inst;
  inst.id = "AAA";
  venue.addInstrument(inst, 1.0);

  micro::domain::Opportunity opp;
  opp.instrument.id = "AAA";
  opp.direction = Direction::Long;
  opp.score = 1.0;
  opp.confidence = 1.0;
  opp.entry_price = 1.0;
  ASSERT_EQ(coordinator.executeRanked({opp}, clock.now_ms()), 1u);
  ASSERT_DOUBLE_EQ(risk.openPositions().front().size, 15.0);

  BalanceSyncOnClose gateway{venue, risk};
  micro::PositionMonitor monitor{gateway, risk, clock, config};
  venue.setPrice("AAA", 0.30);

  EXPECT_EQ(monitor.poll(), 1u);

  EXPECT_FALSE(gateway.synced);
  EXPECT_NEAR(venue.getBalance(), 89.5, 1e-9);
  EXPECT_NEAR(risk.account().balance, 89.5, 1e-9);
  EXPECT_FALSE(risk.isHalted());
  EXPECT_EQ(risk.state(), micro::domain::RiskState::DayLimitReached);
}

// -----------------------------------------------------------------------------
// 8. Priority when several conditions hold at once.
// -----------------------------------------------------------------------------
TEST(PositionMonitorExitReasonTest, PriorityOrder) {
  micro::domain::RiskLimits limits;
  micro::domain::Position pos;
  pos.direction = Direction::Long;
  pos.entry_price = 100.0;
  pos.stop_loss = 99.0;
  pos.take_profit = 101.5;
  pos.opened_at_ms = 0;

  const std::int64_t late = limits.max_hold_time_ms + 1;

  pos.forced_close = true;
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, 98.0, late, limits),
            CloseReason::ForcedClose);
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, std::nullopt, 0, limits),
            CloseReason::ForcedClose);

  pos.forced_close = false;
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, 98.0, late, limits),
            CloseReason::StopLoss);
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, 102.0, late, limits),
            CloseReason::TakeProfit);
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, 100.0, late, limits),
            CloseReason::TimeStop);
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, 100.0, 1, limits),
            CloseReason::None);
  EXPECT_EQ(micro::PositionMonitor::exitReason(pos, std::nullopt, late, limits),
            CloseReason::None);
}
