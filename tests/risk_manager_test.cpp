// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for micro::RiskManager.
//
// Validates:
//   - Position sizing: clamp(confidence × max, min, max), capped by free
//     capital, rejected below the instrument or configured minimum
//   - Gate order: Halted, DayLimitReached, instrument busy, concurrency cap
//   - Reservations count toward the cap and the busy check until released
//   - State machine: daily limit, drawdown and loss circuit breaker
//   - Day rollover clears DayLimitReached but never Halted
//   - Manual resume re-bases peak and session
//   - Event ordering: PositionClosedEvent precedes the transition it caused
//   - A venue balance read around a close is never booked on top of it
//   - Concurrent admit()/commit() keeps the cap and the capital bound
//
// Time is driven with SimulationTimeProvider. Only the concurrent admission
// test uses threads.
// =============================================================================

#include "micro/eventbus/event_bus.hpp"
#include "micro/events/event.hpp"
#include "micro/events/event_types.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/time/simulation_time_provider.hpp"
#include "micro/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

constexpr std::int64_t kStartMs = 20'000 * micro::kMillisPerDay + 3'600'000;

micro::domain::Opportunity makeOpp(const std::string& id, double confidence,
                                   double min_size = 0.0) {
  micro::domain::Opportunity opp;
  opp.instrument.id = id;
  opp.instrument.min_size = min_size;
  opp.direction = micro::domain::Direction::Long;
  opp.score = confidence;
  opp.confidence = confidence;
  opp.entry_price = 100.0;
  return opp;
}

}  // namespace

// =============================================================================
// Test fixture: default limits (cap 8, daily 10%, drawdown 20%, breaker 15%,
// size 5..15) and a starting balance of 100.
// =============================================================================
class RiskManagerTest : public ::testing::Test {
 protected:
  micro::SimulationTimeProvider clock{kStartMs};
  micro::EventBus bus;
  micro::domain::RiskLimits limits;
  micro::domain::PositionId next_position_id = 1;

  std::unique_ptr<micro::RiskManager> makeRisk(double balance) {
    return std::make_unique<micro::RiskManager>(bus, clock, limits, balance);
  }

  // Admits and commits a long position of `size` at `entry`.
  micro::domain::Position openLong(micro::RiskManager& risk,
                                   const std::string& id, double size,
                                   double entry = 100.0) {
    auto decision = risk.admit(makeOpp(id, 0.5));
    EXPECT_TRUE(decision.approved) << id;

    micro::domain::Position pos;
    pos.id = next_position_id++;
    pos.instrument_id = id;
    pos.direction = micro::domain::Direction::Long;
    pos.entry_price = entry;
    pos.size = size;
    pos.opened_at_ms = clock.now_ms();
    EXPECT_TRUE(risk.commit(decision.reservation, pos));
    return pos;
  }

  void closeAt(micro::RiskManager& risk, micro::domain::PositionId id,
               double exit_price) {
    ASSERT_TRUE(risk.beginClose(id, micro::domain::CloseReason::StopLoss));
    ASSERT_TRUE(risk.completeClose(id, exit_price));
  }
};

// -----------------------------------------------------------------------------
// 1. Size is confidence × max, clamped into [min, max].
// Why: Sizing is the only lever between a signal and capital at risk. A
//      confidence of 1.0 must never exceed maxPositionSize and a weak signal
//      must still meet minPositionSize.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, SizeIsClampedConfidenceTimesMax) {
  auto risk = makeRisk(1'000.0);

  auto strong = risk->admit(makeOpp("AAA", 1.0));
  auto middle = risk->admit(makeOpp("BBB", 0.8));
  auto weak = risk->admit(makeOpp("CCC", 0.1));

  ASSERT_TRUE(strong.approved);
  ASSERT_TRUE(middle.approved);
  ASSERT_TRUE(weak.approved);
  EXPECT_DOUBLE_EQ(strong.size, 15.0);
  EXPECT_DOUBLE_EQ(middle.size, 12.0);
  EXPECT_DOUBLE_EQ(weak.size, 5.0);
  EXPECT_EQ(risk->reservationCount(), 3u);
}

// -----------------------------------------------------------------------------
// 2. Size is capped by free capital; below the minimum it is rejected.
// Why: Reservations already spoken for must not be promised twice.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, FreeCapitalCapsSizeAndRejectsBelowMinimum) {
  auto risk = makeRisk(12.0);

  auto first = risk->admit(makeOpp("AAA", 1.0));
  ASSERT_TRUE(first.approved);
  EXPECT_DOUBLE_EQ(first.size, 12.0);

  auto second = risk->admit(makeOpp("BBB", 1.0));
  EXPECT_FALSE(second.approved);
  EXPECT_EQ(second.reason, micro::domain::RejectReason::SizeBelowMinimum);
  EXPECT_DOUBLE_EQ(second.size, 0.0);
}

// -----------------------------------------------------------------------------
// 3. An instrument minimum above maxPositionSize can never be met.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, InstrumentMinimumAboveMaxIsRejected) {
  auto risk = makeRisk(1'000.0);

  auto decision = risk->admit(makeOpp("BIG", 1.0, /*min_size=*/20.0));

  EXPECT_FALSE(decision.approved);
  EXPECT_EQ(decision.reason, micro::domain::RejectReason::SizeBelowMinimum);
  EXPECT_EQ(risk->reservationCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. At most one position or reservation per instrument.
// Why: Two scan cycles scoring the same instrument must not double up.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, InstrumentBusyWhileReservedOrOpen) {
  auto risk = makeRisk(1'000.0);

  auto first = risk->admit(makeOpp("AAA", 0.9));
  ASSERT_TRUE(first.approved);

  auto while_reserved = risk->admit(makeOpp("AAA", 0.9));
  EXPECT_EQ(while_reserved.reason,
            micro::domain::RejectReason::InstrumentAlreadyOpen);

  risk->release(first.reservation);
  openLong(*risk, "AAA", 10.0);

  auto while_open = risk->admit(makeOpp("AAA", 0.9));
  EXPECT_EQ(while_open.reason,
            micro::domain::RejectReason::InstrumentAlreadyOpen);
}

// -----------------------------------------------------------------------------
// 5. Open positions plus reservations never exceed maxConcurrentTrades.
// Why: Without counting reservations, a burst of approvals in one cycle
//      would all pass the cap before any of them commits.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ConcurrencyCapCountsReservations) {
  auto risk = makeRisk(1'000.0);

  std::vector<micro::ReservationId> held;
  for (int i = 0; i < 8; ++i) {
    auto d = risk->admit(makeOpp("I" + std::to_string(i), 0.5));
    ASSERT_TRUE(d.approved) << i;
    held.push_back(d.reservation);
  }

  auto ninth = risk->admit(makeOpp("I8", 0.5));
  EXPECT_FALSE(ninth.approved);
  EXPECT_EQ(ninth.reason, micro::domain::RejectReason::ConcurrencyCapReached);

  risk->release(held.front());
  auto after_release = risk->admit(makeOpp("I8", 0.5));
  EXPECT_TRUE(after_release.approved);
}

// -----------------------------------------------------------------------------
// 6. Losing 10% of the day-start balance blocks entries for the day.
// Why: Day start 100, two closed losses of 5 each. Daily pnl -10 hits the
//      10% limit exactly; drawdown (10%) and session loss (10%) stay below
//      their own limits, so the state is DayLimitReached, not Halted.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, DailyLossLimitBlocksEntries) {
  auto risk = makeRisk(100.0);

  auto a = openLong(*risk, "AAA", 10.0);
  auto b = openLong(*risk, "BBB", 10.0);
  closeAt(*risk, a.id, 50.0);
  EXPECT_EQ(risk->state(), micro::domain::RiskState::Normal);
  closeAt(*risk, b.id, 50.0);

  EXPECT_EQ(risk->state(), micro::domain::RiskState::DayLimitReached);
  EXPECT_DOUBLE_EQ(risk->account().daily_pnl, -10.0);
  EXPECT_DOUBLE_EQ(risk->account().balance, 90.0);

  auto blocked = risk->admit(makeOpp("CCC", 0.9));
  EXPECT_FALSE(blocked.approved);
  EXPECT_EQ(blocked.reason, micro::domain::RejectReason::DailyLimitReached);
}

// -----------------------------------------------------------------------------
// 7. The next trading day clears DayLimitReached.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, RolloverClearsDailyLimit) {
  auto risk = makeRisk(100.0);
  auto a = openLong(*risk, "AAA", 10.0);
  auto b = openLong(*risk, "BBB", 10.0);
  closeAt(*risk, a.id, 50.0);
  closeAt(*risk, b.id, 50.0);
  ASSERT_EQ(risk->state(), micro::domain::RiskState::DayLimitReached);

  clock.advance_by(micro::kMillisPerDay);
  risk->rollDayIfNeeded();

  EXPECT_EQ(risk->state(), micro::domain::RiskState::Normal);
  EXPECT_DOUBLE_EQ(risk->account().daily_pnl, 0.0);
  EXPECT_DOUBLE_EQ(risk->account().day_start_balance, 90.0);
  EXPECT_TRUE(risk->admit(makeOpp("CCC", 0.9)).approved);
}

// -----------------------------------------------------------------------------
// 8. A 20% drawdown from peak halts trading and flags every open position.
// Why: Peak 120, balance 96 is exactly 20% down. Open positions must be
//      closed by the monitor regardless of their own exit levels.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, DrawdownHaltsAndFlagsForcedClose) {
  auto risk = makeRisk(100.0);
  auto pos = openLong(*risk, "AAA", 10.0);

  risk->updateBalance(120.0);
  EXPECT_EQ(risk->state(), micro::domain::RiskState::Normal);
  risk->updateBalance(96.0);

  EXPECT_EQ(risk->state(), micro::domain::RiskState::Halted);
  EXPECT_TRUE(risk->isHalted());
  auto flagged = risk->position(pos.id);
  ASSERT_TRUE(flagged.has_value());
  EXPECT_TRUE(flagged->forced_close);

  auto blocked = risk->admit(makeOpp("BBB", 0.9));
  EXPECT_EQ(blocked.reason, micro::domain::RejectReason::CircuitBreakerHalted);
}

// -----------------------------------------------------------------------------
// 9. Session realized loss of 15% trips the loss circuit breaker.
// Why: Three losses of 5 from a session start of 100. The daily limit fires
//      at -10 first; the breaker must still escalate to Halted at -15.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, SessionLossTripsCircuitBreaker) {
  auto risk = makeRisk(100.0);

  std::vector<micro::domain::RiskState> transitions;
  bus.subscribe<micro::RiskStateChangedEvent>(
      [&](const micro::RiskStateChangedEvent& e) {
        transitions.push_back(e.current);
      });

  auto a = openLong(*risk, "AAA", 10.0);
  auto b = openLong(*risk, "BBB", 10.0);
  auto c = openLong(*risk, "CCC", 10.0);
  closeAt(*risk, a.id, 50.0);
  closeAt(*risk, b.id, 50.0);
  closeAt(*risk, c.id, 50.0);

  EXPECT_EQ(risk->state(), micro::domain::RiskState::Halted);
  ASSERT_EQ(transitions.size(), 2u);
  EXPECT_EQ(transitions[0], micro::domain::RiskState::DayLimitReached);
  EXPECT_EQ(transitions[1], micro::domain::RiskState::Halted);
}

// -----------------------------------------------------------------------------
// 10. Halted survives the day rollover; only resume() clears it.
// Why: The breaker is a manual-reset fuse. Waking up to a fresh day must not
//      silently re-arm a strategy that just lost 20%.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, HaltedPersistsAcrossRolloverUntilResume) {
  auto risk = makeRisk(100.0);
  risk->updateBalance(120.0);
  risk->updateBalance(96.0);
  ASSERT_TRUE(risk->isHalted());

  clock.advance_by(micro::kMillisPerDay);
  risk->rollDayIfNeeded();
  EXPECT_TRUE(risk->isHalted());

  EXPECT_TRUE(risk->resume());
  EXPECT_EQ(risk->state(), micro::domain::RiskState::Normal);
  EXPECT_DOUBLE_EQ(risk->account().peak_balance, 96.0);
  EXPECT_DOUBLE_EQ(risk->account().session_start_balance, 96.0);
  EXPECT_DOUBLE_EQ(risk->account().session_realized_pnl, 0.0);
  EXPECT_TRUE(risk->admit(makeOpp("AAA", 0.9)).approved);
}

TEST_F(RiskManagerTest, ResumeWhenNotHaltedIsRefused) {
  auto risk = makeRisk(100.0);
  EXPECT_FALSE(risk->resume());
  EXPECT_EQ(risk->state(), micro::domain::RiskState::Normal);
}

// -----------------------------------------------------------------------------
// 11. A fill that commits after a halt is flagged for forced close at once.
// Why: The order was approved before the breaker tripped; the venue filled
//      it anyway. It must not survive as a normal position.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, CommitWhileHaltedIsFlaggedForced) {
  auto risk = makeRisk(100.0);
  auto decision = risk->admit(makeOpp("AAA", 0.9));
  ASSERT_TRUE(decision.approved);

  risk->haltTrading("operator");

  micro::domain::Position pos;
  pos.id = 42;
  pos.instrument_id = "AAA";
  pos.entry_price = 100.0;
  pos.size = decision.size;
  ASSERT_TRUE(risk->commit(decision.reservation, pos));

  auto committed = risk->position(42);
  ASSERT_TRUE(committed.has_value());
  EXPECT_TRUE(committed->forced_close);
}

TEST_F(RiskManagerTest, CommitOfUnknownReservationFails) {
  auto risk = makeRisk(100.0);
  micro::domain::Position pos;
  pos.id = 1;
  pos.instrument_id = "AAA";
  EXPECT_FALSE(risk->commit(999, pos));
  EXPECT_TRUE(risk->openPositions().empty());
}

// -----------------------------------------------------------------------------
// 12. The close event is published before the state change it caused.
// Why: Subscribers (journal, telemetry) must record the losing trade before
//      the halt notice that explains it.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, CloseEventPrecedesTransitionEvent) {
  auto risk = makeRisk(100.0);
  auto pos = openLong(*risk, "AAA", 40.0);

  std::vector<std::string> order;
  bus.subscribe([&](const micro::Event& e) {
    if (std::holds_alternative<micro::PositionClosedEvent>(e)) {
      order.push_back("closed");
    } else if (std::holds_alternative<micro::RiskStateChangedEvent>(e)) {
      order.push_back("state");
    }
  });

  // -20 on a 40 position at half price: 20% drawdown.
  closeAt(*risk, pos.id, 50.0);

  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], "closed");
  EXPECT_EQ(order[1], "state");
  EXPECT_TRUE(risk->isHalted());
}

// -----------------------------------------------------------------------------
// 13. Every admit publishes one GateDecisionEvent, approved or not.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, EveryAdmitPublishesDecision) {
  auto risk = makeRisk(100.0);
  std::vector<micro::GateDecisionEvent> decisions;
  bus.subscribe<micro::GateDecisionEvent>(
      [&](const micro::GateDecisionEvent& e) { decisions.push_back(e); });

  risk->admit(makeOpp("AAA", 0.8));
  risk->admit(makeOpp("AAA", 0.8));

  ASSERT_EQ(decisions.size(), 2u);
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_DOUBLE_EQ(decisions[0].size, 12.0);
  EXPECT_FALSE(decisions[1].approved);
  EXPECT_EQ(decisions[1].reason,
            micro::domain::RejectReason::InstrumentAlreadyOpen);
}

TEST_F(RiskManagerTest, NegativeVenueBalanceIsClampedToZero) {
  auto risk = makeRisk(100.0);
  risk->updateBalance(-5.0);
  EXPECT_DOUBLE_EQ(risk->account().balance, 0.0);
  EXPECT_TRUE(risk->isHalted());
}

// -----------------------------------------------------------------------------
// 14. A close in progress cannot be started twice; abort returns it to Open.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, BeginCloseIsExclusiveAndAbortable) {
  auto risk = makeRisk(100.0);
  auto pos = openLong(*risk, "AAA", 10.0);

  ASSERT_TRUE(risk->beginClose(pos.id, micro::domain::CloseReason::TakeProfit));
  EXPECT_FALSE(risk->beginClose(pos.id, micro::domain::CloseReason::StopLoss));

  risk->abortClose(pos.id);
  auto reopened = risk->position(pos.id);
  ASSERT_TRUE(reopened.has_value());
  EXPECT_EQ(reopened->status, micro::domain::PositionStatus::Open);
  EXPECT_FALSE(risk->completeClose(pos.id, 101.0).has_value());
}

// -----------------------------------------------------------------------------
// 15. A venue balance that already includes an unbooked close is refused.
// Why: The venue credits the close before completeClose() books it. Taking
//      that balance and then adding the PnL again counts the loss twice:
//      100 - 10.5 - 10.5 = 79 is a 21% drawdown and halts for good, while
//      the real balance of 89.5 is only 10.5% down.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, BalanceSyncDuringCloseIsRefused) {
  auto risk = makeRisk(100.0);
  auto pos = openLong(*risk, "AAA", 15.0);

  ASSERT_TRUE(risk->beginClose(pos.id, micro::domain::CloseReason::StopLoss));
  EXPECT_FALSE(risk->updateBalance(89.5));  // venue already credited
  EXPECT_DOUBLE_EQ(risk->account().balance, 100.0);

  auto trade = risk->completeClose(pos.id, 30.0);
  ASSERT_TRUE(trade.has_value());
  EXPECT_DOUBLE_EQ(trade->realized_pnl, -10.5);
  EXPECT_DOUBLE_EQ(risk->account().balance, 89.5);
  EXPECT_EQ(risk->state(), micro::domain::RiskState::DayLimitReached);
  EXPECT_FALSE(risk->isHalted());

  // With nothing closing, the same venue figure is accepted.
  EXPECT_TRUE(risk->updateBalance(89.5));
  EXPECT_DOUBLE_EQ(risk->account().balance, 89.5);
}

TEST_F(RiskManagerTest, BalanceReadBeforeASettledCloseIsRefused) {
  auto risk = makeRisk(100.0);
  auto pos = openLong(*risk, "AAA", 15.0);

  // The scan worker takes the count, then the close runs end to end before
  // the venue answer is applied.
  const auto settled = risk->settledCloses();
  closeAt(*risk, pos.id, 30.0);
  EXPECT_EQ(risk->settledCloses(), settled + 1);

  EXPECT_FALSE(risk->updateBalance(89.5, settled));
  EXPECT_FALSE(risk->updateBalance(100.0, settled));  // stale, pre-close
  EXPECT_DOUBLE_EQ(risk->account().balance, 89.5);

  EXPECT_TRUE(risk->updateBalance(89.5, risk->settledCloses()));
  EXPECT_FALSE(risk->isHalted());
}

// -----------------------------------------------------------------------------
// 16. Admission from several threads never breaks the cap or over-commits.
// Why: The scan worker admits while the IPC and monitor threads touch the
//      same book; every decision must see every earlier reservation.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ConcurrentAdmissionKeepsCapAndCapital) {
  // 7.5 per position at confidence 0.5: six fit in 50, the seventh gets the
  // remaining 5.0, and nothing else does.
  constexpr double kBalance = 50.0;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  auto risk = makeRisk(kBalance);

  std::atomic<micro::domain::PositionId> ids{1};
  std::atomic<int> violations{0};
  std::atomic<int> approved{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string id =
            "T" + std::to_string(t) + "-" + std::to_string(i);
        auto decision = risk->admit(makeOpp(id, 0.5));
        if (!decision.approved) {
          continue;
        }
        ++approved;

        micro::domain::Position pos;
        pos.id = ids++;
        pos.instrument_id = id;
        pos.direction = micro::domain::Direction::Long;
        pos.entry_price = 100.0;
        pos.size = decision.size;
        if (!risk->commit(decision.reservation, pos)) {
          ++violations;
        }

        // Open set first: a commit in between can only lower the sum.
        auto open = risk->openPositions();
        auto reserved = risk->reservationCount();
        if (static_cast<int>(open.size() + reserved) >
            limits.max_concurrent_positions) {
          ++violations;
        }
        double committed = 0.0;
        for (const auto& p : open) {
          committed += p.size;
        }
        if (committed > kBalance + 1e-9) {
          ++violations;
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  EXPECT_EQ(violations.load(), 0);
  EXPECT_EQ(approved.load(), 7);
  EXPECT_EQ(risk->reservationCount(), 0u);

  auto open = risk->openPositions();
  ASSERT_EQ(open.size(), 7u);
  double committed = 0.0;
  for (const auto& p : open) {
    committed += p.size;
  }
  EXPECT_NEAR(committed, kBalance, 1e-9);
}

// -----------------------------------------------------------------------------
// 17. The trading day rolls at 00:00 UTC, also before the epoch.
// -----------------------------------------------------------------------------
TEST(TradingDayTest, RollsAtUtcMidnight) {
  EXPECT_EQ(micro::trading_day(0), 0);
  EXPECT_EQ(micro::trading_day(micro::kMillisPerDay - 1), 0);
  EXPECT_EQ(micro::trading_day(micro::kMillisPerDay), 1);
  EXPECT_EQ(micro::trading_day(kStartMs), 20'000);
  EXPECT_EQ(micro::trading_day(-1), -1);
  EXPECT_EQ(micro::trading_day(-micro::kMillisPerDay), -1);
}
