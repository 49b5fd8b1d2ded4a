#pragma once

#include "micro/domain/performance_snapshot.hpp"
#include "micro/domain/position.hpp"
#include "micro/eventbus/event_bus.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/time/i_time_provider.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// PerformanceTracker
// -----------------------------------------------------------------------------
//
// @brief  Keeps closed-trade statistics and produces PerformanceSnapshots.
//
// @details
// Subscribes to PositionClosedEvent and accumulates trade count, wins
// (realized PnL > 0) and total PnL. takeSnapshot() combines those with the
// RiskManager's account view:
//
//   growth%  = (balance - initialCapital) / initialCapital × 100
//   winRate  = wins / trades   (0 with no trades)
//
// Snapshots are appended to an in-memory history of at most
// `history_limit` entries (oldest dropped first), published as a
// SnapshotEvent (journal + telemetry) and logged. The tracker never writes
// account state.
//
// Thread model: onClosed() runs on whichever worker closed the position;
// takeSnapshot() on the snapshot worker or the Scheduler thread. mutex_
// guards the counters and the history.
// -----------------------------------------------------------------------------
class PerformanceTracker {
 public:
  // One week of snapshots at the default 5-minute interval.
  static constexpr std::size_t kDefaultHistoryLimit = 2'016;

  PerformanceTracker(EventBus& bus, const RiskManager& risk,
                     const ITimeProvider& clock, double initial_capital,
                     std::size_t history_limit = kDefaultHistoryLimit);

  ~PerformanceTracker();

  PerformanceTracker(const PerformanceTracker&) = delete;
  PerformanceTracker& operator=(const PerformanceTracker&) = delete;
  PerformanceTracker(PerformanceTracker&&) = delete;
  PerformanceTracker& operator=(PerformanceTracker&&) = delete;

  // Computes, records, publishes and logs a snapshot.
  domain::PerformanceSnapshot takeSnapshot();

  // Computes a snapshot without recording or publishing it.
  domain::PerformanceSnapshot compute() const;

  std::vector<domain::PerformanceSnapshot> history() const;

  static double growthPct(double balance, double initial_capital);

  static double winRate(int wins, int trades);

 private:
  void onClosed(const PositionClosedEvent& event);

  EventBus& bus_;
  const RiskManager& risk_;
  const ITimeProvider& clock_;
  const double initial_capital_;
  const std::size_t history_limit_;

  mutable std::mutex mutex_;
  int trade_count_{0};
  int wins_{0};
  double total_pnl_{0.0};
  std::deque<domain::PerformanceSnapshot> history_;

  EventBus::SubscriptionId closed_sub_id_{0};
};

}  // namespace micro
