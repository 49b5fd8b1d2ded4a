#include "micro/performance/performance_tracker.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor: subscribe to PositionClosedEvent
// -----------------------------------------------------------------------------
PerformanceTracker::PerformanceTracker(EventBus& bus, const RiskManager& risk,
                                       const ITimeProvider& clock,
                                       double initial_capital,
                                       std::size_t history_limit)
    : bus_(bus),
      risk_(risk),
      clock_(clock),
      initial_capital_(initial_capital),
      history_limit_(history_limit) {
  closed_sub_id_ = bus_.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) { onClosed(e); });
}

PerformanceTracker::~PerformanceTracker() { bus_.unsubscribe(closed_sub_id_); }

// -----------------------------------------------------------------------------
// takeSnapshot()
// -----------------------------------------------------------------------------
domain::PerformanceSnapshot PerformanceTracker::takeSnapshot() {
  domain::PerformanceSnapshot snap = compute();
  {
    std::lock_guard lock(mutex_);
    history_.push_back(snap);
    while (history_.size() > history_limit_) {
      history_.pop_front();
    }
  }

  std::ostringstream line;
  line << std::fixed << std::setprecision(2)
       << "[PerformanceTracker] balance=" << snap.balance
       << " growth=" << snap.growth_pct << "% trades=" << snap.trade_count
       << " winRate=" << snap.win_rate * 100.0 << "% pnl=" << snap.total_pnl
       << " open=" << snap.open_positions
       << " state=" << domain::riskStateToString(snap.risk_state) << "\n";
  std::cout << line.str();

  bus_.publish(SnapshotEvent{snap});
  return snap;
}

domain::PerformanceSnapshot PerformanceTracker::compute() const {
  domain::AccountState account = risk_.account();
  domain::RiskState state = risk_.state();

  domain::PerformanceSnapshot snap;
  snap.timestamp_ms = clock_.now_ms();
  snap.balance = account.balance;
  snap.growth_pct = growthPct(account.balance, initial_capital_);
  snap.open_positions = account.open_positions;
  snap.risk_state = state;

  std::lock_guard lock(mutex_);
  snap.trade_count = trade_count_;
  snap.wins = wins_;
  snap.win_rate = winRate(wins_, trade_count_);
  snap.total_pnl = total_pnl_;
  return snap;
}

std::vector<domain::PerformanceSnapshot> PerformanceTracker::history() const {
  std::lock_guard lock(mutex_);
  return {history_.begin(), history_.end()};
}

double PerformanceTracker::growthPct(double balance, double initial_capital) {
  if (initial_capital <= 0.0) {
    return 0.0;
  }
  return (balance - initial_capital) / initial_capital * 100.0;
}

double PerformanceTracker::winRate(int wins, int trades) {
  return trades > 0 ? static_cast<double>(wins) / trades : 0.0;
}

// -----------------------------------------------------------------------------
// onClosed(): accumulate trade statistics
// -----------------------------------------------------------------------------
void PerformanceTracker::onClosed(const PositionClosedEvent& event) {
  std::lock_guard lock(mutex_);
  ++trade_count_;
  if (event.trade.realized_pnl > 0.0) {
    ++wins_;
  }
  total_pnl_ += event.trade.realized_pnl;
}

}  // namespace micro
