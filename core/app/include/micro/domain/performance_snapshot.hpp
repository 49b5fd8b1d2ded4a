#pragma once

#include "micro/domain/account_state.hpp"

#include <cstdint>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// PerformanceSnapshot: periodic account report
// -----------------------------------------------------------------------------
// Emitted by the PerformanceTracker every snapshot interval, written to the
// journal and published as telemetry. Never mutated after creation.
//
//   growth_pct = (balance - initial_capital) / initial_capital * 100
//   win_rate   = wins / trade_count, 0 when no trades (fraction, not percent)
// -----------------------------------------------------------------------------
struct PerformanceSnapshot {
  std::int64_t timestamp_ms{0};
  double balance{0.0};
  double growth_pct{0.0};
  int trade_count{0};
  int wins{0};
  double win_rate{0.0};
  double total_pnl{0.0};
  int open_positions{0};
  RiskState risk_state{RiskState::Normal};
};

}  // namespace domain
}  // namespace micro
