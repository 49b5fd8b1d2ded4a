#pragma once

#include <cstdint>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState: circuit-breaker state machine
// -----------------------------------------------------------------------------
//
//   Normal ──(daily loss cap)──> DayLimitReached ──(day rollover)──> Normal
//     │                                │
//     └──────(drawdown / loss CB)──────┴──────> Halted ──(manual RESUME)──> Normal
//
// Halted never recovers on its own.
// -----------------------------------------------------------------------------
enum class RiskState {
  Normal,
  DayLimitReached,
  Halted,
};

inline const char* riskStateToString(RiskState s) {
  switch (s) {
    case RiskState::Normal:          return "Normal";
    case RiskState::DayLimitReached: return "DayLimitReached";
    case RiskState::Halted:          return "Halted";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// AccountState: capital bookkeeping for the whole process
// -----------------------------------------------------------------------------
//
// @brief  Balance, high-water mark and the running PnL counters the risk
//         state machine evaluates.
//
// @details
// Owned by the Scheduler (inside RiskManager) and only read or written under
// RiskManager's mutex. Components that need a view get a copy via
// RiskManager::account().
//
//   peak_balance           all-time high-water mark of balance
//   daily_pnl              realized PnL since the last trading-day rollover
//   day_start_balance      balance snapshot taken at rollover
//   session_realized_pnl   realized PnL since start or last manual RESUME;
//                          feeds the loss circuit breaker
//   session_start_balance  balance snapshot matching session_realized_pnl
//   trading_day            UTC day index (epoch ms / 86'400'000)
// -----------------------------------------------------------------------------
struct AccountState {
  double balance{0.0};
  double peak_balance{0.0};
  double daily_pnl{0.0};
  double day_start_balance{0.0};
  double session_realized_pnl{0.0};
  double session_start_balance{0.0};
  int open_positions{0};
  std::int64_t trading_day{0};
};

}  // namespace domain
}  // namespace micro
