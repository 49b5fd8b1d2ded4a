#pragma once

#include <cstdint>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: engine-wide hard risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters that govern gating, sizing
//         and exits across the engine.
//
// @details
// Built once by the ConfigLoader (see EngineConfig) and passed by const
// reference or copied into every component at construction. Nothing
// re-reads the configuration file after startup.
//
// Sign convention: every *_fraction value is a positive fraction in (0, 1).
// The daily limit is measured against the day-start balance, the drawdown
// against the peak balance, the loss circuit breaker against the session
// start balance.
//
// Defaults reproduce the 100-unit micro account profile: at most 8 scalps
// of 5..15 each, 1.5% take-profit, 1.0% stop-loss.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Hard cap on simultaneously open positions (reservations included).
  int max_concurrent_positions{8};

  /// Block new entries once daily realized PnL <= -fraction * day start.
  double daily_loss_fraction{0.10};

  /// Trip the circuit breaker once (peak - balance) / peak >= fraction.
  double max_drawdown_fraction{0.20};

  /// Trip the circuit breaker once session realized loss >= fraction of the
  /// session start balance.
  double circuit_breaker_loss_fraction{0.15};

  /// Notional bounds for a single position (quote currency).
  double min_position_size{5.0};
  double max_position_size{15.0};

  /// Exit levels, as fractions of the entry price.
  double take_profit_fraction{0.015};
  double stop_loss_fraction{0.010};

  /// Time stop. 0 disables it.
  std::int64_t max_hold_time_ms{300'000};

  /// Scan cycle period.
  std::int64_t scan_interval_ms{300'000};
};

}  // namespace domain
}  // namespace micro
