#pragma once

#include "micro/domain/direction.hpp"
#include "micro/domain/position_status.hpp"

#include <cstdint>
#include <string>

namespace micro {
namespace domain {

using PositionId = std::uint64_t;

// -----------------------------------------------------------------------------
// Position: one open (or closing) scalp
// -----------------------------------------------------------------------------
//
// @brief  Materialized by the ExecutionCoordinator after a confirmed entry
//         fill; tracked by RiskManager until its closing fill.
//
// @details
// size is a notional in quote currency, not a unit quantity. Realized PnL on
// close is therefore a return on notional:
//
//   Long:  size * (exit - entry) / entry
//   Short: size * (entry - exit) / entry
//
// stop_loss and take_profit are absolute prices computed at entry from the
// configured fractions. forced_close is raised by RiskManager when the
// circuit breaker trips or on shutdown; the Position Monitor honours it
// before any other exit rule.
//
// Ownership:
//   The authoritative copy lives in RiskManager's open-position map and is
//   only mutated under its mutex. Everyone else works on copies.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  std::string instrument_id;
  Direction direction{Direction::Long};
  double entry_price{0.0};
  double size{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  std::int64_t opened_at_ms{0};
  std::string order_id;          // Venue order id of the entry
  PositionStatus status{PositionStatus::Open};
  bool forced_close{false};
  CloseReason close_reason{CloseReason::None};
};

// -----------------------------------------------------------------------------
// ClosedTrade: immutable record of a completed round trip
// -----------------------------------------------------------------------------
struct ClosedTrade {
  PositionId position_id{0};
  std::string instrument_id;
  Direction direction{Direction::Long};
  double size{0.0};
  double entry_price{0.0};
  double exit_price{0.0};
  double realized_pnl{0.0};
  CloseReason reason{CloseReason::None};
  std::int64_t opened_at_ms{0};
  std::int64_t closed_at_ms{0};
};

inline double realizedPnl(Direction direction, double size, double entry,
                          double exit) {
  if (entry <= 0.0) {
    return 0.0;
  }
  double move = (direction == Direction::Long) ? (exit - entry)
                                               : (entry - exit);
  return size * move / entry;
}

}  // namespace domain
}  // namespace micro
