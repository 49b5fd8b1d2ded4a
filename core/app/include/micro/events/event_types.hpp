#pragma once

#include "micro/domain/account_state.hpp"
#include "micro/domain/direction.hpp"
#include "micro/domain/gate_decision.hpp"
#include "micro/domain/performance_snapshot.hpp"
#include "micro/domain/position.hpp"

#include <cstdint>
#include <string>

namespace micro {

// -----------------------------------------------------------------------------
// Engine events
// -----------------------------------------------------------------------------
// Plain value types carried by the Event variant. Timestamps are epoch
// milliseconds taken from the engine's ITimeProvider, so a simulated run
// produces simulated timestamps throughout.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// GateDecisionEvent
// -----------------------------------------------------------------------------
// Responsibility: Records one RiskManager::admit() outcome, approved or not.
// Every scored opportunity that reaches the gate produces exactly one.
// -----------------------------------------------------------------------------
struct GateDecisionEvent {
  std::string instrument_id;
  domain::Direction direction{domain::Direction::Long};
  double score{0.0};
  double confidence{0.0};
  bool approved{false};
  double size{0.0};  // Approved size; 0 on rejection
  domain::RejectReason reason{domain::RejectReason::None};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionOpenedEvent
// -----------------------------------------------------------------------------
// Published once a reservation has been committed into the open set.
// -----------------------------------------------------------------------------
struct PositionOpenedEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
// Published after the close has been confirmed and the account updated.
// `balance` is the account balance including this trade's PnL.
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::ClosedTrade trade;
  double balance{0.0};
};

// -----------------------------------------------------------------------------
// RiskStateChangedEvent
// -----------------------------------------------------------------------------
// Published on every risk state transition, including a manual RESUME.
// -----------------------------------------------------------------------------
struct RiskStateChangedEvent {
  domain::RiskState previous{domain::RiskState::Normal};
  domain::RiskState current{domain::RiskState::Normal};
  std::string reason;
  double balance{0.0};
  double peak_balance{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// SnapshotEvent
// -----------------------------------------------------------------------------
struct SnapshotEvent {
  domain::PerformanceSnapshot snapshot;
};

}  // namespace micro
