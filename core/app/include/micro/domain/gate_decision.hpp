#pragma once

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason: why RiskManager::admit() refused an opportunity
// -----------------------------------------------------------------------------
// None is used only on approved decisions.
// -----------------------------------------------------------------------------
enum class RejectReason {
  None,
  ConcurrencyCapReached,
  DailyLimitReached,
  CircuitBreakerHalted,
  SizeBelowMinimum,
  InstrumentAlreadyOpen,
};

inline const char* rejectReasonToString(RejectReason r) {
  switch (r) {
    case RejectReason::None:                  return "None";
    case RejectReason::ConcurrencyCapReached: return "ConcurrencyCapReached";
    case RejectReason::DailyLimitReached:     return "DailyLimitReached";
    case RejectReason::CircuitBreakerHalted:  return "CircuitBreakerHalted";
    case RejectReason::SizeBelowMinimum:      return "SizeBelowMinimum";
    case RejectReason::InstrumentAlreadyOpen: return "InstrumentAlreadyOpen";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace micro
