#pragma once

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus: position lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates the states a position occupies between its opening fill
//         and its closing fill.
//
// @details
// The legal transition graph is enforced by RiskManager (the only writer of
// the open-position set):
//
//   Open ──────> Closing ──────> Closed
//     ▲             │
//     └─────────────┘   (close submission failed, retried on next poll)
//
// Closing is entered BEFORE the closing order is submitted so that a second
// monitor pass (or a concurrent shutdown) never submits a duplicate close.
// Closed is terminal: the position is removed from the open set and a
// ClosedTrade record is produced. A Closed position never re-opens.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  Closing,
  Closed,
};

inline const char* positionStatusToString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:    return "Open";
    case PositionStatus::Closing: return "Closing";
    case PositionStatus::Closed:  return "Closed";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// CloseReason: why the Position Monitor exited a position
// -----------------------------------------------------------------------------
// Listed in evaluation priority order (ForcedClose wins over StopLoss, etc.).
// -----------------------------------------------------------------------------
enum class CloseReason {
  None,
  ForcedClose,
  StopLoss,
  TakeProfit,
  TimeStop,
};

inline const char* closeReasonToString(CloseReason r) {
  switch (r) {
    case CloseReason::None:        return "None";
    case CloseReason::ForcedClose: return "ForcedClose";
    case CloseReason::StopLoss:    return "StopLoss";
    case CloseReason::TakeProfit:  return "TakeProfit";
    case CloseReason::TimeStop:    return "TimeStop";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace micro
