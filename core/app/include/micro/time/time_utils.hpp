#pragma once

#include <cstdint>

namespace micro {

// -----------------------------------------------------------------------------
// Trading-day utilities
// -----------------------------------------------------------------------------
//
// @brief  Trading-day arithmetic on epoch milliseconds from ITimeProvider.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerDay = 86'400'000;

// -------------------------------------------------------------------------
// trading_day
// -------------------------------------------------------------------------
// @brief  UTC day index of an epoch-millisecond timestamp.
//
// @details
// The trading day rolls over at 00:00 UTC. Two timestamps belong to the same
// trading day iff their trading_day() values are equal. Negative inputs are
// floored so that the day index stays monotonic across the epoch.
// -------------------------------------------------------------------------
inline std::int64_t trading_day(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms < 0 && epoch_ms % kMillisPerDay != 0) {
    --day;
  }
  return day;
}

}  // namespace micro
