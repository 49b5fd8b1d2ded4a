#pragma once

#include "micro/config/engine_config.hpp"
#include "micro/domain/position.hpp"
#include "micro/gateway/i_market_gateway.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace micro {

// -----------------------------------------------------------------------------
// PositionMonitor
// -----------------------------------------------------------------------------
//
// @brief  Polls open positions and closes those whose exit rule fires.
//
// @details
// Exit rules, highest priority first:
//
//   ForcedClose  flagged by the RiskManager (Halted, or shutdown)
//   StopLoss     Long: price <= SL     Short: price >= SL
//   TakeProfit   Long: price >= TP     Short: price <= TP
//   TimeStop     held for >= maxHoldTime (0 disables)
//
// A position whose price cannot be fetched is left for the next poll,
// unless it is flagged for forced close or a previous close attempt already
// fired: those are closed without a fresh price.
//
// Close protocol, per position:
//   beginClose()      Open -> Closing, reason recorded
//   closePosition()   transient errors retried with backoff
//   completeClose()   at the venue's fill price
//
// On a final close error the position goes back to Open with its reason
// kept, so the next poll retries it. AlreadyClosed means the venue has no
// position left: it is recorded as closed at the last observed price (entry
// price if none was ever seen).
//
// Thread model: poll() runs on the monitor worker, and on the Scheduler's
// thread during shutdown after the workers are stopped. The last-price cache
// has its own mutex.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  PositionMonitor(IMarketGateway& gateway, RiskManager& risk,
                  const ITimeProvider& clock, const EngineConfig& config);

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;

  // One pass over the open set. @return number of positions closed.
  std::size_t poll();

  // Pure exit rule evaluation. `price` is std::nullopt when the fetch
  // failed, in which case the price rules cannot fire.
  static domain::CloseReason exitReason(const domain::Position& position,
                                        std::optional<double> price,
                                        std::int64_t now_ms,
                                        const domain::RiskLimits& limits);

 private:
  std::optional<double> fetchPrice(const domain::Position& position);

  // Runs the close protocol. @return true if the position reached Closed.
  bool close(const domain::Position& position, domain::CloseReason reason);

  double lastObservedPrice(const domain::Position& position) const;

  IMarketGateway& gateway_;
  RiskManager& risk_;
  const ITimeProvider& clock_;
  const EngineConfig& config_;

  mutable std::mutex prices_mutex_;
  std::map<domain::PositionId, double> last_prices_;
};

}  // namespace micro
