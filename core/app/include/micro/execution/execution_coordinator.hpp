#pragma once

#include "micro/concurrent/id_generator.hpp"
#include "micro/config/engine_config.hpp"
#include "micro/domain/opportunity.hpp"
#include "micro/domain/position.hpp"
#include "micro/eventbus/event_bus.hpp"
#include "micro/gateway/i_market_gateway.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace micro {

// Stop-loss and take-profit prices for an entry.
struct ExitLevels {
  double stop_loss{0.0};
  double take_profit{0.0};
};

// -----------------------------------------------------------------------------
// ExecutionCoordinator
// -----------------------------------------------------------------------------
//
// @brief  Gates ranked opportunities through the RiskManager and submits the
//         approved ones to the venue.
//
// @details
// Per opportunity, in rank order:
//
//   1. RiskManager::admit(). Rejections stop here (already recorded).
//   2. Claim the instrument's in-flight slot; a second concurrent order for
//      the same instrument is refused.
//   3. placeOrder() with client order id "<instrument>-<cycleTsMs>". The
//      same id is sent on every retry, so a retry after a lost reply cannot
//      open a second position. Timeout / RateLimited are retried with
//      doubling backoff up to orderRetryAttempts; other errors are final.
//   4. On fill: a Position with SL/TP derived from the fill price is
//      committed to the open set and a PositionOpenedEvent is published.
//      On failure the reservation is released.
//
// The reservation is released on every exit path that does not commit,
// including unexpected exceptions.
//
// Thread model: runs on the scan worker. The in-flight set has its own mutex
// because shutdown may query inFlightCount() from another thread.
//
// Ownership:
//   Owned by the Scheduler; every reference outlives it.
// -----------------------------------------------------------------------------
class ExecutionCoordinator {
 public:
  ExecutionCoordinator(IMarketGateway& gateway, RiskManager& risk,
                       EventBus& bus, IdGenerator& ids,
                       const ITimeProvider& clock, const EngineConfig& config);

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // -------------------------------------------------------------------------
  // executeRanked(ranked, cycle_ts_ms)
  // -------------------------------------------------------------------------
  // Gates and executes `ranked` (best first). Every opportunity is gated, so
  // each one yields a decision, but only approved ones reach the venue.
  //
  // `cancelled` is checked before each opportunity; once it returns true
  // nothing further is gated or submitted. The Scheduler passes its
  // shutdown flag.
  //
  // @return number of positions opened.
  // -------------------------------------------------------------------------
  std::size_t executeRanked(const std::vector<domain::Opportunity>& ranked,
                            std::int64_t cycle_ts_ms,
                            const std::function<bool()>& cancelled = {});

  // Submits one already approved opportunity. Consumes the reservation.
  std::optional<domain::Position> execute(
      const domain::Opportunity& opportunity, const GateDecision& decision,
      std::int64_t cycle_ts_ms);

  std::size_t inFlightCount() const;

  static std::string clientOrderId(const std::string& instrument_id,
                                   std::int64_t cycle_ts_ms);

  static ExitLevels exitLevels(domain::Direction direction, double entry_price,
                               const domain::RiskLimits& limits);

 private:
  bool claimInFlight(const std::string& instrument_id);
  void releaseInFlight(const std::string& instrument_id);

  IMarketGateway& gateway_;
  RiskManager& risk_;
  EventBus& bus_;
  IdGenerator& ids_;
  const ITimeProvider& clock_;
  const EngineConfig& config_;

  mutable std::mutex in_flight_mutex_;
  std::set<std::string> in_flight_;
};

}  // namespace micro
