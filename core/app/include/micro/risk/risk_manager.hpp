#pragma once

#include "micro/domain/account_state.hpp"
#include "micro/domain/gate_decision.hpp"
#include "micro/domain/opportunity.hpp"
#include "micro/domain/position.hpp"
#include "micro/domain/risk_limits.hpp"
#include "micro/eventbus/event_bus.hpp"
#include "micro/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace micro {

using ReservationId = std::uint64_t;

// -----------------------------------------------------------------------------
// GateDecision: result of RiskManager::admit()
// -----------------------------------------------------------------------------
// Approved decisions carry the granted size and the reservation that holds
// capital and a concurrency slot for it. The reservation must end in exactly
// one commit() or release().
// -----------------------------------------------------------------------------
struct GateDecision {
  bool approved{false};
  double size{0.0};
  domain::RejectReason reason{domain::RejectReason::None};
  ReservationId reservation{0};
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  The safety core: owns AccountState and the open-position set and
//         is the only code that mutates either.
//
// @details
// State machine:
//
//   Normal ──daily PnL <= -dailyLoss × dayStart──────► DayLimitReached
//   Normal | DayLimitReached
//          ──drawdown >= maxDrawdown──────────────────► Halted
//          ──session PnL <= -circuitBreaker × start───► Halted
//   DayLimitReached ──UTC day rollover────────────────► Normal
//   Halted ──resume() (IPC RESUME)────────────────────► Normal
//
// Entering Halted, by breach or by haltTrading(), flags every open position
// for forced close. Rollover while Halted resets the daily counters only.
// resume() re-bases peak and session start to the current balance.
//
// Gating (admit), in order:
//   Halted                                  -> CircuitBreakerHalted
//   DayLimitReached                         -> DailyLimitReached
//   instrument already open or reserved     -> InstrumentAlreadyOpen
//   open + reserved >= maxConcurrent        -> ConcurrencyCapReached
//   size = clamp(confidence × max, min, max), capped by free capital
//     (balance - open sizes - reserved sizes);
//   size < max(minPositionSize, instrument.min_size) -> SizeBelowMinimum
//
// Every decision is logged and published as a GateDecisionEvent. Every
// transition is published as a RiskStateChangedEvent.
//
// Position lifecycle accessors (used by the PositionMonitor):
//   beginClose()     Open    -> Closing
//   abortClose()     Closing -> Open   (close failed; retried next poll)
//   completeClose()  Closing -> Closed (removed; account updated)
//
// Thread model:
//   Called from the scan worker, the monitor worker, the snapshot worker and
//   the IPC thread. One mutex serializes every read and write of account
//   state, the open set and the reservations. Events are published after the
//   mutex is released, so subscribers may call back into the RiskManager.
//   No method calls the gateway.
//
// Ownership:
//   Owned by the Scheduler. Holds references to the EventBus and the time
//   provider; copies the limits.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  RiskManager(EventBus& bus, const ITimeProvider& clock,
              const domain::RiskLimits& limits, double initial_balance);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // --- Gating -----------------------------------------------------------------

  // -------------------------------------------------------------------------
  // admit(opportunity)
  // -------------------------------------------------------------------------
  // @return Approved(size, reservation) or Rejected(reason).
  //
  // An approval reserves capital and a slot before returning, so the next
  // admit() in the same cycle already sees them as taken.
  // -------------------------------------------------------------------------
  GateDecision admit(const domain::Opportunity& opportunity);

  // Turns a reservation into an open position. `position.size` must equal
  // the reserved size. If trading halted while the order was in flight the
  // position is committed already flagged for forced close.
  // @return false if the reservation is unknown (already committed or
  //         released); the position is not added.
  bool commit(ReservationId reservation, const domain::Position& position);

  // Drops a reservation whose order failed. Unknown ids are ignored.
  void release(ReservationId reservation);

  // --- Position lifecycle -------------------------------------------------------

  std::vector<domain::Position> openPositions() const;

  std::optional<domain::Position> position(domain::PositionId id) const;

  // Open -> Closing with `reason` recorded. std::nullopt if the position is
  // not Open (already closing, or gone).
  std::optional<domain::Position> beginClose(domain::PositionId id,
                                             domain::CloseReason reason);

  // Closing -> Open after a failed close. The close reason and the
  // forced-close flag are kept.
  void abortClose(domain::PositionId id);

  // Closing -> Closed: realized PnL at `exit_price`, balance, peak, daily
  // and session PnL updated together, position removed, limits
  // re-evaluated. std::nullopt if the position is not Closing.
  std::optional<domain::ClosedTrade> completeClose(domain::PositionId id,
                                                   double exit_price);

  // Flags every open position for forced close without changing the risk
  // state (shutdown path).
  void forceCloseAll();

  // --- Account --------------------------------------------------------------------

  // Balance reported by the venue. Negative values are clamped to 0. The
  // peak follows; a drawdown breach halts.
  //
  // The venue credits a close before completeClose() books it, so a venue
  // balance is refused while any position is Closing.
  // @return false if the balance was refused.
  bool updateBalance(double balance);

  // As above, and also refused if a close completed after
  // settledCloses() returned `settled_closes`. Take the count before
  // querying the venue.
  bool updateBalance(double balance, std::uint64_t settled_closes);

  // Number of closes completed so far.
  std::uint64_t settledCloses() const;

  // Resets the daily counters if the time provider has crossed a UTC day
  // boundary since the last call. Leaves DayLimitReached for Normal.
  void rollDayIfNeeded();

  domain::AccountState account() const;

  domain::RiskState state() const;

  bool isHalted() const;

  const domain::RiskLimits& limits() const { return limits_; }

  std::size_t reservationCount() const;

  // --- Manual control (IPC) ---------------------------------------------------------

  // Trips the circuit breaker by hand. No-op if already Halted.
  void haltTrading(const std::string& reason);

  // Leaves Halted. @return false if the engine was not Halted.
  bool resume();

 private:
  struct Reservation {
    std::string instrument_id;
    double size{0.0};
  };

  // --- All helpers below require mutex_ held ---------------------------------

  GateDecision decideLocked(const domain::Opportunity& opportunity);

  double committedCapitalLocked() const;
  double reservedCapitalLocked() const;
  bool instrumentBusyLocked(const std::string& instrument_id) const;
  bool anyClosingLocked() const;

  bool applyBalanceLocked(double balance, std::vector<Event>& events);

  void rollDayLocked(std::vector<Event>& events);

  // Checks drawdown, loss circuit breaker and daily limit after any account
  // change, appending transition events.
  void evaluateLocked(std::vector<Event>& events);

  void transitionLocked(domain::RiskState next, const std::string& reason,
                        std::vector<Event>& events);

  void flagAllForcedLocked();

  // Publishes outside the lock.
  void publishAll(const std::vector<Event>& events);

  EventBus& bus_;
  const ITimeProvider& clock_;
  const domain::RiskLimits limits_;

  mutable std::mutex mutex_;
  domain::AccountState account_;
  domain::RiskState state_{domain::RiskState::Normal};
  std::map<domain::PositionId, domain::Position> open_;
  std::map<ReservationId, Reservation> reservations_;
  ReservationId next_reservation_{1};
  std::uint64_t settled_closes_{0};
};

}  // namespace micro
