#include "micro/risk/risk_manager.hpp"

#include "micro/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor: open the first trading day and session at initial_balance
// -----------------------------------------------------------------------------
RiskManager::RiskManager(EventBus& bus, const ITimeProvider& clock,
                         const domain::RiskLimits& limits,
                         double initial_balance)
    : bus_(bus), clock_(clock), limits_(limits) {
  double start = std::max(0.0, initial_balance);
  account_.balance = start;
  account_.peak_balance = start;
  account_.day_start_balance = start;
  account_.session_start_balance = start;
  account_.trading_day = trading_day(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// admit(): gate one opportunity and reserve on approval
// -----------------------------------------------------------------------------
GateDecision RiskManager::admit(const domain::Opportunity& opportunity) {
  std::vector<Event> events;
  GateDecision decision;
  {
    std::lock_guard lock(mutex_);
    rollDayLocked(events);
    decision = decideLocked(opportunity);
  }

  if (decision.approved) {
    std::cout << "[RiskManager] APPROVED " << opportunity.instrument.id << " "
              << domain::directionToString(opportunity.direction)
              << " size=" << decision.size
              << " confidence=" << opportunity.confidence << "\n";
  } else {
    std::cout << "[RiskManager] REJECTED " << opportunity.instrument.id
              << ": " << domain::rejectReasonToString(decision.reason)
              << "\n";
  }

  GateDecisionEvent ev;
  ev.instrument_id = opportunity.instrument.id;
  ev.direction = opportunity.direction;
  ev.score = opportunity.score;
  ev.confidence = opportunity.confidence;
  ev.approved = decision.approved;
  ev.size = decision.size;
  ev.reason = decision.reason;
  ev.timestamp_ms = clock_.now_ms();
  events.push_back(ev);

  publishAll(events);
  return decision;
}

GateDecision RiskManager::decideLocked(const domain::Opportunity& opp) {
  GateDecision d;

  if (state_ == domain::RiskState::Halted) {
    d.reason = domain::RejectReason::CircuitBreakerHalted;
    return d;
  }
  if (state_ == domain::RiskState::DayLimitReached) {
    d.reason = domain::RejectReason::DailyLimitReached;
    return d;
  }
  if (instrumentBusyLocked(opp.instrument.id)) {
    d.reason = domain::RejectReason::InstrumentAlreadyOpen;
    return d;
  }
  if (static_cast<int>(open_.size() + reservations_.size()) >=
      limits_.max_concurrent_positions) {
    d.reason = domain::RejectReason::ConcurrencyCapReached;
    return d;
  }

  double size = std::clamp(opp.confidence * limits_.max_position_size,
                           limits_.min_position_size,
                           limits_.max_position_size);
  double free_capital = account_.balance - committedCapitalLocked() -
                        reservedCapitalLocked();
  size = std::min(size, free_capital);

  double floor = std::max(limits_.min_position_size, opp.instrument.min_size);
  if (size < floor) {
    d.reason = domain::RejectReason::SizeBelowMinimum;
    return d;
  }

  ReservationId id = next_reservation_++;
  reservations_[id] = Reservation{opp.instrument.id, size};

  d.approved = true;
  d.size = size;
  d.reservation = id;
  return d;
}

// -----------------------------------------------------------------------------
// commit() / release()
// -----------------------------------------------------------------------------
bool RiskManager::commit(ReservationId reservation,
                         const domain::Position& position) {
  {
    std::lock_guard lock(mutex_);
    auto it = reservations_.find(reservation);
    if (it == reservations_.end()) {
      std::cerr << "[RiskManager] commit of unknown reservation "
                << reservation << " for " << position.instrument_id << "\n";
      return false;
    }
    reservations_.erase(it);

    domain::Position committed = position;
    committed.status = domain::PositionStatus::Open;
    if (state_ == domain::RiskState::Halted) {
      committed.forced_close = true;
    }
    open_[committed.id] = committed;
    account_.open_positions = static_cast<int>(open_.size());
  }
  return true;
}

void RiskManager::release(ReservationId reservation) {
  std::lock_guard lock(mutex_);
  reservations_.erase(reservation);
}

// -----------------------------------------------------------------------------
// Position lifecycle
// -----------------------------------------------------------------------------
std::vector<domain::Position> RiskManager::openPositions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(open_.size());
  for (const auto& [id, pos] : open_) {
    out.push_back(pos);
  }
  return out;
}

std::optional<domain::Position> RiskManager::position(
    domain::PositionId id) const {
  std::lock_guard lock(mutex_);
  auto it = open_.find(id);
  if (it == open_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Position> RiskManager::beginClose(
    domain::PositionId id, domain::CloseReason reason) {
  std::lock_guard lock(mutex_);
  auto it = open_.find(id);
  if (it == open_.end() ||
      it->second.status != domain::PositionStatus::Open) {
    return std::nullopt;
  }
  it->second.status = domain::PositionStatus::Closing;
  it->second.close_reason = reason;
  return it->second;
}

void RiskManager::abortClose(domain::PositionId id) {
  std::lock_guard lock(mutex_);
  auto it = open_.find(id);
  if (it != open_.end() &&
      it->second.status == domain::PositionStatus::Closing) {
    it->second.status = domain::PositionStatus::Open;
  }
}

std::optional<domain::ClosedTrade> RiskManager::completeClose(
    domain::PositionId id, double exit_price) {
  std::vector<Event> events;
  domain::ClosedTrade trade;
  double balance_after = 0.0;
  {
    std::lock_guard lock(mutex_);
    auto it = open_.find(id);
    if (it == open_.end() ||
        it->second.status != domain::PositionStatus::Closing) {
      return std::nullopt;
    }
    const domain::Position& pos = it->second;

    trade.position_id = pos.id;
    trade.instrument_id = pos.instrument_id;
    trade.direction = pos.direction;
    trade.size = pos.size;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.realized_pnl = domain::realizedPnl(pos.direction, pos.size,
                                             pos.entry_price, exit_price);
    trade.reason = pos.close_reason;
    trade.opened_at_ms = pos.opened_at_ms;
    trade.closed_at_ms = clock_.now_ms();

    open_.erase(it);
    account_.open_positions = static_cast<int>(open_.size());
    ++settled_closes_;

    account_.balance = std::max(0.0, account_.balance + trade.realized_pnl);
    account_.peak_balance = std::max(account_.peak_balance, account_.balance);
    account_.daily_pnl += trade.realized_pnl;
    account_.session_realized_pnl += trade.realized_pnl;
    balance_after = account_.balance;

    evaluateLocked(events);
  }

  std::cout << "[RiskManager] CLOSED " << trade.instrument_id << " #"
            << trade.position_id << " "
            << domain::closeReasonToString(trade.reason)
            << " pnl=" << trade.realized_pnl << " balance=" << balance_after
            << "\n";

  // The close event goes out before any transition it caused.
  events.insert(events.begin(), PositionClosedEvent{trade, balance_after});
  publishAll(events);
  return trade;
}

void RiskManager::forceCloseAll() {
  std::lock_guard lock(mutex_);
  flagAllForcedLocked();
}

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
bool RiskManager::updateBalance(double balance) {
  std::vector<Event> events;
  bool applied = false;
  {
    std::lock_guard lock(mutex_);
    applied = applyBalanceLocked(balance, events);
  }
  publishAll(events);
  return applied;
}

bool RiskManager::updateBalance(double balance,
                                std::uint64_t settled_closes) {
  std::vector<Event> events;
  bool applied = false;
  {
    std::lock_guard lock(mutex_);
    if (settled_closes != settled_closes_) {
      std::cout << "[RiskManager] venue balance " << balance
                << " ignored: a close settled while it was read\n";
      return false;
    }
    applied = applyBalanceLocked(balance, events);
  }
  publishAll(events);
  return applied;
}

std::uint64_t RiskManager::settledCloses() const {
  std::lock_guard lock(mutex_);
  return settled_closes_;
}

void RiskManager::rollDayIfNeeded() {
  std::vector<Event> events;
  {
    std::lock_guard lock(mutex_);
    rollDayLocked(events);
  }
  publishAll(events);
}

domain::AccountState RiskManager::account() const {
  std::lock_guard lock(mutex_);
  return account_;
}

domain::RiskState RiskManager::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool RiskManager::isHalted() const {
  return state() == domain::RiskState::Halted;
}

std::size_t RiskManager::reservationCount() const {
  std::lock_guard lock(mutex_);
  return reservations_.size();
}

// -----------------------------------------------------------------------------
// Manual control
// -----------------------------------------------------------------------------
void RiskManager::haltTrading(const std::string& reason) {
  std::vector<Event> events;
  {
    std::lock_guard lock(mutex_);
    if (state_ == domain::RiskState::Halted) {
      return;
    }
    transitionLocked(domain::RiskState::Halted, reason, events);
  }
  publishAll(events);
}

bool RiskManager::resume() {
  std::vector<Event> events;
  {
    std::lock_guard lock(mutex_);
    if (state_ != domain::RiskState::Halted) {
      return false;
    }
    account_.peak_balance = account_.balance;
    account_.session_start_balance = account_.balance;
    account_.session_realized_pnl = 0.0;
    transitionLocked(domain::RiskState::Normal, "manual resume", events);

    // The daily limit is independent of the breaker; it may still apply.
    evaluateLocked(events);
  }
  publishAll(events);
  return true;
}

// -----------------------------------------------------------------------------
// Private helpers (mutex_ held)
// -----------------------------------------------------------------------------
double RiskManager::committedCapitalLocked() const {
  double sum = 0.0;
  for (const auto& [id, pos] : open_) {
    sum += pos.size;
  }
  return sum;
}

double RiskManager::reservedCapitalLocked() const {
  double sum = 0.0;
  for (const auto& [id, r] : reservations_) {
    sum += r.size;
  }
  return sum;
}

bool RiskManager::instrumentBusyLocked(const std::string& instrument_id) const {
  for (const auto& [id, pos] : open_) {
    if (pos.instrument_id == instrument_id) {
      return true;
    }
  }
  for (const auto& [id, r] : reservations_) {
    if (r.instrument_id == instrument_id) {
      return true;
    }
  }
  return false;
}

bool RiskManager::anyClosingLocked() const {
  for (const auto& [id, pos] : open_) {
    if (pos.status == domain::PositionStatus::Closing) {
      return true;
    }
  }
  return false;
}

bool RiskManager::applyBalanceLocked(double balance,
                                     std::vector<Event>& events) {
  if (anyClosingLocked()) {
    std::cout << "[RiskManager] venue balance " << balance
              << " ignored: close in progress\n";
    return false;
  }
  if (balance < 0.0) {
    std::cerr << "[RiskManager] WARNING: negative balance " << balance
              << " reported, clamping to 0\n";
    balance = 0.0;
  }
  account_.balance = balance;
  account_.peak_balance = std::max(account_.peak_balance, balance);
  evaluateLocked(events);
  return true;
}

void RiskManager::rollDayLocked(std::vector<Event>& events) {
  std::int64_t today = trading_day(clock_.now_ms());
  if (today == account_.trading_day) {
    return;
  }

  std::cout << "[RiskManager] trading day rollover " << account_.trading_day
            << " -> " << today << " (daily pnl " << account_.daily_pnl
            << ")\n";
  account_.trading_day = today;
  account_.day_start_balance = account_.balance;
  account_.daily_pnl = 0.0;

  if (state_ == domain::RiskState::DayLimitReached) {
    transitionLocked(domain::RiskState::Normal, "trading day rollover",
                     events);
  }
}

void RiskManager::evaluateLocked(std::vector<Event>& events) {
  if (state_ != domain::RiskState::Halted) {
    double drawdown = account_.peak_balance > 0.0
                          ? (account_.peak_balance - account_.balance) /
                                account_.peak_balance
                          : 0.0;
    if (drawdown >= limits_.max_drawdown_fraction) {
      transitionLocked(domain::RiskState::Halted,
                       "max drawdown " + std::to_string(drawdown * 100.0) +
                           "% from peak " +
                           std::to_string(account_.peak_balance),
                       events);
      return;
    }

    if (account_.session_start_balance > 0.0 &&
        account_.session_realized_pnl <=
            -limits_.circuit_breaker_loss_fraction *
                account_.session_start_balance) {
      transitionLocked(domain::RiskState::Halted,
                       "loss circuit breaker, session pnl " +
                           std::to_string(account_.session_realized_pnl),
                       events);
      return;
    }
  }

  if (state_ == domain::RiskState::Normal &&
      account_.day_start_balance > 0.0 &&
      account_.daily_pnl <=
          -limits_.daily_loss_fraction * account_.day_start_balance) {
    transitionLocked(domain::RiskState::DayLimitReached,
                     "daily loss limit, daily pnl " +
                         std::to_string(account_.daily_pnl),
                     events);
  }
}

void RiskManager::transitionLocked(domain::RiskState next,
                                   const std::string& reason,
                                   std::vector<Event>& events) {
  domain::RiskState prev = state_;
  if (prev == next) {
    return;
  }
  state_ = next;

  if (next == domain::RiskState::Halted) {
    flagAllForcedLocked();
    std::cerr << "[RiskManager] CRITICAL: " << reason
              << ". ALL TRADING HALTED, " << open_.size()
              << " position(s) flagged for forced close.\n";
  } else {
    std::cout << "[RiskManager] " << domain::riskStateToString(prev)
              << " -> " << domain::riskStateToString(next) << " (" << reason
              << ")\n";
  }

  RiskStateChangedEvent ev;
  ev.previous = prev;
  ev.current = next;
  ev.reason = reason;
  ev.balance = account_.balance;
  ev.peak_balance = account_.peak_balance;
  ev.timestamp_ms = clock_.now_ms();
  events.push_back(ev);
}

void RiskManager::flagAllForcedLocked() {
  for (auto& [id, pos] : open_) {
    pos.forced_close = true;
  }
}

void RiskManager::publishAll(const std::vector<Event>& events) {
  for (const auto& e : events) {
    bus_.publish(e);
  }
}

}  // namespace micro
