#include "micro/execution/execution_coordinator.hpp"

#include "micro/gateway/retry.hpp"

#include <functional>
#include <iostream>
#include <utility>

namespace micro {

namespace {

// Releases the reservation and the in-flight claim unless the position was
// committed. Covers every early return and any exception from the gateway.
class PendingOrder {
 public:
  PendingOrder(RiskManager& risk, ReservationId reservation,
               std::function<void()> release_in_flight)
      : risk_(risk),
        reservation_(reservation),
        release_in_flight_(std::move(release_in_flight)) {}

  ~PendingOrder() {
    if (!committed_) {
      risk_.release(reservation_);
    }
    release_in_flight_();
  }

  PendingOrder(const PendingOrder&) = delete;
  PendingOrder& operator=(const PendingOrder&) = delete;

  void markCommitted() { committed_ = true; }

 private:
  RiskManager& risk_;
  ReservationId reservation_;
  std::function<void()> release_in_flight_;
  bool committed_{false};
};

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(IMarketGateway& gateway,
                                           RiskManager& risk, EventBus& bus,
                                           IdGenerator& ids,
                                           const ITimeProvider& clock,
                                           const EngineConfig& config)
    : gateway_(gateway),
      risk_(risk),
      bus_(bus),
      ids_(ids),
      clock_(clock),
      config_(config) {}

// -----------------------------------------------------------------------------
// executeRanked(): gate then submit, strictly in rank order
// -----------------------------------------------------------------------------
std::size_t ExecutionCoordinator::executeRanked(
    const std::vector<domain::Opportunity>& ranked, std::int64_t cycle_ts_ms,
    const std::function<bool()>& cancelled) {
  std::size_t opened = 0;
  for (const auto& opp : ranked) {
    if (cancelled && cancelled()) {
      std::cout << "[ExecutionCoordinator] cycle " << cycle_ts_ms
                << " cancelled after " << opened << " entr"
                << (opened == 1 ? "y" : "ies") << "\n";
      break;
    }
    GateDecision decision = risk_.admit(opp);
    if (!decision.approved) {
      continue;
    }
    if (execute(opp, decision, cycle_ts_ms)) {
      ++opened;
    }
  }
  return opened;
}

// -----------------------------------------------------------------------------
// execute(): one order, bounded retry, commit or release
// -----------------------------------------------------------------------------
std::optional<domain::Position> ExecutionCoordinator::execute(
    const domain::Opportunity& opp, const GateDecision& decision,
    std::int64_t cycle_ts_ms) {
  const std::string& instrument_id = opp.instrument.id;

  if (!claimInFlight(instrument_id)) {
    std::cerr << "[ExecutionCoordinator] order already in flight for "
              << instrument_id << ", dropping\n";
    risk_.release(decision.reservation);
    return std::nullopt;
  }
  PendingOrder pending(risk_, decision.reservation,
                       [this, instrument_id] { releaseInFlight(instrument_id); });

  ExitLevels levels =
      exitLevels(opp.direction, opp.entry_price, config_.limits);

  OrderRequest request;
  request.instrument_id = instrument_id;
  request.direction = opp.direction;
  request.size = decision.size;
  request.stop_loss = levels.stop_loss;
  request.take_profit = levels.take_profit;
  request.client_order_id = clientOrderId(instrument_id, cycle_ts_ms);

  OrderAck ack;
  try {
    ack = withTransientRetry(config_.order_retry_attempts,
                             config_.retry_backoff_ms,
                             "placeOrder " + request.client_order_id,
                             [&] { return gateway_.placeOrder(request); });
  } catch (const GatewayError& e) {
    std::cerr << "[ExecutionCoordinator] order " << request.client_order_id
              << " dropped: " << e.what() << "\n";
    return std::nullopt;
  }

  double entry = ack.fill_price > 0.0 ? ack.fill_price : opp.entry_price;
  ExitLevels filled_levels = exitLevels(opp.direction, entry, config_.limits);

  domain::Position pos;
  pos.id = ids_.next_id();
  pos.instrument_id = instrument_id;
  pos.direction = opp.direction;
  pos.entry_price = entry;
  pos.size = decision.size;
  pos.stop_loss = filled_levels.stop_loss;
  pos.take_profit = filled_levels.take_profit;
  pos.opened_at_ms = clock_.now_ms();
  pos.order_id = ack.order_id;

  if (!risk_.commit(decision.reservation, pos)) {
    std::cerr << "[ExecutionCoordinator] CRITICAL: venue order "
              << ack.order_id << " for " << instrument_id
              << " filled but could not be committed\n";
    return std::nullopt;
  }
  pending.markCommitted();

  std::optional<domain::Position> committed = risk_.position(pos.id);
  if (committed) {
    pos = *committed;
  }

  std::cout << "[ExecutionCoordinator] OPENED #" << pos.id << " "
            << instrument_id << " "
            << domain::directionToString(pos.direction) << " size=" << pos.size
            << " @ " << pos.entry_price << " SL=" << pos.stop_loss
            << " TP=" << pos.take_profit << " (" << pos.order_id << ")\n";

  bus_.publish(PositionOpenedEvent{pos, pos.opened_at_ms});
  return pos;
}

std::size_t ExecutionCoordinator::inFlightCount() const {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.size();
}

std::string ExecutionCoordinator::clientOrderId(
    const std::string& instrument_id, std::int64_t cycle_ts_ms) {
  return instrument_id + "-" + std::to_string(cycle_ts_ms);
}

ExitLevels ExecutionCoordinator::exitLevels(domain::Direction direction,
                                            double entry_price,
                                            const domain::RiskLimits& limits) {
  ExitLevels levels;
  if (direction == domain::Direction::Long) {
    levels.stop_loss = entry_price * (1.0 - limits.stop_loss_fraction);
    levels.take_profit = entry_price * (1.0 + limits.take_profit_fraction);
  } else {
    levels.stop_loss = entry_price * (1.0 + limits.stop_loss_fraction);
    levels.take_profit = entry_price * (1.0 - limits.take_profit_fraction);
  }
  return levels;
}

bool ExecutionCoordinator::claimInFlight(const std::string& instrument_id) {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.insert(instrument_id).second;
}

void ExecutionCoordinator::releaseInFlight(const std::string& instrument_id) {
  std::lock_guard lock(in_flight_mutex_);
  in_flight_.erase(instrument_id);
}

}  // namespace micro
