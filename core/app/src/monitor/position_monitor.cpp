#include "micro/monitor/position_monitor.hpp"

#include "micro/gateway/retry.hpp"

#include <exception>
#include <iostream>
#include <vector>

namespace micro {

PositionMonitor::PositionMonitor(IMarketGateway& gateway, RiskManager& risk,
                                 const ITimeProvider& clock,
                                 const EngineConfig& config)
    : gateway_(gateway), risk_(risk), clock_(clock), config_(config) {}

// -----------------------------------------------------------------------------
// poll(): evaluate every Open position once
// -----------------------------------------------------------------------------
std::size_t PositionMonitor::poll() {
  std::vector<domain::Position> positions = risk_.openPositions();
  std::size_t closed = 0;

  for (const auto& pos : positions) {
    if (pos.status != domain::PositionStatus::Open) {
      continue;
    }

    std::optional<double> price = fetchPrice(pos);
    domain::CloseReason reason =
        exitReason(pos, price, clock_.now_ms(), config_.limits);

    // A close that fired on an earlier poll and failed is retried as is.
    if (reason == domain::CloseReason::None &&
        pos.close_reason != domain::CloseReason::None) {
      reason = pos.close_reason;
    }
    if (reason == domain::CloseReason::None) {
      continue;
    }

    if (close(pos, reason)) {
      ++closed;
    }
  }

  // Forget prices of positions that are gone.
  std::lock_guard lock(prices_mutex_);
  for (auto it = last_prices_.begin(); it != last_prices_.end();) {
    if (!risk_.position(it->first)) {
      it = last_prices_.erase(it);
    } else {
      ++it;
    }
  }
  return closed;
}

// -----------------------------------------------------------------------------
// exitReason(): forced > stop-loss > take-profit > time stop
// -----------------------------------------------------------------------------
domain::CloseReason PositionMonitor::exitReason(
    const domain::Position& pos, std::optional<double> price,
    std::int64_t now_ms, const domain::RiskLimits& limits) {
  if (pos.forced_close) {
    return domain::CloseReason::ForcedClose;
  }

  if (price) {
    bool is_long = pos.direction == domain::Direction::Long;
    if (is_long ? *price <= pos.stop_loss : *price >= pos.stop_loss) {
      return domain::CloseReason::StopLoss;
    }
    if (is_long ? *price >= pos.take_profit : *price <= pos.take_profit) {
      return domain::CloseReason::TakeProfit;
    }
    if (limits.max_hold_time_ms > 0 &&
        now_ms - pos.opened_at_ms >= limits.max_hold_time_ms) {
      return domain::CloseReason::TimeStop;
    }
  }
  return domain::CloseReason::None;
}

std::optional<double> PositionMonitor::fetchPrice(
    const domain::Position& pos) {
  try {
    domain::MarketSnapshot snap = withTransientRetry(
        config_.order_retry_attempts, config_.retry_backoff_ms,
        "getMarketData " + pos.instrument_id,
        [&] { return gateway_.getMarketData(pos.instrument_id); });
    if (snap.last_price <= 0.0) {
      return std::nullopt;
    }
    std::lock_guard lock(prices_mutex_);
    last_prices_[pos.id] = snap.last_price;
    return snap.last_price;
  } catch (const GatewayError& e) {
    std::cerr << "[PositionMonitor] no price for #" << pos.id << " "
              << pos.instrument_id << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// close(): Open -> Closing -> Closed, or back to Open on failure
// -----------------------------------------------------------------------------
bool PositionMonitor::close(const domain::Position& pos,
                            domain::CloseReason reason) {
  std::optional<domain::Position> closing = risk_.beginClose(pos.id, reason);
  if (!closing) {
    return false;
  }

  std::cout << "[PositionMonitor] closing #" << pos.id << " "
            << pos.instrument_id << " ("
            << domain::closeReasonToString(reason) << ")\n";

  double fill = 0.0;
  try {
    CloseConfirmation conf = withTransientRetry(
        config_.order_retry_attempts, config_.retry_backoff_ms,
        "closePosition " + pos.order_id,
        [&] { return gateway_.closePosition(pos.order_id, pos.instrument_id); });
    fill = conf.fill_price > 0.0 ? conf.fill_price : lastObservedPrice(pos);
  } catch (const GatewayError& e) {
    if (e.kind() != GatewayErrorKind::AlreadyClosed) {
      std::cerr << "[PositionMonitor] close of #" << pos.id
                << " failed, will retry: " << e.what() << "\n";
      risk_.abortClose(pos.id);
      return false;
    }
    fill = lastObservedPrice(pos);
    std::cerr << "[PositionMonitor] #" << pos.id
              << " already closed at venue, booking at " << fill << "\n";
  } catch (const std::exception&) {
    // Not left stuck in Closing; the activity logs the error.
    risk_.abortClose(pos.id);
    throw;
  }

  return risk_.completeClose(pos.id, fill).has_value();
}

double PositionMonitor::lastObservedPrice(const domain::Position& pos) const {
  std::lock_guard lock(prices_mutex_);
  auto it = last_prices_.find(pos.id);
  return it != last_prices_.end() ? it->second : pos.entry_price;
}

}  // namespace micro
