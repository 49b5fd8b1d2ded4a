#include "micro/gateway/paper_market_gateway.hpp"

#include "micro/domain/position.hpp"

#include <iostream>

namespace micro {

PaperMarketGateway::PaperMarketGateway(IMarketGateway& market_data,
                                       double initial_balance)
    : market_data_(market_data), balance_(initial_balance) {}

std::vector<domain::Instrument> PaperMarketGateway::listInstruments() {
  return market_data_.listInstruments();
}

domain::MarketSnapshot PaperMarketGateway::getMarketData(
    const std::string& instrument_id) {
  return market_data_.getMarketData(instrument_id);
}

// -----------------------------------------------------------------------------
// placeOrder(): paper fill at the delegate's last price
// -----------------------------------------------------------------------------
OrderAck PaperMarketGateway::placeOrder(const OrderRequest& request) {
  {
    std::lock_guard lock(mutex_);
    auto known = acks_by_client_id_.find(request.client_order_id);
    if (known != acks_by_client_id_.end()) {
      return known->second;
    }
    if (request.size > balance_) {
      throw GatewayError(GatewayErrorKind::InsufficientFunds,
                         "paper balance too low for " +
                             request.client_order_id);
    }
  }

  // Market data errors (Timeout, NotFound, ...) propagate unchanged.
  domain::MarketSnapshot snap = market_data_.getMarketData(request.instrument_id);
  if (snap.last_price <= 0.0) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       "no price for " + request.instrument_id);
  }

  std::lock_guard lock(mutex_);
  auto known = acks_by_client_id_.find(request.client_order_id);
  if (known != acks_by_client_id_.end()) {
    return known->second;
  }

  OrderAck ack;
  ack.order_id = "paper-" + std::to_string(next_seq_++);
  ack.fill_price = snap.last_price;

  open_[ack.order_id] =
      PaperPosition{request.client_order_id, request.instrument_id,
                    request.direction, request.size, ack.fill_price};
  acks_by_client_id_[request.client_order_id] = ack;

  std::cout << "[PaperMarketGateway] DRY RUN fill "
            << domain::directionToString(request.direction) << " "
            << request.instrument_id << " size=" << request.size
            << " @ " << ack.fill_price << " (" << ack.order_id << ")\n";
  return ack;
}

// -----------------------------------------------------------------------------
// closePosition(): paper close, realized PnL credited to the paper balance
// -----------------------------------------------------------------------------
CloseConfirmation PaperMarketGateway::closePosition(
    const std::string& order_id, const std::string& instrument_id) {
  {
    std::lock_guard lock(mutex_);
    if (open_.find(order_id) == open_.end()) {
      throw GatewayError(GatewayErrorKind::AlreadyClosed, order_id);
    }
  }

  domain::MarketSnapshot snap = market_data_.getMarketData(instrument_id);

  std::lock_guard lock(mutex_);
  auto it = open_.find(order_id);
  if (it == open_.end()) {
    throw GatewayError(GatewayErrorKind::AlreadyClosed, order_id);
  }

  const PaperPosition& pos = it->second;
  double fill = snap.last_price > 0.0 ? snap.last_price : pos.entry_price;
  double pnl = domain::realizedPnl(pos.direction, pos.size, pos.entry_price,
                                   fill);
  balance_ += pnl;
  acks_by_client_id_.erase(pos.client_order_id);
  open_.erase(it);

  std::cout << "[PaperMarketGateway] DRY RUN close " << order_id << " "
            << instrument_id << " @ " << fill << " pnl=" << pnl << "\n";
  return CloseConfirmation{fill};
}

double PaperMarketGateway::getBalance() {
  std::lock_guard lock(mutex_);
  return balance_;
}

std::size_t PaperMarketGateway::knownClientIds() const {
  std::lock_guard lock(mutex_);
  return acks_by_client_id_.size();
}

}  // namespace micro
