#include "micro/gateway/mock_market_gateway.hpp"

#include "micro/domain/position.hpp"

#include <stdexcept>
#include <utility>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MockMarketGateway::MockMarketGateway(const ITimeProvider& clock,
                                     double balance)
    : clock_(clock), balance_(balance) {}

// -----------------------------------------------------------------------------
// Scripting
// -----------------------------------------------------------------------------
void MockMarketGateway::addInstrument(const domain::Instrument& instrument,
                                      double price, double spread) {
  std::lock_guard lock(mutex_);
  Book& book = books_[instrument.id];
  book.instrument = instrument;
  book.last_price = price;
  book.spread = spread;
}

void MockMarketGateway::removeInstrument(const std::string& instrument_id) {
  std::lock_guard lock(mutex_);
  books_.erase(instrument_id);
}

void MockMarketGateway::setPrice(const std::string& instrument_id,
                                 double price) {
  std::lock_guard lock(mutex_);
  bookFor(instrument_id).last_price = price;
}

void MockMarketGateway::setCandles(const std::string& instrument_id,
                                   std::vector<domain::Candle> candles) {
  std::lock_guard lock(mutex_);
  Book& book = bookFor(instrument_id);
  book.candles = std::move(candles);
  if (!book.candles.empty()) {
    book.last_price = book.candles.back().close;
  }
}

void MockMarketGateway::appendCandle(const std::string& instrument_id,
                                     const domain::Candle& candle,
                                     std::size_t max_history) {
  std::lock_guard lock(mutex_);
  Book& book = bookFor(instrument_id);
  book.candles.push_back(candle);
  if (book.candles.size() > max_history) {
    book.candles.erase(book.candles.begin(),
                       book.candles.begin() +
                           static_cast<std::ptrdiff_t>(book.candles.size() -
                                                       max_history));
  }
  book.last_price = candle.close;
}

void MockMarketGateway::setNextCloseFill(const std::string& instrument_id,
                                         double price) {
  std::lock_guard lock(mutex_);
  Book& book = bookFor(instrument_id);
  book.has_close_override = true;
  book.close_override = price;
}

void MockMarketGateway::setBalance(double balance) {
  std::lock_guard lock(mutex_);
  balance_ = balance;
}

void MockMarketGateway::failNext(Operation op, GatewayErrorKind kind,
                                 int count, const std::string& instrument_id) {
  if (count == 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  failures_.push_back(Failure{op, kind, count, instrument_id});
}

void MockMarketGateway::dropNextPlaceAck() {
  std::lock_guard lock(mutex_);
  drop_next_ack_ = true;
}

void MockMarketGateway::clearFailures() {
  std::lock_guard lock(mutex_);
  failures_.clear();
  drop_next_ack_ = false;
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::vector<OrderRequest> MockMarketGateway::orderAttempts() const {
  std::lock_guard lock(mutex_);
  return order_attempts_;
}

std::size_t MockMarketGateway::filledOrderCount() const {
  std::lock_guard lock(mutex_);
  return acks_by_client_id_.size();
}

std::vector<std::string> MockMarketGateway::closeAttempts() const {
  std::lock_guard lock(mutex_);
  return close_attempts_;
}

std::vector<MockMarketGateway::VenuePosition>
MockMarketGateway::openVenuePositions() const {
  std::lock_guard lock(mutex_);
  std::vector<VenuePosition> out;
  out.reserve(open_orders_.size());
  for (const auto& [id, pos] : open_orders_) {
    out.push_back(pos);
  }
  return out;
}

std::size_t MockMarketGateway::marketDataCalls(
    const std::string& instrument_id) const {
  std::lock_guard lock(mutex_);
  auto it = market_data_calls_.find(instrument_id);
  return it == market_data_calls_.end() ? 0 : it->second;
}

double MockMarketGateway::lastPrice(const std::string& instrument_id) const {
  std::lock_guard lock(mutex_);
  return bookFor(instrument_id).last_price;
}

// -----------------------------------------------------------------------------
// IMarketGateway
// -----------------------------------------------------------------------------
std::vector<domain::Instrument> MockMarketGateway::listInstruments() {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::ListInstruments, "");

  std::vector<domain::Instrument> out;
  out.reserve(books_.size());
  for (const auto& [id, book] : books_) {
    out.push_back(book.instrument);
  }
  return out;
}

domain::MarketSnapshot MockMarketGateway::getMarketData(
    const std::string& instrument_id) {
  std::lock_guard lock(mutex_);
  ++market_data_calls_[instrument_id];
  maybeFail(Operation::GetMarketData, instrument_id);

  auto it = books_.find(instrument_id);
  if (it == books_.end()) {
    throw GatewayError(GatewayErrorKind::NotFound, instrument_id);
  }
  const Book& book = it->second;

  domain::MarketSnapshot snap;
  snap.instrument_id = instrument_id;
  snap.last_price = book.last_price;
  snap.bid = book.last_price * (1.0 - book.spread / 2.0);
  snap.ask = book.last_price * (1.0 + book.spread / 2.0);
  snap.volume_24h = book.instrument.volume_24h;
  snap.candles = book.candles;
  snap.timestamp_ms = clock_.now_ms();
  return snap;
}

OrderAck MockMarketGateway::placeOrder(const OrderRequest& request) {
  std::lock_guard lock(mutex_);
  order_attempts_.push_back(request);
  maybeFail(Operation::PlaceOrder, request.instrument_id);

  // Idempotent replay: the venue already knows this client order id.
  auto known = acks_by_client_id_.find(request.client_order_id);
  if (known != acks_by_client_id_.end()) {
    return known->second;
  }

  auto it = books_.find(request.instrument_id);
  if (it == books_.end()) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       "unknown instrument " + request.instrument_id);
  }
  if (request.size > balance_) {
    throw GatewayError(GatewayErrorKind::InsufficientFunds,
                       request.client_order_id);
  }

  OrderAck ack;
  ack.order_id = "mock-" + std::to_string(next_order_seq_++);
  ack.fill_price = it->second.last_price;

  VenuePosition pos;
  pos.order_id = ack.order_id;
  pos.instrument_id = request.instrument_id;
  pos.direction = request.direction;
  pos.size = request.size;
  pos.entry_price = ack.fill_price;

  open_orders_[ack.order_id] = pos;
  acks_by_client_id_[request.client_order_id] = ack;

  if (drop_next_ack_) {
    drop_next_ack_ = false;
    throw GatewayError(GatewayErrorKind::Timeout,
                       "reply lost for " + request.client_order_id);
  }
  return ack;
}

CloseConfirmation MockMarketGateway::closePosition(
    const std::string& order_id, const std::string& instrument_id) {
  std::lock_guard lock(mutex_);
  close_attempts_.push_back(order_id);
  maybeFail(Operation::ClosePosition, instrument_id);

  auto open = open_orders_.find(order_id);
  if (open == open_orders_.end()) {
    throw GatewayError(GatewayErrorKind::AlreadyClosed, order_id);
  }

  double fill = open->second.entry_price;
  auto it = books_.find(instrument_id);
  if (it != books_.end()) {
    Book& book = it->second;
    fill = book.has_close_override ? book.close_override : book.last_price;
    book.has_close_override = false;
  }

  const VenuePosition& pos = open->second;
  balance_ += domain::realizedPnl(pos.direction, pos.size, pos.entry_price,
                                  fill);
  open_orders_.erase(open);

  return CloseConfirmation{fill};
}

double MockMarketGateway::getBalance() {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::GetBalance, "");
  return balance_;
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
void MockMarketGateway::maybeFail(Operation op,
                                  const std::string& instrument_id) {
  for (auto it = failures_.begin(); it != failures_.end(); ++it) {
    if (it->op != op) {
      continue;
    }
    if (!it->instrument_id.empty() && it->instrument_id != instrument_id) {
      continue;
    }
    GatewayErrorKind kind = it->kind;
    if (it->remaining > 0 && --it->remaining == 0) {
      failures_.erase(it);
    }
    throw GatewayError(kind, "injected failure");
  }
}

MockMarketGateway::Book& MockMarketGateway::bookFor(
    const std::string& instrument_id) {
  auto it = books_.find(instrument_id);
  if (it == books_.end()) {
    throw std::invalid_argument("MockMarketGateway: unknown instrument " +
                                instrument_id);
  }
  return it->second;
}

const MockMarketGateway::Book& MockMarketGateway::bookFor(
    const std::string& instrument_id) const {
  auto it = books_.find(instrument_id);
  if (it == books_.end()) {
    throw std::invalid_argument("MockMarketGateway: unknown instrument " +
                                instrument_id);
  }
  return it->second;
}

}  // namespace micro
