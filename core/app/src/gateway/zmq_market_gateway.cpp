#include "micro/gateway/zmq_market_gateway.hpp"

#include <iostream>
#include <utility>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor: connect the REQ socket
// -----------------------------------------------------------------------------
ZmqMarketGateway::ZmqMarketGateway(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  std::lock_guard lock(mutex_);
  resetSocket();
  std::cout << "[ZmqMarketGateway] connected to " << endpoint_
            << " (timeout " << timeout_ms_ << " ms)\n";
}

ZmqMarketGateway::~ZmqMarketGateway() {
  std::lock_guard lock(mutex_);
  socket_.reset();
}

// -----------------------------------------------------------------------------
// listInstruments()
// -----------------------------------------------------------------------------
std::vector<domain::Instrument> ZmqMarketGateway::listInstruments() {
  nlohmann::json result = roundTrip({{"op", "listInstruments"}});

  std::vector<domain::Instrument> out;
  try {
    for (const auto& item : result) {
      domain::Instrument inst;
      inst.id = item.at("id").get<std::string>();
      inst.min_size = item.value("minSize", 0.0);
      inst.liquidity_tier = item.value("liquidityTier", 0);
      inst.volume_24h = item.value("volume24h", 0.0);
      out.push_back(std::move(inst));
    }
  } catch (const nlohmann::json::exception& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       std::string("malformed instrument list: ") + e.what());
  }
  return out;
}

// -----------------------------------------------------------------------------
// getMarketData()
// -----------------------------------------------------------------------------
domain::MarketSnapshot ZmqMarketGateway::getMarketData(
    const std::string& instrument_id) {
  nlohmann::json result =
      roundTrip({{"op", "getMarketData"}, {"instrument", instrument_id}});

  domain::MarketSnapshot snap;
  try {
    snap.instrument_id = instrument_id;
    snap.last_price = result.at("last").get<double>();
    snap.bid = result.value("bid", snap.last_price);
    snap.ask = result.value("ask", snap.last_price);
    snap.volume_24h = result.value("volume24h", 0.0);
    snap.timestamp_ms = result.value("timestampMs", std::int64_t{0});

    // Candles arrive as [open, high, low, close] arrays, oldest first.
    for (const auto& c : result.value("candles", nlohmann::json::array())) {
      domain::Candle candle;
      candle.open = c.at(0).get<double>();
      candle.high = c.at(1).get<double>();
      candle.low = c.at(2).get<double>();
      candle.close = c.at(3).get<double>();
      snap.candles.push_back(candle);
    }
  } catch (const nlohmann::json::exception& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       "malformed market data for " + instrument_id + ": " +
                           e.what());
  }
  return snap;
}

// -----------------------------------------------------------------------------
// placeOrder()
// -----------------------------------------------------------------------------
OrderAck ZmqMarketGateway::placeOrder(const OrderRequest& request) {
  nlohmann::json req;
  req["op"] = "placeOrder";
  req["instrument"] = request.instrument_id;
  req["side"] = request.direction == domain::Direction::Long ? "buy" : "sell";
  req["size"] = request.size;
  req["stopLoss"] = request.stop_loss;
  req["takeProfit"] = request.take_profit;
  req["clientOrderId"] = request.client_order_id;

  nlohmann::json result = roundTrip(req);

  OrderAck ack;
  try {
    ack.order_id = result.at("orderId").get<std::string>();
    ack.fill_price = result.at("fillPrice").get<double>();
  } catch (const nlohmann::json::exception& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       std::string("malformed order ack: ") + e.what());
  }
  return ack;
}

// -----------------------------------------------------------------------------
// closePosition()
// -----------------------------------------------------------------------------
CloseConfirmation ZmqMarketGateway::closePosition(
    const std::string& order_id, const std::string& instrument_id) {
  nlohmann::json result = roundTrip({{"op", "closePosition"},
                                     {"orderId", order_id},
                                     {"instrument", instrument_id}});
  try {
    return CloseConfirmation{result.at("fillPrice").get<double>()};
  } catch (const nlohmann::json::exception& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       std::string("malformed close confirmation: ") +
                           e.what());
  }
}

// -----------------------------------------------------------------------------
// getBalance()
// -----------------------------------------------------------------------------
double ZmqMarketGateway::getBalance() {
  nlohmann::json result = roundTrip({{"op", "getBalance"}});
  try {
    return result.at("balance").get<double>();
  } catch (const nlohmann::json::exception& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       std::string("malformed balance: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// roundTrip(): one REQ/REP exchange under the socket mutex
// -----------------------------------------------------------------------------
nlohmann::json ZmqMarketGateway::roundTrip(const nlohmann::json& request) {
  std::string payload = request.dump();

  std::lock_guard lock(mutex_);

  zmq::message_t out(payload.data(), payload.size());
  auto sent = socket_->send(out, zmq::send_flags::none);
  if (!sent.has_value()) {
    resetSocket();
    throw GatewayError(GatewayErrorKind::Timeout,
                       "send timed out: " + request.value("op", ""));
  }

  zmq::message_t reply;
  auto received = socket_->recv(reply, zmq::recv_flags::none);
  if (!received.has_value()) {
    // REQ is now waiting for a reply that may never come; start over.
    resetSocket();
    throw GatewayError(GatewayErrorKind::Timeout,
                       "no reply within " + std::to_string(timeout_ms_) +
                           " ms: " + request.value("op", ""));
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(reply.to_string());
  } catch (const nlohmann::json::parse_error& e) {
    throw GatewayError(GatewayErrorKind::Rejected,
                       std::string("unparseable reply: ") + e.what());
  }

  if (!doc.is_object()) {
    throw GatewayError(GatewayErrorKind::Rejected, "reply is not an object");
  }
  if (!doc.value("ok", false)) {
    throw GatewayError(errorKindFromString(doc.value("error", "")),
                       doc.value("message", std::string("bridge error")));
  }
  return doc.value("result", nlohmann::json::object());
}

// -----------------------------------------------------------------------------
// resetSocket()
// -----------------------------------------------------------------------------
void ZmqMarketGateway::resetSocket() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::sndtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// errorKindFromString()
// -----------------------------------------------------------------------------
GatewayErrorKind ZmqMarketGateway::errorKindFromString(
    const std::string& name) {
  if (name == "Timeout") return GatewayErrorKind::Timeout;
  if (name == "RateLimited") return GatewayErrorKind::RateLimited;
  if (name == "NotFound") return GatewayErrorKind::NotFound;
  if (name == "InsufficientFunds") return GatewayErrorKind::InsufficientFunds;
  if (name == "AlreadyClosed") return GatewayErrorKind::AlreadyClosed;
  return GatewayErrorKind::Rejected;
}

}  // namespace micro
