#pragma once

#include "micro/gateway/i_market_gateway.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// ZmqMarketGateway: venue access through an exchange bridge process
// -----------------------------------------------------------------------------
//
// @brief  Implements IMarketGateway as JSON request/reply over a ZeroMQ REQ
//         socket. The bridge on the other end speaks to the actual exchange.
//
// @details
// Wire format, one JSON object per message:
//
//   request  {"op":"getMarketData","instrument":"BTCUSDT"}
//   success  {"ok":true,"result":{...}}
//   failure  {"ok":false,"error":"RateLimited","message":"..."}
//
// `op` is one of listInstruments, getMarketData, placeOrder, closePosition,
// getBalance. `error` is the name of a GatewayErrorKind; anything else maps
// to Rejected.
//
// ZMQ_RCVTIMEO bounds every call by `timeout_ms`. A REQ socket that timed
// out is stuck in the "awaiting reply" state, so it is closed and rebuilt
// before the Timeout is thrown; the next call starts clean.
//
// Thread-safety: a REQ socket is strictly send/recv lockstep and not
// thread-safe, so every round trip holds mutex_. The scan, monitor and
// universe workers therefore serialize on the bridge.
//
// Ownership:
//   Owns the ZMQ context and socket. Created once in main().
// -----------------------------------------------------------------------------
class ZmqMarketGateway final : public IMarketGateway {
 public:
  ZmqMarketGateway(std::string endpoint, int timeout_ms);
  ~ZmqMarketGateway() override;

  ZmqMarketGateway(const ZmqMarketGateway&) = delete;
  ZmqMarketGateway& operator=(const ZmqMarketGateway&) = delete;

  std::vector<domain::Instrument> listInstruments() override;

  domain::MarketSnapshot getMarketData(
      const std::string& instrument_id) override;

  OrderAck placeOrder(const OrderRequest& request) override;

  CloseConfirmation closePosition(const std::string& order_id,
                                  const std::string& instrument_id) override;

  double getBalance() override;

 private:
  // Sends `request`, waits for the reply and returns its "result" member.
  // Throws GatewayError on timeout, on an error reply, or on a malformed
  // reply.
  nlohmann::json roundTrip(const nlohmann::json& request);

  // Closes the current socket (if any) and connects a fresh one.
  // Caller holds mutex_.
  void resetSocket();

  static GatewayErrorKind errorKindFromString(const std::string& name);

  std::string endpoint_;
  int timeout_ms_;

  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace micro
