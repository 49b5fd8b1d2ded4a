#pragma once

#include "micro/domain/direction.hpp"
#include "micro/domain/instrument.hpp"
#include "micro/domain/market_data.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// GatewayErrorKind / GatewayError
// -----------------------------------------------------------------------------
//
// @brief  Failure reported by an IMarketGateway call.
//
// @details
// Timeout and RateLimited are transient: callers retry them with bounded
// backoff. The rest are final for the request that raised them.
//
//   NotFound           getMarketData: unknown instrument
//   Rejected           placeOrder: venue refused the order
//   InsufficientFunds  placeOrder: venue-side balance too low
//   AlreadyClosed      closePosition: nothing left to close
// -----------------------------------------------------------------------------
enum class GatewayErrorKind {
  Timeout,
  RateLimited,
  NotFound,
  Rejected,
  InsufficientFunds,
  AlreadyClosed,
};

inline const char* gatewayErrorKindToString(GatewayErrorKind k) {
  switch (k) {
    case GatewayErrorKind::Timeout:           return "Timeout";
    case GatewayErrorKind::RateLimited:       return "RateLimited";
    case GatewayErrorKind::NotFound:          return "NotFound";
    case GatewayErrorKind::Rejected:          return "Rejected";
    case GatewayErrorKind::InsufficientFunds: return "InsufficientFunds";
    case GatewayErrorKind::AlreadyClosed:     return "AlreadyClosed";
  }
  return "Unknown";
}

class GatewayError : public std::runtime_error {
 public:
  GatewayError(GatewayErrorKind kind, const std::string& message)
      : std::runtime_error(std::string(gatewayErrorKindToString(kind)) +
                           ": " + message),
        kind_(kind) {}

  GatewayErrorKind kind() const noexcept { return kind_; }

  bool isTransient() const noexcept {
    return kind_ == GatewayErrorKind::Timeout ||
           kind_ == GatewayErrorKind::RateLimited;
  }

 private:
  GatewayErrorKind kind_;
};

// -----------------------------------------------------------------------------
// Order wire types
// -----------------------------------------------------------------------------

// Entry order. client_order_id is the idempotency key: a venue that sees the
// same key twice must return the original fill instead of opening again.
struct OrderRequest {
  std::string instrument_id;
  domain::Direction direction{domain::Direction::Long};
  double size{0.0};  // Quote currency
  double stop_loss{0.0};
  double take_profit{0.0};
  std::string client_order_id;
};

struct OrderAck {
  std::string order_id;
  double fill_price{0.0};
};

struct CloseConfirmation {
  double fill_price{0.0};
};

// -----------------------------------------------------------------------------
// IMarketGateway: the engine's only view of the venue
// -----------------------------------------------------------------------------
//
// @brief  Market data, order entry/exit and balance queries.
//
// @details
// Every call may block on I/O and may throw GatewayError. Callers never hold
// the RiskManager mutex across a gateway call.
//
// Implementations:
//   ZmqMarketGateway    JSON over a ZeroMQ REQ socket to an exchange bridge.
//   PaperMarketGateway  Dry run: real market data, simulated fills.
//   MockMarketGateway   In-process scripted venue for tests and --simulate.
//
// Thread-safety: implementations must accept calls from the scan, monitor
// and universe workers concurrently.
// -----------------------------------------------------------------------------
class IMarketGateway {
 public:
  virtual ~IMarketGateway() = default;

  virtual std::vector<domain::Instrument> listInstruments() = 0;

  virtual domain::MarketSnapshot getMarketData(
      const std::string& instrument_id) = 0;

  virtual OrderAck placeOrder(const OrderRequest& request) = 0;

  virtual CloseConfirmation closePosition(const std::string& order_id,
                                          const std::string& instrument_id) = 0;

  virtual double getBalance() = 0;
};

}  // namespace micro
