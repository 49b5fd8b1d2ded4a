#pragma once

#include "micro/gateway/i_market_gateway.hpp"
#include "micro/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// MockMarketGateway
// -----------------------------------------------------------------------------
//
// @brief  Deterministic in-process venue with scripted prices and failure
//         injection.
//
// @details
// Backs the unit tests and the `--simulate` demo. Behaves like a perfect
// venue unless told otherwise:
//
//   - placeOrder() fills instantly at the instrument's last price.
//   - placeOrder() is idempotent on client_order_id: a repeated key returns
//     the original OrderAck and records no second fill.
//   - closePosition() fills at the last price (or a configured override)
//     and credits the realized PnL to the venue balance.
//   - Closing an unknown or already closed order raises AlreadyClosed.
//
// Failures are queued per operation with failNext(). dropNextPlaceAck()
// models the nasty case where the venue fills the order but the reply is
// lost: the fill is booked and the caller sees a Timeout.
//
// Every call is recorded so tests can assert on what the engine sent.
//
// Thread-safety: all methods lock mutex_; safe from any thread.
// -----------------------------------------------------------------------------
class MockMarketGateway final : public IMarketGateway {
 public:
  enum class Operation {
    ListInstruments,
    GetMarketData,
    PlaceOrder,
    ClosePosition,
    GetBalance,
  };

  // Open venue-side position as booked by placeOrder().
  struct VenuePosition {
    std::string order_id;
    std::string instrument_id;
    domain::Direction direction{domain::Direction::Long};
    double size{0.0};
    double entry_price{0.0};
  };

  MockMarketGateway(const ITimeProvider& clock, double balance);

  MockMarketGateway(const MockMarketGateway&) = delete;
  MockMarketGateway& operator=(const MockMarketGateway&) = delete;
  MockMarketGateway(MockMarketGateway&&) = delete;
  MockMarketGateway& operator=(MockMarketGateway&&) = delete;

  // --- Scripting -------------------------------------------------------------

  // Lists the instrument and seeds its book at `price` with a relative
  // spread of `spread` (ask - bid) / mid.
  void addInstrument(const domain::Instrument& instrument, double price,
                     double spread = 0.0);

  // Removes the instrument from listings; market data then raises NotFound.
  void removeInstrument(const std::string& instrument_id);

  // Moves the last price (bid/ask follow with the configured spread).
  void setPrice(const std::string& instrument_id, double price);

  // Replaces the candle history; the last close becomes the last price.
  void setCandles(const std::string& instrument_id,
                  std::vector<domain::Candle> candles);

  // Appends one candle, keeping at most `max_history`; its close becomes the
  // last price.
  void appendCandle(const std::string& instrument_id,
                    const domain::Candle& candle,
                    std::size_t max_history = 100);

  // Overrides the fill price of the next close of `instrument_id`.
  void setNextCloseFill(const std::string& instrument_id, double price);

  void setBalance(double balance);

  // Queues `count` failures of `kind` for `op`. For GetMarketData the
  // failure applies only to `instrument_id`; empty matches any instrument.
  // count < 0 fails forever.
  void failNext(Operation op, GatewayErrorKind kind, int count = 1,
                const std::string& instrument_id = "");

  // Next placeOrder() books the fill, then throws Timeout.
  void dropNextPlaceAck();

  void clearFailures();

  // --- Inspection -------------------------------------------------------------

  // Every placeOrder() attempt, including failed and duplicate ones.
  std::vector<OrderRequest> orderAttempts() const;

  // Distinct client order ids that resulted in a booked fill.
  std::size_t filledOrderCount() const;

  // Every closePosition() attempt (order ids), including failed ones.
  std::vector<std::string> closeAttempts() const;

  std::vector<VenuePosition> openVenuePositions() const;

  std::size_t marketDataCalls(const std::string& instrument_id) const;

  double lastPrice(const std::string& instrument_id) const;

  // --- IMarketGateway ---------------------------------------------------------

  std::vector<domain::Instrument> listInstruments() override;

  domain::MarketSnapshot getMarketData(
      const std::string& instrument_id) override;

  OrderAck placeOrder(const OrderRequest& request) override;

  CloseConfirmation closePosition(const std::string& order_id,
                                  const std::string& instrument_id) override;

  double getBalance() override;

 private:
  struct Book {
    domain::Instrument instrument;
    double last_price{0.0};
    double spread{0.0};
    std::vector<domain::Candle> candles;
    bool has_close_override{false};
    double close_override{0.0};
  };

  struct Failure {
    Operation op;
    GatewayErrorKind kind;
    int remaining;  // < 0: forever
    std::string instrument_id;
  };

  // Throws the first matching queued failure. Caller holds mutex_.
  void maybeFail(Operation op, const std::string& instrument_id);

  Book& bookFor(const std::string& instrument_id);
  const Book& bookFor(const std::string& instrument_id) const;

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  double balance_;
  std::map<std::string, Book> books_;
  std::vector<Failure> failures_;
  bool drop_next_ack_{false};

  std::uint64_t next_order_seq_{1};
  std::map<std::string, OrderAck> acks_by_client_id_;
  std::map<std::string, VenuePosition> open_orders_;

  std::vector<OrderRequest> order_attempts_;
  std::vector<std::string> close_attempts_;
  std::map<std::string, std::size_t> market_data_calls_;
};

}  // namespace micro
