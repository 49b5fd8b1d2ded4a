#pragma once

#include "micro/gateway/i_market_gateway.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// PaperMarketGateway: dry-run venue
// -----------------------------------------------------------------------------
//
// @brief  Serves real market data from a delegate gateway and simulates
//         order fills locally at the delegate's last price.
//
// @details
// Selected when `dryRun` is true. The engine runs the exact same code path as
// in live trading; only the venue is swapped, so no dry-run flag leaks into
// the ExecutionCoordinator or the PositionMonitor.
//
// The paper balance starts at `initial_balance` and moves only by realized
// PnL of paper closes. Fills are idempotent on client_order_id for as long
// as the paper position is open; the ack is forgotten when it closes, so
// the table holds at most one entry per open position.
//
// Ownership:
//   Holds a non-owning reference to the delegate, which must outlive it.
//
// Thread-safety: paper book state is guarded by mutex_. The lock is not held
// across delegate calls.
// -----------------------------------------------------------------------------
class PaperMarketGateway final : public IMarketGateway {
 public:
  PaperMarketGateway(IMarketGateway& market_data, double initial_balance);

  PaperMarketGateway(const PaperMarketGateway&) = delete;
  PaperMarketGateway& operator=(const PaperMarketGateway&) = delete;

  std::vector<domain::Instrument> listInstruments() override;

  domain::MarketSnapshot getMarketData(
      const std::string& instrument_id) override;

  OrderAck placeOrder(const OrderRequest& request) override;

  CloseConfirmation closePosition(const std::string& order_id,
                                  const std::string& instrument_id) override;

  double getBalance() override;

  // Client order ids whose ack is still replayed.
  std::size_t knownClientIds() const;

 private:
  struct PaperPosition {
    std::string client_order_id;
    std::string instrument_id;
    domain::Direction direction{domain::Direction::Long};
    double size{0.0};
    double entry_price{0.0};
  };

  IMarketGateway& market_data_;

  mutable std::mutex mutex_;
  double balance_;
  std::uint64_t next_seq_{1};
  std::map<std::string, OrderAck> acks_by_client_id_;
  std::map<std::string, PaperPosition> open_;
};

}  // namespace micro
