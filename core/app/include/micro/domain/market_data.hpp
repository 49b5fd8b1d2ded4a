#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// Candle
// -----------------------------------------------------------------------------
// One OHLC bar as returned by the venue. Candles inside a MarketSnapshot are
// ordered oldest first.
// -----------------------------------------------------------------------------
struct Candle {
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
};

// -----------------------------------------------------------------------------
// MarketSnapshot: raw market data for one instrument
// -----------------------------------------------------------------------------
//
// @brief  What IMarketGateway::getMarketData() returns: the latest quote plus
//         a short window of recent candles.
//
// @details
// The Scanner turns a snapshot into Features. The Position Monitor only
// reads last_price. timestamp_ms is the venue's time for the quote (epoch
// milliseconds, same unit as ITimeProvider).
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string instrument_id;
  double last_price{0.0};
  double bid{0.0};
  double ask{0.0};
  double volume_24h{0.0};
  std::vector<Candle> candles;  // Oldest first
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// Features: derived signal vector for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Indicator values computed by the Scanner from a MarketSnapshot.
//
// @details
// Features are the only input to the Scorer, which keeps scoring a pure
// function: identical Features always produce an identical Opportunity.
//
//   momentum_5      (close[-1] - close[-5]) / close[-5]
//   volatility      ATR(14) / last_price
//   relative_spread (ask - bid) / mid, 0 when no quote
//   support         min(low) over the last 10 candles
//   resistance      max(high) over the last 10 candles
// -----------------------------------------------------------------------------
struct Features {
  double last_price{0.0};
  double momentum_5{0.0};
  double volatility{0.0};
  double relative_spread{0.0};
  double rsi{50.0};
  double ema_fast{0.0};   // EMA(8)
  double ema_slow{0.0};   // EMA(21)
  double support{0.0};
  double resistance{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace micro
