#pragma once

#include "micro/domain/market_data.hpp"

#include <vector>

namespace micro {
namespace indicators {

// -----------------------------------------------------------------------------
// Technical indicators over candle closes
// -----------------------------------------------------------------------------
// All functions are pure and operate on series ordered oldest first. They
// return the indicator value at the most recent point.
// -----------------------------------------------------------------------------

// Exponential moving average with span smoothing: alpha = 2 / (period + 1),
// seeded with the first value. 0 for an empty series.
double ema(const std::vector<double>& values, int period);

// -----------------------------------------------------------------------------
// rsi(closes, period)
// -----------------------------------------------------------------------------
// Simple-average RSI over the last `period` close-to-close deltas:
//   RSI = 100 - 100 / (1 + mean(gains) / mean(losses))
//
// Edge values:
//   fewer than period + 1 closes    -> 50
//   no losses, at least one gain    -> 100
//   no gains and no losses (flat)   -> 50
// -----------------------------------------------------------------------------
double rsi(const std::vector<double>& closes, int period);

// Mean true range over the last `period` candles (fewer if the series is
// shorter). The first candle's true range is high - low.
double atr(const std::vector<domain::Candle>& candles, int period);

// Fractional change from `lookback` candles back to the last: c[-1]/c[-1-k]-1.
// 0 when the series is too short or the base close is not positive.
double momentum(const std::vector<double>& closes, int lookback);

std::vector<double> closes(const std::vector<domain::Candle>& candles);

}  // namespace indicators
}  // namespace micro
