#include "micro/scanner/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace micro {
namespace indicators {

double ema(const std::vector<double>& values, int period) {
  if (values.empty()) {
    return 0.0;
  }
  const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
  double e = values.front();
  for (std::size_t i = 1; i < values.size(); ++i) {
    e = alpha * values[i] + (1.0 - alpha) * e;
  }
  return e;
}

double rsi(const std::vector<double>& closes, int period) {
  if (period <= 0 || closes.size() < static_cast<std::size_t>(period) + 1) {
    return 50.0;
  }

  double gains = 0.0;
  double losses = 0.0;
  for (std::size_t i = closes.size() - static_cast<std::size_t>(period);
       i < closes.size(); ++i) {
    double delta = closes[i] - closes[i - 1];
    if (delta > 0.0) {
      gains += delta;
    } else {
      losses -= delta;
    }
  }

  double avg_gain = gains / period;
  double avg_loss = losses / period;
  if (avg_loss == 0.0) {
    return avg_gain == 0.0 ? 50.0 : 100.0;
  }
  double rs = avg_gain / avg_loss;
  return 100.0 - 100.0 / (1.0 + rs);
}

double atr(const std::vector<domain::Candle>& candles, int period) {
  if (candles.empty() || period <= 0) {
    return 0.0;
  }

  std::size_t n = std::min(candles.size(), static_cast<std::size_t>(period));
  std::size_t start = candles.size() - n;

  double sum = 0.0;
  for (std::size_t i = start; i < candles.size(); ++i) {
    const domain::Candle& c = candles[i];
    double tr = c.high - c.low;
    if (i > 0) {
      double prev_close = candles[i - 1].close;
      tr = std::max({tr, std::fabs(c.high - prev_close),
                     std::fabs(c.low - prev_close)});
    }
    sum += tr;
  }
  return sum / static_cast<double>(n);
}

double momentum(const std::vector<double>& closes, int lookback) {
  if (lookback <= 0 ||
      closes.size() < static_cast<std::size_t>(lookback) + 1) {
    return 0.0;
  }
  double base = closes[closes.size() - 1 - static_cast<std::size_t>(lookback)];
  if (base <= 0.0) {
    return 0.0;
  }
  return closes.back() / base - 1.0;
}

std::vector<double> closes(const std::vector<domain::Candle>& candles) {
  std::vector<double> out;
  out.reserve(candles.size());
  for (const auto& c : candles) {
    out.push_back(c.close);
  }
  return out;
}

}  // namespace indicators
}  // namespace micro
