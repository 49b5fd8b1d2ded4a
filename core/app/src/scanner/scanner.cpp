#include "micro/scanner/scanner.hpp"

#include "micro/gateway/retry.hpp"
#include "micro/scanner/indicators.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace micro {

namespace {

constexpr int kRsiPeriod = 14;
constexpr int kAtrPeriod = 14;
constexpr int kEmaFast = 8;
constexpr int kEmaSlow = 21;
constexpr int kMomentumLookback = 5;
constexpr std::size_t kRangeLookback = 10;

}  // namespace

// -----------------------------------------------------------------------------
// ScanCycle::next()
// -----------------------------------------------------------------------------
std::optional<ScanResult> ScanCycle::next() {
  while (index_ < instruments_.size()) {
    const domain::Instrument& instrument = instruments_[index_++];
    std::optional<domain::Features> features = scanner_.scanOne(instrument);
    if (features) {
      return ScanResult{instrument, *features};
    }
    ++skipped_;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Scanner
// -----------------------------------------------------------------------------
Scanner::Scanner(IMarketGateway& gateway, const EngineConfig& config)
    : gateway_(gateway), config_(config) {}

ScanCycle Scanner::scan(std::vector<domain::Instrument> instruments) const {
  return ScanCycle(*this, std::move(instruments));
}

std::optional<domain::Features> Scanner::scanOne(
    const domain::Instrument& instrument) const {
  domain::MarketSnapshot snapshot;
  try {
    snapshot = withTransientRetry(
        config_.order_retry_attempts, config_.retry_backoff_ms,
        "getMarketData " + instrument.id,
        [&] { return gateway_.getMarketData(instrument.id); });
  } catch (const GatewayError& e) {
    std::cerr << "[Scanner] skipping " << instrument.id << ": " << e.what()
              << "\n";
    return std::nullopt;
  }

  std::optional<domain::Features> features = deriveFeatures(snapshot);
  if (!features) {
    std::cerr << "[Scanner] skipping " << instrument.id << ": "
              << snapshot.candles.size() << " candle(s), need "
              << kMinCandles << "\n";
  }
  return features;
}

// -----------------------------------------------------------------------------
// deriveFeatures(): indicators over the snapshot's candle history
// -----------------------------------------------------------------------------
std::optional<domain::Features> Scanner::deriveFeatures(
    const domain::MarketSnapshot& snapshot) {
  if (snapshot.candles.size() < kMinCandles) {
    return std::nullopt;
  }

  std::vector<double> closes = indicators::closes(snapshot.candles);
  double price = snapshot.last_price > 0.0 ? snapshot.last_price
                                           : closes.back();
  if (price <= 0.0) {
    return std::nullopt;
  }

  domain::Features f;
  f.last_price = price;
  f.momentum_5 = indicators::momentum(closes, kMomentumLookback);
  f.volatility = indicators::atr(snapshot.candles, kAtrPeriod) / price;
  f.rsi = indicators::rsi(closes, kRsiPeriod);
  f.ema_fast = indicators::ema(closes, kEmaFast);
  f.ema_slow = indicators::ema(closes, kEmaSlow);
  f.timestamp_ms = snapshot.timestamp_ms;

  double mid = (snapshot.bid + snapshot.ask) / 2.0;
  f.relative_spread =
      (mid > 0.0 && snapshot.ask >= snapshot.bid)
          ? (snapshot.ask - snapshot.bid) / mid
          : 0.0;

  std::size_t from = snapshot.candles.size() - kRangeLookback;
  f.support = snapshot.candles[from].low;
  f.resistance = snapshot.candles[from].high;
  for (std::size_t i = from; i < snapshot.candles.size(); ++i) {
    f.support = std::min(f.support, snapshot.candles[i].low);
    f.resistance = std::max(f.resistance, snapshot.candles[i].high);
  }
  return f;
}

}  // namespace micro
