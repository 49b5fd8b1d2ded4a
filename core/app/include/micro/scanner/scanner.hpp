#pragma once

#include "micro/config/engine_config.hpp"
#include "micro/domain/instrument.hpp"
#include "micro/domain/market_data.hpp"
#include "micro/gateway/i_market_gateway.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace micro {

// One scanned instrument with the features derived from its snapshot.
struct ScanResult {
  domain::Instrument instrument;
  domain::Features features;
};

class Scanner;

// -----------------------------------------------------------------------------
// ScanCycle: lazy, finite, single-pass result sequence of one scan
// -----------------------------------------------------------------------------
//
// @brief  Pulls market data for the next instrument only when next() is
//         called.
//
// @details
// next() walks the instrument list in order, skipping instruments whose
// fetch fails or whose data is insufficient, and returns the first one that
// yields Features. Once it returns std::nullopt the cycle is exhausted for
// good; there is no reset. A new scan means a new ScanCycle.
//
// Move-only. Holds a reference to the Scanner that created it.
// -----------------------------------------------------------------------------
class ScanCycle {
 public:
  ScanCycle(ScanCycle&&) = default;
  ScanCycle& operator=(ScanCycle&&) = delete;
  ScanCycle(const ScanCycle&) = delete;
  ScanCycle& operator=(const ScanCycle&) = delete;

  std::optional<ScanResult> next();

  bool exhausted() const { return index_ >= instruments_.size(); }

  // Instruments skipped so far because of gateway errors or short history.
  std::size_t skipped() const { return skipped_; }

 private:
  friend class Scanner;
  ScanCycle(const Scanner& scanner, std::vector<domain::Instrument> instruments)
      : scanner_(scanner), instruments_(std::move(instruments)) {}

  const Scanner& scanner_;
  std::vector<domain::Instrument> instruments_;
  std::size_t index_{0};
  std::size_t skipped_{0};
};

// -----------------------------------------------------------------------------
// Scanner
// -----------------------------------------------------------------------------
//
// @brief  Turns MarketSnapshots into Features, one instrument at a time.
//
// @details
// Per-instrument failure isolation: a transient GatewayError is retried up
// to orderRetryAttempts with the configured backoff; if it persists, or the
// error is final (NotFound, ...), or the snapshot carries fewer than
// kMinCandles candles, the instrument is logged and skipped for this cycle.
// No failure of one instrument stops the scan of the next.
//
// Thread model: scan() is called on the scan worker. The Scanner itself is
// stateless between cycles.
// -----------------------------------------------------------------------------
class Scanner {
 public:
  // EMA(21) needs this many closes to mean anything.
  static constexpr std::size_t kMinCandles = 21;

  Scanner(IMarketGateway& gateway, const EngineConfig& config);

  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // Starts a cycle over `instruments`. No gateway call happens until the
  // first next().
  ScanCycle scan(std::vector<domain::Instrument> instruments) const;

  // Pure feature derivation. Returns std::nullopt when the snapshot has
  // fewer than kMinCandles candles or no usable price.
  static std::optional<domain::Features> deriveFeatures(
      const domain::MarketSnapshot& snapshot);

 private:
  friend class ScanCycle;

  // Fetch + derive for one instrument; std::nullopt on skip.
  std::optional<domain::Features> scanOne(
      const domain::Instrument& instrument) const;

  IMarketGateway& gateway_;
  const EngineConfig& config_;
};

}  // namespace micro
