#pragma once

#include "micro/config/engine_config.hpp"
#include "micro/domain/instrument.hpp"
#include "micro/gateway/i_market_gateway.hpp"

#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// UniverseManager
// -----------------------------------------------------------------------------
//
// @brief  Holds the candidate instrument set the scanner iterates over.
//
// @details
// refresh() pulls the venue listing and selects:
//
//   1. ids in the configured whitelist only (when one is configured);
//   2. 24h volume >= min24hVolume;
//   3. order: liquidity tier desc, 24h volume desc, id asc;
//   4. the first universeSize entries.
//
// A refresh that throws GatewayError, or that selects nothing, keeps the
// previous set. The scanner therefore always sees the last known-good
// universe, possibly stale, never half-built.
//
// Thread model:
//   refresh() runs on the universe worker, instruments() on the scan worker.
//   The set is swapped under a unique_lock and copied out under a
//   shared_lock.
//
// Ownership:
//   Owned by the Scheduler. Holds references to the gateway and config,
//   both of which outlive it.
// -----------------------------------------------------------------------------
class UniverseManager {
 public:
  UniverseManager(IMarketGateway& gateway, const EngineConfig& config);

  UniverseManager(const UniverseManager&) = delete;
  UniverseManager& operator=(const UniverseManager&) = delete;

  // -------------------------------------------------------------------------
  // refresh()
  // -------------------------------------------------------------------------
  // @return true if a new set was adopted, false if the previous one was
  //         kept (gateway failure or empty selection).
  // -------------------------------------------------------------------------
  bool refresh();

  // Copy of the current set, in selection order. Empty before the first
  // successful refresh().
  std::vector<domain::Instrument> instruments() const;

  std::size_t size() const;

  // Pure selection step, exposed for tests.
  static std::vector<domain::Instrument> select(
      std::vector<domain::Instrument> listing, const EngineConfig& config);

 private:
  IMarketGateway& gateway_;
  const EngineConfig& config_;

  mutable std::shared_mutex mutex_;
  std::vector<domain::Instrument> instruments_;
};

}  // namespace micro
