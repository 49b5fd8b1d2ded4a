#pragma once

#include <string>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument: one tradable candidate in the universe
// -----------------------------------------------------------------------------
//
// @brief  Static description of an instrument as listed by the venue.
//
// @details
// Instruments are loaded by the UniverseManager from
// IMarketGateway::listInstruments() and are immutable afterwards. The
// liquidity tier is a coarse venue-assigned bucket (higher = deeper book)
// used by the Scorer as the first tie-breaker and by the UniverseManager
// when selecting the candidate set.
//
// Thread model:
//   Value type. The universe hands out copies, so readers never observe a
//   refresh in progress.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string id;              // Venue symbol (e.g. "DOGEUSDT")
  double min_size{0.0};        // Minimum tradable notional (quote currency)
  int liquidity_tier{0};       // Higher is more liquid
  double volume_24h{0.0};      // 24h traded notional (quote currency)
};

}  // namespace domain
}  // namespace micro
