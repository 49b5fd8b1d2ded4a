#pragma once

#include "micro/domain/direction.hpp"
#include "micro/domain/instrument.hpp"

#include <cstdint>

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// Opportunity: a scored candidate trade for the current cycle
// -----------------------------------------------------------------------------
//
// @brief  Produced by the Scorer, consumed by RiskManager::admit() and the
//         ExecutionCoordinator. Discarded at the end of the cycle.
//
// @details
// score is the signal strength in (0, 1], whatever the direction; ranking
// sorts on it descending. confidence lies in [0, 1] and drives position
// sizing.
// entry_price is the last traded price the features were computed from.
// -----------------------------------------------------------------------------
struct Opportunity {
  Instrument instrument;
  Direction direction{Direction::Long};
  double score{0.0};
  double confidence{0.0};
  double entry_price{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace micro
