#pragma once

#include "micro/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace micro {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         instead of read from the system clock.
//
// @details
// Tests construct the Scheduler with a SimulationTimeProvider, then
// alternate advance_by() and Scheduler::runDue() to step the scan, monitor
// and snapshot cycles deterministically. The --simulate mode of the binary
// does the same against the MockMarketGateway.
//
// Internal storage is a single std::atomic<int64_t>; readers on any thread
// see the latest store without a mutex.
//
// Thread model:
//   - advance_time() / advance_by() are called by a single driver thread.
//   - now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at start_ms (0 = "nothing has happened yet").
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility; tests occasionally need to
  // set arbitrary times (e.g. jump to just before midnight UTC).
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace micro
