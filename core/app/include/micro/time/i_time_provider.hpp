#pragma once

#include <cstdint>

namespace micro {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-dependent decision in the engine (cycle due times, time stops,
// trading-day rollover, snapshot timestamps, idempotency keys) reads the
// clock through this interface:
//
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → virtual time advanced explicitly by tests or
//                              the simulation harness.
//
// With a SimulationTimeProvider injected, Scheduler::runDue() lets a test
// step through hours of scan / monitor / snapshot cycles in microseconds and
// get identical results on every run.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace micro
