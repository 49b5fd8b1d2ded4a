#pragma once

#include <atomic>
#include <cstdint>

namespace micro {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique position ids. 0 is reserved as "unset", so the
//         first id handed out is 1.
//
// @details
// The ExecutionCoordinator allocates a PositionId when an entry fill is
// confirmed. The scan worker is its only caller today, but the Scheduler
// also exposes runDue() to a test driver thread, so the counter is atomic
// rather than relying on thread confinement. memory_order_relaxed is enough:
// only uniqueness matters, not ordering relative to other memory.
//
// Ownership:
//   Value member of the Scheduler, injected by reference. Not a singleton.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Copying would create two sources handing out duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace micro
