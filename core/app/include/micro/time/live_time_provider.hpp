#pragma once

#include "micro/time/i_time_provider.hpp"

namespace micro {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by main() in live and dry-run mode. Converts
// std::chrono::system_clock::now() to milliseconds since the Unix epoch.
// Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace micro
