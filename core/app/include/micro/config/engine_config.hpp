#pragma once

#include "micro/domain/risk_limits.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// EngineConfig: immutable process-wide configuration
// -----------------------------------------------------------------------------
//
// @brief  Everything the engine reads from its configuration source, parsed
//         and validated once at startup by loadConfig().
//
// @details
// The Scheduler receives an EngineConfig by const reference and hands the
// relevant parts (RiskLimits, intervals, retry policy) to each component.
// There is no runtime reload: changing a value requires a restart.
//
// Time values are stored in milliseconds; the JSON file expresses intervals
// in seconds (see ConfigLoader for the key names).
// -----------------------------------------------------------------------------
struct EngineConfig {
  double initial_capital{100.0};
  domain::RiskLimits limits;

  // --- Cycle timing ----------------------------------------------------------
  std::int64_t monitor_interval_ms{5'000};
  std::int64_t snapshot_interval_ms{300'000};
  std::int64_t universe_refresh_interval_ms{3'600'000};
  std::int64_t shutdown_timeout_ms{30'000};

  // --- Universe / scoring ----------------------------------------------------
  std::size_t universe_size{50};
  double min_24h_volume{1'000'000.0};
  double min_confidence{0.6};
  std::vector<std::string> symbols;  // Optional whitelist; empty = all

  // --- Gateway retry policy --------------------------------------------------
  int order_retry_attempts{3};
  std::int64_t retry_backoff_ms{200};

  // --- Collaborators ---------------------------------------------------------
  bool dry_run{false};
  std::string journal_path{"logs/trades.jsonl"};
  std::string gateway_endpoint{"tcp://127.0.0.1:5560"};
  int gateway_timeout_ms{2'000};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

}  // namespace micro
