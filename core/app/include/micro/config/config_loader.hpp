#pragma once

#include "micro/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace micro {

// -----------------------------------------------------------------------------
// ConfigurationError
// -----------------------------------------------------------------------------
// Thrown for a missing file, malformed JSON, a value of the wrong type or a
// value outside its legal range. Fatal: main() reports it and exits before
// the Scheduler is constructed.
// -----------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// loadConfig(path)
// -----------------------------------------------------------------------------
//
// @brief  Reads a JSON configuration file and returns a validated
//         EngineConfig.
//
// @details
// Recognized keys (all optional; defaults are those of EngineConfig):
//
//   initialCapital, maxConcurrentTrades, dailyLossLimit, maxDrawdownLimit,
//   circuitBreakerLimit, minPositionSize, maxPositionSize, scalpTakeProfit,
//   scalpStopLoss, maxHoldTime [s], scanInterval [s], monitorInterval [s],
//   snapshotInterval [s], universeRefreshInterval [s], shutdownTimeout [s],
//   universeSize, min24hVolume, minConfidence, orderRetryAttempts,
//   retryBackoffMs, symbols, dryRun, journalPath, gatewayEndpoint,
//   gatewayTimeoutMs, ipcCommandEndpoint, ipcTelemetryEndpoint
//
// Unknown keys are reported on stderr and ignored.
//
// @throws ConfigurationError  on any I/O, parse, type or range problem.
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path);

// Same as loadConfig() but from an already-parsed document. Used by tests.
EngineConfig configFromJson(const nlohmann::json& doc);

// Range checks shared by both entry points. Throws ConfigurationError.
void validateConfig(const EngineConfig& config);

}  // namespace micro
