#include "micro/config/config_loader.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <type_traits>

namespace micro {

namespace {

const std::set<std::string>& knownKeys() {
  static const std::set<std::string> keys = {
      "initialCapital",     "maxConcurrentTrades",  "dailyLossLimit",
      "maxDrawdownLimit",   "circuitBreakerLimit",  "minPositionSize",
      "maxPositionSize",    "scalpTakeProfit",      "scalpStopLoss",
      "maxHoldTime",        "scanInterval",         "monitorInterval",
      "snapshotInterval",   "universeRefreshInterval", "shutdownTimeout",
      "universeSize",       "min24hVolume",         "minConfidence",
      "orderRetryAttempts", "retryBackoffMs",       "symbols",
      "dryRun",             "journalPath",          "gatewayEndpoint",
      "gatewayTimeoutMs",   "ipcCommandEndpoint",   "ipcTelemetryEndpoint",
  };
  return keys;
}

// Integer keys take JSON integers only, inside the target's range.
// nlohmann would otherwise truncate 8.5 to 8 and wrap -1 to SIZE_MAX.
template <typename T>
void requireIntegral(const nlohmann::json& value, const char* key) {
  if (!value.is_number_integer()) {
    throw ConfigurationError(std::string("'") + key +
                             "' must be an integer, got " + value.dump());
  }
  bool in_range = false;
  if (value.is_number_unsigned()) {
    in_range = value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<T>::max());
  } else if constexpr (std::is_signed_v<T>) {
    const auto v = value.get<std::int64_t>();
    in_range = v >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
               v <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
  }
  if (!in_range) {
    throw ConfigurationError(std::string("'") + key + "' is out of range: " +
                             value.dump());
  }
}

// Copies doc[key] into target when present. A type mismatch is reported
// with the offending key name rather than nlohmann's generic message.
template <typename T>
void read(const nlohmann::json& doc, const char* key, T& target) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    requireIntegral<T>(*it, key);
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("invalid type for '") + key +
                             "': " + e.what());
  }
}

// Interval keys are written in seconds in the file, stored in ms.
void readSeconds(const nlohmann::json& doc, const char* key,
                 std::int64_t& target_ms) {
  double seconds = static_cast<double>(target_ms) / 1000.0;
  read(doc, key, seconds);
  target_ms = static_cast<std::int64_t>(std::llround(seconds * 1000.0));
}

void requireFraction(double value, const char* name) {
  if (!(value > 0.0 && value < 1.0)) {
    throw ConfigurationError(std::string(name) +
                             " must be a fraction in (0, 1), got " +
                             std::to_string(value));
  }
}

void requirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    throw ConfigurationError(std::string(name) + " must be positive, got " +
                             std::to_string(value));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJson
// -----------------------------------------------------------------------------
EngineConfig configFromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigurationError("configuration root must be a JSON object");
  }

  for (const auto& item : doc.items()) {
    if (knownKeys().count(item.key()) == 0) {
      std::cerr << "[ConfigLoader] WARNING: ignoring unknown key '"
                << item.key() << "'\n";
    }
  }

  EngineConfig config;
  domain::RiskLimits& limits = config.limits;

  read(doc, "initialCapital", config.initial_capital);
  read(doc, "maxConcurrentTrades", limits.max_concurrent_positions);
  read(doc, "dailyLossLimit", limits.daily_loss_fraction);
  read(doc, "maxDrawdownLimit", limits.max_drawdown_fraction);
  read(doc, "circuitBreakerLimit", limits.circuit_breaker_loss_fraction);
  read(doc, "minPositionSize", limits.min_position_size);
  read(doc, "maxPositionSize", limits.max_position_size);
  read(doc, "scalpTakeProfit", limits.take_profit_fraction);
  read(doc, "scalpStopLoss", limits.stop_loss_fraction);
  readSeconds(doc, "maxHoldTime", limits.max_hold_time_ms);
  readSeconds(doc, "scanInterval", limits.scan_interval_ms);

  readSeconds(doc, "monitorInterval", config.monitor_interval_ms);
  readSeconds(doc, "snapshotInterval", config.snapshot_interval_ms);
  readSeconds(doc, "universeRefreshInterval",
              config.universe_refresh_interval_ms);
  readSeconds(doc, "shutdownTimeout", config.shutdown_timeout_ms);

  read(doc, "universeSize", config.universe_size);
  read(doc, "min24hVolume", config.min_24h_volume);
  read(doc, "minConfidence", config.min_confidence);
  read(doc, "symbols", config.symbols);

  read(doc, "orderRetryAttempts", config.order_retry_attempts);
  read(doc, "retryBackoffMs", config.retry_backoff_ms);

  read(doc, "dryRun", config.dry_run);
  read(doc, "journalPath", config.journal_path);
  read(doc, "gatewayEndpoint", config.gateway_endpoint);
  read(doc, "gatewayTimeoutMs", config.gateway_timeout_ms);
  read(doc, "ipcCommandEndpoint", config.ipc_cmd_endpoint);
  read(doc, "ipcTelemetryEndpoint", config.ipc_pub_endpoint);

  validateConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("cannot open configuration file: " + path);
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("malformed configuration file " + path + ": " +
                             e.what());
  }

  EngineConfig config = configFromJson(doc);
  std::cout << "[ConfigLoader] loaded " << path
            << " (capital=" << config.initial_capital
            << ", max_trades=" << config.limits.max_concurrent_positions
            << ", dry_run=" << (config.dry_run ? "true" : "false") << ")\n";
  return config;
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& config) {
  const domain::RiskLimits& limits = config.limits;

  requirePositive(config.initial_capital, "initialCapital");
  if (limits.max_concurrent_positions < 1) {
    throw ConfigurationError("maxConcurrentTrades must be at least 1");
  }

  requireFraction(limits.daily_loss_fraction, "dailyLossLimit");
  requireFraction(limits.max_drawdown_fraction, "maxDrawdownLimit");
  requireFraction(limits.circuit_breaker_loss_fraction, "circuitBreakerLimit");
  requireFraction(limits.take_profit_fraction, "scalpTakeProfit");
  requireFraction(limits.stop_loss_fraction, "scalpStopLoss");

  requirePositive(limits.min_position_size, "minPositionSize");
  requirePositive(limits.max_position_size, "maxPositionSize");
  if (limits.min_position_size > limits.max_position_size) {
    throw ConfigurationError("minPositionSize must not exceed maxPositionSize");
  }

  if (limits.max_hold_time_ms < 0) {
    throw ConfigurationError("maxHoldTime must not be negative");
  }
  requirePositive(static_cast<double>(limits.scan_interval_ms), "scanInterval");
  requirePositive(static_cast<double>(config.monitor_interval_ms),
                  "monitorInterval");
  requirePositive(static_cast<double>(config.snapshot_interval_ms),
                  "snapshotInterval");
  requirePositive(static_cast<double>(config.universe_refresh_interval_ms),
                  "universeRefreshInterval");
  requirePositive(static_cast<double>(config.shutdown_timeout_ms),
                  "shutdownTimeout");
  if (config.monitor_interval_ms >= limits.scan_interval_ms) {
    throw ConfigurationError(
        "monitorInterval must be shorter than scanInterval");
  }

  if (config.universe_size == 0) {
    throw ConfigurationError("universeSize must be at least 1");
  }
  if (config.min_24h_volume < 0.0) {
    throw ConfigurationError("min24hVolume must not be negative");
  }
  if (config.min_confidence < 0.0 || config.min_confidence > 1.0) {
    throw ConfigurationError("minConfidence must lie in [0, 1]");
  }
  if (config.order_retry_attempts < 1) {
    throw ConfigurationError("orderRetryAttempts must be at least 1");
  }
  if (config.retry_backoff_ms < 0) {
    throw ConfigurationError("retryBackoffMs must not be negative");
  }
  if (config.gateway_timeout_ms <= 0) {
    throw ConfigurationError("gatewayTimeoutMs must be positive");
  }
  if (config.journal_path.empty()) {
    throw ConfigurationError("journalPath must not be empty");
  }
}

}  // namespace micro
