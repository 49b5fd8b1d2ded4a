#pragma once

#include "micro/domain/account_state.hpp"
#include "micro/domain/performance_snapshot.hpp"
#include "micro/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace micro {

// -----------------------------------------------------------------------------
// JSON encoding of domain records
// -----------------------------------------------------------------------------
// Shared by the TradeJournal (durable JSON Lines), the IPC telemetry stream
// and the STATUS command, so a trade or snapshot looks the same everywhere.
// Keys are camelCase; enums are encoded by name.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Position& position);

nlohmann::json toJson(const domain::ClosedTrade& trade);

nlohmann::json toJson(const domain::PerformanceSnapshot& snapshot);

nlohmann::json toJson(const domain::AccountState& account);

}  // namespace micro
