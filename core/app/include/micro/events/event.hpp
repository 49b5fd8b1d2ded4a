#pragma once

#include "micro/events/event_types.hpp"

#include <variant>

namespace micro {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by the EventBus and by the IPC
// telemetry queue. Subscribers use std::get_if or the typed subscribe<T>()
// overload to pick out the kinds they care about.
//
// Adding an event kind means adding it here and to IpcServer's formatter;
// std::visit sites fail to compile until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    GateDecisionEvent,
    PositionOpenedEvent,
    PositionClosedEvent,
    RiskStateChangedEvent,
    SnapshotEvent>;

}  // namespace micro
