#pragma once

#include "micro/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace micro {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish/subscribe channel for engine events.
// RiskManager publishes gate decisions and risk state changes, the
// ExecutionCoordinator and PositionMonitor publish position lifecycle events,
// the PerformanceTracker publishes snapshots. The TradeJournal, the
// PerformanceTracker and the IPC telemetry bridge subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run on the publishing thread before publish() returns. Since the
// scan and monitor workers both publish, a subscriber may be invoked from two
// threads at once and must protect its own state.
//
// Failure isolation: a subscriber that throws std::exception is logged and
// skipped; the remaining subscribers still receive the event, and the
// publisher never sees the exception.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  // Returned by subscribe(); pass to unsubscribe(). Never 0.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event kind.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only sees events holding EventType, e.g.
  //
  //   bus.subscribe<PositionClosedEvent>(
  //       [this](const PositionClosedEvent& e) { onClosed(e); });
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. A publish() already in flight may still deliver
  // its current event to the removed callback. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every current subscriber with `event`. The subscriber list is
  // copied under the lock and the callbacks run without it, so a callback may
  // itself publish, subscribe or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
  SubscriptionId next_id_{1};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: wrap in a generic callback that filters on the variant
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace micro
