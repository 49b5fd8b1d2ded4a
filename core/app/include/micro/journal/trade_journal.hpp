#pragma once

#include "micro/eventbus/event_bus.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace micro {

// -----------------------------------------------------------------------------
// TradeJournal: append-only JSON Lines record
// -----------------------------------------------------------------------------
//
// @brief  Writes one line per closed trade and one per performance snapshot.
//
// @details
// Line formats:
//
//   {"type":"trade","positionId":3,"instrument":"SOLUSDT",...}
//   {"type":"snapshot","timestampMs":...,"balance":101.2,...}
//
// The file is opened in append mode, so restarts extend the same journal.
// Each line is flushed as soon as it is written. Lines are in publish order,
// which is timestamp order because every publisher stamps from the same
// clock.
//
// A write failure is logged and does not propagate into the publisher.
//
// Thread model: the scan, monitor and snapshot workers may all publish; one
// mutex serializes writes so lines never interleave.
//
// Ownership:
//   Owned by the Scheduler. Subscribes in the constructor, unsubscribes in
//   the destructor.
// -----------------------------------------------------------------------------
class TradeJournal {
 public:
  // Creates missing parent directories. Throws std::runtime_error if the
  // file cannot be opened for append.
  TradeJournal(EventBus& bus, const std::string& path);

  ~TradeJournal();

  TradeJournal(const TradeJournal&) = delete;
  TradeJournal& operator=(const TradeJournal&) = delete;
  TradeJournal(TradeJournal&&) = delete;
  TradeJournal& operator=(TradeJournal&&) = delete;

  const std::string& path() const { return path_; }

  std::size_t linesWritten() const;

 private:
  void onEvent(const Event& event);

  void writeLine(const nlohmann::json& record);

  EventBus& bus_;
  std::string path_;

  mutable std::mutex mutex_;
  std::ofstream out_;
  std::size_t lines_written_{0};

  EventBus::SubscriptionId sub_id_{0};
};

}  // namespace micro
