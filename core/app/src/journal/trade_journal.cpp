#include "micro/journal/trade_journal.hpp"

#include "micro/serialization/json_codec.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor: open for append, then subscribe
// -----------------------------------------------------------------------------
TradeJournal::TradeJournal(EventBus& bus, const std::string& path)
    : bus_(bus), path_(path) {
  std::filesystem::path file(path_);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("TradeJournal: cannot create directory " +
                               file.parent_path().string() + ": " +
                               ec.message());
    }
  }

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    throw std::runtime_error("TradeJournal: cannot open " + path_);
  }

  sub_id_ = bus_.subscribe([this](const Event& e) { onEvent(e); });

  std::cout << "[TradeJournal] appending to " << path_ << "\n";
}

TradeJournal::~TradeJournal() { bus_.unsubscribe(sub_id_); }

std::size_t TradeJournal::linesWritten() const {
  std::lock_guard lock(mutex_);
  return lines_written_;
}

// -----------------------------------------------------------------------------
// onEvent(): closed trades and snapshots only
// -----------------------------------------------------------------------------
void TradeJournal::onEvent(const Event& event) {
  if (const auto* closed = std::get_if<PositionClosedEvent>(&event)) {
    nlohmann::json record = toJson(closed->trade);
    record["type"] = "trade";
    record["balanceAfter"] = closed->balance;
    writeLine(record);
  } else if (const auto* snap = std::get_if<SnapshotEvent>(&event)) {
    nlohmann::json record = toJson(snap->snapshot);
    record["type"] = "snapshot";
    writeLine(record);
  }
}

void TradeJournal::writeLine(const nlohmann::json& record) {
  std::string line = record.dump();

  std::lock_guard lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    std::cerr << "[TradeJournal] ERROR: write to " << path_
              << " failed, record lost: " << line << "\n";
    out_.clear();
    return;
  }
  ++lines_written_;
}

}  // namespace micro
