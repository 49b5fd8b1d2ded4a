#include "micro/engine/scheduler.hpp"

#include "micro/serialization/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <limits>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace micro {

namespace {

// Pause between monitor polls while waiting for forced closes at shutdown.
constexpr auto kShutdownPollPause = std::chrono::milliseconds(100);

std::string normalizeCommand(const std::string& raw) {
  auto first = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) {
                return std::isspace(c) != 0;
              }).base();

  std::string cmd;
  if (first < last) {
    cmd.assign(first, last);
  }
  std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return cmd;
}

std::string okReply(const std::string& response) {
  nlohmann::json j;
  j["status"] = "ok";
  j["response"] = response;
  return j.dump();
}

std::string errorReply(const std::string& response) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = response;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components in dependency order
// -----------------------------------------------------------------------------
Scheduler::Scheduler(const EngineConfig& config, IMarketGateway& gateway,
                     const ITimeProvider& clock, bool enable_ipc)
    : config_(config),
      gateway_(gateway),
      clock_(clock),
      enable_ipc_(enable_ipc) {
  risk_ = std::make_unique<RiskManager>(bus_, clock_, config_.limits,
                                        config_.initial_capital);
  universe_ = std::make_unique<UniverseManager>(gateway_, config_);
  scanner_ = std::make_unique<Scanner>(gateway_, config_);
  scorer_ = std::make_unique<Scorer>(config_.min_confidence);
  execution_ = std::make_unique<ExecutionCoordinator>(gateway_, *risk_, bus_,
                                                      ids_, clock_, config_);
  monitor_ =
      std::make_unique<PositionMonitor>(gateway_, *risk_, clock_, config_);
  performance_ = std::make_unique<PerformanceTracker>(bus_, *risk_, clock_,
                                                      config_.initial_capital);
  if (!config_.journal_path.empty()) {
    journal_ = std::make_unique<TradeJournal>(bus_, config_.journal_path);
  }

  next_due_ms_.fill(std::numeric_limits<std::int64_t>::min());
}

// -----------------------------------------------------------------------------
// Destructor: graceful stop, then members unwind in reverse order
// -----------------------------------------------------------------------------
Scheduler::~Scheduler() { stop(); }

// -----------------------------------------------------------------------------
// start(): IPC first (so the operator sees the first cycle), then workers
// -----------------------------------------------------------------------------
void Scheduler::start() {
  if (stopped_.load() || running_.exchange(true)) {
    return;
  }

  if (enable_ipc_ && !config_.ipc_cmd_endpoint.empty() &&
      !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_sub_id_ = bus_.subscribe([this](const Event& e) {
      if (!std::holds_alternative<GateDecisionEvent>(e)) {
        ipc_server_->pushTelemetry(e);
      }
    });
  }

  for (std::size_t i = 0; i < kActivityCount; ++i) {
    auto activity = static_cast<Activity>(i);
    workers_[i] = std::make_unique<PeriodicWorker>(
        nameOf(activity), intervalOf(activity),
        [this, activity] { runGuarded(activity); });
  }
  for (auto& worker : workers_) {
    worker->start();
  }

  std::cout << "[Scheduler] started. scan=" << config_.limits.scan_interval_ms
            << "ms monitor=" << config_.monitor_interval_ms
            << "ms snapshot=" << config_.snapshot_interval_ms
            << "ms universe=" << config_.universe_refresh_interval_ms
            << "ms" << (config_.dry_run ? " (DRY RUN)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// stop(): graceful shutdown sequence
// -----------------------------------------------------------------------------
void Scheduler::stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  std::cout << "[Scheduler] stopping: no new scan cycles.\n";
  accepting_.store(false);

  for (auto& worker : workers_) {
    if (worker) {
      worker->stop();
    }
  }

  closeAllForShutdown();

  try {
    performance_->takeSnapshot();
  } catch (const std::exception& e) {
    std::cerr << "[Scheduler] final snapshot failed: " << e.what() << "\n";
  }

  // The telemetry bridge dereferences ipc_server_, so it goes first.
  if (ipc_server_) {
    bus_.unsubscribe(telemetry_sub_id_);
    ipc_server_->stop();
    ipc_server_.reset();
  }

  running_.store(false);
  requestStop();

  std::cout << "[Scheduler] stopped.\n";
}

void Scheduler::closeAllForShutdown() {
  risk_->forceCloseAll();

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.shutdown_timeout_ms);

  while (true) {
    try {
      monitor_->poll();
    } catch (const std::exception& e) {
      std::cerr << "[Scheduler] shutdown close pass failed: " << e.what()
                << "\n";
    }

    std::size_t remaining = risk_->openPositions().size();
    if (remaining == 0) {
      std::cout << "[Scheduler] all positions closed.\n";
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      std::cerr << "[Scheduler] WARNING: shutdown timeout with " << remaining
                << " position(s) still open.\n";
      return;
    }
    std::this_thread::sleep_for(kShutdownPollPause);
  }
}

void Scheduler::requestStop() {
  {
    std::lock_guard lock(stop_request_mutex_);
    stop_requested_.store(true);
  }
  stop_request_cv_.notify_all();
}

bool Scheduler::waitForStopRequest(std::int64_t timeout_ms) {
  std::unique_lock lock(stop_request_mutex_);
  return stop_request_cv_.wait_for(
      lock, std::chrono::milliseconds(timeout_ms),
      [this] { return stop_requested_.load(); });
}

// -----------------------------------------------------------------------------
// runDue(): virtual-time driver
// -----------------------------------------------------------------------------
std::size_t Scheduler::runDue() {
  std::size_t ran = 0;

  for (std::size_t i = 0; i < kActivityCount; ++i) {
    auto activity = static_cast<Activity>(i);
    const std::int64_t now = clock_.now_ms();
    {
      std::lock_guard lock(due_mutex_);
      if (now < next_due_ms_[i]) {
        continue;
      }
      next_due_ms_[i] = now + intervalOf(activity);
    }
    runGuarded(activity);
    ++ran;
  }

  return ran;
}

void Scheduler::runGuarded(Activity activity) {
  try {
    switch (activity) {
      case kUniverse:
        runUniverseRefresh();
        break;
      case kMonitor:
        runMonitor();
        break;
      case kScan:
        runScanCycle();
        break;
      case kSnapshot:
        runSnapshot();
        break;
      case kActivityCount:
        break;
    }
  } catch (const std::exception& e) {
    std::cerr << "[Scheduler] " << nameOf(activity)
              << " activity failed: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// runScanCycle(): sync, scan, score, rank, gate, execute
// -----------------------------------------------------------------------------
std::size_t Scheduler::runScanCycle() {
  if (!accepting_.load()) {
    return 0;
  }

  risk_->rollDayIfNeeded();

  try {
    const auto settled = risk_->settledCloses();
    if (!risk_->updateBalance(gateway_.getBalance(), settled)) {
      std::cout << "[Scheduler] balance sync deferred to the next cycle.\n";
    }
  } catch (const GatewayError& e) {
    std::cerr << "[Scheduler] balance sync failed (" << e.what()
              << "), keeping local balance.\n";
  }

  const auto state = risk_->state();
  if (state != domain::RiskState::Normal) {
    std::cout << "[Scheduler] scan skipped: risk state "
              << domain::riskStateToString(state) << "\n";
    return 0;
  }

  if (universe_->size() == 0) {
    universe_->refresh();
  }
  auto instruments = universe_->instruments();
  if (instruments.empty()) {
    std::cerr << "[Scheduler] scan skipped: universe is empty.\n";
    return 0;
  }

  const std::int64_t cycle_ts_ms = clock_.now_ms();
  const std::size_t universe_count = instruments.size();

  ScanCycle cycle = scanner_->scan(std::move(instruments));
  std::vector<domain::Opportunity> opportunities;
  while (auto result = cycle.next()) {
    if (!accepting_.load()) {
      std::cout << "[Scheduler] scan cycle abandoned for shutdown.\n";
      return 0;
    }
    if (auto opp = scorer_->score(result->instrument, result->features)) {
      opportunities.push_back(std::move(*opp));
    }
  }
  Scorer::rank(opportunities);

  std::cout << "[Scheduler] scan: " << universe_count << " instrument(s), "
            << cycle.skipped() << " skipped, " << opportunities.size()
            << " opportunit" << (opportunities.size() == 1 ? "y" : "ies")
            << "\n";

  return execution_->executeRanked(opportunities, cycle_ts_ms,
                                   [this] { return !accepting_.load(); });
}

std::size_t Scheduler::runMonitor() {
  risk_->rollDayIfNeeded();
  return monitor_->poll();
}

domain::PerformanceSnapshot Scheduler::runSnapshot() {
  risk_->rollDayIfNeeded();
  return performance_->takeSnapshot();
}

bool Scheduler::runUniverseRefresh() {
  risk_->rollDayIfNeeded();
  return universe_->refresh();
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command dispatch
// -----------------------------------------------------------------------------
std::string Scheduler::executeCommand(const std::string& cmd) {
  const std::string command = normalizeCommand(cmd);

  if (command == "PING") {
    return okReply("PONG");
  }

  if (command == "STATUS") {
    nlohmann::json j;
    j["status"] = "ok";
    j["riskState"] = domain::riskStateToString(risk_->state());
    j["halted"] = risk_->isHalted();
    j["account"] = toJson(risk_->account());

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& position : risk_->openPositions()) {
      positions.push_back(toJson(position));
    }
    j["positions"] = std::move(positions);
    j["universeSize"] = universe_->size();
    j["running"] = running_.load();
    return j.dump();
  }

  if (command == "HALT") {
    risk_->haltTrading("manual halt via IPC");
    return okReply("Trading halted");
  }

  if (command == "RESUME") {
    if (!risk_->resume()) {
      return errorReply("Not halted");
    }
    return okReply("Trading resumed");
  }

  if (command == "SHUTDOWN") {
    requestStop();
    return okReply("Shutdown requested");
  }

  return errorReply("Unknown command: " + cmd);
}

// -----------------------------------------------------------------------------
// Activity table
// -----------------------------------------------------------------------------
std::int64_t Scheduler::intervalOf(Activity activity) const {
  switch (activity) {
    case kUniverse: return config_.universe_refresh_interval_ms;
    case kMonitor:  return config_.monitor_interval_ms;
    case kScan:     return config_.limits.scan_interval_ms;
    case kSnapshot: return config_.snapshot_interval_ms;
    case kActivityCount: break;
  }
  return 0;
}

const char* Scheduler::nameOf(Activity activity) {
  switch (activity) {
    case kUniverse: return "universe";
    case kMonitor:  return "monitor";
    case kScan:     return "scan";
    case kSnapshot: return "snapshot";
    case kActivityCount: break;
  }
  return "unknown";
}

}  // namespace micro
