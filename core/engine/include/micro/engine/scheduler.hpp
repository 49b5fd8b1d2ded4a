#pragma once

#include "micro/concurrent/id_generator.hpp"
#include "micro/concurrent/periodic_worker.hpp"
#include "micro/config/engine_config.hpp"
#include "micro/domain/performance_snapshot.hpp"
#include "micro/eventbus/event_bus.hpp"
#include "micro/execution/execution_coordinator.hpp"
#include "micro/gateway/i_market_gateway.hpp"
#include "micro/journal/trade_journal.hpp"
#include "micro/monitor/position_monitor.hpp"
#include "micro/network/ipc_server.hpp"
#include "micro/performance/performance_tracker.hpp"
#include "micro/risk/risk_manager.hpp"
#include "micro/scanner/scanner.hpp"
#include "micro/scoring/scorer.hpp"
#include "micro/time/i_time_provider.hpp"
#include "micro/universe/universe_manager.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace micro {

// -----------------------------------------------------------------------------
// Scheduler
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the engine. Owns every component and drives
//         the four periodic activities.
//
// @details
// Activities and their cadence (from EngineConfig):
//
//   universe  universeRefreshInterval  UniverseManager::refresh()
//   scan      scanInterval             balance sync, scan, score, rank,
//                                      gate and execute
//   monitor   monitorInterval          PositionMonitor::poll()
//   snapshot  snapshotInterval         PerformanceTracker::takeSnapshot()
//
// Every activity first checks for a trading-day rollover. An exception
// escaping an activity is logged and the activity runs again on its next
// tick.
//
// Two ways to drive time:
//
//   Live:     start() spawns one PeriodicWorker per activity and the IPC
//             server. main() then waits in waitForStopRequest().
//   Virtual:  runDue() runs, on the caller's thread, every activity whose
//             due time has passed on the ITimeProvider. Tests advance a
//             SimulationTimeProvider and call runDue(); no threads needed.
//
// Shutdown (stop()):
//   1. Stop admitting scan cycles and stop the workers.
//   2. Flag every open position for forced close.
//   3. Poll the monitor until the open set is empty or shutdownTimeout
//      (wall clock) expires.
//   4. Take a final snapshot, then stop the IPC server.
//
// start() and stop() are idempotent; the destructor calls stop(). A stopped
// Scheduler cannot be restarted.
//
// Thread model:
//   Constructed, started and stopped on the main thread. executeCommand()
//   runs on the IPC thread. A SHUTDOWN command only requests the stop; the
//   main thread performs it, since stop() joins the IPC thread.
//
// Ownership:
//   Scheduler
//    ├── config_         (EngineConfig, value; components hold references)
//    ├── bus_            (EventBus, value; outlives all subscribers)
//    ├── ids_            (IdGenerator, value)
//    ├── risk_           (unique_ptr<RiskManager>)
//    ├── universe_       (unique_ptr<UniverseManager>)
//    ├── scanner_        (unique_ptr<Scanner>)
//    ├── scorer_         (unique_ptr<Scorer>)
//    ├── execution_      (unique_ptr<ExecutionCoordinator>)
//    ├── monitor_        (unique_ptr<PositionMonitor>)
//    ├── performance_    (unique_ptr<PerformanceTracker>)
//    ├── journal_        (unique_ptr<TradeJournal>, null if no journalPath)
//    ├── ipc_server_     (unique_ptr<IpcServer>, null unless enabled)
//    └── workers_        (unique_ptr<PeriodicWorker> × 4, live mode only)
//
//   The gateway and the time provider are non-owning references supplied by
//   main() or the test; both must outlive the Scheduler.
// -----------------------------------------------------------------------------
class Scheduler {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config      Validated configuration (copied).
  // @param  gateway     Venue. Must outlive the Scheduler.
  // @param  clock       Time source. Must outlive the Scheduler.
  // @param  enable_ipc  Start the ZeroMQ IPC server in start(). Tests pass
  //                     false to stay off the network.
  //
  // Builds all components and opens the journal. No threads, no sockets.
  // Throws std::runtime_error if the journal cannot be opened.
  // -------------------------------------------------------------------------
  Scheduler(const EngineConfig& config, IMarketGateway& gateway,
            const ITimeProvider& clock, bool enable_ipc = true);

  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  // --- Lifecycle ------------------------------------------------------------------

  void start();

  void stop();

  bool isRunning() const { return running_.load(); }

  // Asks the main thread to stop. Safe from any thread, including the IPC
  // thread and a signal-watching thread.
  void requestStop();

  bool stopRequested() const { return stop_requested_.load(); }

  // Blocks until requestStop() is called or timeout_ms elapses.
  // @return true if a stop was requested.
  bool waitForStopRequest(std::int64_t timeout_ms);

  // --- Virtual-time driving -------------------------------------------------------

  // Runs every activity that is due at the clock's current time, in the
  // order universe, monitor, scan, snapshot. All activities are due on the
  // first call. @return number of activities run.
  std::size_t runDue();

  // --- Activities (one tick each) -------------------------------------------------

  // @return number of positions opened.
  std::size_t runScanCycle();

  // @return number of positions closed.
  std::size_t runMonitor();

  domain::PerformanceSnapshot runSnapshot();

  bool runUniverseRefresh();

  // --- IPC ---------------------------------------------------------------------------

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // Case-insensitive, surrounding whitespace ignored.
  //
  //   PING      {"status":"ok","response":"PONG"}
  //   STATUS    {"status":"ok","riskState":..,"halted":..,"account":{..},
  //              "positions":[..],"universeSize":..,"running":..}
  //   HALT      manual circuit-breaker trip
  //   RESUME    manual reset from Halted; error if not Halted
  //   SHUTDOWN  requestStop()
  //   other     {"status":"error","response":"Unknown command: .."}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // --- Component access (tests, main) ---------------------------------------------

  const EngineConfig& config() const { return config_; }
  EventBus& eventBus() { return bus_; }
  RiskManager& riskManager() { return *risk_; }
  UniverseManager& universe() { return *universe_; }
  ExecutionCoordinator& execution() { return *execution_; }
  PositionMonitor& monitor() { return *monitor_; }
  PerformanceTracker& performance() { return *performance_; }

 private:
  enum Activity : std::size_t {
    kUniverse = 0,
    kMonitor,
    kScan,
    kSnapshot,
    kActivityCount,
  };

  std::int64_t intervalOf(Activity activity) const;

  static const char* nameOf(Activity activity);

  // Runs one activity, logging instead of propagating std::exception.
  void runGuarded(Activity activity);

  void closeAllForShutdown();

  const EngineConfig config_;
  IMarketGateway& gateway_;
  const ITimeProvider& clock_;
  const bool enable_ipc_;

  EventBus bus_;
  IdGenerator ids_;

  std::unique_ptr<RiskManager> risk_;
  std::unique_ptr<UniverseManager> universe_;
  std::unique_ptr<Scanner> scanner_;
  std::unique_ptr<Scorer> scorer_;
  std::unique_ptr<ExecutionCoordinator> execution_;
  std::unique_ptr<PositionMonitor> monitor_;
  std::unique_ptr<PerformanceTracker> performance_;
  std::unique_ptr<TradeJournal> journal_;
  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_sub_id_{0};

  std::array<std::unique_ptr<PeriodicWorker>, kActivityCount> workers_;

  std::mutex due_mutex_;
  std::array<std::int64_t, kActivityCount> next_due_ms_{};

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{true};
  std::atomic<bool> stopped_{false};

  std::atomic<bool> stop_requested_{false};
  std::mutex stop_request_mutex_;
  std::condition_variable stop_request_cv_;
};

}  // namespace micro
