#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace micro {

// -----------------------------------------------------------------------------
// PeriodicWorker
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that invokes a callback, then sleeps
// for a fixed interval, until stopped. One instance per periodic activity
// (scan cycle, position monitor, snapshot, universe refresh).
//
// The sleep is a condition-variable wait, not std::this_thread::sleep_for, so
// stop() interrupts it at once. A scan interval of five minutes would
// otherwise hold up shutdown for up to five minutes.
//
// A callback that throws std::exception is logged and the worker carries on
// with its next tick: one bad cycle must not take an activity down for the
// rest of the process.
//
// Thread model: start() and stop() may be called from any thread. The
// callback runs only on the owned thread, never concurrently with itself.
// -----------------------------------------------------------------------------
class PeriodicWorker {
 public:
  using Task = std::function<void()>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  name         Label used in log lines ("scan", "monitor", ...).
  // @param  interval_ms  Delay between the end of one tick and the start of
  //                      the next. Must be positive.
  // @param  task         Invoked once per tick on the worker thread.
  //
  // No thread is spawned until start().
  // -------------------------------------------------------------------------
  PeriodicWorker(std::string name, std::int64_t interval_ms, Task task);

  // Joins the worker if it is still running.
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&) = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;
  PeriodicWorker(PeriodicWorker&&) = delete;
  PeriodicWorker& operator=(PeriodicWorker&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. The first tick runs immediately. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, wakes the worker out of its interval wait and joins it.
  // A tick already in progress is allowed to finish. Idempotent.
  //
  // Must not be called from inside the task itself (self-join).
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  const std::string& name() const { return name_; }

  // Number of completed ticks, including those that threw.
  std::uint64_t ticks() const { return ticks_.load(); }

 private:
  void run();

  std::string name_;
  std::int64_t interval_ms_;
  Task task_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace micro
