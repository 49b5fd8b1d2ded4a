#include "micro/concurrent/periodic_worker.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace micro {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PeriodicWorker::PeriodicWorker(std::string name, std::int64_t interval_ms,
                               Task task)
    : name_(std::move(name)),
      interval_ms_(interval_ms > 0 ? interval_ms : 1),
      task_(std::move(task)) {}

// -----------------------------------------------------------------------------
// Destructor: the thread must be gone before task_ and the cv are destroyed
// -----------------------------------------------------------------------------
PeriodicWorker::~PeriodicWorker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PeriodicWorker::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the first loop check in run() sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PeriodicWorker::stop() {
  if (!thread_.joinable()) {
    return;
  }

  {
    // Store under the mutex so the worker cannot test the predicate, miss
    // the store, and then block for a full interval.
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();

  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): tick, then wait out the interval or a stop request
// -----------------------------------------------------------------------------
void PeriodicWorker::run() {
  while (running_.load()) {
    try {
      task_();
    } catch (const std::exception& e) {
      std::cerr << "[PeriodicWorker:" << name_
                << "] tick failed: " << e.what() << "\n";
    }
    ticks_.fetch_add(1);

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                      [this] { return !running_.load(); });
  }
}

}  // namespace micro
