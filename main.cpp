// -----------------------------------------------------------------------------
// micro_engine: single executable entry point.
//
// Usage:
//   micro_engine [config.json]                     live (or dry-run) trading
//   micro_engine [config.json] --simulate [mins]   offline simulation
//
// Live mode:
//   1) Load and validate the configuration (exit 1 on error).
//   2) Connect a ZmqMarketGateway to the venue adapter. With dryRun the
//      gateway only supplies market data; a PaperMarketGateway fills orders.
//   3) Start the Scheduler (workers + IPC server) and wait until SIGINT,
//      SIGTERM or an IPC SHUTDOWN command.
//   4) Stop the Scheduler, which force-closes every open position.
//
// Simulation mode:
//   A MockMarketGateway serves a seeded random walk for a few instruments,
//   a SimulationTimeProvider supplies time, and main() steps both, calling
//   Scheduler::runDue() after every step. No network, no threads.
//
// Thread layout (live):
//   main thread        waits for a stop request
//   universe/scan/monitor/snapshot workers   Scheduler activities
//   IPC thread         REP commands + PUB telemetry
// -----------------------------------------------------------------------------

#include "micro/config/config_loader.hpp"
#include "micro/engine/scheduler.hpp"
#include "micro/gateway/mock_market_gateway.hpp"
#include "micro/gateway/paper_market_gateway.hpp"
#include "micro/gateway/zmq_market_gateway.hpp"
#include "micro/time/live_time_provider.hpp"
#include "micro/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Set by the signal handler, polled by main(). A lock-free atomic store is
// the only thing the handler does.
std::atomic<bool> g_stop_signal{false};

void stop_signal_handler(int /*signum*/) { g_stop_signal.store(true); }

constexpr std::int64_t kStopPollMs = 200;
constexpr std::int64_t kDefaultSimulationMinutes = 240;
constexpr std::int64_t kSimulationStepMs = 1'000;
constexpr std::int64_t kSimulationCandleMs = 60'000;

struct Options {
  std::string config_path;
  bool simulate{false};
  std::int64_t simulate_minutes{kDefaultSimulationMinutes};
};

Options parseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--simulate") {
      options.simulate = true;
      if (i + 1 < argc &&
          std::isdigit(static_cast<unsigned char>(argv[i + 1][0])) != 0) {
        options.simulate_minutes = std::stoll(argv[++i]);
      }
    } else if (options.config_path.empty()) {
      options.config_path = arg;
    } else {
      throw micro::ConfigurationError("unexpected argument '" + arg + "'");
    }
  }
  return options;
}

// -----------------------------------------------------------------------------
// Simulation: a seeded random walk per instrument, one candle per minute.
// -----------------------------------------------------------------------------
struct SimInstrument {
  micro::domain::Instrument instrument;
  double price;
  double drift;
};

int runSimulation(const micro::EngineConfig& config, std::int64_t minutes) {
  micro::SimulationTimeProvider clock(1'700'000'000'000);
  micro::MockMarketGateway gateway(clock, config.initial_capital);

  std::vector<SimInstrument> walk = {
      {{"DOGEUSDT", 1.0, 3, 9'000'000.0}, 0.16, 0.0004},
      {{"XRPUSDT", 1.0, 3, 7'500'000.0}, 0.62, 0.0002},
      {{"ADAUSDT", 1.0, 2, 4'000'000.0}, 0.45, -0.0001},
      {{"TRXUSDT", 1.0, 2, 2'500'000.0}, 0.11, 0.0003},
      {{"SHIBUSDT", 1.0, 1, 1'500'000.0}, 0.000009, 0.0},
  };

  std::mt19937 rng(42);
  std::normal_distribution<double> noise(0.0, 0.003);

  auto appendStep = [&](SimInstrument& s) {
    double open = s.price;
    double close = std::max(open * (1.0 + s.drift + noise(rng)), 1e-9);
    double high = std::max(open, close) * (1.0 + std::abs(noise(rng)) / 2.0);
    double low = std::min(open, close) * (1.0 - std::abs(noise(rng)) / 2.0);
    s.price = close;
    gateway.appendCandle(s.instrument.id, {open, high, low, close});
  };

  for (auto& s : walk) {
    gateway.addInstrument(s.instrument, s.price, 0.0005);
    for (std::size_t i = 0; i < micro::Scanner::kMinCandles + 9; ++i) {
      appendStep(s);
    }
  }

  micro::Scheduler scheduler(config, gateway, clock, /*enable_ipc=*/false);

  const std::int64_t end_ms = clock.now_ms() + minutes * 60'000;
  std::int64_t next_candle_ms = clock.now_ms() + kSimulationCandleMs;

  std::cout << "[main] simulation: " << walk.size() << " instruments, "
            << minutes << " simulated minute(s).\n";

  while (clock.now_ms() < end_ms && !g_stop_signal.load()) {
    scheduler.runDue();
    clock.advance_by(kSimulationStepMs);
    if (clock.now_ms() >= next_candle_ms) {
      for (auto& s : walk) {
        appendStep(s);
      }
      next_candle_ms += kSimulationCandleMs;
    }
  }

  scheduler.stop();

  const auto summary = scheduler.performance().compute();
  std::cout << "[main] simulation finished. balance=" << summary.balance
            << " trades=" << summary.trade_count
            << " growth=" << summary.growth_pct << "%\n";
  return 0;
}

// -----------------------------------------------------------------------------
// Live: ZeroMQ venue adapter, optionally behind the paper gateway.
// -----------------------------------------------------------------------------
int runLive(const micro::EngineConfig& config) {
  micro::LiveTimeProvider clock;
  micro::ZmqMarketGateway venue(config.gateway_endpoint,
                                config.gateway_timeout_ms);

  std::unique_ptr<micro::PaperMarketGateway> paper;
  micro::IMarketGateway* gateway = &venue;
  if (config.dry_run) {
    paper = std::make_unique<micro::PaperMarketGateway>(venue,
                                                        config.initial_capital);
    gateway = paper.get();
  }

  micro::Scheduler scheduler(config, *gateway, clock);
  scheduler.start();

  std::cout << "[main] running. Press Ctrl-C or send SHUTDOWN to stop.\n";
  while (!g_stop_signal.load() && !scheduler.waitForStopRequest(kStopPollMs)) {
  }

  std::cout << "\n[main] stop requested. Closing positions...\n";
  scheduler.stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, stop_signal_handler);
  std::signal(SIGTERM, stop_signal_handler);

  micro::EngineConfig config;
  Options options;
  try {
    options = parseArgs(argc, argv);
    config = options.config_path.empty()
                 ? micro::configFromJson(nlohmann::json::object())
                 : micro::loadConfig(options.config_path);
  } catch (const micro::ConfigurationError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::logic_error& e) {
    std::cerr << "[main] bad argument: " << e.what() << "\n";
    return 1;
  }

  try {
    return options.simulate ? runSimulation(config, options.simulate_minutes)
                            : runLive(config);
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
}
