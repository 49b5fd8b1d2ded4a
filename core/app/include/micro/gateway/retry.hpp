#pragma once

#include "micro/gateway/i_market_gateway.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

namespace micro {

// -----------------------------------------------------------------------------
// withTransientRetry
// -----------------------------------------------------------------------------
//
// @brief  Invokes `call` up to `attempts` times, retrying only transient
//         GatewayErrors (Timeout, RateLimited).
//
// @details
// Backoff doubles after each failure: backoff_ms, 2*backoff_ms, 4*... A
// backoff of 0 retries immediately (used by tests). Non-transient errors and
// the last transient error are rethrown unchanged, so the caller decides
// whether to skip an instrument or drop an order.
//
// `label` only feeds the log line, e.g. "getMarketData BTCUSDT".
// -----------------------------------------------------------------------------
template <typename Call>
auto withTransientRetry(int attempts, std::int64_t backoff_ms,
                        const std::string& label, Call&& call)
    -> decltype(call()) {
  if (attempts < 1) {
    attempts = 1;
  }
  std::int64_t delay_ms = backoff_ms;

  for (int attempt = 1;; ++attempt) {
    try {
      return call();
    } catch (const GatewayError& e) {
      if (!e.isTransient() || attempt >= attempts) {
        throw;
      }
      std::cerr << "[Retry] " << label << " attempt " << attempt << "/"
                << attempts << " failed (" << e.what() << "), retrying in "
                << delay_ms << " ms\n";
    }
    if (delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      delay_ms *= 2;
    }
  }
}

}  // namespace micro
