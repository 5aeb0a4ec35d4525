// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite token bucket used by the rate-limited logging macros

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sniffer {
namespace util {

/**
 * RateLimiter - per-callsite log throttle
 *
 * A callsite starts with a full burst of tokens that refills continuously
 * over the period. A persistent fault on a hot path (a malformed line per
 * packet, a failing lookup per cycle) logs its burst and then roughly one
 * line per (period / burst). Dropped lines are counted so the next admitted
 * line can say how many were hidden.
 */
class RateLimiter {
public:
  static constexpr int DEFAULT_BURST = 200;
  static constexpr int DEFAULT_PERIOD_SECONDS = 3600;

  struct Admission {
    bool allowed = false;
    // Lines dropped at this callsite since the previous admitted one
    uint64_t suppressed = 0;
  };

  Admission admit(const std::string& callsite_key, int burst, int period_seconds);

  bool should_log(const std::string& callsite_key, int burst, int period_seconds) {
    return admit(callsite_key, burst, period_seconds).allowed;
  }

  // Forget every callsite (tests)
  void reset();

  static RateLimiter& instance();

private:
  struct Callsite {
    double tokens = 0.0;
    std::chrono::steady_clock::time_point refilled_at;
    uint64_t suppressed = 0;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Callsite> callsites_;
};

}  // namespace util
}  // namespace sniffer
