// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace sniffer {
namespace util {

RateLimiter::Admission RateLimiter::admit(const std::string& callsite_key, int burst, int period_seconds) {
  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(burst);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = callsites_.try_emplace(callsite_key);
  Callsite& site = it->second;
  if (inserted) {
    site.tokens = capacity;
    site.refilled_at = now;
  } else if (now > site.refilled_at && period_seconds > 0) {
    std::chrono::duration<double> elapsed = now - site.refilled_at;
    site.tokens = std::min(capacity, site.tokens + elapsed.count() * capacity / period_seconds);
    site.refilled_at = now;
  }

  Admission result;
  if (site.tokens < 1.0) {
    ++site.suppressed;
    return result;
  }

  site.tokens -= 1.0;
  result.allowed = true;
  result.suppressed = site.suppressed;
  site.suppressed = 0;
  return result;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  callsites_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace sniffer
