// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/capture_stats.hpp"

#include <algorithm>
#include <cmath>

namespace sniffer {
namespace session {

double CaptureStats::RecordPacket(util::Timestamp packet_time, util::Timestamp now) {
  double latency = std::max(0.0, util::SecondsBetween(packet_time, now));

  std::lock_guard<std::mutex> lock(mutex_);
  latencies_.emplace_back(now, latency);
  global_counter_++;
  if (!global_t1_) {
    global_t1_ = now;
  }
  return latency;
}

double CaptureStats::AverageLatency(util::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);

  while (!latencies_.empty() && now - latencies_.front().first > LATENCY_WINDOW) {
    latencies_.pop_front();
  }
  if (latencies_.empty()) {
    return 0.0;
  }

  double total = 0.0;
  for (const auto& [time, latency] : latencies_) {
    total += latency;
  }
  return total / static_cast<double>(latencies_.size());
}

uint64_t CaptureStats::UpdateGlobalRate(util::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!global_t1_) {
    global_t1_ = now;
    return global_rate_;
  }

  double elapsed = util::SecondsBetween(*global_t1_, now);
  if (elapsed >= 1.0) {
    global_rate_ = static_cast<uint64_t>(std::llround(static_cast<double>(global_counter_) / elapsed));
    global_counter_ = 0;
    global_t1_ = now;
  }
  return global_rate_;
}

uint64_t CaptureStats::GlobalRate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_rate_;
}

void CaptureStats::IncrementRestarts() {
  std::lock_guard<std::mutex> lock(mutex_);
  restarts_++;
}

uint32_t CaptureStats::RestartCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restarts_;
}

}  // namespace session
}  // namespace sniffer
