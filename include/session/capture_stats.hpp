// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace sniffer {
namespace session {

// Capture-wide counters shown in the header summary: packet latency (arrival
// time minus capture timestamp), global packet rate and restart count.
// Written by ingestion, read by presentation.
class CaptureStats {
public:
  static constexpr std::chrono::seconds LATENCY_WINDOW{1};

  // Returns the packet latency in seconds (never negative).
  double RecordPacket(util::Timestamp packet_time, util::Timestamp now);

  // Mean latency of packets recorded within LATENCY_WINDOW of `now`; drops
  // older samples. 0 when there are none.
  double AverageLatency(util::Timestamp now);

  // Recompute the global rate once a second has elapsed since the last
  // computation. Returns the current rate.
  uint64_t UpdateGlobalRate(util::Timestamp now);
  uint64_t GlobalRate() const;

  void IncrementRestarts();
  uint32_t RestartCount() const;

private:
  mutable std::mutex mutex_;
  std::deque<std::pair<util::Timestamp, double>> latencies_;
  uint64_t global_counter_{0};
  uint64_t global_rate_{0};
  std::optional<util::Timestamp> global_t1_;
  uint32_t restarts_{0};
};

}  // namespace session
}  // namespace sniffer
