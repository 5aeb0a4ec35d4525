// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sniffer {
namespace util {

// Process-wide cancellation flag shared by all workers.
// Sleeps go through WaitFor() so a stop request wakes them immediately.
class StopSignal {
public:
  void RequestStop();
  bool StopRequested() const;

  // Sleep up to `timeout`. Returns true if stop was requested.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Block until stop is requested.
  void Wait() const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool stopped_{false};
};

}  // namespace util
}  // namespace sniffer
