// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/stop_signal.hpp"

namespace sniffer {
namespace util {

void StopSignal::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool StopSignal::StopRequested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

bool StopSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return stopped_; });
}

void StopSignal::Wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return stopped_; });
}

}  // namespace util
}  // namespace sniffer
