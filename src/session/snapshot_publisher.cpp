// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/snapshot_publisher.hpp"

namespace sniffer {
namespace session {

const char* SeverityName(Severity severity) {
  switch (severity) {
  case Severity::Normal:
    return "normal";
  case Severity::Warning:
    return "warning";
  case Severity::Critical:
    return "critical";
  }
  return "unknown";
}

void SnapshotPublisher::Publish(SessionSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.generation = ++generation_;
  latest_ = std::make_shared<const SessionSnapshot>(std::move(snapshot));
  fresh_ = true;
}

std::shared_ptr<const SessionSnapshot> SnapshotPublisher::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

bool SnapshotPublisher::HasFresh() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fresh_;
}

std::shared_ptr<const SessionSnapshot> SnapshotPublisher::TakeFresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!fresh_) {
    return nullptr;
  }
  fresh_ = false;
  return latest_;
}

uint64_t SnapshotPublisher::Generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

}  // namespace session
}  // namespace sniffer
