// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/notifications.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace sniffer {
namespace session {

const char* PeerEventName(PeerEventKind kind) {
  switch (kind) {
  case PeerEventKind::Connected:
    return "connected";
  case PeerEventKind::Disconnected:
    return "disconnected";
  }
  return "unknown";
}

// ============================================================================
// SessionNotifications::Subscription
// ============================================================================

SessionNotifications::Subscription::Subscription(SessionNotifications* owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

SessionNotifications::Subscription::~Subscription() {
  Unsubscribe();
}

SessionNotifications::Subscription::Subscription(Subscription&& other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

SessionNotifications::Subscription& SessionNotifications::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void SessionNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// SessionNotifications
// ============================================================================

SessionNotifications::Subscription SessionNotifications::Subscribe(PeerEventCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;
  callbacks_.push_back(CallbackEntry{id, std::move(callback)});
  return Subscription(this, id);
}

void SessionNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                         [id](const CallbackEntry& entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

void SessionNotifications::Post(PeerEvent event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
}

void SessionNotifications::Deliver(const PeerEvent& event) {
  std::vector<PeerEventCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto& entry : callbacks_) {
      snapshot.push_back(entry.callback);
    }
  }

  LOG_SESSION_DEBUG("Peer {} {} ({} subscribers)", event.record->ip(), PeerEventName(event.kind), snapshot.size());

  for (const auto& callback : snapshot) {
    callback(event);
  }
}

size_t SessionNotifications::Drain() {
  std::deque<PeerEvent> pending;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    pending.swap(queue_);
  }

  for (const auto& event : pending) {
    Deliver(event);
  }
  return pending.size();
}

void SessionNotifications::Run(const util::StopSignal& stop) {
  while (!stop.StopRequested()) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, POLL_INTERVAL, [this] { return !queue_.empty(); });
    }
    Drain();
  }
  Drain();
}

size_t SessionNotifications::QueuedCount() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

}  // namespace session
}  // namespace sniffer
