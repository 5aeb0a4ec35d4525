// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/peer_registry.hpp"
#include "util/stop_signal.hpp"
#include "util/time.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace sniffer {
namespace session {

enum class PeerEventKind { Connected, Disconnected };

const char* PeerEventName(PeerEventKind kind);

struct PeerEvent {
  PeerRecordPtr record;
  PeerEventKind kind;
  util::Timestamp time;
};

// Lifecycle-edge dispatcher for UserIP-matched peers
//
// Design:
// - Producers (ingestion, presentation) call Post() and never block on
//   subscribers
// - The dispatcher worker delivers queued events in order through Run()
// - Callbacks are snapshotted under the lock and run without it
// - RAII-based subscription management
class SessionNotifications {
public:
  // Subscription handle - RAII wrapper
  // Automatically unsubscribes when destroyed
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void Unsubscribe();

  private:
    friend class SessionNotifications;
    Subscription(SessionNotifications* owner, size_t id);

    SessionNotifications* owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using PeerEventCallback = std::function<void(const PeerEvent& event)>;

  [[nodiscard]] Subscription Subscribe(PeerEventCallback callback);

  // Queue an event for asynchronous delivery.
  void Post(PeerEvent event);

  // Deliver everything queued so far on the calling thread. Returns the
  // number of events delivered.
  size_t Drain();

  // Dispatcher loop. Delivers what is still queued once stop is requested.
  void Run(const util::StopSignal& stop);

  size_t QueuedCount() const;

private:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

  void Unsubscribe(size_t id);
  void Deliver(const PeerEvent& event);

  struct CallbackEntry {
    size_t id;
    PeerEventCallback callback;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};  // 0 reserved for invalid

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<PeerEvent> queue_;
};

}  // namespace session
}  // namespace sniffer
