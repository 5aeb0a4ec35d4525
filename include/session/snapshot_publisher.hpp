// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/peer_view.hpp"
#include "util/time.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace session {

enum class Severity { Normal, Warning, Critical };

const char* SeverityName(Severity severity);

struct HeaderSummary {
  double average_latency{0.0};  // seconds, last second of packets
  uint64_t global_pps{0};
  uint32_t capture_restarts{0};
  Severity latency_severity{Severity::Normal};
  Severity pps_severity{Severity::Normal};

  size_t userip_databases{0};
  size_t userip_conflicts{0};
  size_t userip_invalid{0};
  size_t userip_corrupted{0};

  size_t connected_count{0};
  size_t disconnected_count{0};  // before the display cap
  std::optional<std::string> session_host;
};

// Immutable result of one presentation cycle.
struct SessionSnapshot {
  util::Timestamp time{};
  uint64_t generation{0};
  std::vector<PeerView> connected;
  std::vector<PeerView> disconnected;
  HeaderSummary header;
};

// Latest-value hand-off to renderers. Publish() replaces the snapshot and
// marks it fresh; TakeFresh() returns it once.
class SnapshotPublisher {
public:
  void Publish(SessionSnapshot snapshot);

  std::shared_ptr<const SessionSnapshot> Latest() const;

  bool HasFresh() const;

  // nullptr if nothing new since the last call.
  std::shared_ptr<const SessionSnapshot> TakeFresh();

  uint64_t Generation() const;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const SessionSnapshot> latest_;
  bool fresh_{false};
  uint64_t generation_{0};
};

}  // namespace session
}  // namespace sniffer
