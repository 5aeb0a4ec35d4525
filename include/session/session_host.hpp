// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/peer_registry.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sniffer {
namespace session {

// SessionHostDetector - best-effort guess of the peer hosting the session
//
// The host is taken to be the peer that was already there when we joined:
// the earliest lastRejoin among connected peers, clearly ahead (>= 200 ms)
// of the next one, once it has sent enough packets to belong to the new
// session. The search restarts when the host leaves. When every connected
// peer goes silent at once the whole set is parked as "pending disconnection"
// and the search restarts after they leave.
//
// Only the presentation cycle calls Update(); the detector is not locked.
class SessionHostDetector {
public:
  static constexpr std::chrono::milliseconds MIN_REJOIN_GAP{200};
  static constexpr uint64_t MIN_HOST_PACKETS = 50;

  // `connected` holds the peers that are currently connected.
  void Update(const std::vector<PeerRecordPtr>& connected);

  const PeerRecordPtr& Host() const { return host_; }
  bool Searching() const { return searching_; }
  std::vector<std::string> PendingDisconnection() const;

  void Reset();

private:
  bool IsPendingDisconnection(const PeerRecordPtr& record) const;

  PeerRecordPtr host_;
  bool searching_{true};
  std::vector<PeerRecordPtr> pending_disconnection_;
};

}  // namespace session
}  // namespace sniffer
