// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_host.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <utility>

namespace sniffer {
namespace session {

void SessionHostDetector::Reset() {
  host_.reset();
  searching_ = true;
  pending_disconnection_.clear();
}

bool SessionHostDetector::IsPendingDisconnection(const PeerRecordPtr& record) const {
  return std::find(pending_disconnection_.begin(), pending_disconnection_.end(), record) !=
         pending_disconnection_.end();
}

std::vector<std::string> SessionHostDetector::PendingDisconnection() const {
  std::vector<std::string> ips;
  ips.reserve(pending_disconnection_.size());
  for (const auto& record : pending_disconnection_) {
    ips.push_back(record->ip());
  }
  return ips;
}

void SessionHostDetector::Update(const std::vector<PeerRecordPtr>& connected) {
  if (host_ && !host_->IsConnected()) {
    LOG_SESSION_INFO("Session host {} left, searching again", host_->ip());
    host_.reset();
    searching_ = true;
  }

  if (!pending_disconnection_.empty() &&
      std::all_of(pending_disconnection_.begin(), pending_disconnection_.end(),
                  [](const PeerRecordPtr& record) { return !record->IsConnected(); })) {
    Reset();
  }

  if (connected.empty()) {
    Reset();
    return;
  }

  // Point-in-time state for the peers considered this cycle
  std::vector<std::pair<PeerRecordPtr, PeerState>> peers;
  peers.reserve(connected.size());
  for (const auto& record : connected) {
    peers.emplace_back(record, record->State());
  }

  bool all_silent = std::all_of(peers.begin(), peers.end(), [](const auto& peer) {
    return !peer.second.packet_rate.is_first_calculation && peer.second.packet_rate.rate == 0;
  });
  if (all_silent) {
    pending_disconnection_ = connected;
    return;
  }

  if (!searching_) {
    return;
  }

  std::stable_sort(peers.begin(), peers.end(), [](const auto& a, const auto& b) {
    return a.second.timestamps.last_rejoin < b.second.timestamps.last_rejoin;
  });

  const std::pair<PeerRecordPtr, PeerState>* candidate = nullptr;
  if (peers.size() == 1) {
    candidate = &peers[0];
  } else if (peers[1].second.timestamps.last_rejoin - peers[0].second.timestamps.last_rejoin >= MIN_REJOIN_GAP) {
    candidate = &peers[0];
  }

  if (candidate && !IsPendingDisconnection(candidate->first) &&
      candidate->second.packets_since_rejoin >= MIN_HOST_PACKETS) {
    host_ = candidate->first;
    searching_ = false;
    LOG_SESSION_INFO("Session host is {}", host_->ip());
  }
}

}  // namespace session
}  // namespace sniffer
