// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/peer_record.hpp"

#include <algorithm>
#include <cmath>

namespace sniffer {
namespace session {

// ============================================================================
// PortHistory
// ============================================================================

void PortHistory::Reset(uint16_t port) {
  list.assign(1, port);
  first = port;
  last = port;
}

void PortHistory::Record(uint16_t port) {
  if (std::find(list.begin(), list.end(), port) == list.end()) {
    list.push_back(port);
  }
  last = port;
}

std::vector<uint16_t> PortHistory::Intermediate() const {
  std::vector<uint16_t> out;
  for (auto it = list.rbegin(); it != list.rend(); ++it) {
    if (*it != first && *it != last) {
      out.push_back(*it);
    }
  }
  return out;
}

void AppendUnique(std::vector<std::string>& out, const std::vector<std::string>& items) {
  for (const auto& item : items) {
    if (std::find(out.begin(), out.end(), item) == out.end()) {
      out.push_back(item);
    }
  }
}

// ============================================================================
// PeerRecord
// ============================================================================

PeerRecord::PeerRecord(std::string ip, uint16_t port, util::Timestamp time) : ip_(std::move(ip)) {
  state_.ip = ip_;
  state_.ports.Reset(port);
  state_.packet_rate.t1 = time;
  state_.timestamps.first_seen = time;
  state_.timestamps.last_rejoin = time;
  state_.timestamps.last_seen = time;
}

PeerState PeerRecord::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool PeerRecord::IsConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.IsConnected();
}

PacketOutcome PeerRecord::RecordPacket(uint16_t port, util::Timestamp time, bool reset_ports_on_rejoin) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (state_.just_registered) {
    state_.just_registered = false;
    return PacketOutcome::Registered;
  }

  // Out-of-order capture timestamps never move last_seen backwards
  state_.timestamps.last_seen = std::max(state_.timestamps.last_seen, time);
  state_.total_packets++;
  state_.packet_rate.counter++;

  if (state_.timestamps.left) {
    state_.timestamps.left.reset();
    state_.timestamps.last_rejoin = time;
    state_.rejoin_count++;
    state_.packets_since_rejoin = 1;

    if (reset_ports_on_rejoin) {
      state_.ports.Reset(port);
      return PacketOutcome::Rejoined;
    }
    state_.ports.Record(port);
    return PacketOutcome::Rejoined;
  }

  state_.packets_since_rejoin++;
  state_.ports.Record(port);
  return PacketOutcome::Counted;
}

bool PeerRecord::TryMarkUserIPDetected(util::Timestamp time) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.connected_notified) {
    return false;
  }
  state_.connected_notified = true;
  state_.userip_detection = UserIPDetection{kStaticIPDetection, time};
  return true;
}

IdleTransition PeerRecord::MarkLeftIfIdle(util::Timestamp now, std::chrono::duration<double> timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  IdleTransition transition;
  if (state_.timestamps.left) {
    return transition;
  }
  if (now - state_.timestamps.last_seen < timeout) {
    return transition;
  }

  state_.timestamps.left = state_.timestamps.last_seen;
  transition.became_disconnected = true;

  if (state_.connected_notified) {
    state_.connected_notified = false;
    transition.fire_disconnected_edge = true;
  }
  return transition;
}

void PeerRecord::UpdatePacketRate(util::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  double elapsed = util::SecondsBetween(state_.packet_rate.t1, now);
  if (elapsed < 1.0) {
    return;
  }
  state_.packet_rate.rate = static_cast<uint64_t>(std::llround(static_cast<double>(state_.packet_rate.counter) / elapsed));
  state_.packet_rate.counter = 0;
  state_.packet_rate.t1 = now;
  state_.packet_rate.is_first_calculation = false;
}

void PeerRecord::SetUserIPAssociation(const userip::UserIPAssociation& association) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.userip = association;
}

void PeerRecord::ClearUserIPAssociation() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.userip.reset();
  state_.userip_detection.reset();
  state_.connected_notified = false;
}

void PeerRecord::MergeModMenuUsernames(const std::vector<std::string>& names) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppendUnique(state_.modmenu_usernames, names);
}

void PeerRecord::RefreshUsernames() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> merged;
  AppendUnique(merged, state_.modmenu_usernames);
  if (state_.userip) {
    AppendUnique(merged, state_.userip->usernames);
  }
  state_.usernames = std::move(merged);
}

bool PeerRecord::HasLocalGeo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.local_geo.has_value();
}

void PeerRecord::SetLocalGeo(const lookup::LocalGeoResult& geo) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.local_geo) {
    state_.local_geo = geo;
  }
}

bool PeerRecord::HasRemoteGeo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.remote_geo.has_value();
}

void PeerRecord::SetRemoteGeo(const lookup::RemoteGeoResult& geo) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.remote_geo) {
    state_.remote_geo = geo;
  }
}

}  // namespace session
}  // namespace sniffer
