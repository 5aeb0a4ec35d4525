// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PeerRecord - per-IP session state

 One record exists per remote IP seen during the run; it is never deleted.

 Write ownership is partitioned by worker:
 - Ingestion:    packet counters, ports, last_seen, rejoin bookkeeping,
                 UserIP detection (detection time and the association it
                 matched) and the "connected" edge
 - Presentation: idle timeout (left), packet rate, UserIP association
                 refresh after a database reload, usernames, local geo
                 slot, the "disconnected" edge
 - Lookup:       remote geo slot

 Every operation takes the record mutex for its own short critical section;
 State() returns a copy so readers never hold the lock while formatting.
*/

#include "lookup/geo_types.hpp"
#include "userip/userip_types.hpp"
#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace session {

struct PortHistory {
  uint16_t first{0};
  uint16_t last{0};
  std::vector<uint16_t> list;  // insertion order, no duplicates

  PortHistory() = default;
  explicit PortHistory(uint16_t port) { Reset(port); }

  void Reset(uint16_t port);

  // Append if unseen and make it the last port.
  void Record(uint16_t port);

  // Ports other than first/last, most recent first.
  std::vector<uint16_t> Intermediate() const;
};

struct PacketRate {
  util::Timestamp t1{};
  uint64_t counter{0};
  uint64_t rate{0};
  bool is_first_calculation{true};
};

struct PeerTimestamps {
  util::Timestamp first_seen{};
  util::Timestamp last_rejoin{};
  util::Timestamp last_seen{};
  std::optional<util::Timestamp> left;
};

struct UserIPDetection {
  std::string type;
  util::Timestamp time{};
};

inline constexpr const char* kStaticIPDetection = "Static IP";

struct PeerState {
  std::string ip;
  uint64_t packets_since_rejoin{1};
  uint64_t total_packets{1};
  uint32_t rejoin_count{0};
  PortHistory ports;
  PacketRate packet_rate;
  PeerTimestamps timestamps;

  std::vector<std::string> usernames;
  std::vector<std::string> modmenu_usernames;

  std::optional<userip::UserIPAssociation> userip;
  std::optional<UserIPDetection> userip_detection;

  // Set when the "connected" hand-off fires; cleared at the next disconnect
  bool connected_notified{false};
  bool just_registered{true};

  std::optional<lookup::LocalGeoResult> local_geo;
  std::optional<lookup::RemoteGeoResult> remote_geo;

  bool IsConnected() const { return !timestamps.left.has_value(); }
};

enum class PacketOutcome {
  Registered,  // first packet of a new record, nothing counted
  Counted,     // regular packet while connected
  Rejoined,    // first packet after the peer was marked left
};

struct IdleTransition {
  bool became_disconnected{false};
  bool fire_disconnected_edge{false};
};

class PeerRecord {
public:
  PeerRecord(std::string ip, uint16_t port, util::Timestamp time);

  PeerRecord(const PeerRecord&) = delete;
  PeerRecord& operator=(const PeerRecord&) = delete;

  const std::string& ip() const { return ip_; }

  PeerState State() const;
  bool IsConnected() const;

  // --- Ingestion ---

  // Apply one packet. The registration packet only clears just_registered.
  PacketOutcome RecordPacket(uint16_t port, util::Timestamp time, bool reset_ports_on_rejoin);

  // Fire the "connected" edge once per connection period. Returns false if
  // it already fired.
  bool TryMarkUserIPDetected(util::Timestamp time);

  // --- Presentation ---

  // Mark left = last_seen once idle for at least `timeout`.
  IdleTransition MarkLeftIfIdle(util::Timestamp now, std::chrono::duration<double> timeout);

  // Recompute the rate once at least one second has elapsed since t1.
  void UpdatePacketRate(util::Timestamp now);

  void SetUserIPAssociation(const userip::UserIPAssociation& association);

  // Drops association, detection metadata and the connected edge.
  void ClearUserIPAssociation();

  void MergeModMenuUsernames(const std::vector<std::string>& names);

  // usernames = mod-menu names followed by UserIP names, duplicates removed.
  void RefreshUsernames();

  bool HasLocalGeo() const;
  void SetLocalGeo(const lookup::LocalGeoResult& geo);

  // --- Lookup ---

  bool HasRemoteGeo() const;
  void SetRemoteGeo(const lookup::RemoteGeoResult& geo);

private:
  const std::string ip_;
  mutable std::mutex mutex_;
  PeerState state_;
};

// Append `items` to `out`, skipping values already present.
void AppendUnique(std::vector<std::string>& out, const std::vector<std::string>& items);

}  // namespace session
}  // namespace sniffer
