// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "lookup/geo_types.hpp"
#include "session/peer_record.hpp"
#include "userip/userip_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sniffer {
namespace session {

// Display-ready row of the session tables. Built from a PeerState copy, so
// renderers never touch a live record.
struct PeerView {
  std::string ip;
  bool connected{true};
  bool is_session_host{false};

  std::string first_seen;
  std::string last_rejoin;
  std::string last_seen;

  std::string usernames;
  uint32_t rejoins{0};
  uint64_t total_packets{0};
  uint64_t packets{0};
  uint64_t pps{0};
  bool pps_first_calculation{true};

  std::string first_port;
  std::string last_port;
  std::string intermediate_ports;

  lookup::LocalGeoDisplay local_geo;
  lookup::RemoteGeoDisplay remote_geo;

  std::optional<std::string> userip_database;
  std::optional<userip::DisplayColor> userip_color;
};

PeerView ProjectPeer(const PeerState& state, bool is_session_host);

}  // namespace session
}  // namespace sniffer
