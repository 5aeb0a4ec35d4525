// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/peer_view.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace sniffer {
namespace session {

PeerView ProjectPeer(const PeerState& state, bool is_session_host) {
  PeerView view;
  view.ip = state.ip;
  view.connected = state.IsConnected();
  view.is_session_host = is_session_host;

  view.first_seen = util::FormatClockTime(state.timestamps.first_seen);
  view.last_rejoin = util::FormatClockTime(state.timestamps.last_rejoin);
  view.last_seen = util::FormatClockTime(state.timestamps.last_seen);

  view.usernames = fmt::format("{}", fmt::join(state.usernames, ", "));
  view.rejoins = state.rejoin_count;
  view.total_packets = state.total_packets;
  view.packets = state.packets_since_rejoin;
  view.pps = state.packet_rate.rate;
  view.pps_first_calculation = state.packet_rate.is_first_calculation;

  view.first_port = std::to_string(state.ports.first);
  view.last_port = std::to_string(state.ports.last);
  view.intermediate_ports = fmt::format("{}", fmt::join(state.ports.Intermediate(), ", "));

  view.local_geo = lookup::ProjectLocalGeo(state.local_geo);
  view.remote_geo = lookup::ProjectRemoteGeo(state.remote_geo);

  if (state.userip) {
    view.userip_database = state.userip->database_name;
    view.userip_color = state.userip->settings.color;
  }
  return view;
}

}  // namespace session
}  // namespace sniffer
