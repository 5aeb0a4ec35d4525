// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/presentation_feed.hpp"

#include "lookup/local_geo_database.hpp"
#include "session/peer_view.hpp"
#include "userip/userip_database.hpp"
#include "userip/userip_loader.hpp"
#include "util/logging.hpp"

#include <utility>
#include <vector>

namespace sniffer {
namespace session {

PresentationFeed::PresentationFeed(PeerRegistry& registry, CaptureStats& stats, SessionNotifications& notifications,
                                   SnapshotPublisher& publisher, Sources sources, Config config)
    : registry_(registry),
      stats_(stats),
      notifications_(notifications),
      publisher_(publisher),
      sources_(sources),
      config_(config) {}

Severity PresentationFeed::LatencySeverity(double latency, double overflow_timer) {
  if (latency >= 0.9 * overflow_timer) {
    return Severity::Critical;
  }
  if (latency >= 0.75 * overflow_timer) {
    return Severity::Warning;
  }
  return Severity::Normal;
}

Severity PresentationFeed::PPSSeverity(uint64_t pps) {
  if (pps >= PPS_CRITICAL) {
    return Severity::Critical;
  }
  if (pps >= PPS_WARNING) {
    return Severity::Warning;
  }
  return Severity::Normal;
}

void PresentationFeed::ReloadSources(util::Timestamp now) {
  if (sources_.usernames && (!last_modmenu_reload_ || now - *last_modmenu_reload_ >= RELOAD_INTERVAL)) {
    last_modmenu_reload_ = now;
    modmenu_names_ = sources_.usernames->Refresh();
  }

  if (config_.userip_enabled && sources_.userip && sources_.userip_source &&
      (!last_userip_reload_ || now - *last_userip_reload_ >= RELOAD_INTERVAL)) {
    last_userip_reload_ = now;
    sources_.userip->Rebuild(sources_.userip_source->Load());
  }
}

void PresentationFeed::UpdateRecord(const PeerRecordPtr& record, util::Timestamp now) {
  if (config_.userip_enabled && sources_.userip) {
    if (!sources_.userip->UpdatePlayerAssociation(*record)) {
      record->ClearUserIPAssociation();
    }
  }

  auto names = modmenu_names_.find(record->ip());
  if (names != modmenu_names_.end()) {
    record->MergeModMenuUsernames(names->second);
  }
  record->RefreshUsernames();

  IdleTransition transition = record->MarkLeftIfIdle(now, config_.disconnected_timer);
  if (transition.became_disconnected) {
    LOG_SESSION_DEBUG("Peer {} timed out", record->ip());
  }
  if (transition.fire_disconnected_edge) {
    notifications_.Post(PeerEvent{record, PeerEventKind::Disconnected, now});
  }

  if (sources_.local_geo && !record->HasLocalGeo()) {
    record->SetLocalGeo(lookup::ResolveLocalGeo(*sources_.local_geo, record->ip()));
  }

  if (record->IsConnected()) {
    record->UpdatePacketRate(now);
  }
}

SessionSnapshot PresentationFeed::RunCycle(util::Timestamp now) {
  ReloadSources(now);

  std::vector<PeerRecordPtr> connected;
  std::vector<PeerRecordPtr> disconnected;
  for (const auto& record : registry_.Snapshot()) {
    UpdateRecord(record, now);
    (record->IsConnected() ? connected : disconnected).push_back(record);
  }

  if (config_.detect_session_host) {
    host_.Update(connected);
  }

  std::vector<PeerState> connected_states;
  connected_states.reserve(connected.size());
  for (const auto& record : connected) {
    connected_states.push_back(record->State());
  }
  std::vector<PeerState> disconnected_states;
  disconnected_states.reserve(disconnected.size());
  for (const auto& record : disconnected) {
    disconnected_states.push_back(record->State());
  }

  SortPeers(connected_states, config_.connected_sort);
  SortPeers(disconnected_states, config_.disconnected_sort);

  SessionSnapshot snapshot;
  snapshot.time = now;

  const PeerRecordPtr& host = host_.Host();
  auto is_host = [&host](const PeerState& state) { return host && host->ip() == state.ip; };

  for (const auto& state : connected_states) {
    snapshot.connected.push_back(ProjectPeer(state, is_host(state)));
  }
  size_t shown = disconnected_states.size();
  if (config_.disconnected_limit > 0 && shown > config_.disconnected_limit) {
    shown = config_.disconnected_limit;
  }
  for (size_t i = 0; i < shown; ++i) {
    snapshot.disconnected.push_back(ProjectPeer(disconnected_states[i], false));
  }

  HeaderSummary& header = snapshot.header;
  header.average_latency = stats_.AverageLatency(now);
  header.global_pps = stats_.UpdateGlobalRate(now);
  header.capture_restarts = stats_.RestartCount();
  header.latency_severity = LatencySeverity(header.average_latency, config_.overflow_timer.count());
  header.pps_severity = PPSSeverity(header.global_pps);
  if (config_.userip_enabled && sources_.userip) {
    header.userip_databases = sources_.userip->DatabaseCount();
    header.userip_conflicts = sources_.userip->ConflictCount();
    header.userip_invalid = sources_.userip->InvalidCount();
    header.userip_corrupted = sources_.userip->CorruptedCount();
  }
  header.connected_count = connected_states.size();
  header.disconnected_count = disconnected_states.size();
  if (host) {
    header.session_host = host->ip();
  }

  publisher_.Publish(snapshot);
  snapshot.generation = publisher_.Generation();
  return snapshot;
}

void PresentationFeed::Run(const util::StopSignal& stop) {
  LOG_SESSION_INFO("Presentation feed started");

  uint64_t cycles = 0;
  while (!stop.StopRequested()) {
    RunCycle(util::GetWallClock());
    ++cycles;
    if (stop.WaitFor(config_.cycle_interval)) {
      break;
    }
  }

  LOG_SESSION_INFO("Presentation feed stopped after {} cycles", cycles);
}

}  // namespace session
}  // namespace sniffer
