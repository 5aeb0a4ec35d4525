// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/ingestion_worker.hpp"

#include "userip/userip_database.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

namespace sniffer {
namespace session {

IngestionWorker::IngestionWorker(PeerRegistry& registry, CaptureStats& stats, SessionNotifications& notifications,
                                 const userip::UserIPDatabase* userip, Config config)
    : registry_(registry), stats_(stats), notifications_(notifications), userip_(userip), config_(std::move(config)) {}

RemoteEndpoint IngestionWorker::ResolveRemote(const DecodedPacket& packet,
                                              const std::optional<std::string>& local_ip) {
  bool src_is_remote;

  if (local_ip) {
    if (packet.src_ip == *local_ip) {
      src_is_remote = false;
    } else if (packet.dst_ip == *local_ip) {
      src_is_remote = true;
    } else {
      throw util::ContractViolation("Packet " + packet.src_ip + " -> " + packet.dst_ip +
                                    " does not involve local IP " + *local_ip);
    }
  } else {
    bool src_private = util::IsPrivateIPv4(packet.src_ip);
    bool dst_private = util::IsPrivateIPv4(packet.dst_ip);
    if (src_private == dst_private) {
      throw util::ContractViolation("Cannot tell the remote side of " + packet.src_ip + " -> " + packet.dst_ip +
                                    (src_private ? " (both private)" : " (neither private)"));
    }
    src_is_remote = dst_private;
  }

  const auto& ip = src_is_remote ? packet.src_ip : packet.dst_ip;
  const auto& port = src_is_remote ? packet.src_port : packet.dst_port;
  if (!port) {
    throw util::ContractViolation("No port for remote peer " + ip);
  }
  return RemoteEndpoint{ip, *port};
}

void IngestionWorker::DetectUserIP(const PeerRecordPtr& record, util::Timestamp now) {
  if (!config_.userip_enabled || !userip_) {
    return;
  }

  auto association = userip_->Lookup(record->ip());
  if (!association) {
    return;
  }
  if (!record->TryMarkUserIPDetected(now)) {
    return;
  }

  record->SetUserIPAssociation(*association);
  LOG_USERIP_INFO("Detected {} from database \"{}\"", record->ip(), association->database_name);
  notifications_.Post(PeerEvent{record, PeerEventKind::Connected, now});
}

IngestResult IngestionWorker::ProcessPacket(const DecodedPacket& packet, util::Timestamp now) {
  double latency = stats_.RecordPacket(packet.timestamp, now);
  if (latency >= config_.overflow_timer.count()) {
    return IngestResult::Overflow;
  }

  RemoteEndpoint remote = ResolveRemote(packet, config_.local_ip);

  PeerRecordPtr record = registry_.Get(remote.ip);
  if (!record) {
    record = registry_.AddNew(remote.ip, remote.port, packet.timestamp);
  }

  DetectUserIP(record, now);

  switch (record->RecordPacket(remote.port, packet.timestamp, config_.reset_ports_on_rejoin)) {
  case PacketOutcome::Registered:
    return IngestResult::Registered;
  case PacketOutcome::Rejoined:
    LOG_SESSION_DEBUG("Peer {} rejoined on port {}", remote.ip, remote.port);
    return IngestResult::Rejoined;
  case PacketOutcome::Counted:
    break;
  }
  return IngestResult::Processed;
}

void IngestionWorker::Run(PacketSource& source, const util::StopSignal& stop) {
  const bool live = source.IsLive();
  LOG_CAPTURE_INFO("Ingestion worker started ({} capture)", live ? "live" : "recorded");

  // Recorded captures are shifted so their first packet lands on "now"
  std::optional<util::Timestamp::duration> replay_shift;
  // Packets captured before this belong to the backlog of the last restart
  std::optional<util::Timestamp> backlog_cutoff;

  while (!stop.StopRequested()) {
    auto packet = source.Next();
    if (!packet) {
      if (!stop.StopRequested()) {
        LOG_CAPTURE_INFO("Packet source exhausted");
      }
      break;
    }

    const auto now = util::GetWallClock();
    if (!live) {
      if (!replay_shift) {
        replay_shift = now - packet->timestamp;
      }
      packet->timestamp += *replay_shift;
    }

    if (ProcessPacket(*packet, now) != IngestResult::Overflow) {
      continue;
    }
    if (backlog_cutoff && packet->timestamp < *backlog_cutoff) {
      // Same lag episode; the source has already been restarted
      continue;
    }

    backlog_cutoff = now - std::chrono::duration_cast<util::Timestamp::duration>(config_.overflow_timer);
    stats_.IncrementRestarts();
    LOG_CAPTURE_WARN_RL("Capture is lagging beyond {:.1f}s, restarting packet source",
                        config_.overflow_timer.count());
    // The source sees the capture's own timestamps
    auto discard_before = replay_shift ? *backlog_cutoff - *replay_shift : *backlog_cutoff;
    if (!source.Restart(discard_before)) {
      LOG_CAPTURE_ERROR("Packet source could not be restarted");
      break;
    }
  }

  LOG_CAPTURE_INFO("Ingestion worker stopped ({} peers)", registry_.Size());
}

}  // namespace session
}  // namespace sniffer
