// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 IngestionWorker - turns decoded packets into peer lifecycle updates

 Per packet:
 1. Capture latency / global rate bookkeeping; drop on overflow
 2. Pick the remote side (configured local IP, else private-address rule)
 3. Find or register the PeerRecord
 4. UserIP detection and the "connected" hand-off (also on the first packet)
 5. Counters, ports and rejoin handling

 A packet whose remote side or port cannot be determined breaks the capture
 filter's guarantees and raises util::ContractViolation.
*/

#include "session/capture_stats.hpp"
#include "session/notifications.hpp"
#include "session/packet_source.hpp"
#include "session/peer_registry.hpp"
#include "util/stop_signal.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sniffer {
namespace userip {
class UserIPDatabase;
}  // namespace userip

namespace session {

enum class IngestResult {
  Processed,   // counted against an existing, connected peer
  Registered,  // first packet of a new peer
  Rejoined,    // peer came back after being marked left
  Overflow,    // dropped: capture is lagging beyond the overflow timer
};

struct RemoteEndpoint {
  std::string ip;
  uint16_t port;
};

class IngestionWorker {
public:
  static constexpr std::chrono::duration<double> DEFAULT_OVERFLOW_TIMER{3.0};

  struct Config {
    std::optional<std::string> local_ip;
    std::chrono::duration<double> overflow_timer;
    bool reset_ports_on_rejoin;
    bool userip_enabled;

    Config() : overflow_timer(DEFAULT_OVERFLOW_TIMER), reset_ports_on_rejoin(true), userip_enabled(true) {}
  };

  // `userip` may be null when UserIP matching is disabled.
  IngestionWorker(PeerRegistry& registry, CaptureStats& stats, SessionNotifications& notifications,
                  const userip::UserIPDatabase* userip, Config config = Config{});

  IngestResult ProcessPacket(const DecodedPacket& packet, util::Timestamp now);

  // Pull from `source` until it is exhausted or stop is requested. A lag
  // episode restarts the source once; recorded captures are replayed with
  // timestamps shifted to the current time.
  void Run(PacketSource& source, const util::StopSignal& stop);

  // Remote side of a packet. Throws util::ContractViolation if it cannot be
  // determined.
  static RemoteEndpoint ResolveRemote(const DecodedPacket& packet, const std::optional<std::string>& local_ip);

private:
  void DetectUserIP(const PeerRecordPtr& record, util::Timestamp now);

  PeerRegistry& registry_;
  CaptureStats& stats_;
  SessionNotifications& notifications_;
  const userip::UserIPDatabase* userip_;
  Config config_;
};

}  // namespace session
}  // namespace sniffer
