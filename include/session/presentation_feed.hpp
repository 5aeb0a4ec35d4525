// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PresentationFeed - periodic enrichment, timeout and snapshot cycle

 Once per cycle (~100 ms):
 1. Reload UserIP databases and mod-menu names (each at most once a second)
 2. Per record: UserIP association, usernames, idle timeout and the
    "disconnected" hand-off, local geo lookup, packet rate
 3. Session-host detection (program preset)
 4. Sort both tables, cap the disconnected one
 5. Publish a SessionSnapshot with the header summary

 Owns the presentation-side writes to PeerRecord (see peer_record.hpp).
*/

#include "session/capture_stats.hpp"
#include "session/mod_menu_names.hpp"
#include "session/notifications.hpp"
#include "session/peer_registry.hpp"
#include "session/session_host.hpp"
#include "session/session_sort.hpp"
#include "session/snapshot_publisher.hpp"
#include "util/stop_signal.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace sniffer {
namespace lookup {
class LocalGeoDatabase;
}  // namespace lookup
namespace userip {
class UserIPDatabase;
class UserIPSource;
}  // namespace userip

namespace session {

class PresentationFeed {
public:
  static constexpr std::chrono::duration<double> DEFAULT_DISCONNECTED_TIMER{10.0};
  static constexpr size_t DEFAULT_DISCONNECTED_LIMIT = 6;
  static constexpr std::chrono::milliseconds DEFAULT_CYCLE_INTERVAL{100};
  static constexpr std::chrono::seconds RELOAD_INTERVAL{1};

  static constexpr uint64_t PPS_WARNING = 1500;
  static constexpr uint64_t PPS_CRITICAL = 3000;

  struct Config {
    std::chrono::duration<double> disconnected_timer;
    size_t disconnected_limit;  // 0: no cap
    SortField connected_sort;
    SortField disconnected_sort;
    bool detect_session_host;
    bool userip_enabled;
    std::chrono::duration<double> overflow_timer;
    std::chrono::milliseconds cycle_interval;

    Config()
        : disconnected_timer(DEFAULT_DISCONNECTED_TIMER),
          disconnected_limit(DEFAULT_DISCONNECTED_LIMIT),
          connected_sort(SortField::LastRejoin),
          disconnected_sort(SortField::LastSeen),
          detect_session_host(true),
          userip_enabled(true),
          overflow_timer(3.0),
          cycle_interval(DEFAULT_CYCLE_INTERVAL) {}
  };

  // Optional collaborators; any of them may be null.
  struct Sources {
    userip::UserIPDatabase* userip{nullptr};
    userip::UserIPSource* userip_source{nullptr};
    UsernameSource* usernames{nullptr};
    lookup::LocalGeoDatabase* local_geo{nullptr};
  };

  PresentationFeed(PeerRegistry& registry, CaptureStats& stats, SessionNotifications& notifications,
                   SnapshotPublisher& publisher, Sources sources, Config config = Config{});

  // One full cycle at `now`. Publishes and returns the snapshot.
  SessionSnapshot RunCycle(util::Timestamp now);

  void Run(const util::StopSignal& stop);

  const SessionHostDetector& host_detector() const { return host_; }

  static Severity LatencySeverity(double latency, double overflow_timer);
  static Severity PPSSeverity(uint64_t pps);

private:
  void ReloadSources(util::Timestamp now);
  void UpdateRecord(const PeerRecordPtr& record, util::Timestamp now);

  PeerRegistry& registry_;
  CaptureStats& stats_;
  SessionNotifications& notifications_;
  SnapshotPublisher& publisher_;
  Sources sources_;
  Config config_;

  SessionHostDetector host_;
  UsernamesByIP modmenu_names_;
  std::optional<util::Timestamp> last_userip_reload_;
  std::optional<util::Timestamp> last_modmenu_reload_;
};

}  // namespace session
}  // namespace sniffer
