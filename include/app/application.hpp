// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/config.hpp"
#include "app/worker_supervisor.hpp"
#include "lookup/geo_batch_client.hpp"
#include "lookup/ip_lookup_orchestrator.hpp"
#include "lookup/ip_lookup_sets.hpp"
#include "lookup/local_geo_database.hpp"
#include "session/capture_stats.hpp"
#include "session/ingestion_worker.hpp"
#include "session/mod_menu_names.hpp"
#include "session/notifications.hpp"
#include "session/packet_source.hpp"
#include "session/peer_registry.hpp"
#include "session/presentation_feed.hpp"
#include "session/snapshot_publisher.hpp"
#include "userip/userip_database.hpp"
#include "userip/userip_event_log.hpp"
#include "userip/userip_loader.hpp"
#include "util/stop_signal.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace sniffer {
namespace app {

// Application - owns the shared session state and the workers
//
// initialize() builds every component, start() spawns the ingestion,
// lookup, presentation and notification workers under a WorkerSupervisor,
// wait_for_shutdown() blocks until a signal or a crashed worker, then tears
// everything down within the grace period.
class Application {
public:
  static constexpr std::chrono::seconds SHUTDOWN_GRACE{3};
  static constexpr std::chrono::seconds STATUS_INTERVAL{5};

  explicit Application(AppConfig config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  static Application* instance();

  bool initialize();
  bool start();
  void stop();

  // Returns the process exit code.
  int wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }

  const session::SnapshotPublisher& publisher() const { return publisher_; }

private:
  bool init_input();
  bool init_userip();
  void init_lookup();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  void log_status();
  int shutdown();

  static Application* instance_;

  AppConfig config_;
  util::StopSignal stop_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  session::PeerRegistry registry_;
  session::CaptureStats stats_;
  session::SessionNotifications notifications_;
  session::SnapshotPublisher publisher_;
  lookup::IPLookupSets lookup_sets_;

  std::unique_ptr<session::PacketSource> source_;
  std::unique_ptr<userip::UserIPDatabase> userip_db_;
  std::unique_ptr<userip::UserIPSource> userip_source_;
  std::unique_ptr<userip::UserIPEventLog> userip_log_;
  std::unique_ptr<session::UsernameSource> modmenu_names_;
  std::unique_ptr<lookup::LocalGeoDatabase> local_geo_;
  std::unique_ptr<lookup::GeoBatchClient> batch_client_;

  std::unique_ptr<session::IngestionWorker> ingestion_;
  std::unique_ptr<lookup::IPLookupOrchestrator> lookup_;
  std::unique_ptr<session::PresentationFeed> presentation_;

  std::unique_ptr<WorkerSupervisor> supervisor_;
};

}  // namespace app
}  // namespace sniffer
