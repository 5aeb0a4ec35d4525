// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"

#include "app/version.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace sniffer {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(AppConfig config) : config_(std::move(config)) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  std::cout << GetFullVersionString() << "\n" << std::flush;

  LOG_APP_INFO("Initializing session sniffer (preset {})...", PresetName(config_.preset));

  if (!init_input()) {
    LOG_APP_ERROR("Failed to open capture input");
    return false;
  }

  if (!init_userip()) {
    LOG_APP_ERROR("Failed to initialize UserIP databases");
    return false;
  }

  init_lookup();

  if (!config_.modmenu_logs.empty()) {
    modmenu_names_ = std::make_unique<session::ModMenuLogReader>(config_.modmenu_logs);
  }
  local_geo_ = std::make_unique<lookup::NullLocalGeoDatabase>();

  ingestion_ = std::make_unique<session::IngestionWorker>(registry_, stats_, notifications_, userip_db_.get(),
                                                          config_.ingestion);

  session::PresentationFeed::Sources sources;
  sources.userip = userip_db_.get();
  sources.userip_source = userip_source_.get();
  sources.usernames = modmenu_names_.get();
  sources.local_geo = local_geo_.get();
  presentation_ = std::make_unique<session::PresentationFeed>(registry_, stats_, notifications_, publisher_, sources,
                                                              config_.presentation);

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_input() {
  if (!config_.input_path) {
    LOG_APP_INFO("Reading capture lines from stdin");
    source_ = std::make_unique<session::StreamPacketSource>(std::cin);
    return true;
  }

  auto source = std::make_unique<session::StreamPacketSource>(config_.input_path->string());
  if (!source->IsOpen()) {
    LOG_APP_ERROR("Cannot open capture input {}", config_.input_path->string());
    return false;
  }
  LOG_APP_INFO("Reading capture lines from {}", config_.input_path->string());
  source_ = std::move(source);
  return true;
}

bool Application::init_userip() {
  if (!config_.userip_enabled) {
    LOG_APP_INFO("UserIP matching disabled");
    return true;
  }

  if (!util::ensure_directory(config_.userip_dir.parent_path().empty() ? std::filesystem::path(".")
                                                                          : config_.userip_dir.parent_path())) {
    LOG_APP_ERROR("Cannot create directory for {}", config_.userip_dir.string());
    return false;
  }

  auto loader = std::make_unique<userip::UserIPDirectoryLoader>(config_.userip_dir);
  userip_db_ = std::make_unique<userip::UserIPDatabase>();

  // First load up front so detection works from the first packet
  userip_db_->Rebuild(loader->Load());
  LOG_APP_INFO("Loaded {} UserIP databases from {}", userip_db_->DatabaseCount(), config_.userip_dir.string());

  userip_source_ = std::move(loader);
  userip_log_ = std::make_unique<userip::UserIPEventLog>(config_.userip_log);
  userip_log_->Attach(notifications_);
  return true;
}

void Application::init_lookup() {
  if (!config_.lookup_enabled) {
    LOG_APP_INFO("Remote IP lookup disabled");
    return;
  }

  LOG_APP_INFO("Remote IP lookup via {}:{}", config_.http.host, config_.http.port);
  batch_client_ = std::make_unique<lookup::HttpGeoBatchClient>(config_.http);
  lookup_ = std::make_unique<lookup::IPLookupOrchestrator>(registry_, lookup_sets_, *batch_client_, config_.lookup);
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting session sniffer...");

  setup_signal_handlers();

  supervisor_ = std::make_unique<WorkerSupervisor>(stop_);
  supervisor_->Spawn("notifications", [this] { notifications_.Run(stop_); });
  supervisor_->Spawn("presentation", [this] { presentation_->Run(stop_); });
  if (lookup_) {
    supervisor_->Spawn("lookup", [this] { lookup_->Run(stop_); });
  }
  supervisor_->Spawn("ingestion", [this] { ingestion_->Run(*source_, stop_); });

  running_ = true;

  LOG_APP_INFO("Session sniffer started");
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown_requested_ = true;
  shutdown();
}

int Application::wait_for_shutdown() {
  auto last_status = util::GetSteadyTime();

  while (running_ && !shutdown_requested_ && !stop_.StopRequested()) {
    stop_.WaitFor(std::chrono::milliseconds(100));

    auto now = util::GetSteadyTime();
    if (now - last_status >= STATUS_INTERVAL) {
      log_status();
      last_status = now;
    }
  }

  return shutdown();
}

void Application::log_status() {
  auto snapshot = publisher_.TakeFresh();
  if (!snapshot) {
    return;
  }

  const auto& header = snapshot->header;
  LOG_APP_INFO("{} connected, {} disconnected | host {} | {} pps ({}) | latency {:.3f}s ({}) | restarts {}",
               header.connected_count, header.disconnected_count, header.session_host.value_or("unknown"),
               header.global_pps, session::SeverityName(header.pps_severity), header.average_latency,
               session::SeverityName(header.latency_severity), header.capture_restarts);
  if (header.userip_conflicts > 0 || header.userip_invalid > 0 || header.userip_corrupted > 0) {
    LOG_APP_INFO("UserIP: {} databases, {} conflicts, {} invalid entries, {} corrupted files",
                 header.userip_databases, header.userip_conflicts, header.userip_invalid,
                 header.userip_corrupted);
  }
}

int Application::shutdown() {
  if (!running_) {
    return EXIT_SUCCESS;
  }

  running_ = false;

  bool crashed = supervisor_->Crashed();
  if (crashed) {
    LOG_APP_ERROR("Session sniffer crashed:");
    for (const auto& failure : supervisor_->Failures()) {
      LOG_APP_ERROR("  worker {}: {}", failure.worker, failure.what);
    }
  } else {
    LOG_APP_INFO("Shutting down session sniffer...");
  }

  stop_.RequestStop();
  if (source_) {
    source_->Stop();
  }

  auto stragglers = supervisor_->JoinAll(SHUTDOWN_GRACE);
  int exit_code = crashed ? EXIT_FAILURE : EXIT_SUCCESS;
  if (!stragglers.empty()) {
    LOG_APP_ERROR("Forcing exit, workers still running: {}", fmt::join(stragglers, ", "));
    TerminateProcess(exit_code);
  }

  if (userip_log_) {
    userip_log_->Detach();
  }

  LOG_APP_INFO("Shutdown complete ({} peers seen)", registry_.Size());
  return exit_code;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE to prevent crashes when the output pipe closes
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal\n";
    (void)!write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace sniffer
