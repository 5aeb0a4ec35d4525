// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "userip/userip_event_log.hpp"

#include "lookup/geo_types.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <vector>

namespace sniffer {
namespace userip {

UserIPEventLog::UserIPEventLog(std::filesystem::path path) : path_(std::move(path)) {}

void UserIPEventLog::Attach(session::SessionNotifications& notifications) {
  subscription_ = notifications.Subscribe([this](const session::PeerEvent& event) { OnPeerEvent(event); });
}

void UserIPEventLog::Detach() {
  subscription_.Unsubscribe();
}

std::string UserIPEventLog::FormatLine(const session::PeerState& state) {
  std::vector<std::string> usernames;
  std::string database;
  if (state.userip) {
    usernames = state.userip->usernames;
    database = state.userip->database_name;
  }

  std::vector<uint16_t> ports(state.ports.list.rbegin(), state.ports.list.rend());

  std::string detected_at = state.userip_detection ? util::FormatDateTime(state.userip_detection->time) : "";
  std::string detection_type = state.userip_detection ? state.userip_detection->type : "";
  std::string country = lookup::ProjectLocalGeo(state.local_geo).country;

  return fmt::format("User{}:{} | IP:{} | Ports:{} | Time:{} | Country:{} | Detection Type: {} | Database:{}",
                     usernames.size() == 1 ? "" : "s", fmt::join(usernames, ", "), state.ip, fmt::join(ports, ", "),
                     detected_at, country, detection_type, database);
}

void UserIPEventLog::OnPeerEvent(const session::PeerEvent& event) {
  if (event.kind != session::PeerEventKind::Connected) {
    return;
  }

  session::PeerState state = event.record->State();
  if (!state.userip || !state.userip->settings.log) {
    return;
  }

  std::string line = FormatLine(state);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!util::append_line(path_, line)) {
    LOG_USERIP_WARN_RL("Failed to append to UserIP log {}", path_.string());
  }
}

}  // namespace userip
}  // namespace sniffer
