// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/notifications.hpp"
#include "session/peer_record.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace sniffer {
namespace userip {

// Appends one line per UserIP detection to a text log, for databases whose
// settings have LOG enabled. Only "connected" edges are logged.
class UserIPEventLog {
public:
  explicit UserIPEventLog(std::filesystem::path path);

  void Attach(session::SessionNotifications& notifications);
  void Detach();

  void OnPeerEvent(const session::PeerEvent& event);

  // "User(s):a, b | IP:x | Ports:p2, p1 | Time:... | Country:... | Detection Type: Static IP | Database:Name"
  static std::string FormatLine(const session::PeerState& state);

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::mutex write_mutex_;
  session::SessionNotifications::Subscription subscription_;
};

}  // namespace userip
}  // namespace sniffer
