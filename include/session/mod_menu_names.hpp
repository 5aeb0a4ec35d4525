// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sniffer {
namespace session {

using UsernamesByIP = std::unordered_map<std::string, std::vector<std::string>>;

// Source of usernames reported by third-party tools, keyed by IP.
class UsernameSource {
public:
  virtual ~UsernameSource() = default;

  // Re-read the underlying data and return every name known so far.
  virtual UsernamesByIP Refresh() = 0;
};

// Scans mod-menu plugin logs for lines of the form
//   user:<name>, scid:<digits>, ip:<a.b.c.d>, timestamp:<10 digits>
// Names accumulate for the whole run; a log that is rotated away does not
// make names disappear.
class ModMenuLogReader : public UsernameSource {
public:
  explicit ModMenuLogReader(std::vector<std::filesystem::path> paths);

  UsernamesByIP Refresh() override;

  // (username, ip) for a matching line.
  static std::optional<std::pair<std::string, std::string>> ParseLine(const std::string& line);

private:
  std::vector<std::filesystem::path> paths_;
  UsernamesByIP names_;
};

}  // namespace session
}  // namespace sniffer
