// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/mod_menu_names.hpp"

#include "util/files.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <system_error>

namespace sniffer {
namespace session {

namespace {

const std::regex& UserLinePattern() {
  static const std::regex pattern(R"(^user:([\w._-]{1,16}), scid:\d{1,9}, ip:([\d.]+), timestamp:\d{10}$)");
  return pattern;
}

}  // namespace

ModMenuLogReader::ModMenuLogReader(std::vector<std::filesystem::path> paths) : paths_(std::move(paths)) {}

std::optional<std::pair<std::string, std::string>> ModMenuLogReader::ParseLine(const std::string& raw) {
  std::string line = raw;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }

  std::smatch match;
  if (!std::regex_match(line, match, UserLinePattern())) {
    return std::nullopt;
  }
  return std::make_pair(match[1].str(), match[2].str());
}

UsernamesByIP ModMenuLogReader::Refresh() {
  for (const auto& path : paths_) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      continue;
    }

    auto content = util::read_file_string(path);
    if (!content) {
      continue;
    }

    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
      auto entry = ParseLine(line);
      if (!entry) {
        continue;
      }
      auto& names = names_[entry->second];
      if (std::find(names.begin(), names.end(), entry->first) == names.end()) {
        names.push_back(entry->first);
      }
    }
  }
  return names_;
}

}  // namespace session
}  // namespace sniffer
