// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "userip/userip_database.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace sniffer {
namespace userip {

// Source of UserIP databases (config collaborator).
class UserIPSource {
public:
  virtual ~UserIPSource() = default;

  virtual UserIPLoadResult Load() = 0;
};

/*
 UserIPDirectoryLoader - one JSON file per database

 <dir>/<Name>.json:
   {
     "settings": {
       "ENABLED": true, "COLOR": "RED" | null, "LOG": true,
       "NOTIFICATIONS": true, "VOICE_NOTIFICATIONS": "Male" | "Female" | false,
       "PROTECTION": false | "Suspend_Process" | ..., "PROTECTION_PROCESS_PATH": null,
       "PROTECTION_RESTART_PROCESS_PATH": null, "PROTECTION_SUSPEND_PROCESS_MODE": "Auto"
     },
     "users": { "<username>": "<ip>" | ["<ip>", ...] }
   }

 Every settings key is required. Files are read in name order, which is the
 order that decides UserIP conflicts.
*/
class UserIPDirectoryLoader : public UserIPSource {
public:
  explicit UserIPDirectoryLoader(std::filesystem::path directory);

  // Creates the default databases first if the directory does not exist.
  UserIPLoadResult Load() override;

  const std::filesystem::path& directory() const { return directory_; }

  // Settings object -> UserIPSettings. nullopt if any key is missing or invalid.
  static std::optional<UserIPSettings> ParseSettings(const nlohmann::ordered_json& settings);

  // Writes Blacklist, Enemylist, Friendlist, Randomlist and Searchlist.
  static bool WriteDefaultDatabases(const std::filesystem::path& directory);

private:
  std::filesystem::path directory_;
};

}  // namespace userip
}  // namespace sniffer
