// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "userip/userip_loader.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace sniffer {
namespace userip {

namespace {

constexpr const char* kExtension = ".json";

constexpr std::array<const char*, 9> kSettingKeys = {
    "ENABLED",
    "COLOR",
    "LOG",
    "NOTIFICATIONS",
    "VOICE_NOTIFICATIONS",
    "PROTECTION",
    "PROTECTION_PROCESS_PATH",
    "PROTECTION_RESTART_PROCESS_PATH",
    "PROTECTION_SUSPEND_PROCESS_MODE",
};

struct DefaultDatabase {
  const char* name;
  DisplayColor color;
  bool notifications;
  VoiceNotification voice;
};

constexpr std::array<DefaultDatabase, 5> kDefaultDatabases = {{
    {"Blacklist", DisplayColor::Red, true, VoiceNotification::Male},
    {"Enemylist", DisplayColor::Yellow, true, VoiceNotification::Male},
    {"Friendlist", DisplayColor::Green, false, VoiceNotification::Female},
    {"Randomlist", DisplayColor::Black, false, VoiceNotification::Female},
    {"Searchlist", DisplayColor::Blue, false, VoiceNotification::Female},
}};

std::optional<bool> ReadBool(const json& value) {
  if (!value.is_boolean()) {
    return std::nullopt;
  }
  return value.get<bool>();
}

// null, or a non-empty path
bool ReadOptionalPath(const json& value, std::optional<std::string>& out) {
  if (value.is_null()) {
    out.reset();
    return true;
  }
  if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
    return false;
  }
  out = value.get<std::string>();
  return true;
}

// "Auto", "Manual" or a non-negative number of seconds
std::optional<std::string> ReadSuspendMode(const json& value) {
  if (value.is_string()) {
    std::string lower = value.get<std::string>();
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "auto") {
      return std::string("Auto");
    }
    if (lower == "manual") {
      return std::string("Manual");
    }
    return std::nullopt;
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return std::to_string(value.get<int64_t>());
  }
  if (value.is_number_float() && value.get<double>() >= 0.0) {
    return value.dump();
  }
  return std::nullopt;
}

json SettingsToJson(const UserIPSettings& settings) {
  json out = json::object();
  out["ENABLED"] = settings.enabled;
  out["COLOR"] = settings.color ? json(ColorName(*settings.color)) : json(nullptr);
  out["LOG"] = settings.log;
  out["NOTIFICATIONS"] = settings.notifications;
  out["VOICE_NOTIFICATIONS"] = settings.voice_notifications == VoiceNotification::Off
                                   ? json(false)
                                   : json(VoiceName(settings.voice_notifications));
  out["PROTECTION"] = settings.protection == Protection::Off ? json(false) : json(ProtectionName(settings.protection));
  out["PROTECTION_PROCESS_PATH"] =
      settings.protection_process_path ? json(*settings.protection_process_path) : json(nullptr);
  out["PROTECTION_RESTART_PROCESS_PATH"] =
      settings.protection_restart_process_path ? json(*settings.protection_restart_process_path) : json(nullptr);
  out["PROTECTION_SUSPEND_PROCESS_MODE"] = settings.protection_suspend_process_mode;
  return out;
}

}  // namespace

UserIPDirectoryLoader::UserIPDirectoryLoader(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::optional<UserIPSettings> UserIPDirectoryLoader::ParseSettings(const json& settings) {
  if (!settings.is_object()) {
    return std::nullopt;
  }
  for (const char* key : kSettingKeys) {
    if (!settings.contains(key)) {
      return std::nullopt;
    }
  }

  UserIPSettings out;

  auto enabled = ReadBool(settings["ENABLED"]);
  auto log = ReadBool(settings["LOG"]);
  auto notifications = ReadBool(settings["NOTIFICATIONS"]);
  if (!enabled || !log || !notifications) {
    return std::nullopt;
  }
  out.enabled = *enabled;
  out.log = *log;
  out.notifications = *notifications;

  const auto& color = settings["COLOR"];
  if (color.is_string()) {
    out.color = ParseColor(color.get<std::string>());
    if (!out.color) {
      return std::nullopt;
    }
  } else if (!color.is_null()) {
    return std::nullopt;
  }

  // false, or a named value
  const auto& voice = settings["VOICE_NOTIFICATIONS"];
  if (voice.is_boolean() && !voice.get<bool>()) {
    out.voice_notifications = VoiceNotification::Off;
  } else if (voice.is_string()) {
    auto parsed = ParseVoice(voice.get<std::string>());
    if (!parsed || *parsed == VoiceNotification::Off) {
      return std::nullopt;
    }
    out.voice_notifications = *parsed;
  } else {
    return std::nullopt;
  }

  const auto& protection = settings["PROTECTION"];
  if (protection.is_boolean() && !protection.get<bool>()) {
    out.protection = Protection::Off;
  } else if (protection.is_string()) {
    auto parsed = ParseProtection(protection.get<std::string>());
    if (!parsed || *parsed == Protection::Off) {
      return std::nullopt;
    }
    out.protection = *parsed;
  } else {
    return std::nullopt;
  }

  if (!ReadOptionalPath(settings["PROTECTION_PROCESS_PATH"], out.protection_process_path) ||
      !ReadOptionalPath(settings["PROTECTION_RESTART_PROCESS_PATH"], out.protection_restart_process_path)) {
    return std::nullopt;
  }

  auto mode = ReadSuspendMode(settings["PROTECTION_SUSPEND_PROCESS_MODE"]);
  if (!mode) {
    return std::nullopt;
  }
  out.protection_suspend_process_mode = *mode;

  return out;
}

bool UserIPDirectoryLoader::WriteDefaultDatabases(const std::filesystem::path& directory) {
  if (!util::ensure_directory(directory)) {
    LOG_USERIP_ERROR("Failed to create UserIP directory {}", directory.string());
    return false;
  }

  bool ok = true;
  for (const auto& def : kDefaultDatabases) {
    auto path = directory / (std::string(def.name) + kExtension);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      continue;
    }

    UserIPSettings settings;
    settings.color = def.color;
    settings.notifications = def.notifications;
    settings.voice_notifications = def.voice;

    json doc = json::object();
    doc["settings"] = SettingsToJson(settings);
    doc["users"] = json::object();

    if (!util::atomic_write_file(path, doc.dump(2) + "\n")) {
      ok = false;
      continue;
    }
    LOG_USERIP_INFO("Created default UserIP database {}", path.string());
  }
  return ok;
}

UserIPLoadResult UserIPDirectoryLoader::Load() {
  UserIPLoadResult result;

  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec) && !WriteDefaultDatabases(directory_)) {
    LOG_USERIP_WARN_RL("Default UserIP databases could not be created in {}", directory_.string());
  }

  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == kExtension) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    LOG_USERIP_WARN_RL("Failed to list UserIP directory {}: {}", directory_.string(), ec.message());
    return result;
  }
  std::sort(files.begin(), files.end());

  for (const auto& path : files) {
    const std::string file_name = path.filename().string();

    auto data = util::read_file_string(path);
    if (!data) {
      // Removed or unreadable between listing and reading
      continue;
    }

    json doc = json::parse(*data, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("settings")) {
      result.corrupted_files.insert(file_name);
      continue;
    }

    auto settings = ParseSettings(doc["settings"]);
    if (!settings) {
      result.corrupted_files.insert(file_name);
      continue;
    }
    if (!settings->enabled) {
      continue;
    }

    UserIPDatabaseEntry entry;
    entry.name = path.stem().string();
    entry.settings = *settings;

    if (doc.contains("users")) {
      const auto& users = doc["users"];
      if (!users.is_object()) {
        result.corrupted_files.insert(file_name);
        continue;
      }

      for (const auto& [username, value] : users.items()) {
        std::vector<std::string> candidates;
        if (value.is_string()) {
          candidates.push_back(value.get<std::string>());
        } else if (value.is_array()) {
          for (const auto& ip : value) {
            candidates.push_back(ip.is_string() ? ip.get<std::string>() : ip.dump());
          }
        } else {
          candidates.push_back(value.dump());
        }

        std::vector<std::string> ips;
        for (const auto& ip : candidates) {
          if (!util::IsValidIPv4Address(ip)) {
            result.invalid_entries.insert(file_name + "=" + username + "=" + ip);
            continue;
          }
          if (std::find(ips.begin(), ips.end(), ip) == ips.end()) {
            ips.push_back(ip);
          }
        }
        if (!ips.empty()) {
          entry.users.emplace_back(username, std::move(ips));
        }
      }
    }

    result.databases.push_back(std::move(entry));
  }

  return result;
}

}  // namespace userip
}  // namespace sniffer
