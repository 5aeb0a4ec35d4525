// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace userip {

enum class DisplayColor { Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

enum class VoiceNotification { Off, Male, Female };

enum class Protection { Off, SuspendProcess, ExitProcess, RestartProcess, ShutdownPC, RestartPC };

// Per-database behavior toggles, already validated.
struct UserIPSettings {
  bool enabled{true};
  std::optional<DisplayColor> color;  // nullopt: default color
  bool log{true};
  bool notifications{false};
  VoiceNotification voice_notifications{VoiceNotification::Off};
  Protection protection{Protection::Off};
  std::optional<std::string> protection_process_path;
  std::optional<std::string> protection_restart_process_path;
  // "Auto", "Manual" or a number of seconds
  std::string protection_suspend_process_mode{"Auto"};

  bool operator==(const UserIPSettings&) const = default;
};

// Match of one IP against the loaded databases.
struct UserIPAssociation {
  std::string database_name;
  UserIPSettings settings;
  std::vector<std::string> usernames;
};

const char* ColorName(DisplayColor color);
std::optional<DisplayColor> ParseColor(const std::string& name);

const char* VoiceName(VoiceNotification voice);
std::optional<VoiceNotification> ParseVoice(const std::string& name);

const char* ProtectionName(Protection protection);
std::optional<Protection> ParseProtection(const std::string& name);

}  // namespace userip
}  // namespace sniffer
