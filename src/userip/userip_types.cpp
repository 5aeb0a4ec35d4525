// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "userip/userip_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace sniffer {
namespace userip {

namespace {

constexpr std::array<std::pair<DisplayColor, const char*>, 8> kColors = {{
    {DisplayColor::Black, "BLACK"},
    {DisplayColor::Red, "RED"},
    {DisplayColor::Green, "GREEN"},
    {DisplayColor::Yellow, "YELLOW"},
    {DisplayColor::Blue, "BLUE"},
    {DisplayColor::Magenta, "MAGENTA"},
    {DisplayColor::Cyan, "CYAN"},
    {DisplayColor::White, "WHITE"},
}};

constexpr std::array<std::pair<VoiceNotification, const char*>, 3> kVoices = {{
    {VoiceNotification::Off, "False"},
    {VoiceNotification::Male, "Male"},
    {VoiceNotification::Female, "Female"},
}};

constexpr std::array<std::pair<Protection, const char*>, 6> kProtections = {{
    {Protection::Off, "False"},
    {Protection::SuspendProcess, "Suspend_Process"},
    {Protection::ExitProcess, "Exit_Process"},
    {Protection::RestartProcess, "Restart_Process"},
    {Protection::ShutdownPC, "Shutdown_PC"},
    {Protection::RestartPC, "Restart_PC"},
}};

bool EqualsIgnoreCase(const std::string& a, const char* b) {
  std::string_view bv(b);
  return a.size() == bv.size() && std::equal(a.begin(), a.end(), bv.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

template <typename Enum, size_t N>
const char* NameOf(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) {
  for (const auto& [v, name] : table) {
    if (v == value)
      return name;
  }
  return "?";
}

// Values are matched case-insensitively
template <typename Enum, size_t N>
std::optional<Enum> Parse(const std::array<std::pair<Enum, const char*>, N>& table, const std::string& name) {
  for (const auto& [v, n] : table) {
    if (EqualsIgnoreCase(name, n))
      return v;
  }
  return std::nullopt;
}

}  // namespace

const char* ColorName(DisplayColor color) {
  return NameOf(kColors, color);
}

std::optional<DisplayColor> ParseColor(const std::string& name) {
  return Parse(kColors, name);
}

const char* VoiceName(VoiceNotification voice) {
  return NameOf(kVoices, voice);
}

std::optional<VoiceNotification> ParseVoice(const std::string& name) {
  return Parse(kVoices, name);
}

const char* ProtectionName(Protection protection) {
  return NameOf(kProtections, protection);
}

std::optional<Protection> ParseProtection(const std::string& name) {
  return Parse(kProtections, name);
}

}  // namespace userip
}  // namespace sniffer
