// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace sniffer {

inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." + std::to_string(VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "Session Sniffer v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\nDistributed under the MIT software license";
}

}  // namespace sniffer
