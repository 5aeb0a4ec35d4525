// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"

#include "session/session_sort.hpp"
#include "util/files.hpp"
#include "util/netaddress.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace sniffer {
namespace app {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

ParseResult Fail(std::string message) {
  return ParseResult{ParseStatus::Error, std::move(message)};
}

std::optional<double> ParsePositiveSeconds(const std::string& value) {
  try {
    size_t used = 0;
    double seconds = std::stod(value, &used);
    if (used != value.size() || !std::isfinite(seconds) || seconds <= 0.0) {
      return std::nullopt;
    }
    return seconds;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

template <typename T>
std::optional<T> ParseUnsigned(const std::string& value) {
  T out{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}

// "--key=value" -> value if `arg` starts with `prefix`
bool TakeValue(const std::string& arg, const std::string& prefix, std::string& value) {
  if (!arg.starts_with(prefix)) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

}  // namespace

const char* PresetName(Preset preset) {
  switch (preset) {
  case Preset::GTA5:
    return "GTA5";
  case Preset::Minecraft:
    return "Minecraft";
  case Preset::None:
    return "none";
  }
  return "unknown";
}

std::optional<Preset> ParsePreset(const std::string& name) {
  if (name == "GTA5")
    return Preset::GTA5;
  if (name == "Minecraft")
    return Preset::Minecraft;
  if (name == "none")
    return Preset::None;
  return std::nullopt;
}

void PrintUsage(const char* program_name) {
  std::cout
      << "Session Sniffer - track peers of a UDP game session\n\n"
      << "Usage: " << program_name << " [options] < capture-lines\n\n"
      << "Reads \"time_epoch|ip.src|ip.dst|udp.srcport|udp.dstport\" lines.\n\n"
      << "Capture:\n"
      << "  --input=<path>                Read capture lines from a file (default: stdin)\n"
      << "  --local-ip=<ip>               Local IPv4 address (default: private-address rule)\n"
      << "  --overflow-timer=<seconds>    Capture lag that restarts the source (default: 3.0)\n"
      << "  --keep-ports-on-rejoin        Keep the port history when a peer rejoins\n"
      << "\n"
      << "Session tables:\n"
      << "  --disconnected-timer=<sec>    Idle time before a peer is disconnected (default: 10.0)\n"
      << "  --disconnected-limit=<n>      Disconnected peers shown, 0 = all (default: 6)\n"
      << "  --sort-connected=<column>     Connected table order (default: \"Last Rejoin\")\n"
      << "  --sort-disconnected=<column>  Disconnected table order (default: \"Last Seen\")\n"
      << "  --preset=<GTA5|Minecraft|none>  Program preset (default: GTA5)\n"
      << "\n"
      << "UserIP:\n"
      << "  --no-userip                   Disable UserIP database matching\n"
      << "  --userip-dir=<path>           UserIP database directory\n"
      << "  --userip-log=<path>           UserIP detection log file\n"
      << "  --modmenu-log=<path>          Mod-menu plugin log to scan (repeatable)\n"
      << "\n"
      << "IP lookup:\n"
      << "  --no-lookup                   Disable remote IP geolocation\n"
      << "  --lookup-host=<host>          Batch lookup host (default: ip-api.com)\n"
      << "  --lookup-port=<port>          Batch lookup port (default: 80)\n"
      << "\n"
      << "General:\n"
      << "  --datadir=<path>              Data directory (default: ~/.session_sniffer)\n"
      << "  --loglevel=<level>            trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --logfile=<path>              Also write logs to a file\n"
      << "  --version                     Show version information\n"
      << "  --help                        Show this help message\n"
      << std::endl;
}

ParseResult ParseCommandLine(int argc, const char* const argv[], AppConfig& config) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "--help" || arg == "-h") {
      return ParseResult{ParseStatus::Help, {}};
    } else if (arg == "--version" || arg == "-v") {
      return ParseResult{ParseStatus::Version, {}};
    } else if (TakeValue(arg, "--input=", value)) {
      if (value.empty()) {
        return Fail("--input requires a non-empty path");
      }
      config.input_path = value;
    } else if (TakeValue(arg, "--local-ip=", value)) {
      if (!util::IsValidIPv4Address(value)) {
        return Fail("--local-ip must be an IPv4 address: " + value);
      }
      config.ingestion.local_ip = value;
    } else if (TakeValue(arg, "--overflow-timer=", value)) {
      auto seconds = ParsePositiveSeconds(value);
      if (!seconds) {
        return Fail("--overflow-timer must be a positive number of seconds: " + value);
      }
      config.ingestion.overflow_timer = std::chrono::duration<double>(*seconds);
      config.presentation.overflow_timer = config.ingestion.overflow_timer;
    } else if (arg == "--keep-ports-on-rejoin") {
      config.ingestion.reset_ports_on_rejoin = false;
    } else if (TakeValue(arg, "--disconnected-timer=", value)) {
      auto seconds = ParsePositiveSeconds(value);
      if (!seconds) {
        return Fail("--disconnected-timer must be a positive number of seconds: " + value);
      }
      config.presentation.disconnected_timer = std::chrono::duration<double>(*seconds);
    } else if (TakeValue(arg, "--disconnected-limit=", value)) {
      auto limit = ParseUnsigned<size_t>(value);
      if (!limit) {
        return Fail("--disconnected-limit must be a non-negative integer: " + value);
      }
      config.presentation.disconnected_limit = *limit;
    } else if (TakeValue(arg, "--sort-connected=", value)) {
      auto field = session::ParseSortField(value);
      // Connected peers have no meaningful "Last Seen"
      if (!field || *field == session::SortField::LastSeen) {
        return Fail("--sort-connected: unknown or unsupported column \"" + value + "\"");
      }
      config.presentation.connected_sort = *field;
    } else if (TakeValue(arg, "--sort-disconnected=", value)) {
      auto field = session::ParseSortField(value);
      // Disconnected peers have no packet rate
      if (!field || *field == session::SortField::PPS) {
        return Fail("--sort-disconnected: unknown or unsupported column \"" + value + "\"");
      }
      config.presentation.disconnected_sort = *field;
    } else if (TakeValue(arg, "--preset=", value)) {
      auto preset = ParsePreset(value);
      if (!preset) {
        return Fail("--preset must be GTA5, Minecraft or none: " + value);
      }
      config.preset = *preset;
    } else if (arg == "--no-userip") {
      config.userip_enabled = false;
    } else if (TakeValue(arg, "--userip-dir=", value)) {
      if (value.empty()) {
        return Fail("--userip-dir requires a non-empty path");
      }
      config.userip_dir = value;
    } else if (TakeValue(arg, "--userip-log=", value)) {
      if (value.empty()) {
        return Fail("--userip-log requires a non-empty path");
      }
      config.userip_log = value;
    } else if (TakeValue(arg, "--modmenu-log=", value)) {
      if (value.empty()) {
        return Fail("--modmenu-log requires a non-empty path");
      }
      config.modmenu_logs.emplace_back(value);
    } else if (arg == "--no-lookup") {
      config.lookup_enabled = false;
    } else if (TakeValue(arg, "--lookup-host=", value)) {
      if (value.empty()) {
        return Fail("--lookup-host requires a non-empty host");
      }
      config.http.host = value;
    } else if (TakeValue(arg, "--lookup-port=", value)) {
      auto port = ParseUnsigned<uint16_t>(value);
      if (!port || *port == 0) {
        return Fail("--lookup-port must be 1-65535: " + value);
      }
      config.http.port = *port;
    } else if (TakeValue(arg, "--datadir=", value)) {
      if (value.empty()) {
        return Fail("--datadir requires a non-empty path");
      }
      config.datadir = value;
    } else if (TakeValue(arg, "--loglevel=", value)) {
      bool known = false;
      for (const char* level : kLogLevels) {
        known = known || value == level;
      }
      if (!known) {
        return Fail("--loglevel: unknown level \"" + value + "\"");
      }
      config.log_level = value;
    } else if (TakeValue(arg, "--logfile=", value)) {
      if (value.empty()) {
        return Fail("--logfile requires a non-empty path");
      }
      config.log_file = value;
    } else {
      return Fail("Unknown option: " + arg);
    }
  }

  config.ingestion.userip_enabled = config.userip_enabled;
  config.presentation.userip_enabled = config.userip_enabled;
  config.presentation.detect_session_host = config.preset == Preset::GTA5;

  if (config.datadir.empty()) {
    config.datadir = util::get_default_datadir();
  }
  if (config.userip_enabled && (config.userip_dir.empty() || config.userip_log.empty()) && config.datadir.empty()) {
    return Fail("Cannot determine the data directory (HOME not set); use --datadir");
  }
  if (config.userip_dir.empty()) {
    config.userip_dir = config.datadir / "UserIP_Databases";
  }
  if (config.userip_log.empty()) {
    config.userip_log = config.datadir / "UserIP_Logging.log";
  }

  return ParseResult{ParseStatus::Ok, {}};
}

}  // namespace app
}  // namespace sniffer
