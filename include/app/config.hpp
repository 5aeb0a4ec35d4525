// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "lookup/geo_batch_client.hpp"
#include "lookup/ip_lookup_orchestrator.hpp"
#include "session/ingestion_worker.hpp"
#include "session/presentation_feed.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace app {

// Program presets tune game-specific heuristics.
enum class Preset { GTA5, Minecraft, None };

const char* PresetName(Preset preset);
std::optional<Preset> ParsePreset(const std::string& name);

struct AppConfig {
  // Capture lines; stdin when unset
  std::optional<std::filesystem::path> input_path;

  session::IngestionWorker::Config ingestion;
  session::PresentationFeed::Config presentation;
  lookup::IPLookupOrchestrator::Config lookup;
  lookup::HttpGeoBatchClient::Config http;

  Preset preset{Preset::GTA5};
  bool lookup_enabled{true};
  bool userip_enabled{true};

  std::filesystem::path datadir;
  std::filesystem::path userip_dir;  // default: <datadir>/UserIP_Databases
  std::filesystem::path userip_log;  // default: <datadir>/UserIP_Logging.log
  std::vector<std::filesystem::path> modmenu_logs;

  std::string log_level{"info"};
  std::optional<std::filesystem::path> log_file;
};

enum class ParseStatus {
  Ok,
  Help,     // --help: print usage, exit 0
  Version,  // --version: print version, exit 0
  Error,
};

struct ParseResult {
  ParseStatus status{ParseStatus::Ok};
  std::string error;
};

// Parse "--key=value" options into `config` and resolve path defaults.
ParseResult ParseCommandLine(int argc, const char* const argv[], AppConfig& config);

void PrintUsage(const char* program_name);

}  // namespace app
}  // namespace sniffer
