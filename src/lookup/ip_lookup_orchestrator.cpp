// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "lookup/ip_lookup_orchestrator.hpp"

#include "util/error.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <unordered_set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sniffer {
namespace lookup {

namespace {

[[noreturn]] void Violation(const std::string& what, const std::string& ip = "") {
  throw util::ContractViolation("Malformed lookup payload: " + what + (ip.empty() ? "" : " (" + ip + ")"));
}

bool IsNotAvailable(const json& value) {
  return value.is_string() && value.get_ref<const std::string&>() == kNotAvailable;
}

std::optional<std::string> TextField(const json& obj, const char* key, const std::string& ip) {
  auto it = obj.find(key);
  if (it == obj.end() || IsNotAvailable(*it)) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    Violation(std::string("expected string for \"") + key + "\", got " + it->type_name(), ip);
  }
  return it->get<std::string>();
}

std::optional<double> NumberField(const json& obj, const char* key, const std::string& ip) {
  auto it = obj.find(key);
  if (it == obj.end() || IsNotAvailable(*it)) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    Violation(std::string("expected number for \"") + key + "\", got " + it->type_name(), ip);
  }
  return it->get<double>();
}

std::optional<int64_t> IntegerField(const json& obj, const char* key, const std::string& ip) {
  auto it = obj.find(key);
  if (it == obj.end() || IsNotAvailable(*it)) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    Violation(std::string("expected integer for \"") + key + "\", got " + it->type_name(), ip);
  }
  return it->get<int64_t>();
}

std::optional<bool> BoolField(const json& obj, const char* key, const std::string& ip) {
  auto it = obj.find(key);
  if (it == obj.end() || IsNotAvailable(*it)) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    Violation(std::string("expected boolean for \"") + key + "\", got " + it->type_name(), ip);
  }
  return it->get<bool>();
}

}  // namespace

IPLookupOrchestrator::IPLookupOrchestrator(session::PeerRegistry& registry, IPLookupSets& sets,
                                           GeoBatchClient& client, Config config)
    : registry_(registry), sets_(sets), client_(client), config_(config) {}

std::vector<std::string> IPLookupOrchestrator::BuildBatch() {
  std::vector<std::string> connected;
  std::vector<std::string> disconnected;
  std::optional<std::string> removed_disconnected;

  for (const auto& record : registry_.Snapshot()) {
    if (record->HasRemoteGeo()) {
      continue;
    }

    // Resolved earlier but not yet pushed into the record: no re-fetch
    if (auto cached = sets_.GetResult(record->ip())) {
      record->SetRemoteGeo(*cached);
      continue;
    }

    if (record->IsConnected()) {
      connected.push_back(record->ip());
    } else {
      disconnected.push_back(record->ip());
    }

    // At the cap: make room by dropping the latest disconnected candidate
    if (connected.size() + disconnected.size() == MAX_BATCH_SIZE) {
      if (disconnected.empty()) {
        break;
      }
      removed_disconnected = disconnected.back();
      disconnected.pop_back();
    }
  }

  std::vector<std::string> batch = std::move(connected);
  batch.insert(batch.end(), disconnected.begin(), disconnected.end());

  if (batch.size() < MAX_BATCH_SIZE) {
    if (batch.size() == MAX_BATCH_SIZE - 1 && removed_disconnected) {
      batch.push_back(*removed_disconnected);
    } else {
      // Backfill with queued IPs; skip ones already in the batch
      std::unordered_set<std::string> present(batch.begin(), batch.end());
      for (const auto& ip : sets_.PendingSlice(0, sets_.PendingCount())) {
        if (batch.size() >= MAX_BATCH_SIZE) {
          break;
        }
        if (present.insert(ip).second) {
          batch.push_back(ip);
        }
      }
    }
  }

  if (batch.size() > MAX_BATCH_SIZE) {
    batch.resize(MAX_BATCH_SIZE);
  }

  for (const auto& ip : batch) {
    if (!sets_.IsPending(ip)) {
      sets_.AddPending(ip);
    }
  }

  return batch;
}

std::vector<RemoteGeoResult> IPLookupOrchestrator::ParseBatchResponse(const std::string& body) {
  json payload = json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    Violation("response body is not valid JSON");
  }
  if (!payload.is_array()) {
    Violation(std::string("expected array, got ") + payload.type_name());
  }

  std::vector<RemoteGeoResult> results;
  results.reserve(payload.size());

  for (const auto& entry : payload) {
    if (!entry.is_object()) {
      Violation(std::string("expected object, got ") + entry.type_name());
    }

    auto query = entry.find("query");
    if (query == entry.end() || !query->is_string()) {
      Violation("missing or non-string \"query\"");
    }

    RemoteGeoResult r;
    r.ip = query->get<std::string>();
    r.continent = TextField(entry, "continent", r.ip);
    r.continent_code = TextField(entry, "continentCode", r.ip);
    r.country = TextField(entry, "country", r.ip);
    r.country_code = TextField(entry, "countryCode", r.ip);
    // The service names the full region "regionName" and its code "region"
    r.region = TextField(entry, "regionName", r.ip);
    r.region_code = TextField(entry, "region", r.ip);
    r.city = TextField(entry, "city", r.ip);
    r.district = TextField(entry, "district", r.ip);
    r.zip_code = TextField(entry, "zip", r.ip);
    r.lat = NumberField(entry, "lat", r.ip);
    r.lon = NumberField(entry, "lon", r.ip);
    r.time_zone = TextField(entry, "timezone", r.ip);
    r.offset = IntegerField(entry, "offset", r.ip);
    r.currency = TextField(entry, "currency", r.ip);
    r.isp = TextField(entry, "isp", r.ip);
    r.org = TextField(entry, "org", r.ip);
    r.as_info = TextField(entry, "as", r.ip);
    r.as_name = TextField(entry, "asname", r.ip);
    r.mobile = BoolField(entry, "mobile", r.ip);
    r.proxy = BoolField(entry, "proxy", r.ip);
    r.hosting = BoolField(entry, "hosting", r.ip);
    results.push_back(std::move(r));
  }

  return results;
}

std::chrono::milliseconds IPLookupOrchestrator::ComputeBackoff(std::optional<int> remaining,
                                                               std::optional<int> window_seconds,
                                                               std::chrono::seconds fallback_window) {
  if (!remaining || !window_seconds) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(fallback_window);
  }

  std::chrono::milliseconds window{static_cast<int64_t>(std::max(0, *window_seconds)) * 1000};
  if (*remaining <= 1) {
    return window;
  }
  return window / *remaining;
}

void IPLookupOrchestrator::ApplyResult(const RemoteGeoResult& result) {
  sets_.Resolve(result);

  if (auto record = registry_.Get(result.ip)) {
    record->SetRemoteGeo(result);
  }
}

IPLookupOrchestrator::CycleResult IPLookupOrchestrator::RunCycle() {
  CycleResult cycle;

  auto batch = BuildBatch();
  cycle.batch_size = batch.size();
  if (batch.empty()) {
    cycle.outcome = CycleOutcome::Idle;
    cycle.sleep = config_.idle_delay;
    return cycle;
  }

  BatchResponse response = client_.PostBatch(batch);

  if (!response.transport_ok) {
    LOG_LOOKUP_WARN_RL("Batch lookup of {} IPs failed: {}", batch.size(), response.error);
    cycle.outcome = CycleOutcome::TransportError;
    cycle.sleep = config_.transport_retry_delay;
    return cycle;
  }

  cycle.sleep = ComputeBackoff(response.remaining, response.window_seconds, config_.default_window);

  if (response.status != 200) {
    LOG_LOOKUP_WARN_RL("Batch lookup returned HTTP {}, backing off {}ms", response.status, cycle.sleep.count());
    cycle.outcome = CycleOutcome::Throttled;
    return cycle;
  }

  auto results = ParseBatchResponse(response.body);
  for (const auto& result : results) {
    ApplyResult(result);
  }

  cycle.outcome = CycleOutcome::Resolved;
  cycle.resolved = results.size();
  LOG_LOOKUP_DEBUG("Resolved {}/{} IPs, next batch in {}ms", results.size(), batch.size(), cycle.sleep.count());
  return cycle;
}

void IPLookupOrchestrator::Run(const util::StopSignal& stop) {
  LOG_LOOKUP_INFO("IP lookup worker started");

  while (!stop.StopRequested()) {
    CycleResult cycle = RunCycle();
    if (cycle.sleep.count() > 0 && stop.WaitFor(cycle.sleep)) {
      break;
    }
  }

  LOG_LOOKUP_INFO("IP lookup worker stopped ({} resolved, {} pending)", sets_.ResolvedCount(), sets_.PendingCount());
}

}  // namespace lookup
}  // namespace sniffer
