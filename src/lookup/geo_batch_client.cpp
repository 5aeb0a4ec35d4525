// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "lookup/geo_batch_client.hpp"

#include "util/logging.hpp"

#include <charconv>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace sniffer {
namespace lookup {

HttpGeoBatchClient::HttpGeoBatchClient(Config config) : config_(std::move(config)) {}

std::string HttpGeoBatchClient::BatchPath() {
  return std::string("/batch?fields=") + BATCH_FIELDS;
}

std::string HttpGeoBatchClient::BatchBody(const std::vector<std::string>& ips) {
  return nlohmann::json(ips).dump();
}

std::optional<int> HttpGeoBatchClient::ParseRateHeader(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

BatchResponse HttpGeoBatchClient::PostBatch(const std::vector<std::string>& ips) {
  httplib::Client client(config_.host, config_.port);
  client.set_connection_timeout(config_.timeout);
  client.set_read_timeout(config_.timeout);
  client.set_write_timeout(config_.timeout);

  const httplib::Headers headers{{"Accept", "application/json"}, {"User-Agent", "session_sniffer"}};

  BatchResponse out;
  auto res = client.Post(BatchPath(), headers, BatchBody(ips), "application/json");
  if (!res) {
    out.error = httplib::to_string(res.error());
    return out;
  }

  out.transport_ok = true;
  out.status = res->status;
  out.body = std::move(res->body);
  out.remaining = ParseRateHeader(res->get_header_value("X-Rl"));
  out.window_seconds = ParseRateHeader(res->get_header_value("X-Ttl"));

  LOG_LOOKUP_TRACE("Batch of {} IPs -> HTTP {} (X-Rl={}, X-Ttl={})", ips.size(), out.status,
                   out.remaining ? std::to_string(*out.remaining) : "?",
                   out.window_seconds ? std::to_string(*out.window_seconds) : "?");
  return out;
}

}  // namespace lookup
}  // namespace sniffer
