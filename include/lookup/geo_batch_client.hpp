// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace lookup {

// Outcome of one batch POST. transport_ok == false means the request never
// produced an HTTP response (resolve/connect/IO error or timeout).
struct BatchResponse {
  bool transport_ok{false};
  std::string error;
  int status{0};
  std::string body;
  std::optional<int> remaining;       // X-Rl: requests left in the current window
  std::optional<int> window_seconds;  // X-Ttl: seconds until the window resets
};

// Remote batch geolocation service.
class GeoBatchClient {
public:
  virtual ~GeoBatchClient() = default;

  // POST a JSON array of IPs. Blocks until response or timeout.
  virtual BatchResponse PostBatch(const std::vector<std::string>& ips) = 0;
};

// cpp-httplib client for the ip-api.com batch endpoint.
class HttpGeoBatchClient : public GeoBatchClient {
public:
  static constexpr const char* DEFAULT_HOST = "ip-api.com";
  static constexpr int DEFAULT_PORT = 80;
  static constexpr const char* BATCH_FIELDS =
      "continent,continentCode,country,countryCode,region,regionName,city,district,zip,lat,lon,timezone,offset,"
      "currency,isp,org,as,asname,mobile,proxy,hosting,query";
  static constexpr std::chrono::seconds DEFAULT_TIMEOUT{3};

  struct Config {
    std::string host;
    int port;
    std::chrono::milliseconds timeout;

    Config() : host(DEFAULT_HOST), port(DEFAULT_PORT), timeout(DEFAULT_TIMEOUT) {}
  };

  explicit HttpGeoBatchClient(Config config = Config{});

  BatchResponse PostBatch(const std::vector<std::string>& ips) override;

  // Request target and JSON body of a batch (exposed for tests).
  static std::string BatchPath();
  static std::string BatchBody(const std::vector<std::string>& ips);

  // Integer value of a rate limit header, nullopt if absent or not a number.
  static std::optional<int> ParseRateHeader(const std::string& value);

private:
  Config config_;
};

}  // namespace lookup
}  // namespace sniffer
