// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sniffer {
namespace lookup {

// Placeholder for a slot that has not been resolved yet
inline constexpr const char* kPendingPlaceholder = "...";
// Placeholder for a field the source could not provide
inline constexpr const char* kNotAvailable = "N/A";

// One result of the remote batch geolocation service. A field left empty
// means the service did not provide it.
struct RemoteGeoResult {
  std::string ip;
  std::optional<std::string> continent;
  std::optional<std::string> continent_code;
  std::optional<std::string> country;
  std::optional<std::string> country_code;
  std::optional<std::string> region;
  std::optional<std::string> region_code;
  std::optional<std::string> city;
  std::optional<std::string> district;
  std::optional<std::string> zip_code;
  std::optional<double> lat;
  std::optional<double> lon;
  std::optional<std::string> time_zone;
  std::optional<int64_t> offset;
  std::optional<std::string> currency;
  std::optional<std::string> isp;
  std::optional<std::string> org;
  std::optional<std::string> as_info;
  std::optional<std::string> as_name;
  std::optional<bool> mobile;
  std::optional<bool> proxy;
  std::optional<bool> hosting;
};

// Result of the synchronous local database lookup.
struct LocalGeoResult {
  std::optional<std::string> country;
  std::optional<std::string> country_code;
  std::optional<std::string> city;
  std::optional<std::string> asn;
};

// Display-ready strings. Never empty, never null.
struct RemoteGeoDisplay {
  std::string continent;
  std::string continent_code;
  std::string country;
  std::string country_code;
  std::string region;
  std::string region_code;
  std::string city;
  std::string district;
  std::string zip_code;
  std::string lat;
  std::string lon;
  std::string time_zone;
  std::string offset;
  std::string currency;
  std::string isp;
  std::string org;
  std::string as_info;
  std::string as_name;
  std::string mobile;
  std::string proxy;
  std::string hosting;
};

struct LocalGeoDisplay {
  std::string country;
  std::string country_code;
  std::string city;
  std::string asn;
};

// Projections: an unresolved slot renders "...", a missing field "N/A".
RemoteGeoDisplay ProjectRemoteGeo(const std::optional<RemoteGeoResult>& slot);
LocalGeoDisplay ProjectLocalGeo(const std::optional<LocalGeoResult>& slot);

}  // namespace lookup
}  // namespace sniffer
