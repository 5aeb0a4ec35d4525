// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "lookup/geo_types.hpp"

#include <optional>
#include <string>

namespace sniffer {
namespace lookup {

struct CountryInfo {
  std::string name;
  std::string iso_code;
};

// Synchronous local geolocation database (country / city / ASN readers).
// Each lookup is best-effort: nullopt means "not found".
class LocalGeoDatabase {
public:
  virtual ~LocalGeoDatabase() = default;

  virtual std::optional<CountryInfo> LookupCountry(const std::string& ip) = 0;
  virtual std::optional<std::string> LookupCity(const std::string& ip) = 0;
  virtual std::optional<std::string> LookupASN(const std::string& ip) = 0;
};

// Used when no database is installed; every lookup is "not found".
class NullLocalGeoDatabase : public LocalGeoDatabase {
public:
  std::optional<CountryInfo> LookupCountry(const std::string& ip) override;
  std::optional<std::string> LookupCity(const std::string& ip) override;
  std::optional<std::string> LookupASN(const std::string& ip) override;
};

// Runs all three readers and folds them into one slot value.
LocalGeoResult ResolveLocalGeo(LocalGeoDatabase& db, const std::string& ip);

}  // namespace lookup
}  // namespace sniffer
