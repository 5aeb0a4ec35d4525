// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "lookup/local_geo_database.hpp"

namespace sniffer {
namespace lookup {

std::optional<CountryInfo> NullLocalGeoDatabase::LookupCountry(const std::string&) {
  return std::nullopt;
}

std::optional<std::string> NullLocalGeoDatabase::LookupCity(const std::string&) {
  return std::nullopt;
}

std::optional<std::string> NullLocalGeoDatabase::LookupASN(const std::string&) {
  return std::nullopt;
}

LocalGeoResult ResolveLocalGeo(LocalGeoDatabase& db, const std::string& ip) {
  LocalGeoResult result;
  if (auto country = db.LookupCountry(ip)) {
    result.country = country->name;
    result.country_code = country->iso_code;
  }
  result.city = db.LookupCity(ip);
  result.asn = db.LookupASN(ip);
  return result;
}

}  // namespace lookup
}  // namespace sniffer
