// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "lookup/geo_types.hpp"

#include <spdlog/fmt/fmt.h>

namespace sniffer {
namespace lookup {

namespace {

std::string Show(const std::optional<std::string>& v) {
  return v ? *v : kNotAvailable;
}

std::string Show(const std::optional<double>& v) {
  return v ? fmt::format("{}", *v) : kNotAvailable;
}

std::string Show(const std::optional<int64_t>& v) {
  return v ? std::to_string(*v) : kNotAvailable;
}

std::string Show(const std::optional<bool>& v) {
  if (!v)
    return kNotAvailable;
  return *v ? "True" : "False";
}

}  // namespace

RemoteGeoDisplay ProjectRemoteGeo(const std::optional<RemoteGeoResult>& slot) {
  RemoteGeoDisplay d;
  if (!slot) {
    for (std::string* field : {&d.continent, &d.continent_code, &d.country, &d.country_code, &d.region,
                               &d.region_code, &d.city, &d.district, &d.zip_code, &d.lat, &d.lon, &d.time_zone,
                               &d.offset, &d.currency, &d.isp, &d.org, &d.as_info, &d.as_name, &d.mobile, &d.proxy,
                               &d.hosting}) {
      *field = kPendingPlaceholder;
    }
    return d;
  }

  const RemoteGeoResult& r = *slot;
  d.continent = Show(r.continent);
  d.continent_code = Show(r.continent_code);
  d.country = Show(r.country);
  d.country_code = Show(r.country_code);
  d.region = Show(r.region);
  d.region_code = Show(r.region_code);
  d.city = Show(r.city);
  d.district = Show(r.district);
  d.zip_code = Show(r.zip_code);
  d.lat = Show(r.lat);
  d.lon = Show(r.lon);
  d.time_zone = Show(r.time_zone);
  d.offset = Show(r.offset);
  d.currency = Show(r.currency);
  d.isp = Show(r.isp);
  d.org = Show(r.org);
  d.as_info = Show(r.as_info);
  d.as_name = Show(r.as_name);
  d.mobile = Show(r.mobile);
  d.proxy = Show(r.proxy);
  d.hosting = Show(r.hosting);
  return d;
}

LocalGeoDisplay ProjectLocalGeo(const std::optional<LocalGeoResult>& slot) {
  if (!slot) {
    return {kPendingPlaceholder, kPendingPlaceholder, kPendingPlaceholder, kPendingPlaceholder};
  }
  return {Show(slot->country), Show(slot->country_code), Show(slot->city), Show(slot->asn)};
}

}  // namespace lookup
}  // namespace sniffer
