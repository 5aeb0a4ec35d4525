// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_sort.hpp"

#include "lookup/geo_types.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace sniffer {
namespace session {

namespace {

constexpr std::array<std::pair<SortField, const char*>, 32> kFieldNames = {{
    {SortField::FirstSeen, "First Seen"},
    {SortField::LastRejoin, "Last Rejoin"},
    {SortField::LastSeen, "Last Seen"},
    {SortField::Usernames, "Usernames"},
    {SortField::Rejoins, "Rejoins"},
    {SortField::TotalPackets, "T. Packets"},
    {SortField::Packets, "Packets"},
    {SortField::PPS, "PPS"},
    {SortField::IPAddress, "IP Address"},
    {SortField::LastPort, "Last Port"},
    {SortField::IntermediatePorts, "Intermediate Ports"},
    {SortField::FirstPort, "First Port"},
    {SortField::Continent, "Continent"},
    {SortField::Country, "Country"},
    {SortField::Region, "Region"},
    {SortField::RegionCode, "R. Code"},
    {SortField::City, "City"},
    {SortField::District, "District"},
    {SortField::ZIPCode, "ZIP Code"},
    {SortField::Lat, "Lat"},
    {SortField::Lon, "Lon"},
    {SortField::TimeZone, "Time Zone"},
    {SortField::Offset, "Offset"},
    {SortField::Currency, "Currency"},
    {SortField::Organization, "Organization"},
    {SortField::ISP, "ISP"},
    {SortField::ASNISP, "ASN / ISP"},
    {SortField::AS, "AS"},
    {SortField::ASN, "ASN"},
    {SortField::Mobile, "Mobile"},
    {SortField::VPN, "VPN"},
    {SortField::Hosting, "Hosting"},
}};

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

// Text columns compare on what the table shows
std::string DisplayText(const PeerState& p, SortField field) {
  switch (field) {
  case SortField::Usernames:
    return JoinNames(p.usernames);
  case SortField::Country:
    return lookup::ProjectLocalGeo(p.local_geo).country;
  case SortField::City:
    return lookup::ProjectLocalGeo(p.local_geo).city;
  case SortField::ASNISP:
    return lookup::ProjectLocalGeo(p.local_geo).asn;
  default:
    break;
  }

  auto remote = lookup::ProjectRemoteGeo(p.remote_geo);
  switch (field) {
  case SortField::Continent:
    return remote.continent;
  case SortField::Region:
    return remote.region;
  case SortField::RegionCode:
    return remote.region_code;
  case SortField::District:
    return remote.district;
  case SortField::ZIPCode:
    return remote.zip_code;
  case SortField::TimeZone:
    return remote.time_zone;
  case SortField::Currency:
    return remote.currency;
  case SortField::Organization:
    return remote.org;
  case SortField::ISP:
    return remote.isp;
  case SortField::AS:
    return remote.as_info;
  case SortField::ASN:
    return remote.as_name;
  case SortField::Mobile:
    return remote.mobile;
  case SortField::VPN:
    return remote.proxy;
  case SortField::Hosting:
    return remote.hosting;
  default:
    return {};
  }
}

// Numeric geo columns; unresolved or N/A values sort after every number
template <typename T>
int CompareNumeric(const std::optional<T>& x, const std::optional<T>& y) {
  if (!x || !y) {
    return x ? -1 : (y ? 1 : 0);
  }
  return *x < *y ? -1 : (*y < *x ? 1 : 0);
}

template <typename T>
std::optional<T> RemoteField(const PeerState& p, std::optional<T> lookup::RemoteGeoResult::*field) {
  if (!p.remote_geo) {
    return std::nullopt;
  }
  return (*p.remote_geo).*field;
}

// Three-way compare in ascending order
int Compare(const PeerState& a, const PeerState& b, SortField field) {
  auto three_way = [](const auto& x, const auto& y) { return x < y ? -1 : (y < x ? 1 : 0); };

  switch (field) {
  case SortField::FirstSeen:
    return three_way(a.timestamps.first_seen, b.timestamps.first_seen);
  case SortField::LastRejoin:
    return three_way(a.timestamps.last_rejoin, b.timestamps.last_rejoin);
  case SortField::LastSeen:
    return three_way(a.timestamps.last_seen, b.timestamps.last_seen);
  case SortField::Rejoins:
    return three_way(a.rejoin_count, b.rejoin_count);
  case SortField::TotalPackets:
    return three_way(a.total_packets, b.total_packets);
  case SortField::Packets:
    return three_way(a.packets_since_rejoin, b.packets_since_rejoin);
  case SortField::PPS:
    return three_way(a.packet_rate.rate, b.packet_rate.rate);
  case SortField::IPAddress:
    return util::CompareIPAddresses(a.ip, b.ip);
  case SortField::LastPort:
    return three_way(a.ports.last, b.ports.last);
  case SortField::FirstPort:
    return three_way(a.ports.first, b.ports.first);
  case SortField::IntermediatePorts:
    return three_way(a.ports.Intermediate(), b.ports.Intermediate());
  case SortField::Lat:
    return CompareNumeric(RemoteField(a, &lookup::RemoteGeoResult::lat),
                          RemoteField(b, &lookup::RemoteGeoResult::lat));
  case SortField::Lon:
    return CompareNumeric(RemoteField(a, &lookup::RemoteGeoResult::lon),
                          RemoteField(b, &lookup::RemoteGeoResult::lon));
  case SortField::Offset:
    return CompareNumeric(RemoteField(a, &lookup::RemoteGeoResult::offset),
                          RemoteField(b, &lookup::RemoteGeoResult::offset));
  default:
    return DisplayText(a, field).compare(DisplayText(b, field));
  }
}

}  // namespace

const char* SortFieldName(SortField field) {
  for (const auto& [f, name] : kFieldNames) {
    if (f == field)
      return name;
  }
  return "?";
}

std::optional<SortField> ParseSortField(const std::string& name) {
  for (const auto& [f, n] : kFieldNames) {
    if (name == n)
      return f;
  }
  return std::nullopt;
}

const std::vector<SortField>& AllSortFields() {
  static const std::vector<SortField> fields = [] {
    std::vector<SortField> out;
    for (const auto& [f, name] : kFieldNames) {
      out.push_back(f);
    }
    return out;
  }();
  return fields;
}

bool IsDescending(SortField field) {
  switch (field) {
  case SortField::TotalPackets:
  case SortField::Packets:
  case SortField::PPS:
  case SortField::Rejoins:
    return true;
  default:
    return false;
  }
}

void SortPeers(std::vector<PeerState>& peers, SortField field) {
  bool descending = IsDescending(field);
  std::stable_sort(peers.begin(), peers.end(), [field, descending](const PeerState& a, const PeerState& b) {
    int c = Compare(a, b, field);
    return descending ? c > 0 : c < 0;
  });
}

}  // namespace session
}  // namespace sniffer
