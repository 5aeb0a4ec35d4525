// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/peer_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace session {

// Session table columns, named as in the table header.
enum class SortField {
  FirstSeen,
  LastRejoin,
  LastSeen,
  Usernames,
  Rejoins,
  TotalPackets,
  Packets,
  PPS,
  IPAddress,
  LastPort,
  IntermediatePorts,
  FirstPort,
  Continent,
  Country,
  Region,
  RegionCode,
  City,
  District,
  ZIPCode,
  Lat,
  Lon,
  TimeZone,
  Offset,
  Currency,
  Organization,
  ISP,
  ASNISP,
  AS,
  ASN,
  Mobile,
  VPN,
  Hosting,
};

const char* SortFieldName(SortField field);

// Exact header name ("T. Packets", "IP Address", ...).
std::optional<SortField> ParseSortField(const std::string& name);

const std::vector<SortField>& AllSortFields();

// Counters sort largest first; everything else ascending.
bool IsDescending(SortField field);

// Stable sort. IP addresses compare numerically.
void SortPeers(std::vector<PeerState>& peers, SortField field);

}  // namespace session
}  // namespace sniffer
