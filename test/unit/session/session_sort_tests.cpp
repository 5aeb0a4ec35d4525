// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "session/session_sort.hpp"
#include "util/time.hpp"

#include <string>
#include <vector>

using namespace sniffer;
using namespace sniffer::session;

namespace {

PeerState Peer(const std::string& ip, uint64_t total_packets = 1, double last_rejoin = 0.0) {
    PeerState state;
    state.ip = ip;
    state.total_packets = total_packets;
    state.timestamps.last_rejoin = util::FromEpochSeconds(1700000000.0 + last_rejoin);
    return state;
}

std::vector<std::string> Ips(const std::vector<PeerState>& peers) {
    std::vector<std::string> ips;
    for (const auto& peer : peers) {
        ips.push_back(peer.ip);
    }
    return ips;
}

}  // namespace

TEST_CASE("SortPeers: counters sort descending", "[session][sort]") {
    std::vector<PeerState> peers = {Peer("1.1.1.1", 5), Peer("2.2.2.2", 50), Peer("3.3.3.3", 20)};
    SortPeers(peers, SortField::TotalPackets);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "3.3.3.3", "1.1.1.1"});

    REQUIRE(IsDescending(SortField::TotalPackets));
    REQUIRE(IsDescending(SortField::Packets));
    REQUIRE(IsDescending(SortField::PPS));
    REQUIRE(IsDescending(SortField::Rejoins));
    REQUIRE_FALSE(IsDescending(SortField::IPAddress));
    REQUIRE_FALSE(IsDescending(SortField::LastRejoin));
}

TEST_CASE("SortPeers: IP addresses compare numerically", "[session][sort]") {
    std::vector<PeerState> peers = {Peer("10.0.0.10"), Peer("10.0.0.2"), Peer("9.255.255.255")};
    SortPeers(peers, SortField::IPAddress);
    REQUIRE(Ips(peers) == std::vector<std::string>{"9.255.255.255", "10.0.0.2", "10.0.0.10"});
}

TEST_CASE("SortPeers: timestamps ascending and ties stable", "[session][sort]") {
    std::vector<PeerState> peers = {Peer("1.1.1.1", 1, 3.0), Peer("2.2.2.2", 1, 1.0), Peer("3.3.3.3", 1, 3.0),
                                    Peer("4.4.4.4", 1, 2.0)};
    SortPeers(peers, SortField::LastRejoin);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "4.4.4.4", "1.1.1.1", "3.3.3.3"});

    // Equal counters keep their previous relative order
    SortPeers(peers, SortField::TotalPackets);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "4.4.4.4", "1.1.1.1", "3.3.3.3"});
}

TEST_CASE("SortPeers: text columns use displayed values", "[session][sort]") {
    std::vector<PeerState> peers = {Peer("1.1.1.1"), Peer("2.2.2.2"), Peer("3.3.3.3")};
    peers[0].local_geo = lookup::LocalGeoResult{};
    peers[0].local_geo->country = "Sweden";
    peers[1].local_geo = lookup::LocalGeoResult{};
    peers[1].local_geo->country = "Canada";
    peers[2].local_geo = lookup::LocalGeoResult{};
    peers[2].local_geo->country = "Norway";

    SortPeers(peers, SortField::Country);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "3.3.3.3", "1.1.1.1"});

    peers[0].usernames = {"zed"};
    peers[1].usernames = {"amy", "bob"};
    peers[2].usernames = {"max"};
    SortPeers(peers, SortField::Usernames);
    REQUIRE(Ips(peers) == std::vector<std::string>{"3.3.3.3", "1.1.1.1", "2.2.2.2"});
}

TEST_CASE("SortPeers: coordinates and offsets compare as numbers", "[session][sort]") {
    std::vector<PeerState> peers = {Peer("1.1.1.1"), Peer("2.2.2.2"), Peer("3.3.3.3"), Peer("4.4.4.4")};
    peers[0].remote_geo = lookup::RemoteGeoResult{};
    peers[0].remote_geo->lat = 10.5;
    peers[0].remote_geo->offset = 3600;
    peers[1].remote_geo = lookup::RemoteGeoResult{};
    peers[1].remote_geo->lat = 9.2;
    peers[1].remote_geo->offset = -14400;
    // Resolved but no value: N/A
    peers[2].remote_geo = lookup::RemoteGeoResult{};
    peers[3].remote_geo.reset();

    SortPeers(peers, SortField::Lat);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "1.1.1.1", "3.3.3.3", "4.4.4.4"});

    SortPeers(peers, SortField::Offset);
    REQUIRE(Ips(peers) == std::vector<std::string>{"2.2.2.2", "1.1.1.1", "3.3.3.3", "4.4.4.4"});
}

TEST_CASE("SortField: header names", "[session][sort]") {
    REQUIRE(AllSortFields().size() == 32);
    for (SortField field : AllSortFields()) {
        auto parsed = ParseSortField(SortFieldName(field));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == field);
    }

    REQUIRE(ParseSortField("T. Packets") == SortField::TotalPackets);
    REQUIRE(ParseSortField("IP Address") == SortField::IPAddress);
    REQUIRE(ParseSortField("ASN / ISP") == SortField::ASNISP);
    REQUIRE_FALSE(ParseSortField("ip address").has_value());
    REQUIRE_FALSE(ParseSortField("").has_value());
}
