// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-IP lifecycle: counters, ports, idle timeout and rejoin

#include <catch2/catch_test_macros.hpp>

#include "session/peer_record.hpp"
#include "util/time.hpp"

#include <chrono>
#include <vector>

using namespace sniffer;
using namespace sniffer::session;
using namespace std::chrono_literals;

namespace {

const util::Timestamp kT0 = util::FromEpochSeconds(1700000000.0);

util::Timestamp At(double seconds) {
    return util::FromEpochSeconds(1700000000.0 + seconds);
}

}  // namespace

TEST_CASE("PortHistory: first, last and intermediate ports", "[session][peer_record]") {
    PortHistory ports(10);
    ports.Record(20);
    ports.Record(30);

    REQUIRE(ports.first == 10);
    REQUIRE(ports.last == 30);
    REQUIRE(ports.list == std::vector<uint16_t>{10, 20, 30});
    REQUIRE(ports.Intermediate() == std::vector<uint16_t>{20});

    SECTION("Known port becomes last without duplicating") {
        ports.Record(20);
        REQUIRE(ports.last == 20);
        REQUIRE(ports.list == std::vector<uint16_t>{10, 20, 30});
        REQUIRE(ports.Intermediate() == std::vector<uint16_t>{30});
    }

    SECTION("Intermediate ports are most recent first") {
        ports.Record(40);
        ports.Record(50);
        REQUIRE(ports.Intermediate() == std::vector<uint16_t>{40, 30, 20});
    }
}

TEST_CASE("PeerRecord: registration packet is counted once", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);

    auto state = record.State();
    REQUIRE(state.ip == "8.8.8.8");
    REQUIRE(state.total_packets == 1);
    REQUIRE(state.packets_since_rejoin == 1);
    REQUIRE(state.just_registered);
    REQUIRE(state.timestamps.first_seen == kT0);
    REQUIRE(state.timestamps.last_rejoin == kT0);
    REQUIRE(state.IsConnected());

    REQUIRE(record.RecordPacket(10, kT0, true) == PacketOutcome::Registered);
    state = record.State();
    REQUIRE_FALSE(state.just_registered);
    REQUIRE(state.total_packets == 1);

    REQUIRE(record.RecordPacket(20, At(1), true) == PacketOutcome::Counted);
    REQUIRE(record.RecordPacket(30, At(2), true) == PacketOutcome::Counted);
    state = record.State();
    REQUIRE(state.total_packets == 3);
    REQUIRE(state.packets_since_rejoin == 3);
    REQUIRE(state.ports.first == 10);
    REQUIRE(state.ports.last == 30);
    REQUIRE(state.ports.Intermediate() == std::vector<uint16_t>{20});
    REQUIRE(state.timestamps.last_seen == At(2));
}

TEST_CASE("PeerRecord: out-of-order timestamps never move last_seen back", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);
    record.RecordPacket(10, kT0, true);
    record.RecordPacket(10, At(5), true);
    record.RecordPacket(10, At(3), true);

    REQUIRE(record.State().timestamps.last_seen == At(5));
}

TEST_CASE("PeerRecord: idle timeout and rejoin", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 100, kT0);
    record.RecordPacket(100, kT0, true);
    record.RecordPacket(100, At(1), true);
    record.RecordPacket(101, At(2), true);

    SECTION("Not idle long enough") {
        auto transition = record.MarkLeftIfIdle(At(11.5), 10s);
        REQUIRE_FALSE(transition.became_disconnected);
        REQUIRE(record.IsConnected());
    }

    auto transition = record.MarkLeftIfIdle(At(13), 10s);
    REQUIRE(transition.became_disconnected);
    REQUIRE_FALSE(transition.fire_disconnected_edge);
    REQUIRE_FALSE(record.IsConnected());

    auto state = record.State();
    REQUIRE(state.timestamps.left == At(2));
    REQUIRE(state.ports.first == 100);
    REQUIRE(state.ports.last == 101);

    SECTION("Already left: no second transition") {
        REQUIRE_FALSE(record.MarkLeftIfIdle(At(60), 10s).became_disconnected);
    }

    SECTION("Rejoin resets per-connection state") {
        REQUIRE(record.RecordPacket(200, At(30), true) == PacketOutcome::Rejoined);
        state = record.State();
        REQUIRE(state.IsConnected());
        REQUIRE(state.rejoin_count == 1);
        REQUIRE(state.packets_since_rejoin == 1);
        REQUIRE(state.total_packets == 4);
        REQUIRE(state.timestamps.last_rejoin == At(30));
        REQUIRE(state.timestamps.first_seen == kT0);
        REQUIRE(state.ports.list == std::vector<uint16_t>{200});
        REQUIRE(state.ports.first == 200);
    }

    SECTION("Rejoin can keep the port history") {
        REQUIRE(record.RecordPacket(200, At(30), false) == PacketOutcome::Rejoined);
        state = record.State();
        REQUIRE(state.ports.first == 100);
        REQUIRE(state.ports.last == 200);
        REQUIRE(state.ports.list == std::vector<uint16_t>{100, 101, 200});
    }
}

TEST_CASE("PeerRecord: connected edge fires once per connection", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);

    REQUIRE(record.TryMarkUserIPDetected(kT0));
    REQUIRE_FALSE(record.TryMarkUserIPDetected(At(1)));
    auto state = record.State();
    REQUIRE(state.connected_notified);
    REQUIRE(state.userip_detection->type == kStaticIPDetection);
    REQUIRE(state.userip_detection->time == kT0);

    // Disconnect clears the edge so the next connection fires again
    auto transition = record.MarkLeftIfIdle(At(20), 10s);
    REQUIRE(transition.fire_disconnected_edge);
    REQUIRE_FALSE(record.State().connected_notified);
    REQUIRE(record.TryMarkUserIPDetected(At(21)));
}

TEST_CASE("PeerRecord: packet rate", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);
    record.RecordPacket(10, kT0, true);
    for (int i = 0; i < 30; ++i) {
        record.RecordPacket(10, At(0.5), true);
    }

    record.UpdatePacketRate(At(0.9));
    REQUIRE(record.State().packet_rate.is_first_calculation);

    record.UpdatePacketRate(At(2));
    auto rate = record.State().packet_rate;
    REQUIRE_FALSE(rate.is_first_calculation);
    REQUIRE(rate.rate == 15);
    REQUIRE(rate.counter == 0);
    REQUIRE(rate.t1 == At(2));

    record.UpdatePacketRate(At(3));
    REQUIRE(record.State().packet_rate.rate == 0);
}

TEST_CASE("PeerRecord: usernames merge mod-menu and UserIP names", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);

    record.MergeModMenuUsernames({"modder", "alice"});
    record.MergeModMenuUsernames({"alice"});

    userip::UserIPAssociation association;
    association.database_name = "Friendlist";
    association.usernames = {"alice", "bob"};
    record.SetUserIPAssociation(association);
    record.RefreshUsernames();

    REQUIRE(record.State().usernames == std::vector<std::string>{"modder", "alice", "bob"});

    record.ClearUserIPAssociation();
    record.RefreshUsernames();
    auto state = record.State();
    REQUIRE(state.usernames == std::vector<std::string>{"modder", "alice"});
    REQUIRE_FALSE(state.userip.has_value());
    REQUIRE_FALSE(state.userip_detection.has_value());
}

TEST_CASE("PeerRecord: geo slots are written once", "[session][peer_record]") {
    PeerRecord record("8.8.8.8", 10, kT0);
    REQUIRE_FALSE(record.HasLocalGeo());
    REQUIRE_FALSE(record.HasRemoteGeo());

    lookup::LocalGeoResult local;
    local.country = "First";
    record.SetLocalGeo(local);
    local.country = "Second";
    record.SetLocalGeo(local);
    REQUIRE(record.State().local_geo->country == "First");

    lookup::RemoteGeoResult remote;
    remote.ip = "8.8.8.8";
    remote.city = "Mountain View";
    record.SetRemoteGeo(remote);
    REQUIRE(record.HasRemoteGeo());
    REQUIRE(record.State().remote_geo->city == "Mountain View");
}

TEST_CASE("AppendUnique", "[session][peer_record]") {
    std::vector<std::string> out = {"a"};
    AppendUnique(out, {"b", "a", "c", "b"});
    REQUIRE(out == std::vector<std::string>{"a", "b", "c"});
}
