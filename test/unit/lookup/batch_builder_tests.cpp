// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Batch selection for the remote lookup worker

#include <catch2/catch_test_macros.hpp>

#include "lookup/geo_batch_client.hpp"
#include "lookup/ip_lookup_orchestrator.hpp"
#include "lookup/ip_lookup_sets.hpp"
#include "session/peer_registry.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <vector>

using namespace sniffer;
using namespace sniffer::lookup;

namespace {

class UnusedClient : public GeoBatchClient {
public:
    BatchResponse PostBatch(const std::vector<std::string>&) override { return BatchResponse{}; }
};

const util::Timestamp kStart = util::FromEpochSeconds(1700000000.0);

std::string IP(int n) {
    return "20.0." + std::to_string(n / 256) + "." + std::to_string(n % 256);
}

void AddDisconnected(session::PeerRegistry& registry, const std::string& ip) {
    auto record = registry.AddNew(ip, 6672, kStart);
    record->MarkLeftIfIdle(kStart + std::chrono::seconds(30), std::chrono::seconds(10));
}

}  // namespace

TEST_CASE("BuildBatch: connected peers come before disconnected ones", "[lookup][batch]") {
    session::PeerRegistry registry;
    IPLookupSets sets;
    UnusedClient client;
    IPLookupOrchestrator orchestrator(registry, sets, client);

    AddDisconnected(registry, "1.0.0.1");
    registry.AddNew("2.0.0.1", 6672, kStart);
    AddDisconnected(registry, "1.0.0.2");
    registry.AddNew("2.0.0.2", 6672, kStart);

    auto batch = orchestrator.BuildBatch();
    REQUIRE(batch == std::vector<std::string>{"2.0.0.1", "2.0.0.2", "1.0.0.1", "1.0.0.2"});

    SECTION("Every batched IP is queued as pending") {
        for (const auto& ip : batch) {
            REQUIRE(sets.Query(ip) == LookupMembership::Pending);
        }
    }

    SECTION("Rebuilding does not queue twice") {
        auto again = orchestrator.BuildBatch();
        REQUIRE(again == batch);
        REQUIRE(sets.PendingCount() == 4);
    }
}

TEST_CASE("BuildBatch: skips peers that already have a remote slot", "[lookup][batch]") {
    session::PeerRegistry registry;
    IPLookupSets sets;
    UnusedClient client;
    IPLookupOrchestrator orchestrator(registry, sets, client);

    RemoteGeoResult known;
    known.ip = "3.0.0.1";
    known.country = "Known";
    registry.AddNew("3.0.0.1", 1, kStart)->SetRemoteGeo(known);

    SECTION("Cached result is pushed into the record without a fetch") {
        RemoteGeoResult cached;
        cached.ip = "3.0.0.2";
        cached.country = "Cached";
        sets.Resolve(cached);
        auto record = registry.AddNew("3.0.0.2", 1, kStart);

        REQUIRE(orchestrator.BuildBatch().empty());
        REQUIRE(record->State().remote_geo->country == "Cached");
    }

    SECTION("Nothing to do") {
        REQUIRE(orchestrator.BuildBatch().empty());
        REQUIRE(sets.PendingCount() == 0);
    }
}

TEST_CASE("BuildBatch: backfills from the pending queue", "[lookup][batch]") {
    session::PeerRegistry registry;
    IPLookupSets sets;
    UnusedClient client;
    IPLookupOrchestrator orchestrator(registry, sets, client);

    sets.AddPending("9.0.0.1");
    registry.AddNew("9.0.0.2", 1, kStart);
    sets.AddPending("9.0.0.2");

    auto batch = orchestrator.BuildBatch();
    REQUIRE(batch == std::vector<std::string>{"9.0.0.2", "9.0.0.1"});
}

TEST_CASE("BuildBatch: never exceeds the batch size", "[lookup][batch]") {
    session::PeerRegistry registry;
    IPLookupSets sets;
    UnusedClient client;
    IPLookupOrchestrator orchestrator(registry, sets, client);

    SECTION("Only connected peers") {
        for (int i = 0; i < 150; ++i) {
            registry.AddNew(IP(i), 1, kStart);
        }
        auto batch = orchestrator.BuildBatch();
        REQUIRE(batch.size() == IPLookupOrchestrator::MAX_BATCH_SIZE);
        REQUIRE(batch.front() == IP(0));
        REQUIRE(batch.back() == IP(99));
    }

    SECTION("Only disconnected peers") {
        for (int i = 0; i < 120; ++i) {
            AddDisconnected(registry, IP(i));
        }
        auto batch = orchestrator.BuildBatch();
        REQUIRE(batch.size() == IPLookupOrchestrator::MAX_BATCH_SIZE);
        std::set<std::string> unique(batch.begin(), batch.end());
        REQUIRE(unique.size() == batch.size());
    }

    SECTION("Connected peers win over disconnected at the cap") {
        for (int i = 0; i < 60; ++i) {
            AddDisconnected(registry, IP(i));
        }
        for (int i = 60; i < 140; ++i) {
            registry.AddNew(IP(i), 1, kStart);
        }
        auto batch = orchestrator.BuildBatch();
        REQUIRE(batch.size() == IPLookupOrchestrator::MAX_BATCH_SIZE);
        for (int i = 60; i < 140; ++i) {
            REQUIRE(std::find(batch.begin(), batch.end(), IP(i)) != batch.end());
        }
        REQUIRE(batch.front() == IP(60));
    }
}
