// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "lookup/ip_lookup_sets.hpp"
#include "util/error.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace sniffer;
using namespace sniffer::lookup;

namespace {

RemoteGeoResult Result(const std::string& ip) {
    RemoteGeoResult r;
    r.ip = ip;
    r.country = "Testland";
    return r;
}

}  // namespace

TEST_CASE("IPLookupSets: pending queue", "[lookup][sets]") {
    IPLookupSets sets;
    sets.AddPending("1.1.1.1");
    sets.AddPending("2.2.2.2");
    sets.AddPending("3.3.3.3");

    REQUIRE(sets.PendingCount() == 3);
    REQUIRE(sets.IsPending("2.2.2.2"));
    REQUIRE(sets.Query("2.2.2.2") == LookupMembership::Pending);
    REQUIRE(sets.Query("9.9.9.9") == LookupMembership::Absent);

    SECTION("Slices are oldest first") {
        REQUIRE(sets.PendingSlice(0, 2) == std::vector<std::string>{"1.1.1.1", "2.2.2.2"});
        REQUIRE(sets.PendingSlice(2, 10) == std::vector<std::string>{"3.3.3.3"});
        REQUIRE(sets.PendingSlice(5, 1).empty());
    }

    SECTION("Duplicate pending insert is a contract violation") {
        REQUIRE_THROWS_AS(sets.AddPending("1.1.1.1"), util::ContractViolation);
        REQUIRE(sets.PendingCount() == 3);
    }
}

TEST_CASE("IPLookupSets: resolve moves pending to resolved", "[lookup][sets]") {
    IPLookupSets sets;
    sets.AddPending("1.1.1.1");
    sets.AddPending("2.2.2.2");

    sets.Resolve(Result("1.1.1.1"));

    REQUIRE_FALSE(sets.IsPending("1.1.1.1"));
    REQUIRE(sets.IsResolved("1.1.1.1"));
    REQUIRE(sets.Query("1.1.1.1") == LookupMembership::Resolved);
    REQUIRE(sets.GetResult("1.1.1.1")->country == "Testland");
    REQUIRE(sets.PendingSlice(0, 10) == std::vector<std::string>{"2.2.2.2"});
    REQUIRE(sets.ResolvedCount() == 1);

    SECTION("Resolving an IP that was never queued just stores it") {
        sets.Resolve(Result("3.3.3.3"));
        REQUIRE(sets.Query("3.3.3.3") == LookupMembership::Resolved);
        REQUIRE(sets.PendingCount() == 1);
    }

    REQUIRE(std::string(MembershipName(LookupMembership::Absent)) == "absent");
}

TEST_CASE("IPLookupSets: observers never see an IP in both sets or neither", "[lookup][sets][threading]") {
    IPLookupSets sets;
    const int count = 500;
    for (int i = 0; i < count; ++i) {
        sets.AddPending("10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256));
    }

    std::atomic<bool> done{false};
    std::atomic<int> absent_seen{0};

    std::thread observer([&] {
        while (!done) {
            for (int i = 0; i < count; i += 7) {
                auto ip = "10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256);
                if (sets.Query(ip) == LookupMembership::Absent) {
                    absent_seen++;
                }
            }
        }
    });

    for (int i = 0; i < count; ++i) {
        sets.Resolve(Result("10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256)));
    }
    done = true;
    observer.join();

    REQUIRE(absent_seen == 0);
    REQUIRE(sets.PendingCount() == 0);
    REQUIRE(sets.ResolvedCount() == static_cast<size_t>(count));
}
