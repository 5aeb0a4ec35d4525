// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/config.hpp"

#include <initializer_list>
#include <string>
#include <vector>

using namespace sniffer;
using namespace sniffer::app;

namespace {

ParseResult Parse(AppConfig& config, std::initializer_list<const char*> args) {
    std::vector<const char*> argv = {"session_sniffer"};
    argv.insert(argv.end(), args.begin(), args.end());
    return ParseCommandLine(static_cast<int>(argv.size()), argv.data(), config);
}

}  // namespace

TEST_CASE("Config: defaults", "[app][config]") {
    AppConfig config;
    auto result = Parse(config, {"--datadir=/tmp/sniffer-data"});
    REQUIRE(result.status == ParseStatus::Ok);

    REQUIRE_FALSE(config.input_path.has_value());
    REQUIRE(config.preset == Preset::GTA5);
    REQUIRE(config.presentation.detect_session_host);
    REQUIRE(config.lookup_enabled);
    REQUIRE(config.userip_enabled);
    REQUIRE(config.ingestion.userip_enabled);
    REQUIRE(config.ingestion.reset_ports_on_rejoin);
    REQUIRE_FALSE(config.ingestion.local_ip.has_value());
    REQUIRE(config.ingestion.overflow_timer.count() == 3.0);
    REQUIRE(config.presentation.disconnected_timer.count() == 10.0);
    REQUIRE(config.presentation.disconnected_limit == 6);
    REQUIRE(config.presentation.connected_sort == session::SortField::LastRejoin);
    REQUIRE(config.presentation.disconnected_sort == session::SortField::LastSeen);
    REQUIRE(config.userip_dir == std::filesystem::path("/tmp/sniffer-data/UserIP_Databases"));
    REQUIRE(config.userip_log == std::filesystem::path("/tmp/sniffer-data/UserIP_Logging.log"));
    REQUIRE(config.log_level == "info");
    REQUIRE_FALSE(config.log_file.has_value());
}

TEST_CASE("Config: options", "[app][config]") {
    AppConfig config;
    auto result = Parse(config, {"--input=capture.txt", "--local-ip=192.168.1.10", "--overflow-timer=2.5",
                                 "--keep-ports-on-rejoin", "--disconnected-timer=30", "--disconnected-limit=0",
                                 "--sort-connected=T. Packets", "--sort-disconnected=IP Address",
                                 "--userip-dir=/tmp/u", "--userip-log=/tmp/u.log", "--modmenu-log=a.log",
                                 "--modmenu-log=b.log", "--lookup-host=localhost", "--lookup-port=8080",
                                 "--loglevel=debug", "--logfile=/tmp/sniffer.log", "--datadir=/tmp/d"});
    REQUIRE(result.status == ParseStatus::Ok);
    REQUIRE(result.error.empty());

    REQUIRE(config.input_path == std::filesystem::path("capture.txt"));
    REQUIRE(config.ingestion.local_ip == std::optional<std::string>("192.168.1.10"));
    REQUIRE(config.ingestion.overflow_timer.count() == 2.5);
    REQUIRE(config.presentation.overflow_timer.count() == 2.5);
    REQUIRE_FALSE(config.ingestion.reset_ports_on_rejoin);
    REQUIRE(config.presentation.disconnected_timer.count() == 30.0);
    REQUIRE(config.presentation.disconnected_limit == 0);
    REQUIRE(config.presentation.connected_sort == session::SortField::TotalPackets);
    REQUIRE(config.presentation.disconnected_sort == session::SortField::IPAddress);
    REQUIRE(config.userip_dir == std::filesystem::path("/tmp/u"));
    REQUIRE(config.userip_log == std::filesystem::path("/tmp/u.log"));
    REQUIRE(config.modmenu_logs.size() == 2);
    REQUIRE(config.http.host == "localhost");
    REQUIRE(config.http.port == 8080);
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.log_file == std::filesystem::path("/tmp/sniffer.log"));
}

TEST_CASE("Config: presets and switches", "[app][config]") {
    AppConfig config;

    SECTION("Minecraft turns host detection off") {
        REQUIRE(Parse(config, {"--preset=Minecraft", "--datadir=/tmp/d"}).status == ParseStatus::Ok);
        REQUIRE(config.preset == Preset::Minecraft);
        REQUIRE_FALSE(config.presentation.detect_session_host);
    }

    SECTION("No preset") {
        REQUIRE(Parse(config, {"--preset=none", "--datadir=/tmp/d"}).status == ParseStatus::Ok);
        REQUIRE_FALSE(config.presentation.detect_session_host);
    }

    SECTION("Disabling UserIP reaches both workers") {
        REQUIRE(Parse(config, {"--no-userip", "--no-lookup", "--datadir=/tmp/d"}).status == ParseStatus::Ok);
        REQUIRE_FALSE(config.userip_enabled);
        REQUIRE_FALSE(config.ingestion.userip_enabled);
        REQUIRE_FALSE(config.presentation.userip_enabled);
        REQUIRE_FALSE(config.lookup_enabled);
    }

    REQUIRE(ParsePreset("GTA5") == Preset::GTA5);
    REQUIRE_FALSE(ParsePreset("gta5").has_value());
    REQUIRE(std::string(PresetName(Preset::None)) == "none");
}

TEST_CASE("Config: help and version", "[app][config]") {
    AppConfig config;
    REQUIRE(Parse(config, {"--help"}).status == ParseStatus::Help);
    REQUIRE(Parse(config, {"-h"}).status == ParseStatus::Help);
    REQUIRE(Parse(config, {"--version"}).status == ParseStatus::Version);

    // Parsing stops at help
    REQUIRE(Parse(config, {"--help", "--bogus"}).status == ParseStatus::Help);
}

TEST_CASE("Config: invalid options", "[app][config]") {
    const std::vector<std::string> bad = {
        "--bogus",
        "--input=",
        "--local-ip=999.1.1.1",
        "--local-ip=example.com",
        "--overflow-timer=0",
        "--overflow-timer=-1",
        "--overflow-timer=abc",
        "--disconnected-timer=1s",
        "--disconnected-limit=-1",
        "--disconnected-limit=six",
        "--sort-connected=Last Seen",
        "--sort-connected=t. packets",
        "--sort-disconnected=Nope",
        "--sort-disconnected=PPS",
        "--preset=GTA6",
        "--lookup-port=0",
        "--lookup-port=70000",
        "--loglevel=verbose",
        "--datadir=",
    };

    for (const auto& arg : bad) {
        CAPTURE(arg);
        AppConfig config;
        auto result = Parse(config, {arg.c_str(), "--datadir=/tmp/d"});
        REQUIRE(result.status == ParseStatus::Error);
        REQUIRE_FALSE(result.error.empty());
    }
}
