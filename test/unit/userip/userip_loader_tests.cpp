// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Loading UserIP databases from a directory of JSON files

#include <catch2/catch_test_macros.hpp>

#include "userip/userip_loader.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

using namespace sniffer;
using namespace sniffer::userip;
using ordered_json = nlohmann::ordered_json;

namespace {

const char* kValidSettings = R"({
    "ENABLED": true, "COLOR": "RED", "LOG": true, "NOTIFICATIONS": false,
    "VOICE_NOTIFICATIONS": false, "PROTECTION": false,
    "PROTECTION_PROCESS_PATH": null, "PROTECTION_RESTART_PROCESS_PATH": null,
    "PROTECTION_SUSPEND_PROCESS_MODE": "Auto"
})";

class TempDir {
public:
    explicit TempDir(const std::string& name) : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() { std::filesystem::remove_all(path_); }

    const std::filesystem::path& path() const { return path_; }

    void Write(const std::string& file, const std::string& content) const {
        REQUIRE(util::atomic_write_file(path_ / file, content));
    }

private:
    std::filesystem::path path_;
};

std::string DatabaseFile(const std::string& users, const std::string& settings = kValidSettings) {
    return R"({"settings": )" + settings + R"(, "users": )" + users + "}";
}

ordered_json Settings() {
    return ordered_json::parse(kValidSettings);
}

}  // namespace

TEST_CASE("ParseSettings: valid settings", "[userip][loader]") {
    auto settings = UserIPDirectoryLoader::ParseSettings(Settings());
    REQUIRE(settings.has_value());
    REQUIRE(settings->enabled);
    REQUIRE(settings->color == DisplayColor::Red);
    REQUIRE(settings->log);
    REQUIRE_FALSE(settings->notifications);
    REQUIRE(settings->voice_notifications == VoiceNotification::Off);
    REQUIRE(settings->protection == Protection::Off);
    REQUIRE_FALSE(settings->protection_process_path.has_value());
    REQUIRE(settings->protection_suspend_process_mode == "Auto");

    SECTION("Named values") {
        auto s = Settings();
        s["COLOR"] = nullptr;
        s["VOICE_NOTIFICATIONS"] = "Female";
        s["PROTECTION"] = "Suspend_Process";
        s["PROTECTION_PROCESS_PATH"] = "/usr/bin/game";
        s["PROTECTION_SUSPEND_PROCESS_MODE"] = 2.5;
        auto parsed = UserIPDirectoryLoader::ParseSettings(s);
        REQUIRE(parsed.has_value());
        REQUIRE_FALSE(parsed->color.has_value());
        REQUIRE(parsed->voice_notifications == VoiceNotification::Female);
        REQUIRE(parsed->protection == Protection::SuspendProcess);
        REQUIRE(parsed->protection_process_path == "/usr/bin/game");
        REQUIRE(parsed->protection_suspend_process_mode == "2.5");
    }
}

TEST_CASE("ParseSettings: rejects missing or invalid keys", "[userip][loader]") {
    SECTION("Missing key") {
        auto s = Settings();
        s.erase("LOG");
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("Wrong type") {
        auto s = Settings();
        s["ENABLED"] = "yes";
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("Unknown color") {
        auto s = Settings();
        s["COLOR"] = "PINKISH";
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("true is not a voice") {
        auto s = Settings();
        s["VOICE_NOTIFICATIONS"] = true;
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("Empty path") {
        auto s = Settings();
        s["PROTECTION_RESTART_PROCESS_PATH"] = "";
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("Negative suspend mode") {
        auto s = Settings();
        s["PROTECTION_SUSPEND_PROCESS_MODE"] = -1;
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(s).has_value());
    }
    SECTION("Not an object") {
        REQUIRE_FALSE(UserIPDirectoryLoader::ParseSettings(ordered_json::array()).has_value());
    }
}

TEST_CASE("UserIPDirectoryLoader: reads databases in name order", "[userip][loader]") {
    TempDir dir("sniffer_userip_loader_order");
    dir.Write("Zeta.json", DatabaseFile(R"({"zed": "1.2.3.4"})"));
    dir.Write("Alpha.json", DatabaseFile(R"({"amy": ["1.2.3.4", "5.6.7.8", "5.6.7.8"], "bo": "9.9.9.9"})"));
    dir.Write("notes.txt", "ignored");

    UserIPDirectoryLoader loader(dir.path());
    auto load = loader.Load();

    REQUIRE(load.databases.size() == 2);
    REQUIRE(load.databases[0].name == "Alpha");
    REQUIRE(load.databases[1].name == "Zeta");
    REQUIRE(load.invalid_entries.empty());
    REQUIRE(load.corrupted_files.empty());

    const auto& alpha = load.databases[0];
    REQUIRE(alpha.users.size() == 2);
    REQUIRE(alpha.users[0].first == "amy");
    REQUIRE(alpha.users[0].second == std::vector<std::string>{"1.2.3.4", "5.6.7.8"});
    REQUIRE(alpha.users[1].first == "bo");

    SECTION("Name order decides conflicts") {
        UserIPDatabase db;
        auto report = db.Rebuild(load);
        REQUIRE(db.Lookup("1.2.3.4")->database_name == "Alpha");
        REQUIRE(report.new_conflicts.size() == 1);
        REQUIRE(report.new_conflicts[0].conflicting_database == "Zeta");
    }
}

TEST_CASE("UserIPDirectoryLoader: invalid IPs and corrupted files", "[userip][loader]") {
    TempDir dir("sniffer_userip_loader_invalid");
    dir.Write("Blacklist.json", DatabaseFile(R"({"bob": ["999.1.1.1", "2.2.2.2"], "carl": "not-an-ip"})"));
    dir.Write("Broken.json", "{ not json");
    dir.Write("NoSettings.json", R"({"users": {}})");
    dir.Write("BadSettings.json", DatabaseFile("{}", R"({"ENABLED": true})"));

    UserIPDirectoryLoader loader(dir.path());
    auto load = loader.Load();

    REQUIRE(load.databases.size() == 1);
    REQUIRE(load.databases[0].users.size() == 1);
    REQUIRE(load.databases[0].users[0].second == std::vector<std::string>{"2.2.2.2"});

    REQUIRE(load.invalid_entries ==
            std::set<std::string>{"Blacklist.json=bob=999.1.1.1", "Blacklist.json=carl=not-an-ip"});
    REQUIRE(load.corrupted_files == std::set<std::string>{"BadSettings.json", "Broken.json", "NoSettings.json"});
}

TEST_CASE("UserIPDirectoryLoader: disabled databases are skipped", "[userip][loader]") {
    TempDir dir("sniffer_userip_loader_disabled");
    auto settings = Settings();
    settings["ENABLED"] = false;
    dir.Write("Off.json", DatabaseFile(R"({"x": "1.1.1.1"})", settings.dump()));

    UserIPDirectoryLoader loader(dir.path());
    auto load = loader.Load();
    REQUIRE(load.databases.empty());
    REQUIRE(load.corrupted_files.empty());
}

TEST_CASE("UserIPDirectoryLoader: creates defaults for a missing directory", "[userip][loader]") {
    auto root = std::filesystem::temp_directory_path() / "sniffer_userip_loader_defaults";
    std::filesystem::remove_all(root);
    auto dir = root / "UserIP_Databases";

    UserIPDirectoryLoader loader(dir);
    auto load = loader.Load();

    REQUIRE(std::filesystem::exists(dir / "Blacklist.json"));
    REQUIRE(std::filesystem::exists(dir / "Searchlist.json"));
    REQUIRE(load.databases.size() == 5);
    REQUIRE(load.databases[0].name == "Blacklist");
    REQUIRE(load.databases[0].settings.color == DisplayColor::Red);
    REQUIRE(load.databases[0].users.empty());
    REQUIRE(load.corrupted_files.empty());

    SECTION("An existing empty directory is left alone") {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        auto empty = loader.Load();
        REQUIRE(empty.databases.empty());
        REQUIRE_FALSE(std::filesystem::exists(dir / "Blacklist.json"));
    }

    std::filesystem::remove_all(root);
}
