// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 UserIPDatabase - IP -> association index over the loaded UserIP lists

 Rebuilt wholesale from a UserIPLoadResult, at most once per second:
 - Databases are folded in load order; the first database that lists an IP
   owns it, later ones are recorded as conflicts and not merged
 - Within one database, usernames sharing an IP accumulate without duplicates
 - Conflicts, invalid entries and corrupted files are diffed against the
   previous build: new ones are reported once, resolved ones are cleared

 The index is built without the lock and swapped in, so lookups from the
 ingestion worker never wait on a rebuild.
*/

#include "userip/userip_types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sniffer {
namespace session {
class PeerRecord;
}  // namespace session

namespace userip {

// One enabled database as read from its file. `users` keeps file order.
struct UserIPDatabaseEntry {
  std::string name;
  UserIPSettings settings;
  std::vector<std::pair<std::string, std::vector<std::string>>> users;
};

// Output of a UserIPSource load. Invalid entries are "<file>=<username>=<ip>"
// keys; corrupted files are file names.
struct UserIPLoadResult {
  std::vector<UserIPDatabaseEntry> databases;
  std::set<std::string> invalid_entries;
  std::set<std::string> corrupted_files;
};

// IP listed by two different databases. The first one keeps the IP.
struct UserIPConflict {
  std::string ip;
  std::string kept_database;
  std::string kept_username;
  std::string conflicting_database;
  std::string conflicting_username;
};

class UserIPDatabase {
public:
  struct RebuildReport {
    std::vector<UserIPConflict> new_conflicts;
    std::vector<std::string> resolved_conflicts;  // IPs
    std::vector<std::string> new_invalid;
    std::vector<std::string> resolved_invalid;
    std::vector<std::string> new_corrupted;
    std::vector<std::string> resolved_corrupted;
  };

  UserIPDatabase();

  RebuildReport Rebuild(const UserIPLoadResult& load);

  std::optional<UserIPAssociation> Lookup(const std::string& ip) const;
  bool Contains(const std::string& ip) const;

  // Copy the association onto the record if its IP is listed.
  // Returns false (record untouched) otherwise.
  bool UpdatePlayerAssociation(session::PeerRecord& record) const;

  size_t DatabaseCount() const;
  size_t ConflictCount() const;
  size_t InvalidCount() const;
  size_t CorruptedCount() const;

  std::vector<std::string> DatabaseNames() const;

private:
  struct Index {
    std::vector<std::string> database_names;
    std::unordered_map<std::string, UserIPAssociation> ip_to_association;
    std::map<std::string, UserIPConflict> conflicts;  // by IP
    std::set<std::string> invalid_entries;
    std::set<std::string> corrupted_files;
  };

  static std::shared_ptr<const Index> BuildIndex(const UserIPLoadResult& load);

  mutable std::mutex mutex_;
  std::shared_ptr<const Index> index_;
};

}  // namespace userip
}  // namespace sniffer
