// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "userip/userip_database.hpp"

#include "session/peer_record.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace sniffer {
namespace userip {

namespace {

template <typename T>
std::vector<std::string> KeysMissingFrom(const std::set<std::string>& keys, const T& other) {
  std::vector<std::string> out;
  for (const auto& key : keys) {
    if (other.find(key) == other.end()) {
      out.push_back(key);
    }
  }
  return out;
}

}  // namespace

UserIPDatabase::UserIPDatabase() : index_(std::make_shared<const Index>()) {}

std::shared_ptr<const UserIPDatabase::Index> UserIPDatabase::BuildIndex(const UserIPLoadResult& load) {
  auto index = std::make_shared<Index>();
  index->invalid_entries = load.invalid_entries;
  index->corrupted_files = load.corrupted_files;

  // Username that introduced each IP into its owning database
  std::unordered_map<std::string, std::string> first_username;

  for (const auto& database : load.databases) {
    if (!database.settings.enabled) {
      continue;
    }
    index->database_names.push_back(database.name);

    for (const auto& [username, ips] : database.users) {
      for (const auto& ip : ips) {
        auto it = index->ip_to_association.find(ip);
        if (it == index->ip_to_association.end()) {
          index->ip_to_association.emplace(ip, UserIPAssociation{database.name, database.settings, {username}});
          first_username.emplace(ip, username);
          continue;
        }

        UserIPAssociation& existing = it->second;
        if (existing.database_name == database.name) {
          if (std::find(existing.usernames.begin(), existing.usernames.end(), username) == existing.usernames.end()) {
            existing.usernames.push_back(username);
          }
          continue;
        }

        // Keep the first conflict per IP
        index->conflicts.emplace(
            ip, UserIPConflict{ip, existing.database_name, first_username[ip], database.name, username});
      }
    }
  }

  return index;
}

UserIPDatabase::RebuildReport UserIPDatabase::Rebuild(const UserIPLoadResult& load) {
  std::shared_ptr<const Index> next = BuildIndex(load);

  std::shared_ptr<const Index> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = index_;
    index_ = next;
  }

  RebuildReport report;

  for (const auto& [ip, conflict] : next->conflicts) {
    if (previous->conflicts.find(ip) == previous->conflicts.end()) {
      report.new_conflicts.push_back(conflict);
    }
  }
  for (const auto& [ip, conflict] : previous->conflicts) {
    if (next->conflicts.find(ip) == next->conflicts.end()) {
      report.resolved_conflicts.push_back(ip);
    }
  }

  report.new_invalid = KeysMissingFrom(next->invalid_entries, previous->invalid_entries);
  report.resolved_invalid = KeysMissingFrom(previous->invalid_entries, next->invalid_entries);
  report.new_corrupted = KeysMissingFrom(next->corrupted_files, previous->corrupted_files);
  report.resolved_corrupted = KeysMissingFrom(previous->corrupted_files, next->corrupted_files);

  for (const auto& c : report.new_conflicts) {
    LOG_USERIP_WARN("IP {} is listed in both \"{}\" (user {}) and \"{}\" (user {}); keeping \"{}\"", c.ip,
                    c.kept_database, c.kept_username, c.conflicting_database, c.conflicting_username,
                    c.kept_database);
  }
  for (const auto& ip : report.resolved_conflicts) {
    LOG_USERIP_INFO("Conflict for IP {} resolved", ip);
  }
  for (const auto& entry : report.new_invalid) {
    LOG_USERIP_WARN("Ignoring invalid UserIP entry {}", entry);
  }
  for (const auto& entry : report.resolved_invalid) {
    LOG_USERIP_INFO("UserIP entry {} is no longer invalid", entry);
  }
  for (const auto& file : report.new_corrupted) {
    LOG_USERIP_WARN("Ignoring UserIP database {}: missing or invalid settings", file);
  }
  for (const auto& file : report.resolved_corrupted) {
    LOG_USERIP_INFO("UserIP database {} settings fixed", file);
  }

  return report;
}

std::optional<UserIPAssociation> UserIPDatabase::Lookup(const std::string& ip) const {
  std::shared_ptr<const Index> index;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    index = index_;
  }
  auto it = index->ip_to_association.find(ip);
  if (it == index->ip_to_association.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool UserIPDatabase::Contains(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->ip_to_association.count(ip) > 0;
}

bool UserIPDatabase::UpdatePlayerAssociation(session::PeerRecord& record) const {
  auto association = Lookup(record.ip());
  if (!association) {
    return false;
  }
  record.SetUserIPAssociation(*association);
  return true;
}

size_t UserIPDatabase::DatabaseCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->database_names.size();
}

size_t UserIPDatabase::ConflictCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->conflicts.size();
}

size_t UserIPDatabase::InvalidCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->invalid_entries.size();
}

size_t UserIPDatabase::CorruptedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->corrupted_files.size();
}

std::vector<std::string> UserIPDatabase::DatabaseNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_->database_names;
}

}  // namespace userip
}  // namespace sniffer
