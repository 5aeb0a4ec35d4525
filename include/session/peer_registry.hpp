// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/peer_record.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sniffer {
namespace session {

using PeerRecordPtr = std::shared_ptr<PeerRecord>;

// PeerRegistry - one PeerRecord per remote IP, in first-seen order.
// Records are never removed. Snapshot() copies the record pointers under the
// lock so callers can iterate while ingestion keeps adding peers.
class PeerRegistry {
public:
  // nullptr if the IP has never been seen
  PeerRecordPtr Get(const std::string& ip) const;

  // Throws util::DuplicateKeyError if the IP is already registered.
  PeerRecordPtr AddNew(const std::string& ip, uint16_t port, util::Timestamp time);

  std::vector<PeerRecordPtr> Snapshot() const;

  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, PeerRecordPtr> by_ip_;
  std::vector<PeerRecordPtr> order_;
};

}  // namespace session
}  // namespace sniffer
