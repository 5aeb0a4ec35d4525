// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/peer_registry.hpp"

#include "util/error.hpp"
#include "util/logging.hpp"

namespace sniffer {
namespace session {

PeerRecordPtr PeerRegistry::Get(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_ip_.find(ip);
  if (it == by_ip_.end()) {
    return nullptr;
  }
  return it->second;
}

PeerRecordPtr PeerRegistry::AddNew(const std::string& ip, uint16_t port, util::Timestamp time) {
  auto record = std::make_shared<PeerRecord>(ip, port, time);

  size_t known = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!by_ip_.emplace(ip, record).second) {
      throw util::DuplicateKeyError("Peer with IP \"" + ip + "\" already exists");
    }
    order_.push_back(record);
    known = order_.size();
  }

  LOG_SESSION_DEBUG("Registered peer {} (port {}), {} known", ip, port, known);
  return record;
}

std::vector<PeerRecordPtr> PeerRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

size_t PeerRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_.size();
}

}  // namespace session
}  // namespace sniffer
