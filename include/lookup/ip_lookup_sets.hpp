// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 IPLookupSets - pending / resolved bookkeeping for remote geolocation

 Purpose:
 - Track IPs queued for the batch service (insertion-ordered, no duplicates)
 - Store the resolved result per IP
 - Move an IP from pending to resolved so that no observer ever sees it in
   both sets, or in neither, during the move

 Locking:
 - pending_mutex_ and results_mutex_ protect their own container
 - transition_mutex_ is held across the whole pending -> resolved move and by
   Query(), which therefore always sees a consistent membership
*/

#include "lookup/geo_types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sniffer {
namespace lookup {

enum class LookupMembership { Pending, Resolved, Absent };

const char* MembershipName(LookupMembership membership);

class IPLookupSets {
public:
  // Queue an IP. Throws util::ContractViolation if it is already pending.
  void AddPending(const std::string& ip);

  bool IsPending(const std::string& ip) const;
  bool IsResolved(const std::string& ip) const;

  // Oldest-first window of the pending queue.
  std::vector<std::string> PendingSlice(size_t start, size_t count) const;
  size_t PendingCount() const;

  // Atomically drop result.ip from pending and store the result.
  void Resolve(const RemoteGeoResult& result);

  std::optional<RemoteGeoResult> GetResult(const std::string& ip) const;
  size_t ResolvedCount() const;

  LookupMembership Query(const std::string& ip) const;

private:
  mutable std::mutex transition_mutex_;

  mutable std::mutex pending_mutex_;
  std::vector<std::string> pending_order_;
  std::unordered_set<std::string> pending_;

  mutable std::mutex results_mutex_;
  std::unordered_map<std::string, RemoteGeoResult> results_;
};

}  // namespace lookup
}  // namespace sniffer
