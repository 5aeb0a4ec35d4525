// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "lookup/ip_lookup_sets.hpp"

#include "util/error.hpp"

#include <algorithm>

namespace sniffer {
namespace lookup {

const char* MembershipName(LookupMembership membership) {
  switch (membership) {
  case LookupMembership::Pending:
    return "pending";
  case LookupMembership::Resolved:
    return "resolved";
  case LookupMembership::Absent:
    return "absent";
  }
  return "unknown";
}

void IPLookupSets::AddPending(const std::string& ip) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  if (!pending_.insert(ip).second) {
    throw util::ContractViolation("IP address '" + ip + "' is already in the pending lookup set");
  }
  pending_order_.push_back(ip);
}

bool IPLookupSets::IsPending(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.count(ip) > 0;
}

bool IPLookupSets::IsResolved(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return results_.count(ip) > 0;
}

std::vector<std::string> IPLookupSets::PendingSlice(size_t start, size_t count) const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  if (start >= pending_order_.size()) {
    return {};
  }
  size_t end = std::min(pending_order_.size(), start + count);
  return std::vector<std::string>(pending_order_.begin() + static_cast<std::ptrdiff_t>(start),
                                  pending_order_.begin() + static_cast<std::ptrdiff_t>(end));
}

size_t IPLookupSets::PendingCount() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

void IPLookupSets::Resolve(const RemoteGeoResult& result) {
  std::lock_guard<std::mutex> transition(transition_mutex_);
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_.erase(result.ip) > 0) {
      pending_order_.erase(std::remove(pending_order_.begin(), pending_order_.end(), result.ip),
                           pending_order_.end());
    }
  }
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results_[result.ip] = result;
  }
}

std::optional<RemoteGeoResult> IPLookupSets::GetResult(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  auto it = results_.find(ip);
  if (it == results_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t IPLookupSets::ResolvedCount() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return results_.size();
}

LookupMembership IPLookupSets::Query(const std::string& ip) const {
  std::lock_guard<std::mutex> transition(transition_mutex_);
  if (IsPending(ip)) {
    return LookupMembership::Pending;
  }
  if (IsResolved(ip)) {
    return LookupMembership::Resolved;
  }
  return LookupMembership::Absent;
}

}  // namespace lookup
}  // namespace sniffer
