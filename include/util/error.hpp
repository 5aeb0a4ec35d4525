// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace sniffer {
namespace util {

// An invariant the rest of the engine depends on has been broken
// (impossible packet classification, malformed lookup payload, ...).
// Never caught below the worker supervisor: it ends the session.
class ContractViolation : public std::logic_error {
public:
  explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

// Insert of a key that already exists in a unique registry.
class DuplicateKeyError : public ContractViolation {
public:
  explicit DuplicateKeyError(const std::string& what) : ContractViolation(what) {}
};

}  // namespace util
}  // namespace sniffer
