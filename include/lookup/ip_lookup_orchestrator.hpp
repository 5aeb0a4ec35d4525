// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 IPLookupOrchestrator - batched, rate-limited remote geolocation

 Purpose:
 - Collect peers whose remote geo slot is still empty (connected first)
 - Send at most one batch of up to 100 IPs per cycle
 - Publish results into IPLookupSets and the owning PeerRecord
 - Pace requests using the service's X-Rl / X-Ttl hints

 Error taxonomy:
 - Transport failure (resolve/connect/timeout): retry next cycle, pending untouched
 - Non-200 status: back off and retry
 - Malformed 200 payload: util::ContractViolation (fatal)
*/

#include "lookup/geo_batch_client.hpp"
#include "lookup/ip_lookup_sets.hpp"
#include "session/peer_registry.hpp"
#include "util/stop_signal.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sniffer {
namespace lookup {

class IPLookupOrchestrator {
public:
  static constexpr size_t MAX_BATCH_SIZE = 100;
  // Documented ip-api.com window, used when the response carries no hints
  static constexpr std::chrono::seconds DEFAULT_THROTTLE_WINDOW{60};
  static constexpr std::chrono::milliseconds DEFAULT_IDLE_DELAY{1000};

  struct Config {
    std::chrono::milliseconds idle_delay;
    std::chrono::milliseconds transport_retry_delay;
    std::chrono::seconds default_window;

    Config()
        : idle_delay(DEFAULT_IDLE_DELAY),
          transport_retry_delay(DEFAULT_IDLE_DELAY),
          default_window(DEFAULT_THROTTLE_WINDOW) {}
  };

  enum class CycleOutcome {
    Idle,            // nothing to look up
    TransportError,  // no HTTP response
    Throttled,       // non-200 status
    Resolved,        // 200 with results applied
  };

  struct CycleResult {
    CycleOutcome outcome{CycleOutcome::Idle};
    size_t batch_size{0};
    size_t resolved{0};
    std::chrono::milliseconds sleep{0};
  };

  IPLookupOrchestrator(session::PeerRegistry& registry, IPLookupSets& sets, GeoBatchClient& client,
                       Config config = Config{});

  // Next batch: connected peers, then disconnected, then backfill from the
  // pending queue. No duplicates, at most MAX_BATCH_SIZE. IPs not yet pending
  // are queued.
  std::vector<std::string> BuildBatch();

  // One request/response cycle. Does not sleep; returns the delay to apply.
  CycleResult RunCycle();

  // Loop RunCycle() until stop is requested.
  void Run(const util::StopSignal& stop);

  // Strict decode of a 200 body. Throws util::ContractViolation on any
  // unexpected shape or field type.
  static std::vector<RemoteGeoResult> ParseBatchResponse(const std::string& body);

  // Full window if remaining <= 1, otherwise window / remaining.
  static std::chrono::milliseconds ComputeBackoff(std::optional<int> remaining, std::optional<int> window_seconds,
                                                  std::chrono::seconds fallback_window);

private:
  void ApplyResult(const RemoteGeoResult& result);

  session::PeerRegistry& registry_;
  IPLookupSets& sets_;
  GeoBatchClient& client_;
  Config config_;
};

}  // namespace lookup
}  // namespace sniffer
