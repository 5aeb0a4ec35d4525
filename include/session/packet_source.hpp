// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sniffer {
namespace session {

// One captured UDP packet as decoded by the capture tool.
struct DecodedPacket {
  util::Timestamp timestamp{};
  std::string src_ip;
  std::string dst_ip;
  std::optional<uint16_t> src_port;
  std::optional<uint16_t> dst_port;
};

// Blocking packet producer (capture collaborator).
class PacketSource {
public:
  virtual ~PacketSource() = default;

  // Next packet, or nullopt once the source is exhausted or stopped.
  virtual std::optional<DecodedPacket> Next() = 0;

  // Called after a capture overflow. Packets captured before
  // `discard_before` are backlog and are not delivered again. Returns false
  // if the source cannot continue.
  virtual bool Restart(util::Timestamp discard_before) = 0;

  // False for recorded captures, whose timestamps lie in the past.
  virtual bool IsLive() const { return true; }

  virtual void Stop() = 0;
};

// Reads "time_epoch|ip.src|ip.dst|udp.srcport|udp.dstport" lines, the
// capture tool's "-T fields -E separator=|" output. Malformed lines are
// skipped with a rate-limited warning. A stream is live (piped from the
// capture tool); a file is a recorded capture.
class StreamPacketSource : public PacketSource {
public:
  explicit StreamPacketSource(std::istream& input, bool live = true);

  // Opens `path`; IsOpen() reports whether that succeeded.
  explicit StreamPacketSource(const std::string& path);

  bool IsOpen() const;

  std::optional<DecodedPacket> Next() override;
  bool Restart(util::Timestamp discard_before) override;
  void Stop() override;
  bool IsLive() const override { return live_; }

  uint64_t SkippedLines() const { return skipped_lines_.load(); }
  uint64_t DiscardedBacklog() const { return discarded_backlog_.load(); }

  static std::optional<DecodedPacket> ParseLine(const std::string& line);

private:
  std::unique_ptr<std::ifstream> owned_;
  std::istream* input_;
  bool live_;
  std::mutex read_mutex_;
  std::optional<util::Timestamp> discard_before_;
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> skipped_lines_{0};
  std::atomic<uint64_t> discarded_backlog_{0};
};

}  // namespace session
}  // namespace sniffer
