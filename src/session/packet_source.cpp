// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/packet_source.hpp"

#include "util/logging.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace sniffer {
namespace session {

namespace {

constexpr size_t kFieldCount = 5;

std::vector<std::string> SplitFields(const std::string& line) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t pos = line.find('|', start);
    if (pos == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

// Empty field: the packet carried no such port. Anything else must parse.
bool ParsePort(const std::string& field, std::optional<uint16_t>& out) {
  if (field.empty()) {
    out.reset();
    return true;
  }
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec != std::errc() || ptr != field.data() + field.size() || value > 65535) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

StreamPacketSource::StreamPacketSource(std::istream& input, bool live) : input_(&input), live_(live) {}

StreamPacketSource::StreamPacketSource(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path)), input_(owned_.get()), live_(false) {}

bool StreamPacketSource::IsOpen() const {
  return owned_ ? owned_->is_open() : static_cast<bool>(*input_);
}

std::optional<DecodedPacket> StreamPacketSource::ParseLine(const std::string& raw) {
  std::string line = raw;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  auto fields = SplitFields(line);
  if (fields.size() != kFieldCount) {
    return std::nullopt;
  }

  DecodedPacket packet;

  double epoch = 0.0;
  try {
    size_t used = 0;
    epoch = std::stod(fields[0], &used);
    if (used != fields[0].size() || !std::isfinite(epoch) || epoch < 0.0) {
      return std::nullopt;
    }
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
  packet.timestamp = util::FromEpochSeconds(epoch);

  packet.src_ip = fields[1];
  packet.dst_ip = fields[2];
  if (packet.src_ip.empty() || packet.dst_ip.empty()) {
    return std::nullopt;
  }

  if (!ParsePort(fields[3], packet.src_port) || !ParsePort(fields[4], packet.dst_port)) {
    return std::nullopt;
  }

  return packet;
}

std::optional<DecodedPacket> StreamPacketSource::Next() {
  std::lock_guard<std::mutex> lock(read_mutex_);

  std::string line;
  while (!stopped_.load() && std::getline(*input_, line)) {
    if (line.empty()) {
      continue;
    }
    auto packet = ParseLine(line);
    if (!packet) {
      skipped_lines_++;
      LOG_CAPTURE_WARN_RL("Skipping malformed capture line: {}", line);
      continue;
    }
    if (discard_before_) {
      if (packet->timestamp < *discard_before_) {
        discarded_backlog_++;
        continue;
      }
      // Caught up with the capture
      discard_before_.reset();
    }
    return packet;
  }
  return std::nullopt;
}

bool StreamPacketSource::Restart(util::Timestamp discard_before) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (stopped_.load() || !*input_) {
    return false;
  }
  // A stream cannot be re-spawned; skip the queued backlog instead
  discard_before_ = discard_before;
  LOG_CAPTURE_INFO("Capture restart: skipping packets captured before {}", util::FormatClockTime(discard_before));
  return true;
}

void StreamPacketSource::Stop() {
  stopped_ = true;
}

}  // namespace session
}  // namespace sniffer
