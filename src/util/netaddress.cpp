#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <asio/ip/address.hpp>

namespace sniffer {
namespace util {

// ============================================================================
// Byte-based helpers
// ============================================================================

bool IsIPv4Private(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) noexcept {
  // 0.0.0.0/8 - "This network" (RFC 1122)
  if (b0 == 0)
    return true;

  // 10.0.0.0/8 - Private (RFC 1918)
  if (b0 == 10)
    return true;

  // 127.0.0.0/8 - Loopback (RFC 1122)
  if (b0 == 127)
    return true;

  // 169.254.0.0/16 - Link-local (RFC 3927)
  if (b0 == 169 && b1 == 254)
    return true;

  // 172.16.0.0/12 - Private (RFC 1918)
  if (b0 == 172 && (b1 >= 16 && b1 <= 31))
    return true;

  // 192.0.0.0/24 - IETF Protocol Assignments (RFC 6890)
  if (b0 == 192 && b1 == 0 && b2 == 0)
    return true;

  // 192.0.2.0/24 - Documentation TEST-NET-1 (RFC 5737)
  if (b0 == 192 && b1 == 0 && b2 == 2)
    return true;

  // 192.168.0.0/16 - Private (RFC 1918)
  if (b0 == 192 && b1 == 168)
    return true;

  // 198.18.0.0/15 - Benchmarking (RFC 2544)
  if (b0 == 198 && (b1 == 18 || b1 == 19))
    return true;

  // 198.51.100.0/24 - Documentation TEST-NET-2 (RFC 5737)
  if (b0 == 198 && b1 == 51 && b2 == 100)
    return true;

  // 203.0.113.0/24 - Documentation TEST-NET-3 (RFC 5737)
  if (b0 == 203 && b1 == 0 && b2 == 113)
    return true;

  // 240.0.0.0/4 - Reserved, includes 255.255.255.255 broadcast
  if (b0 >= 240)
    return true;

  (void)b3;
  return false;
}

// ============================================================================
// String-based functions (parse then delegate to byte helpers)
// ============================================================================

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // Normalize IPv4-mapped IPv6 addresses to IPv4 format
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()).to_string();
  }

  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<uint32_t> ParseIPv4(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address_v4(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // inet_pton accepts only dotted-quad; reject anything that does not round-trip
  if (ip.to_string() != address) {
    return std::nullopt;
  }
  return ip.to_uint();
}

bool IsValidIPv4Address(const std::string& address) {
  return ParseIPv4(address).has_value();
}

bool IsPrivateIPv4(const std::string& address) {
  auto value = ParseIPv4(address);
  if (!value) {
    LOG_TRACE("IsPrivateIPv4: not an IPv4 address '{}'", address);
    return false;
  }
  uint32_t v = *value;
  return IsIPv4Private(static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8),
                       static_cast<uint8_t>(v));
}

int CompareIPAddresses(const std::string& a, const std::string& b) {
  auto va = ParseIPv4(a);
  auto vb = ParseIPv4(b);

  if (va && vb) {
    if (*va == *vb)
      return 0;
    return *va < *vb ? -1 : 1;
  }
  if (va)
    return -1;
  if (vb)
    return 1;
  return a.compare(b);
}

}  // namespace util
}  // namespace sniffer
