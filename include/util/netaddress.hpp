#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings coming from the capture stream,
   UserIP databases and mod-menu logs
 - Classify capture endpoints as private (local device) or public (remote peer)
 - Order IPv4 addresses numerically for session tables

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPv4Address: Strict dotted-quad IPv4 check
 - IsPrivateIPv4: Private/reserved IPv4 classification used to find the remote side
 - CompareIPAddresses: Numeric ordering (10.0.0.2 < 10.0.0.10)
*/

#include <cstdint>
#include <optional>
#include <string>

namespace sniffer {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address():
 * 1. Validates that the string is a valid IP address (IPv4 or IPv6)
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 format (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * @return Normalized IP address string, or std::nullopt if invalid
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// True only for a canonical dotted-quad IPv4 address.
bool IsValidIPv4Address(const std::string& address);

// IPv4 string -> host-order integer, nullopt if not IPv4.
std::optional<uint32_t> ParseIPv4(const std::string& address);

/**
 * Check if an IPv4 address is private/reserved (not a remote internet peer)
 *
 * Covers 0/8, 10/8, 127/8, 169.254/16, 172.16/12, 192.0.0/24, 192.0.2/24,
 * 192.168/16, 198.18/15, 198.51.100/24, 203.0.113/24, 240/4 and broadcast.
 * Non-IPv4 input returns false.
 */
bool IsPrivateIPv4(const std::string& address);

// Byte-based helper shared with IsPrivateIPv4
bool IsIPv4Private(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) noexcept;

/**
 * Three-way numeric comparison of two IP addresses.
 * IPv4 addresses compare by value; anything unparsable sorts after valid
 * addresses and falls back to string order among itself.
 * @return negative, zero or positive
 */
int CompareIPAddresses(const std::string& a, const std::string& b);

}  // namespace util
}  // namespace sniffer
