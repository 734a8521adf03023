// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split and join "host:port" strings, including bracketed IPv6 hosts
 - Centralized address handling shared by the beacons, the address normalizer
   and configuration parsing

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - SplitHostPort / JoinHostPort: authority handling with empty-host support
 - ParseIPPort: strict numeric "IP:port" / "[IPv6]:port" parsing
*/

#include <cstdint>
#include <optional>
#include <string>

namespace lanpeer {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address() and additionally:
 * 1. Rejects empty strings and hostnames (only numeric IPs accepted)
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * Announcements received on a dual-stack socket carry v4-mapped source
 * addresses; without normalization the same peer would be registered under
 * two different host spellings.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Split "host:port", "[host]:port" or ":port" into host and port strings
 *
 * The host may be empty (":21027") and is returned without brackets. The port
 * is returned unparsed. Fails on a missing port, unbalanced brackets, or an
 * unbracketed host containing colons.
 */
bool SplitHostPort(const std::string& hostport, std::string& out_host, std::string& out_port);

/**
 * Join host and port, bracketing hosts that contain a colon (IPv6)
 *
 *   ("192.0.2.5", 22000) -> "192.0.2.5:22000"
 *   ("fe80::1", 22000)   -> "[fe80::1]:22000"
 *   ("", 22000)          -> ":22000"
 */
std::string JoinHostPort(const std::string& host, uint16_t port);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * Supports both IPv4 and IPv6 formats:
 * - IPv4: "192.168.1.1:21027"
 * - IPv6: "[ff12::8384]:21027"
 *
 * The IP must be a numeric address; it is returned normalized.
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

}  // namespace util
}  // namespace lanpeer
