// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <asio/ip/address.hpp>

namespace lanpeer {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool SplitHostPort(const std::string& hostport, std::string& out_host, std::string& out_port) {
  size_t last_colon = hostport.rfind(':');
  if (last_colon == std::string::npos) {
    return false;  // Missing port
  }

  std::string host;
  if (!hostport.empty() && hostport[0] == '[') {
    size_t bracket_end = hostport.find(']');
    if (bracket_end == std::string::npos) {
      return false;  // Missing closing bracket
    }
    // The port separator must follow the closing bracket directly
    if (bracket_end + 1 != last_colon) {
      return false;
    }
    host = hostport.substr(1, bracket_end - 1);
  } else {
    host = hostport.substr(0, last_colon);
    if (host.find(':') != std::string::npos) {
      return false;  // Unbracketed IPv6
    }
  }

  if (host.find_first_of("[]") != std::string::npos) {
    return false;
  }

  std::string port = hostport.substr(last_colon + 1);
  if (port.find_first_of("[]") != std::string::npos) {
    return false;
  }

  out_host = std::move(host);
  out_port = std::move(port);
  return true;
}

std::string JoinHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;
  if (!SplitHostPort(address_port, host, port_str)) {
    return false;
  }

  // An IPv6 address must be bracketed; SplitHostPort already rejects bare ones
  if (host.find(':') != std::string::npos && address_port[0] != '[') {
    return false;
  }

  auto port_opt = SafeParsePort(port_str);
  if (!port_opt) {
    return false;
  }

  auto normalized = ValidateAndNormalizeIP(host);
  if (!normalized.has_value()) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port_opt;
  return true;
}

}  // namespace util
}  // namespace lanpeer
