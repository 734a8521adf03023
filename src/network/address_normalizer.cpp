// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/address_normalizer.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/uri.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace lanpeer {
namespace network {

namespace {

std::optional<asio::ip::address> ResolveHost(const std::string& host) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(host, ec);
  if (!ec) {
    return ip;
  }

  try {
    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(host, "", ec);
    if (ec) {
      LOG_NET_TRACE("failed to resolve {}: {}", host, ec.message());
      return std::nullopt;
    }

    std::optional<asio::ip::address> first;
    for (const auto& entry : results) {
      auto addr = entry.endpoint().address();
      if (addr.is_v4()) {
        return addr;
      }
      if (!first) {
        first = addr;
      }
    }
    return first;
  } catch (const std::exception& e) {
    LOG_NET_TRACE("exception resolving {}: {}", host, e.what());
    return std::nullopt;
  }
}

// Source host of an announcement packet as it goes into a URI: v4-mapped
// addresses unwrapped, and the zone delimiter of a scoped IPv6 address
// percent-encoded (RFC 6874).
std::string SourceHost(const asio::ip::udp::endpoint& source) {
  auto ip = source.address();
  if (ip.is_v4()) {
    return ip.to_string();
  }

  auto v6 = ip.to_v6();
  if (v6.is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string();
  }

  std::string host = v6.to_string();
  auto zone = host.find('%');
  if (zone != std::string::npos) {
    host.insert(zone + 1, "25");
  }
  return host;
}

}  // namespace

std::optional<TcpAddress> ResolveTcpAddress(const std::string& hostport) {
  std::string host;
  std::string port_str;
  if (!util::SplitHostPort(hostport, host, port_str)) {
    return std::nullopt;
  }

  TcpAddress addr;
  if (!port_str.empty()) {
    auto port = util::SafeParsePort(port_str);
    if (!port) {
      return std::nullopt;
    }
    addr.port = *port;
  }

  if (!host.empty()) {
    addr.ip = ResolveHost(host);
    if (!addr.ip) {
      return std::nullopt;
    }
  }
  return addr;
}

std::string CanonicalizeAddress(const TcpAddress& addr) {
  if (addr.IsUnspecified()) {
    return ":" + std::to_string(addr.port);
  }
  if (addr.ip->is_v4()) {
    return addr.ip->to_v4().to_string() + ":" + std::to_string(addr.port);
  }
  auto v6 = addr.ip->to_v6();
  if (v6.is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string() + ":" + std::to_string(addr.port);
  }
  return "[" + v6.to_string() + "]:" + std::to_string(addr.port);
}

std::vector<std::string> NormalizeAddresses(const std::vector<std::string>& announced,
                                            const asio::ip::udp::endpoint& source) {
  std::vector<std::string> valid;
  valid.reserve(announced.size());

  for (const auto& addr : announced) {
    auto uri = util::Uri::Parse(addr);
    if (!uri) {
      LOG_NET_TRACE("dropping unparseable address {}", addr);
      continue;
    }

    auto tcp_addr = ResolveTcpAddress(uri->host);
    if (!tcp_addr) {
      LOG_NET_TRACE("dropping unresolvable address {}", addr);
      continue;
    }

    if (tcp_addr->IsUnspecified()) {
      uri->host = util::JoinHostPort(SourceHost(source), tcp_addr->port);
      valid.push_back(uri->ToString());
    } else {
      valid.push_back(addr);
    }
  }

  return valid;
}

std::vector<std::string> ResolveAddresses(const std::vector<std::string>& addrs) {
  std::vector<std::string> resolved;
  resolved.reserve(addrs.size());

  for (const auto& addr : addrs) {
    auto uri = util::Uri::Parse(addr);
    if (!uri) {
      continue;
    }
    auto tcp_addr = ResolveTcpAddress(uri->host);
    if (!tcp_addr) {
      continue;
    }
    std::string canonical = CanonicalizeAddress(*tcp_addr);
    if (!canonical.empty()) {
      uri->host = canonical;
      resolved.push_back(uri->ToString());
    }
  }

  return resolved;
}

}  // namespace network
}  // namespace lanpeer
