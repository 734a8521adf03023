// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 Address normalization for announced and advertised addresses

 Peers announce URIs such as "tcp://0.0.0.0:22000" when they listen on all
 interfaces. The receiving side cannot dial an unspecified host, so such
 addresses are rewritten to use the source IP of the announcement packet while
 keeping the announced port. Addresses that already name a specific host are
 kept verbatim.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace lanpeer {
namespace network {

// Result of resolving a "host:port" authority. ip is empty when the host was
// empty (":22000").
struct TcpAddress {
  std::optional<asio::ip::address> ip;
  uint16_t port{0};

  // True for an empty host or 0.0.0.0 / ::
  bool IsUnspecified() const { return !ip || ip->is_unspecified(); }
};

// Resolve "host:port" to a TCP address. IP literals are parsed directly,
// hostnames go through the system resolver (IPv4 results preferred).
// Returns nullopt if the authority cannot be split, the port is not numeric,
// or the host does not resolve.
std::optional<TcpAddress> ResolveTcpAddress(const std::string& hostport);

// Render a TCP address as "a.b.c.d:port", "[v6]:port" or ":port" (unspecified
// host). IPv4-mapped IPv6 addresses are rendered as IPv4.
std::string CanonicalizeAddress(const TcpAddress& addr);

// Rewrite announced addresses against the source of the announcement packet.
// Addresses that fail to parse or resolve are dropped; the rest are kept in
// order.
std::vector<std::string> NormalizeAddresses(const std::vector<std::string>& announced,
                                            const asio::ip::udp::endpoint& source);

// Parse and resolve each address, replacing its host with the canonical form.
// Used to present this node's own listen addresses.
std::vector<std::string> ResolveAddresses(const std::vector<std::string>& addrs);

}  // namespace network
}  // namespace lanpeer
