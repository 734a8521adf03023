// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

#include <asio/ip/address_v4.hpp>

namespace lanpeer {
namespace network {

struct MulticastInterface {
  std::string name;
  unsigned int index{0};
};

// Directed broadcast addresses of all interfaces that are up and
// broadcast-capable. Empty if none are found or enumeration fails.
std::vector<asio::ip::address_v4> BroadcastAddresses();

// Interfaces that are up, multicast-capable and carry an IPv6 address
std::vector<MulticastInterface> MulticastInterfaces();

}  // namespace network
}  // namespace lanpeer
