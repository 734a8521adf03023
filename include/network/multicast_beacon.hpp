// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/udp_beacon.hpp"

#include <cstdint>
#include <string>

#include <asio/ip/address_v6.hpp>

namespace lanpeer {
namespace network {

// IPv6 beacon: joins the multicast group on every multicast-capable interface
// and sends one copy of each packet out of each of them with a hop limit of 1.
class MulticastBeacon : public UdpBeacon {
public:
  // address is "[group]:port", e.g. "[ff12::8384]:21027".
  // Throws std::invalid_argument if it is not an IPv6 multicast group.
  explicit MulticastBeacon(const std::string& address);

  const asio::ip::address_v6& group() const { return group_; }
  uint16_t port() const { return port_; }

protected:
  void Open(asio::ip::udp::socket& socket) override;
  asio::error_code Write(asio::ip::udp::socket& socket, const std::vector<uint8_t>& data) override;

private:
  asio::ip::address_v6 group_;
  uint16_t port_{0};
};

}  // namespace network
}  // namespace lanpeer
