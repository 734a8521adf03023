// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/udp_beacon.hpp"

#include <cstdint>

namespace lanpeer {
namespace network {

// IPv4 beacon: listens on 0.0.0.0:port and sends to the directed broadcast
// address of every broadcast-capable interface, or to 255.255.255.255 when
// none are found.
class BroadcastBeacon : public UdpBeacon {
public:
  explicit BroadcastBeacon(uint16_t port);

  uint16_t port() const { return port_; }

protected:
  void Open(asio::ip::udp::socket& socket) override;
  asio::error_code Write(asio::ip::udp::socket& socket, const std::vector<uint8_t>& data) override;

private:
  const uint16_t port_;
};

}  // namespace network
}  // namespace lanpeer
