// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/broadcast_beacon.hpp"

#include "network/interfaces.hpp"
#include "util/logging.hpp"

#include <asio/socket_base.hpp>

namespace lanpeer {
namespace network {

BroadcastBeacon::BroadcastBeacon(uint16_t port)
    : UdpBeacon("broadcast beacon :" + std::to_string(port)), port_(port) {}

void BroadcastBeacon::Open(asio::ip::udp::socket& socket) {
  socket.open(asio::ip::udp::v4());
  socket.set_option(asio::socket_base::reuse_address(true));
  socket.set_option(asio::socket_base::broadcast(true));
  socket.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port_));
}

asio::error_code BroadcastBeacon::Write(asio::ip::udp::socket& socket, const std::vector<uint8_t>& data) {
  auto dsts = BroadcastAddresses();
  if (dsts.empty()) {
    dsts.push_back(asio::ip::address_v4::broadcast());
  }

  asio::error_code last_error;
  for (const auto& dst : dsts) {
    asio::error_code ec;
    socket.send_to(asio::buffer(data), asio::ip::udp::endpoint(dst, port_), 0, ec);
    if (ec) {
      LOG_NET_TRACE("broadcast to {} failed: {}", dst.to_string(), ec.message());
      last_error = ec;
      continue;
    }
    LOG_NET_TRACE("sent {} bytes to {}:{}", data.size(), dst.to_string(), port_);
  }
  return last_error;
}

}  // namespace network
}  // namespace lanpeer
