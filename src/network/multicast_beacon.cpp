// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/multicast_beacon.hpp"

#include "network/interfaces.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <stdexcept>

#include <asio/ip/multicast.hpp>
#include <asio/ip/v6_only.hpp>
#include <asio/socket_base.hpp>

namespace lanpeer {
namespace network {

MulticastBeacon::MulticastBeacon(const std::string& address) : UdpBeacon("multicast beacon " + address) {
  std::string ip;
  if (!util::ParseIPPort(address, ip, port_)) {
    throw std::invalid_argument("invalid multicast address: " + address);
  }

  asio::error_code ec;
  auto parsed = asio::ip::make_address(ip, ec);
  if (ec || !parsed.is_v6() || !parsed.is_multicast()) {
    throw std::invalid_argument("not an IPv6 multicast group: " + address);
  }
  group_ = parsed.to_v6();
}

void MulticastBeacon::Open(asio::ip::udp::socket& socket) {
  socket.open(asio::ip::udp::v6());
  socket.set_option(asio::socket_base::reuse_address(true));
  socket.set_option(asio::ip::v6_only(true));
  socket.bind(asio::ip::udp::endpoint(asio::ip::address_v6::any(), port_));

  auto ifaces = MulticastInterfaces();
  size_t joined = 0;
  for (const auto& iface : ifaces) {
    asio::error_code ec;
    socket.set_option(asio::ip::multicast::join_group(group_, iface.index), ec);
    if (ec) {
      LOG_NET_DEBUG("IPv6 join {} on {} failed: {}", group_.to_string(), iface.name, ec.message());
      continue;
    }
    LOG_NET_DEBUG("IPv6 join {} on {} succeeded", group_.to_string(), iface.name);
    ++joined;
  }

  if (joined == 0) {
    throw std::runtime_error("no multicast interfaces available");
  }

  socket.set_option(asio::ip::multicast::hops(1));
  socket.set_option(asio::ip::multicast::enable_loopback(true));
}

asio::error_code MulticastBeacon::Write(asio::ip::udp::socket& socket, const std::vector<uint8_t>& data) {
  auto ifaces = MulticastInterfaces();
  asio::error_code last_error;
  size_t success = 0;

  for (const auto& iface : ifaces) {
    asio::error_code ec;
    socket.set_option(asio::ip::multicast::outbound_interface(iface.index), ec);
    if (!ec) {
      socket.send_to(asio::buffer(data), asio::ip::udp::endpoint(group_, port_), 0, ec);
    }
    if (ec) {
      LOG_NET_TRACE("multicast write to {} on {} failed: {}", group_.to_string(), iface.name, ec.message());
      last_error = ec;
      continue;
    }
    LOG_NET_TRACE("sent {} bytes to {} on {}", data.size(), group_.to_string(), iface.name);
    ++success;
  }

  if (success > 0) {
    return {};
  }
  if (!last_error) {
    last_error = asio::error::make_error_code(asio::error::address_not_available);
  }
  return last_error;
}

}  // namespace network
}  // namespace lanpeer
