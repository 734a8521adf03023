// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 Beacon - broadcast/multicast datagram channel used by local discovery

 A beacon is a supervised service: Serve() owns the socket and runs until
 Stop() or a socket failure, after which the supervisor restarts it. The send
 and receive queues live in the beacon object, not in Serve(), so callers of
 Send()/Recv() are unaffected by restarts.
*/

#include "util/supervisor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/udp.hpp>

namespace lanpeer {
namespace network {

struct BeaconPacket {
  std::vector<uint8_t> data;
  asio::ip::udp::endpoint source;
};

class Beacon : public util::Service {
public:
  // Queue data for transmission to every peer on the segment
  virtual void Send(const std::vector<uint8_t>& data) = 0;

  // Block until a datagram arrives. Returns nullopt once Close() was called.
  virtual std::optional<BeaconPacket> Recv() = 0;

  // Last transport error, cleared by the next successful send
  virtual std::optional<std::string> Error() const = 0;

  // Permanently unblock Recv() and refuse further sends
  virtual void Close() = 0;
};

}  // namespace network
}  // namespace lanpeer
