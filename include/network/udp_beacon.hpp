// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/beacon.hpp"
#include "util/blocking_queue.hpp"

#include <mutex>

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>

namespace lanpeer {
namespace network {

// UdpBeacon - asio UDP implementation shared by the broadcast and multicast beacons
//
// Each Serve() call creates its own io_context and socket and runs the
// io_context on the calling (supervisor) thread. Sends are queued and flushed
// on that io_context, so the socket is only ever touched from one thread.
class UdpBeacon : public Beacon {
public:
  ~UdpBeacon() override = default;

  UdpBeacon(const UdpBeacon&) = delete;
  UdpBeacon& operator=(const UdpBeacon&) = delete;

  // Beacon interface
  void Send(const std::vector<uint8_t>& data) override;
  std::optional<BeaconPacket> Recv() override;
  std::optional<std::string> Error() const override;
  void Close() override;

  // Service interface
  void Serve() override;
  void Stop() override;
  std::string String() const override { return name_; }

  static constexpr size_t QUEUE_CAPACITY = 16;
  static constexpr size_t MAX_DATAGRAM_SIZE = 65536;

protected:
  explicit UdpBeacon(std::string name);

  // Open and bind the socket. Throws asio::system_error or std::runtime_error.
  virtual void Open(asio::ip::udp::socket& socket) = 0;

  // Transmit one payload to all destinations. Returns the last error, if any.
  virtual asio::error_code Write(asio::ip::udp::socket& socket, const std::vector<uint8_t>& data) = 0;

  void SetError(const std::string& error);
  void ClearError();

private:
  void Flush(asio::ip::udp::socket& socket);

  const std::string name_;

  util::BlockingQueue<std::vector<uint8_t>> inbox_{QUEUE_CAPACITY};
  util::BlockingQueue<BeaconPacket> outbox_{QUEUE_CAPACITY};

  // Guards io_, socket_, error_ and stopping_
  mutable std::mutex mutex_;
  asio::io_context* io_{nullptr};
  asio::ip::udp::socket* socket_{nullptr};
  std::optional<std::string> error_;
  bool stopping_{false};
};

}  // namespace network
}  // namespace lanpeer
