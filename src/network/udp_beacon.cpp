// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/udp_beacon.hpp"

#include "util/logging.hpp"

#include <functional>
#include <stdexcept>

#include <asio/post.hpp>

namespace lanpeer {
namespace network {

UdpBeacon::UdpBeacon(std::string name) : name_(std::move(name)) {}

void UdpBeacon::Send(const std::vector<uint8_t>& data) {
  if (!inbox_.TryPush(data)) {
    LOG_NET_DEBUG_RL("{}: send queue full, dropping {} byte packet", name_, data.size());
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (io_ && socket_) {
    // Flush on the io thread; the socket is never touched from here
    asio::post(*io_, [this, socket = socket_]() { Flush(*socket); });
  }
}

std::optional<BeaconPacket> UdpBeacon::Recv() {
  return outbox_.Pop();
}

std::optional<std::string> UdpBeacon::Error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void UdpBeacon::Close() {
  inbox_.Close();
  outbox_.Close();
}

void UdpBeacon::SetError(const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = error;
}

void UdpBeacon::ClearError() {
  std::lock_guard<std::mutex> lock(mutex_);
  error_.reset();
}

void UdpBeacon::Serve() {
  asio::io_context io;
  asio::ip::udp::socket socket(io);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
  }

  try {
    Open(socket);
  } catch (const std::exception& e) {
    SetError(e.what());
    throw std::runtime_error(name_ + ": " + e.what());
  }

  asio::error_code ep_ec;
  auto local = socket.local_endpoint(ep_ec);
  if (!ep_ec) {
    LOG_NET_DEBUG("{}: listening on port {}", name_, local.port());
  }

  std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
  asio::ip::udp::endpoint sender;
  std::optional<std::string> failure;

  std::function<void()> receive = [&]() {
    socket.async_receive_from(asio::buffer(buffer), sender, [&](const asio::error_code& ec, size_t bytes) {
      if (ec) {
        if (ec != asio::error::operation_aborted) {
          failure = ec.message();
        }
        io.stop();
        return;
      }

      BeaconPacket packet;
      packet.data.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(bytes));
      packet.source = sender;
      LOG_NET_TRACE("{}: received {} bytes from {}", name_, bytes, sender.address().to_string());
      if (!outbox_.TryPush(std::move(packet))) {
        LOG_NET_DEBUG_RL("{}: receive queue full, dropping packet", name_);
      }
      receive();
    });
  };
  receive();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    io_ = &io;
    socket_ = &socket;
  }

  // Anything queued while the socket was down goes out first
  asio::post(io, [this, &socket]() { Flush(socket); });
  io.run();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    io_ = nullptr;
    socket_ = nullptr;
  }

  asio::error_code ignored;
  socket.close(ignored);

  if (failure) {
    SetError(*failure);
    throw std::runtime_error(name_ + ": receive failed: " + *failure);
  }
}

void UdpBeacon::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopping_ = true;
  if (io_) {
    io_->stop();
  }
}

void UdpBeacon::Flush(asio::ip::udp::socket& socket) {
  while (auto data = inbox_.TryPop()) {
    asio::error_code ec = Write(socket, *data);
    if (ec) {
      LOG_NET_DEBUG_RL("{}: write failed: {}", name_, ec.message());
      SetError(ec.message());
    } else {
      LOG_NET_TRACE("{}: sent {} bytes", name_, data->size());
      ClearError();
    }
  }
}

}  // namespace network
}  // namespace lanpeer
