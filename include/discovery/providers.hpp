// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanpeer {
namespace discovery {

// Source of the addresses this node advertises
class AddressLister {
public:
  virtual ~AddressLister() = default;
  virtual std::vector<std::string> AllAddresses() = 0;
};

// Source of the relay endpoints this node is reachable through
class RelayStatusProvider {
public:
  virtual ~RelayStatusProvider() = default;
  virtual std::vector<std::string> Relays() = 0;

  // Measured latency to the relay, nullopt when not (yet) known
  virtual std::optional<std::chrono::nanoseconds> RelayStatus(const std::string& url) = 0;
};

// Advertises a fixed list of listen addresses, resolved to canonical form
class StaticAddressLister : public AddressLister {
public:
  explicit StaticAddressLister(std::vector<std::string> addresses);

  std::vector<std::string> AllAddresses() override;

private:
  const std::vector<std::string> addresses_;
};

struct StaticRelay {
  std::string url;
  std::optional<std::chrono::milliseconds> latency;
};

// Relay list from configuration. Latencies can be updated at runtime.
class StaticRelayStatus : public RelayStatusProvider {
public:
  explicit StaticRelayStatus(std::vector<StaticRelay> relays);

  std::vector<std::string> Relays() override;
  std::optional<std::chrono::nanoseconds> RelayStatus(const std::string& url) override;

  // Returns false if url is not a configured relay
  bool SetLatency(const std::string& url, std::optional<std::chrono::milliseconds> latency);

private:
  mutable std::mutex mutex_;
  std::vector<StaticRelay> relays_;
};

}  // namespace discovery
}  // namespace lanpeer
