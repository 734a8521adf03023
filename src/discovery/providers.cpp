// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "discovery/providers.hpp"

#include "network/address_normalizer.hpp"
#include "util/logging.hpp"

namespace lanpeer {
namespace discovery {

StaticAddressLister::StaticAddressLister(std::vector<std::string> addresses) : addresses_(std::move(addresses)) {}

std::vector<std::string> StaticAddressLister::AllAddresses() {
  auto resolved = network::ResolveAddresses(addresses_);
  if (resolved.size() != addresses_.size()) {
    LOG_DISC_WARN("{} of {} listen addresses could not be resolved", addresses_.size() - resolved.size(),
                  addresses_.size());
  }
  return resolved;
}

StaticRelayStatus::StaticRelayStatus(std::vector<StaticRelay> relays) : relays_(std::move(relays)) {}

std::vector<std::string> StaticRelayStatus::Relays() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> urls;
  urls.reserve(relays_.size());
  for (const auto& relay : relays_) {
    urls.push_back(relay.url);
  }
  return urls;
}

std::optional<std::chrono::nanoseconds> StaticRelayStatus::RelayStatus(const std::string& url) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& relay : relays_) {
    if (relay.url == url) {
      if (!relay.latency) {
        return std::nullopt;
      }
      return std::chrono::duration_cast<std::chrono::nanoseconds>(*relay.latency);
    }
  }
  return std::nullopt;
}

bool StaticRelayStatus::SetLatency(const std::string& url, std::optional<std::chrono::milliseconds> latency) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& relay : relays_) {
    if (relay.url == url) {
      relay.latency = latency;
      return true;
    }
  }
  return false;
}

}  // namespace discovery
}  // namespace lanpeer
