// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/announcement.hpp"
#include "network/device_id.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lanpeer {
namespace discovery {

struct CacheEntry {
  std::vector<std::string> direct;
  std::vector<protocol::Relay> relays;
  std::chrono::steady_clock::time_point when;
  bool found{false};
};

// ReachabilityCache - device id -> last seen addresses
//
// Entries are overwritten unconditionally (last writer wins) and never expire
// on their own; callers decide freshness with IsStale(). Sweep() drops entries
// that are long past their lifetime so the map stays bounded by the set of
// recently seen devices. Time comes from util::GetSteadyTime().
class ReachabilityCache {
public:
  explicit ReachabilityCache(std::chrono::steady_clock::duration lifetime);

  std::optional<CacheEntry> Get(const protocol::DeviceID& id) const;
  void Set(const protocol::DeviceID& id, CacheEntry entry);

  // True once now - entry.when >= lifetime
  bool IsStale(const CacheEntry& entry) const;

  // Remove entries with now - when >= max_age. Returns the number removed.
  size_t Sweep(std::chrono::steady_clock::duration max_age);

  size_t Size() const;
  std::vector<std::pair<protocol::DeviceID, CacheEntry>> Snapshot() const;

  std::chrono::steady_clock::duration lifetime() const { return lifetime_; }

private:
  const std::chrono::steady_clock::duration lifetime_;

  mutable std::mutex mutex_;
  std::unordered_map<protocol::DeviceID, CacheEntry> entries_;
};

}  // namespace discovery
}  // namespace lanpeer
