// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "discovery/reachability_cache.hpp"

#include "util/time.hpp"

namespace lanpeer {
namespace discovery {

ReachabilityCache::ReachabilityCache(std::chrono::steady_clock::duration lifetime) : lifetime_(lifetime) {}

std::optional<CacheEntry> ReachabilityCache::Get(const protocol::DeviceID& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ReachabilityCache::Set(const protocol::DeviceID& id, CacheEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[id] = std::move(entry);
}

bool ReachabilityCache::IsStale(const CacheEntry& entry) const {
  return util::GetSteadyTime() - entry.when >= lifetime_;
}

size_t ReachabilityCache::Sweep(std::chrono::steady_clock::duration max_age) {
  const auto now = util::GetSteadyTime();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.when >= max_age) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t ReachabilityCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::pair<protocol::DeviceID, CacheEntry>> ReachabilityCache::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

}  // namespace discovery
}  // namespace lanpeer
