// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>
#include <utility>

namespace lanpeer {
namespace util {

std::optional<uint64_t> RateLimiter::Acquire(const Callsite& site) {
  const auto now = GetSteadyTime();
  const auto capacity = static_cast<double>(policy_.burst);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(site, Bucket{capacity, now, 0});
  Bucket& bucket = it->second;

  if (!inserted && now > bucket.refilled && policy_.period.count() > 0) {
    std::chrono::duration<double> elapsed = now - bucket.refilled;
    double refill = capacity * (elapsed.count() / static_cast<double>(policy_.period.count()));
    bucket.tokens = std::min(capacity, bucket.tokens + refill);
    bucket.refilled = now;
  }

  if (bucket.tokens < 1.0) {
    ++bucket.suppressed;
    return std::nullopt;
  }

  bucket.tokens -= 1.0;
  return std::exchange(bucket.suppressed, 0);
}

RateLimiter& RateLimiter::Global() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace lanpeer
