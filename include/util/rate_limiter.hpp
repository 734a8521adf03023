// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace lanpeer {
namespace util {

/**
 * Per-callsite log throttle.
 *
 * Every host on the local segment can send us datagrams, so log lines fed by
 * received packets are throttled per source location. Each callsite owns a
 * bucket of `burst` tokens that refills linearly over `period`.
 *
 * Acquire() also counts the messages it refused, so the first message let
 * through after a quiet spell can report how many were dropped.
 */
class RateLimiter {
public:
  struct Policy {
    uint32_t burst{200};
    std::chrono::seconds period{std::chrono::hours(1)};
  };

  struct Callsite {
    const char* file;
    int line;

    bool operator==(const Callsite& other) const {
      return line == other.line && std::string_view(file) == std::string_view(other.file);
    }
  };

  RateLimiter() = default;
  explicit RateLimiter(Policy policy) : policy_(policy) {}

  // Returns the number of messages suppressed at this callsite since the
  // previous accepted one, or nullopt if this message must be dropped.
  std::optional<uint64_t> Acquire(const Callsite& site);

  const Policy& policy() const { return policy_; }

  // Shared limiter behind the *_RL logging macros.
  static RateLimiter& Global();

private:
  struct CallsiteHash {
    size_t operator()(const Callsite& site) const {
      return std::hash<std::string_view>()(site.file) ^ (static_cast<size_t>(site.line) * 0x9E3779B97F4A7C15ULL);
    }
  };

  struct Bucket {
    double tokens;
    std::chrono::steady_clock::time_point refilled;
    uint64_t suppressed{0};
  };

  Policy policy_;
  std::mutex mutex_;
  std::unordered_map<Callsite, Bucket, CallsiteHash> buckets_;
};

}  // namespace util
}  // namespace lanpeer
