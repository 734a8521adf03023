// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace lanpeer {
namespace util {

// Current unix time in seconds, or the mock time when one is set.
int64_t GetTime();

// Monotonic clock used for cache freshness and rate limiting.
// While mock time is active this advances in whole seconds with the mock value,
// so tests can move the clock deterministically.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (unix seconds). 0 disables mock time.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII mock time for tests: sets the mock time on construction and restores
// real time on destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(0); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
};

}  // namespace util
}  // namespace lanpeer
