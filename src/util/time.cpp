// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace lanpeer {
namespace util {

namespace {

// Mock clock state. While active, steady time is pinned to the real steady
// instant at which mock time was first enabled, shifted by how far the mock
// unix time has moved since then.
struct MockClock {
  std::mutex mutex;
  std::atomic<int64_t> now{0};
  int64_t anchor_unix{0};
  std::chrono::steady_clock::time_point anchor_steady;
};

MockClock& Mock() {
  static MockClock clock;
  return clock;
}

}  // namespace

int64_t GetTime() {
  if (int64_t mock = GetMockTime()) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  auto& clock = Mock();
  if (clock.now.load(std::memory_order_acquire) == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(clock.mutex);
  int64_t mock = clock.now.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }
  return clock.anchor_steady + std::chrono::seconds(mock - clock.anchor_unix);
}

void SetMockTime(int64_t time) {
  auto& clock = Mock();
  std::lock_guard<std::mutex> lock(clock.mutex);

  // Enabling anchors the mock to the current steady instant. Later moves keep
  // the anchor so steady time follows the mock value.
  if (time != 0 && clock.now.load(std::memory_order_relaxed) == 0) {
    clock.anchor_unix = time;
    clock.anchor_steady = std::chrono::steady_clock::now();
  }
  clock.now.store(time, std::memory_order_release);
}

int64_t GetMockTime() {
  return Mock().now.load(std::memory_order_acquire);
}

}  // namespace util
}  // namespace lanpeer
