// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/supervisor.hpp"

#include "util/logging.hpp"

#include <cmath>

namespace lanpeer {
namespace util {

Supervisor::Supervisor(std::string name, SupervisorSpec spec) : name_(std::move(name)), spec_(spec) {}

Supervisor::~Supervisor() {
  Stop();
}

void Supervisor::Add(std::shared_ptr<Service> service) {
  if (!service) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    LOG_WARN("supervisor {}: not adding {} after stop", name_, service->String());
    return;
  }
  services_.push_back(service);
  if (running_) {
    Launch(service);
  }
}

bool Supervisor::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_ || running_.exchange(true)) {
    return false;
  }
  for (const auto& service : services_) {
    Launch(service);
  }
  return true;
}

// Must be called with mutex_ held
void Supervisor::Launch(const std::shared_ptr<Service>& service) {
  threads_.emplace_back(&Supervisor::RunService, this, service);
}

void Supervisor::Stop() {
  std::vector<std::thread> threads;
  std::vector<std::shared_ptr<Service>> services;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_.exchange(true)) {
      return;
    }
    running_ = false;
    threads.swap(threads_);
    services = services_;
  }
  cv_.notify_all();

  for (const auto& service : services) {
    service->Stop();
  }

  for (auto& thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool Supervisor::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this]() { return !running_.load(); });
}

void Supervisor::RunService(std::shared_ptr<Service> service) {
  double failures = 0.0;
  auto last_failure = std::chrono::steady_clock::now();

  while (running_) {
    try {
      service->Serve();
      if (!running_) {
        break;
      }
      LOG_NET_DEBUG("supervisor {}: service {} returned, restarting", name_, service->String());
    } catch (const std::exception& e) {
      if (!running_) {
        break;
      }
      LOG_NET_WARN("supervisor {}: service {} failed: {}", name_, service->String(), e.what());
    }

    // Exponential decay of the failure score, then count this failure
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - last_failure).count();
    double half_life = std::chrono::duration<double>(spec_.failure_decay).count();
    if (half_life > 0) {
      failures *= std::pow(0.5, elapsed / half_life);
    }
    failures += 1.0;
    last_failure = now;

    if (failures > spec_.failure_threshold) {
      LOG_NET_WARN("supervisor {}: service {} failing repeatedly, backing off for {} ms", name_, service->String(),
                   spec_.failure_backoff.count());
      if (!WaitFor(spec_.failure_backoff)) {
        break;
      }
      failures = 0.0;
    }

    if (!running_) {
      break;
    }
    restarts_.fetch_add(1);
  }

  LOG_NET_TRACE("supervisor {}: service {} exited", name_, service->String());
}

}  // namespace util
}  // namespace lanpeer
