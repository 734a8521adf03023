// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 Supervisor - keeps restartable services running

 Purpose
 - Own a set of long-running services (beacons) and run each on its own thread
 - Restart a service whenever Serve() throws or returns while the supervisor is
   still running
 - Back off when a service fails repeatedly so a broken socket does not spin

 Failure accounting
 - Each service has a failure score that decays exponentially with
   failure_decay as half-life and grows by one per failure
 - When the score exceeds failure_threshold the supervisor waits
   failure_backoff before the next restart and resets the score
*/

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanpeer {
namespace util {

// A unit of work the supervisor can (re)start.
class Service {
public:
  virtual ~Service() = default;

  // Run until Stop() is called. Throwing, or returning before Stop(), is
  // treated as a failure and the service is restarted.
  virtual void Serve() = 0;

  // Make a running (or the next) Serve() return promptly. Called once.
  virtual void Stop() = 0;

  virtual std::string String() const = 0;
};

struct SupervisorSpec {
  double failure_threshold{5.0};
  std::chrono::milliseconds failure_decay{std::chrono::seconds(30)};
  std::chrono::milliseconds failure_backoff{std::chrono::seconds(15)};
};

class Supervisor {
public:
  explicit Supervisor(std::string name, SupervisorSpec spec = {});
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Register a service. If the supervisor is already running the service is
  // started immediately.
  void Add(std::shared_ptr<Service> service);

  // Start all registered services. Returns false if already started or stopped.
  bool Start();

  // Stop all services and join their threads. Idempotent.
  void Stop();

  bool is_running() const { return running_.load(); }

  // Number of restarts performed across all services
  uint64_t restart_count() const { return restarts_.load(); }

  const std::string& name() const { return name_; }

private:
  void Launch(const std::shared_ptr<Service>& service);
  void RunService(std::shared_ptr<Service> service);

  // Wait for the given duration or until stopped. Returns false if stopped.
  bool WaitFor(std::chrono::milliseconds duration);

  const std::string name_;
  const SupervisorSpec spec_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<Service>> services_;
  std::vector<std::thread> threads_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> restarts_{0};
};

}  // namespace util
}  // namespace lanpeer
