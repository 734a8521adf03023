// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "app/config.hpp"
#include "discovery/events.hpp"
#include "discovery/local_discovery.hpp"
#include "discovery/providers.hpp"
#include "network/device_id.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace lanpeer {
namespace app {

// Application - owns the discovery engines and their collaborators
//
// Lifecycle: initialize() builds everything (configuration errors surface
// here), start() begins announcing, wait_for_shutdown() blocks until SIGINT /
// SIGTERM or request_shutdown(), stop() tears down in reverse order.
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }
  bool is_running() const { return running_; }

  const protocol::DeviceID& device_id() const { return device_id_; }
  const std::vector<std::unique_ptr<discovery::LocalDiscovery>>& finders() const { return finders_; }

  // Fresh cache entries of every engine
  nlohmann::json Status() const;

  static Application* instance();

private:
  bool init_device_id();
  bool init_discovery();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  void start_status_thread();
  void stop_status_thread();

  void shutdown();

  AppConfig config_;
  protocol::DeviceID device_id_;

  std::shared_ptr<discovery::EventBus> events_;
  std::shared_ptr<discovery::StaticAddressLister> addr_list_;
  std::shared_ptr<discovery::StaticRelayStatus> relay_stat_;
  std::vector<std::unique_ptr<discovery::LocalDiscovery>> finders_;

  discovery::EventBus::Subscription discovered_sub_;

  std::thread status_thread_;
  std::mutex status_mutex_;
  std::condition_variable status_cv_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace lanpeer
