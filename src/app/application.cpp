// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "app/application.hpp"

#include "util/logging.hpp"

#include <array>
#include <chrono>
#include <csignal>
#include <random>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace lanpeer {
namespace app {

namespace {

protocol::DeviceID RandomDeviceID() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::array<uint8_t, protocol::DeviceID::SIZE> bytes;
  for (size_t i = 0; i < bytes.size(); i += 8) {
    uint64_t v = gen();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(v >> (8 * j));
    }
  }
  return protocol::DeviceID(bytes);
}

}  // namespace

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  LOG_INFO("Initializing lanpeer...");

  if (!init_device_id()) {
    return false;
  }

  events_ = std::make_shared<discovery::EventBus>();
  addr_list_ = std::make_shared<discovery::StaticAddressLister>(config_.addresses);

  std::vector<discovery::StaticRelay> relays;
  for (const auto& relay : config_.relays) {
    discovery::StaticRelay r;
    r.url = relay.url;
    if (relay.latency_ms) {
      r.latency = std::chrono::milliseconds(*relay.latency_ms);
    }
    relays.push_back(std::move(r));
  }
  relay_stat_ = std::make_shared<discovery::StaticRelayStatus>(std::move(relays));

  discovered_sub_ = events_->Subscribe(
      discovery::EventType::DeviceDiscovered, [](discovery::EventType type, const nlohmann::json& data) {
        LOG_INFO("{}: {}", discovery::EventTypeString(type), discovery::EventDataString(data));
      });

  if (!init_discovery()) {
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::init_device_id() {
  if (config_.device_id.empty()) {
    device_id_ = RandomDeviceID();
    LOG_INFO("Generated device id {}", device_id_.ToString());
    return true;
  }

  auto id = protocol::DeviceID::FromString(config_.device_id);
  if (!id) {
    LOG_ERROR("Invalid device id: {}", config_.device_id);
    return false;
  }
  device_id_ = *id;
  LOG_INFO("Device id {}", device_id_.ToString());
  return true;
}

bool Application::init_discovery() {
  discovery::LocalDiscoveryOptions options;
  options.broadcast_interval = std::chrono::seconds(config_.broadcast_interval_sec);

  std::vector<std::string> addrs;
  if (config_.ipv4) {
    addrs.push_back(config_.listen_v4);
  }
  if (config_.ipv6) {
    addrs.push_back(config_.listen_v6);
  }

  for (const auto& addr : addrs) {
    try {
      finders_.push_back(std::make_unique<discovery::LocalDiscovery>(device_id_, addr, addr_list_, relay_stat_,
                                                                     events_, options));
      LOG_INFO("Local discovery on {} ({})", addr, finders_.back()->String());
    } catch (const discovery::ConfigError& e) {
      LOG_ERROR("Cannot set up local discovery on {}: {}", addr, e.what());
      return false;
    }
  }
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  setup_signal_handlers();

  for (const auto& finder : finders_) {
    if (!finder->Start()) {
      LOG_ERROR("Failed to start {}", finder->String());
      return false;
    }
  }

  running_ = true;
  start_status_thread();

  LOG_INFO("lanpeer started, announcing {} address(es)", config_.addresses.size());
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down lanpeer...");

  stop_status_thread();

  // Unsubscribe before stopping the engines so no callback outlives us
  discovered_sub_.Unsubscribe();

  for (const auto& finder : finders_) {
    LOG_INFO("Stopping {}...", finder->String());
    finder->Stop();
  }

  LOG_INFO("Shutdown complete");
}

nlohmann::json Application::Status() const {
  nlohmann::json status = nlohmann::json::object();
  status["device"] = device_id_.ToString();

  nlohmann::json engines = nlohmann::json::array();
  for (const auto& finder : finders_) {
    nlohmann::json engine;
    engine["name"] = finder->String();
    auto error = finder->Error();
    engine["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);

    nlohmann::json devices = nlohmann::json::object();
    for (const auto& [id, entry] : finder->cache().Snapshot()) {
      if (finder->cache().IsStale(entry)) {
        continue;
      }
      nlohmann::json relays = nlohmann::json::array();
      for (const auto& relay : entry.relays) {
        relays.push_back({{"url", relay.url}, {"latency", relay.latency}});
      }
      devices[id.ToString()] = {{"addresses", entry.direct}, {"relays", relays}};
    }
    engine["devices"] = devices;
    engines.push_back(engine);
  }
  status["discovery"] = engines;
  return status;
}

void Application::start_status_thread() {
  if (config_.status_interval_sec <= 0) {
    return;
  }

  const auto interval = std::chrono::seconds(config_.status_interval_sec);
  status_thread_ = std::thread([this, interval]() {
    std::unique_lock<std::mutex> lock(status_mutex_);
    while (running_) {
      if (status_cv_.wait_for(lock, interval, [this]() { return !running_; })) {
        break;
      }
      LOG_INFO("Status: {}", discovery::EventDataString(Status()));
    }
  });
}

void Application::stop_status_thread() {
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
  }
  status_cv_.notify_all();
  if (status_thread_.joinable()) {
    status_thread_.join();
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace lanpeer
