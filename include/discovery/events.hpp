// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lanpeer {
namespace discovery {

enum class EventType {
  DeviceDiscovered,
};

std::string EventTypeString(EventType type);

// Serializes event data for logging. Payloads carry strings taken from
// received packets, so invalid UTF-8 is replaced instead of throwing.
std::string EventDataString(const nlohmann::json& data);

// Fire-and-forget publish capability used by the discovery engine
class EventPublisher {
public:
  virtual ~EventPublisher() = default;
  virtual void Publish(EventType type, const nlohmann::json& data) = 0;
};

// In-process event bus
//
// Design:
// - Observer pattern with std::function, one subscriber list per bus
// - Synchronous delivery on the publishing thread
// - Callbacks run on a snapshot, without holding the lock, so a callback may
//   subscribe or unsubscribe
// - RAII subscription handles
class EventBus : public EventPublisher {
public:
  using Callback = std::function<void(EventType type, const nlohmann::json& data)>;

  // Subscription handle - unsubscribes when destroyed
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void Unsubscribe();

  private:
    friend class EventBus;
    Subscription(EventBus* owner, size_t id);

    EventBus* owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Subscribe to one event type
  [[nodiscard]] Subscription Subscribe(EventType type, Callback callback);

  void Publish(EventType type, const nlohmann::json& data) override;

  size_t subscriber_count() const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    EventType type;
    Callback callback;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};  // 0 reserved for invalid
};

}  // namespace discovery
}  // namespace lanpeer
