// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "discovery/events.hpp"

#include <algorithm>

namespace lanpeer {
namespace discovery {

std::string EventTypeString(EventType type) {
  switch (type) {
  case EventType::DeviceDiscovered:
    return "DeviceDiscovered";
  }
  return "Unknown";
}

std::string EventDataString(const nlohmann::json& data) {
  return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// EventBus::Subscription
// ============================================================================

EventBus::Subscription::Subscription(EventBus* owner, size_t id) : owner_(owner), id_(id), active_(true) {}

EventBus::Subscription::~Subscription() {
  Unsubscribe();
}

EventBus::Subscription::Subscription(Subscription&& other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void EventBus::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::Subscription EventBus::Subscribe(EventType type, Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;
  callbacks_.push_back(CallbackEntry{id, type, std::move(callback)});
  return Subscription(this, id);
}

void EventBus::Publish(EventType type, const nlohmann::json& data) {
  std::vector<Callback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto& entry : callbacks_) {
      if (entry.type == type && entry.callback) {
        snapshot.push_back(entry.callback);
      }
    }
  }

  for (const auto& callback : snapshot) {
    callback(type, data);
  }
}

size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void EventBus::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry& entry) { return entry.id == id; }),
                   callbacks_.end());
}

}  // namespace discovery
}  // namespace lanpeer
