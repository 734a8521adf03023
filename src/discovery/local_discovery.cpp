// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "discovery/local_discovery.hpp"

#include "network/address_normalizer.hpp"
#include "network/announcement.hpp"
#include "network/broadcast_beacon.hpp"
#include "network/multicast_beacon.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <limits>

#include <spdlog/fmt/bin_to_hex.h>

namespace lanpeer {
namespace discovery {

LocalDiscovery::BeaconSetup LocalDiscovery::CreateBeacon(const std::string& addr) {
  std::string host;
  std::string port;
  if (!util::SplitHostPort(addr, host, port)) {
    throw ConfigError("invalid discovery address: " + addr);
  }

  if (host.empty()) {
    auto bcport = util::SafeParsePort(port);
    if (!bcport) {
      throw ConfigError("invalid broadcast port in " + addr);
    }
    return BeaconSetup{"IPv4 local", std::make_shared<network::BroadcastBeacon>(*bcport)};
  }

  try {
    return BeaconSetup{"IPv6 local", std::make_shared<network::MulticastBeacon>(addr)};
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

LocalDiscovery::LocalDiscovery(const protocol::DeviceID& my_id,
                               const std::string& addr,
                               std::shared_ptr<AddressLister> addr_list,
                               std::shared_ptr<RelayStatusProvider> relay_stat,
                               std::shared_ptr<EventPublisher> events,
                               LocalDiscoveryOptions options)
    : LocalDiscovery(my_id,
                     CreateBeacon(addr),
                     std::move(addr_list),
                     std::move(relay_stat),
                     std::move(events),
                     options) {}

LocalDiscovery::LocalDiscovery(const protocol::DeviceID& my_id,
                               std::string name,
                               std::shared_ptr<network::Beacon> beacon,
                               std::shared_ptr<AddressLister> addr_list,
                               std::shared_ptr<RelayStatusProvider> relay_stat,
                               std::shared_ptr<EventPublisher> events,
                               LocalDiscoveryOptions options)
    : LocalDiscovery(my_id,
                     BeaconSetup{std::move(name), std::move(beacon)},
                     std::move(addr_list),
                     std::move(relay_stat),
                     std::move(events),
                     options) {}

LocalDiscovery::LocalDiscovery(const protocol::DeviceID& my_id,
                               BeaconSetup setup,
                               std::shared_ptr<AddressLister> addr_list,
                               std::shared_ptr<RelayStatusProvider> relay_stat,
                               std::shared_ptr<EventPublisher> events,
                               LocalDiscoveryOptions options)
    : my_id_(my_id),
      name_(std::move(setup.name)),
      options_(options),
      beacon_(std::move(setup.beacon)),
      addr_list_(std::move(addr_list)),
      relay_stat_(std::move(relay_stat)),
      events_(std::move(events)),
      cache_(options.broadcast_interval * CACHE_LIFETIME_INTERVALS),
      supervisor_("discovery " + name_, options.supervisor) {
  if (!beacon_) {
    throw ConfigError(name_ + ": no beacon");
  }
  if (options_.broadcast_interval <= std::chrono::milliseconds::zero()) {
    throw ConfigError(name_ + ": broadcast interval must be positive");
  }
  supervisor_.Add(beacon_);
}

LocalDiscovery::~LocalDiscovery() {
  Stop();
}

bool LocalDiscovery::Start() {
  {
    // Threads are created under the lock so a concurrent Stop() either
    // prevents the start or sees both threads to join
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
      return false;
    }
    started_ = true;

    supervisor_.Start();
    recv_thread_ = std::thread([this]() { RecvLoop(); });
    send_thread_ = std::thread([this]() { SendLoop(); });
  }

  LOG_DISC_INFO("{}: discovery started (interval {}ms)", name_, options_.broadcast_interval.count());
  return true;
}

void LocalDiscovery::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();

  // Unblocks the receive loop
  beacon_->Close();
  supervisor_.Stop();

  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }
  if (send_thread_.joinable()) {
    send_thread_.join();
  }

  LOG_DISC_DEBUG("{}: discovery stopped", name_);
}

bool LocalDiscovery::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopping_;
}

uint64_t LocalDiscovery::broadcast_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return broadcasts_;
}

LookupResult LocalDiscovery::Lookup(const protocol::DeviceID& device) {
  auto entry = cache_.Get(device);
  if (entry && !cache_.IsStale(*entry)) {
    return LookupResult{entry->direct, entry->relays};
  }
  return {};
}

std::optional<std::string> LocalDiscovery::Error() const {
  return beacon_->Error();
}

std::vector<uint8_t> LocalDiscovery::BuildAnnouncement() {
  protocol::Announce pkt;
  pkt.this_device.id = my_id_.ToVector();

  // Everything announced must pass the decoder's limits at the peer, or the
  // whole packet is rejected there
  if (addr_list_) {
    for (auto& addr : addr_list_->AllAddresses()) {
      if (addr.size() > protocol::MAX_URL_LENGTH) {
        LOG_DISC_WARN("{}: not announcing address of {} bytes (limit {})", name_, addr.size(),
                      protocol::MAX_URL_LENGTH);
        continue;
      }
      pkt.this_device.addresses.push_back(std::move(addr));
    }
  }
  if (pkt.this_device.addresses.size() > protocol::MAX_ADDRESSES) {
    LOG_DISC_WARN("{}: announcing only {} of {} addresses", name_, protocol::MAX_ADDRESSES,
                  pkt.this_device.addresses.size());
    pkt.this_device.addresses.resize(protocol::MAX_ADDRESSES);
  }

  if (relay_stat_) {
    for (const auto& url : relay_stat_->Relays()) {
      auto latency = relay_stat_->RelayStatus(url);
      if (!latency) {
        continue;
      }
      if (url.size() > protocol::MAX_URL_LENGTH) {
        LOG_DISC_WARN("{}: not announcing relay URL of {} bytes (limit {})", name_, url.size(),
                      protocol::MAX_URL_LENGTH);
        continue;
      }
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(*latency).count();
      if (ms < 0) {
        LOG_DISC_WARN("{}: not announcing relay {} with negative latency {}ms", name_, url, ms);
        continue;
      }
      ms = std::min<int64_t>(ms, std::numeric_limits<int32_t>::max());
      pkt.this_device.relays.push_back(protocol::Relay{url, static_cast<int32_t>(ms)});
    }
  }
  if (pkt.this_device.relays.size() > protocol::MAX_RELAYS) {
    LOG_DISC_WARN("{}: announcing only {} of {} relays", name_, protocol::MAX_RELAYS, pkt.this_device.relays.size());
    pkt.this_device.relays.resize(protocol::MAX_RELAYS);
  }

  LOG_DISC_DEBUG("{}: announcing {} addresses and {} relays", name_, pkt.this_device.addresses.size(),
                 pkt.this_device.relays.size());
  return pkt.MarshalXDR();
}

void LocalDiscovery::SendLoop() {
  const auto msg = BuildAnnouncement();
  const auto interval = options_.broadcast_interval;
  const auto sweep_age = cache_.lifetime() * 2;
  auto next_tick = std::chrono::steady_clock::now() + interval;

  while (true) {
    beacon_->Send(msg);

    {
      std::unique_lock<std::mutex> lock(mutex_);
      ++broadcasts_;
      cv_.wait_until(lock, next_tick, [this]() { return stopping_ || force_requested_ > force_consumed_; });
      if (stopping_) {
        break;
      }

      if (force_requested_ > force_consumed_) {
        force_consumed_ = force_requested_;
        LOG_DISC_DEBUG("{}: forced re-broadcast", name_);
      } else {
        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick <= now) {
          next_tick = now + interval;
        }
      }
    }
    // Outside the lock: the waiting receive loop must see force_consumed_
    cv_.notify_all();

    size_t swept = cache_.Sweep(sweep_age);
    if (swept > 0) {
      LOG_DISC_DEBUG("{}: swept {} expired cache entries", name_, swept);
    }
  }
}

void LocalDiscovery::RecvLoop() {
  while (auto packet = beacon_->Recv()) {
    protocol::Announce pkt;
    auto err = pkt.UnmarshalXDR(packet->data);
    if (err != protocol::DecodeError::OK) {
      LOG_DISC_DEBUG_RL("{}: failed to decode packet from {}: {} ({})", name_,
                        packet->source.address().to_string(), protocol::DecodeErrorString(err),
                        spdlog::to_hex(packet->data));
      continue;
    }

    auto id = protocol::DeviceID::FromBytes(pkt.this_device.id);
    if (!id) {
      continue;
    }
    if (*id == my_id_) {
      LOG_DISC_TRACE("{}: ignoring own announcement", name_);
      continue;
    }

    if (RegisterDevice(pkt.this_device, packet->source)) {
      if (!ForceBroadcast()) {
        break;
      }
    }
  }

  LOG_DISC_DEBUG("{}: receive loop exiting", name_);
}

bool LocalDiscovery::RegisterDevice(const protocol::Device& device, const asio::ip::udp::endpoint& source) {
  auto id = protocol::DeviceID::FromBytes(device.id);
  if (!id) {
    return false;
  }

  auto existing = cache_.Get(*id);
  bool is_new = !existing || cache_.IsStale(*existing);

  auto valid_addrs = network::NormalizeAddresses(device.addresses, source);

  CacheEntry entry;
  entry.direct = valid_addrs;
  entry.relays = device.relays;
  entry.when = util::GetSteadyTime();
  entry.found = true;
  cache_.Set(*id, std::move(entry));

  if (is_new) {
    LOG_DISC_INFO("{}: discovered device {} at {}", name_, id->ToString(), source.address().to_string());

    if (events_) {
      nlohmann::json relays = nlohmann::json::array();
      for (const auto& relay : device.relays) {
        relays.push_back({{"url", relay.url}, {"latency", relay.latency}});
      }
      nlohmann::json data = {
          {"device", id->ToString()},
          {"addrs", device.addresses},
          {"relays", relays},
      };
      try {
        events_->Publish(EventType::DeviceDiscovered, data);
      } catch (const std::exception& e) {
        LOG_DISC_WARN("{}: DeviceDiscovered subscriber failed for {}: {}", name_, id->ToString(), e.what());
      }
    }
  }

  return is_new;
}

bool LocalDiscovery::ForceBroadcast() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (stopping_) {
    return false;
  }
  const uint64_t ticket = ++force_requested_;
  cv_.notify_all();
  cv_.wait(lock, [this, ticket]() { return stopping_ || force_consumed_ >= ticket; });
  return force_consumed_ >= ticket;
}

}  // namespace discovery
}  // namespace lanpeer
