// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 LocalDiscovery - LAN announcement engine

 Purpose
 - Periodically announce this device's id, addresses and relays on the local
   segment (IPv4 broadcast or IPv6 multicast, chosen by the bind address)
 - Listen for announcements from other devices and remember where they can be
   reached for a short time (3 broadcast intervals)
 - Re-announce immediately when a device is seen for the first time (or again
   after its entry went stale) so the new peer learns about us without waiting
   for the next interval

 Threads
 - send loop: builds the announcement once, sends it on every tick or forced
   re-broadcast, sweeps long-expired cache entries
 - receive loop: decodes packets, ignores our own, registers the rest
 - the beacon runs under a Supervisor that restarts it on socket failure

 Lookup() is a pure cache read and may be called from any thread.
*/

#include "discovery/events.hpp"
#include "discovery/finder.hpp"
#include "discovery/providers.hpp"
#include "discovery/reachability_cache.hpp"
#include "network/beacon.hpp"
#include "network/device_id.hpp"
#include "util/supervisor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lanpeer {

// Forward declaration for test access
namespace test {
class LocalDiscoveryTestAccess;
}  // namespace test

namespace discovery {

// Invalid bind address or unusable multicast group
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

constexpr std::chrono::seconds BROADCAST_INTERVAL{30};
constexpr int CACHE_LIFETIME_INTERVALS = 3;

struct LocalDiscoveryOptions {
  std::chrono::milliseconds broadcast_interval{BROADCAST_INTERVAL};
  util::SupervisorSpec supervisor;
};

class LocalDiscovery : public Finder {
public:
  // Bind according to addr: ":port" selects IPv4 broadcast on that port,
  // "[group]:port" selects IPv6 multicast. Throws ConfigError.
  LocalDiscovery(const protocol::DeviceID& my_id,
                 const std::string& addr,
                 std::shared_ptr<AddressLister> addr_list,
                 std::shared_ptr<RelayStatusProvider> relay_stat,
                 std::shared_ptr<EventPublisher> events,
                 LocalDiscoveryOptions options = {});

  // Use an existing beacon. name is what String() reports.
  LocalDiscovery(const protocol::DeviceID& my_id,
                 std::string name,
                 std::shared_ptr<network::Beacon> beacon,
                 std::shared_ptr<AddressLister> addr_list,
                 std::shared_ptr<RelayStatusProvider> relay_stat,
                 std::shared_ptr<EventPublisher> events,
                 LocalDiscoveryOptions options = {});

  ~LocalDiscovery() override;

  LocalDiscovery(const LocalDiscovery&) = delete;
  LocalDiscovery& operator=(const LocalDiscovery&) = delete;

  // Start the beacon and both loops. Returns false if already started or stopped.
  bool Start();

  // Stop everything and join the loops. Idempotent; the engine cannot be restarted.
  void Stop();

  // Finder interface
  LookupResult Lookup(const protocol::DeviceID& device) override;
  std::string String() const override { return name_; }
  std::optional<std::string> Error() const override;

  bool is_running() const;
  const ReachabilityCache& cache() const { return cache_; }
  std::chrono::milliseconds broadcast_interval() const { return options_.broadcast_interval; }
  uint64_t broadcast_count() const;

private:
  friend class test::LocalDiscoveryTestAccess;

  struct BeaconSetup {
    std::string name;
    std::shared_ptr<network::Beacon> beacon;
  };
  static BeaconSetup CreateBeacon(const std::string& addr);

  LocalDiscovery(const protocol::DeviceID& my_id,
                 BeaconSetup setup,
                 std::shared_ptr<AddressLister> addr_list,
                 std::shared_ptr<RelayStatusProvider> relay_stat,
                 std::shared_ptr<EventPublisher> events,
                 LocalDiscoveryOptions options);

  void SendLoop();
  void RecvLoop();

  // Encode the announcement for this device
  std::vector<uint8_t> BuildAnnouncement();

  // Record a received announcement. Returns true if the device was unknown or
  // its previous entry had gone stale.
  bool RegisterDevice(const protocol::Device& device, const asio::ip::udp::endpoint& source);

  // Hand a re-broadcast request to the send loop and wait until it has been
  // taken. Returns false if the engine stopped first.
  bool ForceBroadcast();

  const protocol::DeviceID my_id_;
  const std::string name_;
  const LocalDiscoveryOptions options_;

  std::shared_ptr<network::Beacon> beacon_;
  std::shared_ptr<AddressLister> addr_list_;
  std::shared_ptr<RelayStatusProvider> relay_stat_;
  std::shared_ptr<EventPublisher> events_;

  ReachabilityCache cache_;
  util::Supervisor supervisor_;

  // Guards the fields below; cv_ signals forced broadcasts and shutdown
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t force_requested_{0};
  uint64_t force_consumed_{0};
  uint64_t broadcasts_{0};
  bool started_{false};
  bool stopping_{false};

  std::thread send_thread_;
  std::thread recv_thread_;
};

}  // namespace discovery
}  // namespace lanpeer
