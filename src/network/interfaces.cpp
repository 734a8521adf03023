// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/interfaces.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace lanpeer {
namespace network {

namespace {

// RAII holder for getifaddrs() results
class IfAddrs {
public:
  IfAddrs() {
    if (getifaddrs(&head_) != 0) {
      LOG_NET_DEBUG("getifaddrs failed: {}", std::strerror(errno));
      head_ = nullptr;
    }
  }
  ~IfAddrs() {
    if (head_) {
      freeifaddrs(head_);
    }
  }
  IfAddrs(const IfAddrs&) = delete;
  IfAddrs& operator=(const IfAddrs&) = delete;

  const ifaddrs* head() const { return head_; }

private:
  ifaddrs* head_{nullptr};
};

}  // namespace

std::vector<asio::ip::address_v4> BroadcastAddresses() {
  std::vector<asio::ip::address_v4> result;
  IfAddrs ifs;

  for (const ifaddrs* ifa = ifs.head(); ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_BROADCAST)) {
      continue;
    }
    if (!ifa->ifa_netmask) {
      continue;
    }

    const auto* addr = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    const auto* mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);
    uint32_t host = ntohl(addr->sin_addr.s_addr);
    uint32_t netmask = ntohl(mask->sin_addr.s_addr);
    asio::ip::address_v4 bcast(host | ~netmask);

    if (std::find(result.begin(), result.end(), bcast) == result.end()) {
      result.push_back(bcast);
    }
  }

  return result;
}

std::vector<MulticastInterface> MulticastInterfaces() {
  std::vector<MulticastInterface> result;
  IfAddrs ifs;

  for (const ifaddrs* ifa = ifs.head(); ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET6) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST)) {
      continue;
    }

    unsigned int index = if_nametoindex(ifa->ifa_name);
    if (index == 0) {
      continue;
    }
    auto dup = std::find_if(result.begin(), result.end(),
                            [index](const MulticastInterface& i) { return i.index == index; });
    if (dup == result.end()) {
      result.push_back(MulticastInterface{ifa->ifa_name, index});
    }
  }

  return result;
}

}  // namespace network
}  // namespace lanpeer
