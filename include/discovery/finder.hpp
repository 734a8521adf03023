// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/announcement.hpp"
#include "network/device_id.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lanpeer {
namespace discovery {

struct LookupResult {
  std::vector<std::string> direct;
  std::vector<protocol::Relay> relays;
};

// Query surface shared by discovery mechanisms
class Finder {
public:
  virtual ~Finder() = default;

  // Known addresses for a device. Both lists are empty when nothing fresh is known.
  virtual LookupResult Lookup(const protocol::DeviceID& device) = 0;

  virtual std::string String() const = 0;

  virtual std::optional<std::string> Error() const = 0;
};

}  // namespace discovery
}  // namespace lanpeer
