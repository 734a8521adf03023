// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanpeer {
namespace app {

struct RelayConfig {
  std::string url;
  std::optional<int64_t> latency_ms;  // unset: relay is not announced
};

struct AppConfig {
  // Empty: generate a random id at startup
  std::string device_id;

  std::string listen_v4{":21027"};
  std::string listen_v6{"[ff12::8384]:21027"};
  bool ipv4{true};
  bool ipv6{true};

  std::vector<std::string> addresses{"tcp://0.0.0.0:22000"};
  std::vector<RelayConfig> relays;

  int64_t broadcast_interval_sec{30};

  std::string loglevel{"info"};
  std::string debuglogfile;  // empty: console only

  // Periodic JSON dump of fresh cache entries, 0 disables
  int64_t status_interval_sec{0};
};

enum class ParseResult {
  OK,
  HELP,   // --help given; usage should be printed
  ERROR,  // error holds the reason
};

// Load settings from a JSON file, overwriting the fields it names.
// Returns false and sets error if the file cannot be read or has the wrong shape.
bool LoadConfigFile(const std::string& path, AppConfig& config, std::string& error);

// Parse command line flags. A --conf=<file> is loaded first so that the other
// flags override it.
ParseResult ParseCommandLine(int argc, const char* const argv[], AppConfig& config, std::string& error);

std::string UsageString(const std::string& program_name);

}  // namespace app
}  // namespace lanpeer
