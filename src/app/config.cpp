// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "app/config.hpp"

#include "util/string_parsing.hpp"

#include <climits>
#include <cstdint>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanpeer {
namespace app {

namespace {

constexpr int64_t MAX_INTERVAL_SEC = 24 * 60 * 60;

bool ParseRelayFlag(const std::string& value, RelayConfig& relay) {
  // "<url>" or "<url>,<latency_ms>". Anything after the last comma must be a
  // latency that fits the announcement's int32 field.
  auto comma = value.rfind(',');
  if (comma == std::string::npos) {
    relay.url = value;
    relay.latency_ms.reset();
    return !relay.url.empty();
  }

  auto latency = util::SafeParseInt64(value.substr(comma + 1), 0, INT32_MAX);
  if (!latency) {
    return false;
  }
  relay.url = value.substr(0, comma);
  relay.latency_ms = *latency;
  return !relay.url.empty();
}

bool ParseIntervalFlag(const std::string& value, int64_t min, int64_t& out) {
  auto parsed = util::SafeParseInt64(value, min, MAX_INTERVAL_SEC);
  if (!parsed) {
    return false;
  }
  out = *parsed;
  return true;
}

}  // namespace

bool LoadConfigFile(const std::string& path, AppConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open config file " + path;
    return false;
  }

  try {
    json j;
    file >> j;
    if (!j.is_object()) {
      error = "config file " + path + " must contain a JSON object";
      return false;
    }

    config.device_id = j.value("device_id", config.device_id);
    config.listen_v4 = j.value("listen_v4", config.listen_v4);
    config.listen_v6 = j.value("listen_v6", config.listen_v6);
    config.ipv4 = j.value("ipv4", config.ipv4);
    config.ipv6 = j.value("ipv6", config.ipv6);
    config.broadcast_interval_sec = j.value("broadcast_interval_sec", config.broadcast_interval_sec);
    config.loglevel = j.value("loglevel", config.loglevel);
    config.debuglogfile = j.value("debuglogfile", config.debuglogfile);
    config.status_interval_sec = j.value("status_interval_sec", config.status_interval_sec);

    if (j.contains("addresses")) {
      config.addresses = j.at("addresses").get<std::vector<std::string>>();
    }

    if (j.contains("relays")) {
      config.relays.clear();
      for (const auto& item : j.at("relays")) {
        RelayConfig relay;
        relay.url = item.at("url").get<std::string>();
        if (item.contains("latency_ms") && !item.at("latency_ms").is_null()) {
          relay.latency_ms = item.at("latency_ms").get<int64_t>();
          if (*relay.latency_ms < 0 || *relay.latency_ms > INT32_MAX) {
            error = "latency_ms of relay " + relay.url + " out of range in " + path;
            return false;
          }
        }
        config.relays.push_back(std::move(relay));
      }
    }
  } catch (const json::exception& e) {
    error = "failed to parse " + path + ": " + e.what();
    return false;
  }

  if (config.broadcast_interval_sec <= 0 || config.broadcast_interval_sec > MAX_INTERVAL_SEC) {
    error = "broadcast_interval_sec out of range in " + path;
    return false;
  }
  if (config.status_interval_sec < 0 || config.status_interval_sec > MAX_INTERVAL_SEC) {
    error = "status_interval_sec out of range in " + path;
    return false;
  }
  return true;
}

ParseResult ParseCommandLine(int argc, const char* const argv[], AppConfig& config, std::string& error) {
  // The config file goes first so that flags override it
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.starts_with("--conf=")) {
      if (!LoadConfigFile(arg.substr(7), config, error)) {
        return ParseResult::ERROR;
      }
    }
  }

  bool addresses_from_flags = false;
  bool relays_from_flags = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      return ParseResult::HELP;
    } else if (arg.starts_with("--conf=")) {
      continue;
    } else if (arg.starts_with("--device-id=")) {
      config.device_id = arg.substr(12);
    } else if (arg.starts_with("--listen-v4=")) {
      config.listen_v4 = arg.substr(12);
    } else if (arg.starts_with("--listen-v6=")) {
      config.listen_v6 = arg.substr(12);
    } else if (arg == "--noipv4") {
      config.ipv4 = false;
    } else if (arg == "--noipv6") {
      config.ipv6 = false;
    } else if (arg.starts_with("--address=")) {
      if (!addresses_from_flags) {
        config.addresses.clear();
        addresses_from_flags = true;
      }
      config.addresses.push_back(arg.substr(10));
    } else if (arg.starts_with("--relay=")) {
      if (!relays_from_flags) {
        config.relays.clear();
        relays_from_flags = true;
      }
      RelayConfig relay;
      if (!ParseRelayFlag(arg.substr(8), relay)) {
        error = "invalid --relay value: " + arg.substr(8);
        return ParseResult::ERROR;
      }
      config.relays.push_back(std::move(relay));
    } else if (arg.starts_with("--broadcast-interval=")) {
      if (!ParseIntervalFlag(arg.substr(21), 1, config.broadcast_interval_sec)) {
        error = "invalid --broadcast-interval value: " + arg.substr(21);
        return ParseResult::ERROR;
      }
    } else if (arg.starts_with("--status-interval=")) {
      if (!ParseIntervalFlag(arg.substr(18), 0, config.status_interval_sec)) {
        error = "invalid --status-interval value: " + arg.substr(18);
        return ParseResult::ERROR;
      }
    } else if (arg.starts_with("--loglevel=")) {
      config.loglevel = arg.substr(11);
    } else if (arg.starts_with("--debuglogfile=")) {
      config.debuglogfile = arg.substr(15);
    } else {
      error = "unknown option: " + arg;
      return ParseResult::ERROR;
    }
  }

  if (!config.ipv4 && !config.ipv6) {
    error = "both IPv4 and IPv6 discovery are disabled";
    return ParseResult::ERROR;
  }

  return ParseResult::OK;
}

std::string UsageString(const std::string& program_name) {
  std::ostringstream out;
  out << "lanpeerd - local peer discovery daemon\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --conf=<file>                JSON config file (flags override it)\n"
      << "  --device-id=<id>             Device id (default: random)\n"
      << "  --listen-v4=<:port>          IPv4 broadcast address (default: :21027)\n"
      << "  --listen-v6=<[group]:port>   IPv6 multicast address (default: [ff12::8384]:21027)\n"
      << "  --noipv4                     Disable IPv4 broadcast discovery\n"
      << "  --noipv6                     Disable IPv6 multicast discovery\n"
      << "  --address=<uri>              Address to announce, repeatable (default: tcp://0.0.0.0:22000)\n"
      << "  --relay=<url>[,<ms>]         Relay to announce with its latency, repeatable\n"
      << "  --broadcast-interval=<sec>   Seconds between announcements (default: 30)\n"
      << "  --status-interval=<sec>      Log known devices every <sec> seconds (default: 0, off)\n"
      << "  --loglevel=<level>           trace, debug, info, warn, error, off (default: info)\n"
      << "  --debuglogfile=<file>        Also write logs to <file>\n"
      << "  --help                       Show this help message\n";
  return out.str();
}

}  // namespace app
}  // namespace lanpeer
