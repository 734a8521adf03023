// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace lanpeer {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the per-component
 * loggers ("default", "network", "discovery").
 *
 * Thread-safety: All methods are thread-safe. Initialization is performed
 * exactly once using std::call_once. Logger access is protected by a mutex.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call has
  // an effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. Logging after shutdown re-initializes.
  static void Shutdown();

  // Get logger for a component. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for one component (network, discovery, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace lanpeer

// Convenience macros for logging
#define LOG_TRACE(...) lanpeer::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) lanpeer::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) lanpeer::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) lanpeer::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) lanpeer::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) lanpeer::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) lanpeer::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) lanpeer::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) lanpeer::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) lanpeer::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...) lanpeer::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) lanpeer::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) lanpeer::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) lanpeer::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) lanpeer::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Use these for messages triggered by received datagrams. Anyone on the local
// segment can send us packets, so each callsite is limited to 200 messages per
// hour. When messages were dropped, the next accepted one is preceded by a note
// with the number dropped.

#include "util/rate_limiter.hpp"

#define LOG_RL_(component, level, ...)                                                                                 \
  do {                                                                                                                 \
    if (auto suppressed_ = lanpeer::util::RateLimiter::Global().Acquire({__FILE__, __LINE__})) {                       \
      auto logger_ = lanpeer::util::LogManager::GetLogger(component);                                                  \
      if (*suppressed_ > 0) {                                                                                          \
        logger_->level("{} similar messages suppressed", *suppressed_);                                                \
      }                                                                                                                \
      logger_->level(__VA_ARGS__);                                                                                     \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_DEBUG_RL(...) LOG_RL_("network", debug, __VA_ARGS__)
#define LOG_NET_WARN_RL(...) LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_DISC_DEBUG_RL(...) LOG_RL_("discovery", debug, __VA_ARGS__)
