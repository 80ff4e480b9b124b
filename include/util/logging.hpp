// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace peerlink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "network", "discovery", "transfer", "app").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "peerlink.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "discovery", "transfer")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, discovery, transfer, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Names of all registered components
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace peerlink

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  peerlink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  peerlink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  peerlink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  peerlink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  peerlink::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  peerlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  peerlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  peerlink::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  peerlink::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  peerlink::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  peerlink::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  peerlink::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_XFER_TRACE(...)                                                    \
  peerlink::util::LogManager::GetLogger("transfer")->trace(__VA_ARGS__)
#define LOG_XFER_DEBUG(...)                                                    \
  peerlink::util::LogManager::GetLogger("transfer")->debug(__VA_ARGS__)
#define LOG_XFER_INFO(...)                                                     \
  peerlink::util::LogManager::GetLogger("transfer")->info(__VA_ARGS__)
#define LOG_XFER_WARN(...)                                                     \
  peerlink::util::LogManager::GetLogger("transfer")->warn(__VA_ARGS__)
#define LOG_XFER_ERROR(...)                                                    \
  peerlink::util::LogManager::GetLogger("transfer")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  peerlink::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  peerlink::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  peerlink::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  peerlink::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
