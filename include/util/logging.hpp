// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace netsession {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "network", "session", "match", "app").
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
                         const std::string &log_file_path = "netsession.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "session", "match")
   *
   * Auto-initializes if not initialized. Unknown names get the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, session, match, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace netsession

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  netsession::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  netsession::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  netsession::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  netsession::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  netsession::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  netsession::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  netsession::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  netsession::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  netsession::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  netsession::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SESSION_TRACE(...)                                                 \
  netsession::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...)                                                 \
  netsession::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...)                                                  \
  netsession::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...)                                                  \
  netsession::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)

#define LOG_MATCH_TRACE(...)                                                   \
  netsession::util::LogManager::GetLogger("match")->trace(__VA_ARGS__)
#define LOG_MATCH_DEBUG(...)                                                   \
  netsession::util::LogManager::GetLogger("match")->debug(__VA_ARGS__)
#define LOG_MATCH_WARN(...)                                                    \
  netsession::util::LogManager::GetLogger("match")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  netsession::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  netsession::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
