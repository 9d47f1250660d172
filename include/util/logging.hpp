// Copyright (c) 2025 The Unicity Foundation
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
 * for the session engine ("session", "codec", "transport", "network").
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
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Only the first call
   * performs initialization.
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
   * @param name Component name (session, codec, transport, network, default)
   *
   * Auto-initializes if not initialized. Unknown components map to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a single component
   * Returns false if the component is unknown or logging is not initialized
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  /**
   * Names of the component loggers created by Initialize()
   */
  static std::vector<std::string> Components();
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
#define LOG_SESSION_TRACE(...)                                                 \
  peerlink::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...)                                                 \
  peerlink::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...)                                                  \
  peerlink::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...)                                                  \
  peerlink::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)
#define LOG_SESSION_ERROR(...)                                                 \
  peerlink::util::LogManager::GetLogger("session")->error(__VA_ARGS__)

#define LOG_CODEC_TRACE(...)                                                   \
  peerlink::util::LogManager::GetLogger("codec")->trace(__VA_ARGS__)
#define LOG_CODEC_DEBUG(...)                                                   \
  peerlink::util::LogManager::GetLogger("codec")->debug(__VA_ARGS__)
#define LOG_CODEC_WARN(...)                                                    \
  peerlink::util::LogManager::GetLogger("codec")->warn(__VA_ARGS__)
#define LOG_CODEC_ERROR(...)                                                   \
  peerlink::util::LogManager::GetLogger("codec")->error(__VA_ARGS__)

#define LOG_TRANSPORT_TRACE(...)                                               \
  peerlink::util::LogManager::GetLogger("transport")->trace(__VA_ARGS__)
#define LOG_TRANSPORT_DEBUG(...)                                               \
  peerlink::util::LogManager::GetLogger("transport")->debug(__VA_ARGS__)
#define LOG_TRANSPORT_WARN(...)                                                \
  peerlink::util::LogManager::GetLogger("transport")->warn(__VA_ARGS__)
#define LOG_TRANSPORT_ERROR(...)                                               \
  peerlink::util::LogManager::GetLogger("transport")->error(__VA_ARGS__)

#define LOG_NETWORK_TRACE(...)                                                 \
  peerlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NETWORK_DEBUG(...)                                                 \
  peerlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NETWORK_INFO(...)                                                  \
  peerlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NETWORK_WARN(...)                                                  \
  peerlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
