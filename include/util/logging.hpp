// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_UTIL_LOGGING_HPP
#define KVMRELAY_UTIL_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace kvmrelay {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to per-component loggers throughout the relay.
 *
 * Thread-safety: All methods are thread-safe. Logger access is
 * protected by a mutex; initialization happens once until Shutdown().
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "relay", "registry")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, relay, registry, rpc, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  /**
   * Names of all registered components
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace kvmrelay

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  kvmrelay::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  kvmrelay::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  kvmrelay::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  kvmrelay::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  kvmrelay::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  kvmrelay::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...)                                                   \
  kvmrelay::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...)                                                   \
  kvmrelay::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_INFO(...)                                                    \
  kvmrelay::util::LogManager::GetLogger("relay")->info(__VA_ARGS__)
#define LOG_RELAY_WARN(...)                                                    \
  kvmrelay::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)
#define LOG_RELAY_ERROR(...)                                                   \
  kvmrelay::util::LogManager::GetLogger("relay")->error(__VA_ARGS__)

#define LOG_REG_TRACE(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("registry")->trace(__VA_ARGS__)
#define LOG_REG_DEBUG(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("registry")->debug(__VA_ARGS__)
#define LOG_REG_INFO(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("registry")->info(__VA_ARGS__)
#define LOG_REG_WARN(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("registry")->warn(__VA_ARGS__)
#define LOG_REG_ERROR(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("registry")->error(__VA_ARGS__)

#define LOG_RPC_DEBUG(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  kvmrelay::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  kvmrelay::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#endif // KVMRELAY_UTIL_LOGGING_HPP
