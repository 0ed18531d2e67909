// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace kvmrelay {
namespace util {

namespace {
std::mutex s_mutex;
bool s_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

const std::vector<std::string> kComponents = {"default", "network", "relay",
                                              "registry", "rpc",     "app"};

void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (s_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink (append mode)
    if (log_to_file) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      // Console sink; stdout stays free for tool output
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    for (const auto &component : kComponents) {
      // Drop any logger left over from a previous session
      spdlog::drop(component);
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::debug);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized = true;

    s_loggers["default"]->info("Logging system initialized (level: {})",
                               log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}
} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(s_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  s_loggers["default"]->info("Shutting down logging system");

  spdlog::shutdown();
  s_loggers.clear();
  s_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    // Auto-initialize with defaults if not initialized
    InitializeLocked("info", false, "");
  }

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Return default logger if component not found
  auto def = s_loggers.find("default");
  if (def != s_loggers.end()) {
    return def->second;
  }
  return spdlog::default_logger();
}

void LogManager::SetLogLevel(const std::string &level) {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized) {
      return;
    }

    auto log_level = spdlog::level::from_str(level);
    for (auto &[name, logger] : s_loggers) {
      logger->set_level(log_level);
    }
  }

  LOG_INFO("Log level changed to: {}", level);
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized) {
      return;
    }

    auto it = s_loggers.find(component);
    if (it != s_loggers.end()) {
      it->second->set_level(spdlog::level::from_str(level));
      found = true;
    }
  }

  if (found) {
    LOG_INFO("Component '{}' log level set to: {}", component, level);
  } else {
    LOG_WARN("Unknown log component: {}", component);
  }
}

const std::vector<std::string> &LogManager::Components() { return kComponents; }

} // namespace util
} // namespace kvmrelay
