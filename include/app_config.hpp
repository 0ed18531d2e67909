// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_APP_CONFIG_HPP
#define KVMRELAY_APP_CONFIG_HPP

#include "relay/relay_manager.hpp"
#include "util/files.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kvmrelay {
namespace app {

// A device to relay at startup
struct DeviceConfig {
  std::string ip;
  uint16_t port{80};
  std::string name;
};

/**
 * Daemon configuration
 *
 * Built from an optional JSON file (<datadir>/kvmrelay.json or --conf)
 * with command-line flags applied on top.
 */
struct AppConfig {
  std::filesystem::path datadir = util::get_default_datadir();
  std::filesystem::path config_file; // empty: <datadir>/kvmrelay.json

  std::vector<DeviceConfig> devices;

  // Directory service
  std::string api_url;
  std::string api_token;
  std::string location;
  std::chrono::seconds heartbeat_interval{60};

  // Overlay identity
  std::string overlay_prefix{"10.147."};
  std::string overlay_ip; // pins the identity when set

  relay::RelayManager::Config relay_config;

  // Logging
  std::string log_level{"info"};
  std::vector<std::string> debug_components;

  std::filesystem::path ResolvedConfigFile() const {
    return config_file.empty() ? datadir / "kvmrelay.json" : config_file;
  }
};

enum class CommandLineAction { RUN, SHOW_HELP, SHOW_VERSION, INVALID };

/**
 * Parse "ip[:port[:name]]"; port defaults to 80
 */
std::optional<DeviceConfig> ParseDeviceSpec(const std::string &spec);

/**
 * Apply command-line flags (argv[1..]) to config
 * @param error Set when INVALID is returned
 */
CommandLineAction ApplyCommandLine(const std::vector<std::string> &args,
                                   AppConfig &config, std::string &error);

/**
 * Apply a JSON config file to config
 * @return false if the file exists but cannot be parsed; a missing file is
 *         not an error
 */
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error);

/**
 * Full resolution: flags locate the file, the file is applied, then flags
 * are applied again so they win.
 */
CommandLineAction ResolveConfig(const std::vector<std::string> &args,
                                AppConfig &config, std::string &error);

} // namespace app
} // namespace kvmrelay

#endif // KVMRELAY_APP_CONFIG_HPP
