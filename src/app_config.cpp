// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app_config.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <charconv>
#include <nlohmann/json.hpp>

namespace kvmrelay {
namespace app {

using json = nlohmann::json;

namespace {

std::optional<uint32_t> ParseNumber(const std::string &s, uint32_t min,
                                    uint32_t max) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() ||
      value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> SplitComma(const std::string &s) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= s.size()) {
    size_t comma = s.find(',', pos);
    std::string item = s.substr(pos, comma == std::string::npos
                                         ? std::string::npos
                                         : comma - pos);
    if (!item.empty()) {
      out.push_back(item);
    }
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }
  return out;
}

// Shared by the file and the flags: one "key" / "value" setting.
// Returns false with `error` set for bad values, nullopt for unknown keys.
std::optional<bool> ApplySetting(const std::string &key,
                                 const std::string &value, AppConfig &config,
                                 std::string &error) {
  auto number = [&](uint32_t min, uint32_t max) -> std::optional<uint32_t> {
    auto n = ParseNumber(value, min, max);
    if (!n) {
      error = "invalid value for " + key + ": '" + value + "'";
    }
    return n;
  };

  if (key == "api-url") {
    config.api_url = value;
    while (!config.api_url.empty() && config.api_url.back() == '/') {
      config.api_url.pop_back();
    }
  } else if (key == "api-token") {
    config.api_token = value;
  } else if (key == "location") {
    config.location = value;
  } else if (key == "overlay-prefix") {
    config.overlay_prefix = value;
  } else if (key == "overlay-ip") {
    config.overlay_ip = value;
  } else if (key == "heartbeat") {
    auto n = number(1, 86400);
    if (!n)
      return false;
    config.heartbeat_interval = std::chrono::seconds(*n);
  } else if (key == "threads") {
    auto n = number(1, 64);
    if (!n)
      return false;
    config.relay_config.io_threads = *n;
  } else if (key == "bind") {
    config.relay_config.bind_address = value;
  } else if (key == "tcp-base") {
    auto n = number(1, 65535);
    if (!n)
      return false;
    config.relay_config.bands.tcp_base = static_cast<uint16_t>(*n);
  } else if (key == "alt-tcp-base") {
    auto n = number(1, 65535);
    if (!n)
      return false;
    config.relay_config.bands.alt_tcp_base = static_cast<uint16_t>(*n);
  } else if (key == "udp-base") {
    auto n = number(1, 65535);
    if (!n)
      return false;
    config.relay_config.bands.udp_base = static_cast<uint16_t>(*n);
  } else if (key == "connect-timeout") {
    auto n = number(1, 300);
    if (!n)
      return false;
    config.relay_config.connect_timeout = std::chrono::seconds(*n);
  } else if (key == "loglevel") {
    config.log_level = value;
  } else if (key == "debug") {
    config.debug_components = SplitComma(value);
  } else {
    return std::nullopt;
  }
  return true;
}

} // namespace

std::optional<DeviceConfig> ParseDeviceSpec(const std::string &spec) {
  DeviceConfig device;

  size_t first = spec.find(':');
  device.ip = spec.substr(0, first);
  if (first != std::string::npos) {
    size_t second = spec.find(':', first + 1);
    std::string port_str = spec.substr(
        first + 1, second == std::string::npos ? std::string::npos
                                               : second - first - 1);
    if (!port_str.empty()) {
      auto port = ParseNumber(port_str, 1, 65535);
      if (!port) {
        return std::nullopt;
      }
      device.port = static_cast<uint16_t>(*port);
    }
    if (second != std::string::npos) {
      device.name = spec.substr(second + 1);
    }
  }

  boost::system::error_code ec;
  boost::asio::ip::make_address_v4(device.ip, ec);
  if (ec) {
    return std::nullopt;
  }
  return device;
}

CommandLineAction ApplyCommandLine(const std::vector<std::string> &args,
                                   AppConfig &config, std::string &error) {
  bool devices_from_flags = false;

  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      return CommandLineAction::SHOW_HELP;
    }
    if (arg == "--version") {
      return CommandLineAction::SHOW_VERSION;
    }
    if (arg.rfind("--", 0) != 0) {
      error = "Unknown option: " + arg;
      return CommandLineAction::INVALID;
    }

    size_t eq = arg.find('=');
    if (eq == std::string::npos) {
      error = "Option needs a value: " + arg;
      return CommandLineAction::INVALID;
    }
    const std::string key = arg.substr(2, eq - 2);
    const std::string value = arg.substr(eq + 1);

    if (key == "datadir") {
      config.datadir = value;
    } else if (key == "conf") {
      config.config_file = value;
    } else if (key == "device") {
      auto device = ParseDeviceSpec(value);
      if (!device) {
        error = "invalid --device '" + value + "' (expected ip[:port[:name]])";
        return CommandLineAction::INVALID;
      }
      // Devices on the command line replace those from the file
      if (!devices_from_flags) {
        config.devices.clear();
        devices_from_flags = true;
      }
      config.devices.push_back(*device);
    } else {
      auto applied = ApplySetting(key, value, config, error);
      if (!applied) {
        error = "Unknown option: " + arg;
        return CommandLineAction::INVALID;
      }
      if (!*applied) {
        return CommandLineAction::INVALID;
      }
    }
  }
  return CommandLineAction::RUN;
}

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }

  json j = json::parse(util::read_file_string(path), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    error = "cannot parse config file " + path.string();
    return false;
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string &key = it.key();

    if (key == "devices") {
      if (!it->is_array()) {
        error = "\"devices\" must be an array";
        return false;
      }
      config.devices.clear();
      for (const auto &d : *it) {
        std::optional<DeviceConfig> device;
        if (d.is_string()) {
          device = ParseDeviceSpec(d.get<std::string>());
        } else if (d.is_object() && d.contains("ip") && d["ip"].is_string()) {
          auto port = d.find("port");
          auto name = d.find("name");
          bool port_ok = port == d.end() || port->is_number_unsigned();
          bool name_ok = name == d.end() || name->is_string();
          if (port_ok && name_ok) {
            std::string spec = d["ip"].get<std::string>() + ":" +
                               (port == d.end() ? "80" : port->dump());
            device = ParseDeviceSpec(spec);
            if (device && name != d.end()) {
              device->name = name->get<std::string>();
            }
          }
        }
        if (!device) {
          error = "invalid device entry: " + d.dump();
          return false;
        }
        config.devices.push_back(*device);
      }
      continue;
    }

    std::string value;
    if (it->is_string()) {
      value = it->get<std::string>();
    } else if (it->is_number_unsigned() || it->is_number_integer()) {
      value = it->dump();
    } else {
      error = "unsupported value for " + key;
      return false;
    }

    auto applied = ApplySetting(key, value, config, error);
    if (!applied) {
      LOG_WARN("ignoring unknown config key '{}' in {}", key, path.string());
      continue;
    }
    if (!*applied) {
      return false;
    }
  }
  return true;
}

CommandLineAction ResolveConfig(const std::vector<std::string> &args,
                                AppConfig &config, std::string &error) {
  // First pass only to find --datadir / --conf
  AppConfig located = config;
  CommandLineAction action = ApplyCommandLine(args, located, error);
  if (action != CommandLineAction::RUN) {
    return action;
  }

  config.datadir = located.datadir;
  config.config_file = located.config_file;
  if (!LoadConfigFile(config.ResolvedConfigFile(), config, error)) {
    return CommandLineAction::INVALID;
  }

  return ApplyCommandLine(args, config, error);
}

} // namespace app
} // namespace kvmrelay
