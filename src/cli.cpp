// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/rpc_client.hpp"
#include "util/files.hpp"
#include "version.hpp"
#include <iostream>
#include <string>
#include <vector>

using kvmrelay::rpc::RPCClient;
using kvmrelay::rpc::RPCError;
using json = nlohmann::json;

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [--datadir=<path>] <command> [params]\n"
      << "\n"
      << "Commands:\n"
      << "  startrelay <ip> [port] [name]  Relay a device (port defaults to 80)\n"
      << "  stoprelay <ip> [port]          Stop relaying a device\n"
      << "  listrelays                     Show running relays\n"
      << "  register                       Re-announce relays to the directory\n"
      << "  getinfo                        Show overlay address and relay count\n"
      << "  stop                           Stop kvmrelayd\n"
      << std::endl;
}

uint16_t ParseDevicePort(const std::vector<std::string> &params, size_t index) {
  if (params.size() <= index) {
    return 80;
  }
  try {
    size_t consumed = 0;
    int port = std::stoi(params[index], &consumed);
    if (consumed == params[index].size() && port > 0 && port <= 65535) {
      return static_cast<uint16_t>(port);
    }
  } catch (const std::exception &) {
  }
  throw RPCError("invalid port: " + params[index]);
}

void PrintRelays(const json &relays) {
  if (relays.empty()) {
    std::cout << "no relays running" << std::endl;
    return;
  }
  for (const auto &r : relays) {
    std::cout << r.value("device_ip", "") << ":" << r.value("device_port", 0)
              << "  tcp " << r.value("relay_port", 0) << "  udp "
              << r.value("udp_relay_port", 0) << "  media "
              << (r["media_port"].is_null() ? std::string("-")
                                            : r["media_port"].dump());
    const std::string name = r.value("name", "");
    if (!name.empty()) {
      std::cout << "  " << name;
    }
    const std::string url = r.value("url", "");
    if (!url.empty()) {
      std::cout << "  " << url;
    }
    std::cout << std::endl;
  }
}

int Run(const RPCClient &client, const std::string &command,
        const std::vector<std::string> &params) {
  if (command == "startrelay") {
    if (params.empty()) {
      throw RPCError("startrelay needs a device address");
    }
    json started = client.StartRelay(params[0], ParseDevicePort(params, 1),
                                     params.size() > 2 ? params[2] : "");
    std::cout << started.dump(2) << std::endl;
  } else if (command == "stoprelay") {
    if (params.empty()) {
      throw RPCError("stoprelay needs a device address");
    }
    bool stopped = client.StopRelay(params[0], ParseDevicePort(params, 1));
    std::cout << (stopped ? "stopped" : "no such relay") << std::endl;
  } else if (command == "listrelays") {
    PrintRelays(client.ListRelays());
  } else if (command == "register") {
    json reply = client.Register();
    std::cout << reply.value("result", "") << std::endl;
    return reply.value("ok", false) ? 0 : 1;
  } else if (command == "getinfo") {
    std::cout << client.GetInfo().dump(2) << std::endl;
  } else if (command == "stop") {
    client.Stop();
    std::cout << "kvmrelay stopping" << std::endl;
  } else {
    std::cerr << "unknown command: " << command << std::endl;
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::filesystem::path datadir = kvmrelay::util::get_default_datadir();
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << kvmrelay::GetFullVersionString() << std::endl;
      return 0;
    } else if (arg.find("--datadir=") == 0) {
      datadir = arg.substr(10);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  RPCClient client((datadir / "relay.sock").string());
  try {
    return Run(client, positional[0],
               std::vector<std::string>(positional.begin() + 1,
                                        positional.end()));
  } catch (const RPCError &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }
}
