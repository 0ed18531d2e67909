// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>        Data directory (default: ~/.kvmrelay)\n"
      << "  --conf=<file>           JSON config file (default: <datadir>/kvmrelay.json)\n"
      << "  --device=<ip[:port[:name]]>  Relay a device (repeatable, port defaults to 80)\n"
      << "  --threads=<n>           Number of relay IO threads (default: 4)\n"
      << "  --bind=<addr>           Listen address for relay ports (default: 0.0.0.0)\n"
      << "  --tcp-base=<port>       TCP band for port-80 devices (default: 18000)\n"
      << "  --alt-tcp-base=<port>   TCP band for other devices (default: 19000)\n"
      << "  --udp-base=<port>       UDP media band (default: 28000)\n"
      << "  --connect-timeout=<s>   Device connect timeout (default: 5)\n"
      << "\n"
      << "Overlay / directory:\n"
      << "  --overlay-prefix=<p>    Overlay address prefix (default: 10.147.)\n"
      << "  --overlay-ip=<addr>     Use this overlay address instead of discovering it\n"
      << "  --api-url=<url>         Directory service base URL (http://host:port)\n"
      << "  --api-token=<token>     Bearer token for the directory service\n"
      << "  --location=<tag>        Location tag sent with registrations\n"
      << "  --heartbeat=<s>         Heartbeat interval (default: 60)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>      Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                          Default: info\n"
      << "  --debug=<component>     Enable trace logging for specific component(s)\n"
      << "                          Components: network, relay, registry, rpc, app, all\n"
      << "                          Can be comma-separated: --debug=relay,registry\n"
      << "\n"
      << "Other:\n"
      << "  --version               Show version information\n"
      << "  --help                  Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    kvmrelay::app::AppConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;

    switch (kvmrelay::app::ResolveConfig(args, config, error)) {
    case kvmrelay::app::CommandLineAction::SHOW_HELP:
      print_usage(argv[0]);
      return 0;
    case kvmrelay::app::CommandLineAction::SHOW_VERSION:
      std::cout << kvmrelay::GetFullVersionString() << std::endl;
      std::cout << kvmrelay::GetCopyrightString() << std::endl;
      return 0;
    case kvmrelay::app::CommandLineAction::INVALID:
      std::cerr << error << std::endl;
      print_usage(argv[0]);
      return 1;
    case kvmrelay::app::CommandLineAction::RUN:
      break;
    }

    // Initialize logging system (file logging to debug.log)
    if (!kvmrelay::util::ensure_directory(config.datadir)) {
      std::cerr << "Cannot create data directory " << config.datadir
                << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    kvmrelay::util::LogManager::Initialize(config.log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : config.debug_components) {
      if (component == "all") {
        kvmrelay::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        kvmrelay::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        kvmrelay::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    kvmrelay::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      kvmrelay::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      kvmrelay::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    app.wait_for_shutdown();

    kvmrelay::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    kvmrelay::util::LogManager::Shutdown();
    return 1;
  }
}
