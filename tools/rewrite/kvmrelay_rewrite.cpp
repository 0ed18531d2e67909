// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

// kvmrelay-rewrite - peer-side negotiation rewriter
//
// Reads negotiation messages from stdin, one per line, and writes them to
// stdout with the device's private address replaced by the relay's. Each
// distinct device media port seen in a UDP candidate is reported to the
// relay through its port-learning path.

#include "network/http_client.hpp"
#include "relay/address_rewriter.hpp"
#include "relay/media_port_reporter.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace kvmrelay;

namespace {

enum class InputMode { SIGNALING, SDP, CANDIDATE };

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --relay-ip=<addr> --relay-port=<port> --udp-port=<port> [options]\n"
      << "\n"
      << "Options:\n"
      << "  --device-ip=<addr>   Device private address (default: any private IPv4)\n"
      << "  --mode=<mode>        signaling (JSON per line, default), sdp, candidate\n"
      << "  --no-report          Rewrite only, do not report media ports\n"
      << "  --loglevel=<level>   Log level on stderr (default: warn)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

bool ParsePort(const std::string &s, uint16_t &out) {
  try {
    size_t consumed = 0;
    int port = std::stoi(s, &consumed);
    if (consumed != s.size() || port <= 0 || port > 65535) {
      return false;
    }
    out = static_cast<uint16_t>(port);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  relay::RewriteTarget target;
  uint16_t relay_port = 0;
  InputMode mode = InputMode::SIGNALING;
  bool report = true;
  std::string log_level = "warn";

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << GetFullVersionString() << std::endl;
      return 0;
    } else if (arg.find("--relay-ip=") == 0) {
      target.relay_ip = arg.substr(11);
    } else if (arg.find("--device-ip=") == 0) {
      target.device_ip = arg.substr(12);
    } else if (arg.find("--relay-port=") == 0) {
      if (!ParsePort(arg.substr(13), relay_port)) {
        std::cerr << "invalid --relay-port" << std::endl;
        return 1;
      }
    } else if (arg.find("--udp-port=") == 0) {
      if (!ParsePort(arg.substr(11), target.udp_listen_port)) {
        std::cerr << "invalid --udp-port" << std::endl;
        return 1;
      }
    } else if (arg.find("--mode=") == 0) {
      std::string m = arg.substr(7);
      if (m == "signaling") {
        mode = InputMode::SIGNALING;
      } else if (m == "sdp") {
        mode = InputMode::SDP;
      } else if (m == "candidate") {
        mode = InputMode::CANDIDATE;
      } else {
        std::cerr << "unknown mode: " << m << std::endl;
        return 1;
      }
    } else if (arg == "--no-report") {
      report = false;
    } else if (arg.find("--loglevel=") == 0) {
      log_level = arg.substr(11);
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  if (target.relay_ip.empty() || target.udp_listen_port == 0 ||
      (report && relay_port == 0)) {
    print_usage(argv[0]);
    return 1;
  }

  util::LogManager::Initialize(log_level, false);

  network::BeastHttpClient::Config http_config;
  http_config.timeout = std::chrono::seconds(3);

  // Reports go out on a worker thread; rewritten lines are never held back
  std::unique_ptr<relay::MediaPortReporter> port_reporter;
  relay::AddressRewriter::PortReporter reporter;
  if (report) {
    port_reporter = std::make_unique<relay::MediaPortReporter>(
        std::make_shared<network::BeastHttpClient>(http_config),
        target.relay_ip, relay_port);
    reporter = [&port_reporter](uint16_t port) {
      port_reporter->Report(port);
    };
  }

  relay::AddressRewriter rewriter(target, reporter);

  if (mode == InputMode::SDP) {
    // Whole description on stdin
    std::string sdp((std::istreambuf_iterator<char>(std::cin)),
                    std::istreambuf_iterator<char>());
    std::cout << rewriter.RewriteSdp(sdp) << std::flush;
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (mode == InputMode::CANDIDATE) {
        std::cout << rewriter.RewriteCandidate(line) << "\n";
      } else {
        std::cout << rewriter.RewriteSignalingMessage(line) << "\n";
      }
      std::cout.flush();
    }
  }

  // Give reports still queued at end of input a chance to go out
  if (port_reporter &&
      !port_reporter->Flush(http_config.timeout + std::chrono::seconds(1))) {
    LOG_RELAY_WARN("port reports still pending at exit");
  }
  port_reporter.reset();

  util::LogManager::Shutdown();
  return 0;
}
