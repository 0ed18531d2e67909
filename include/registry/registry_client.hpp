// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include "network/http_client.hpp"
#include "relay/relay_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kvmrelay {
namespace registry {

/**
 * RegistryClient - announces running relays to the directory service
 *
 * Registration is a one-shot POST of every live relay. The heartbeat is a
 * background thread that posts this host's overlay address on a fixed
 * interval while at least one relay runs. Directory failures are logged
 * and never stop anything.
 */
class RegistryClient {
public:
  struct Config {
    std::string api_url; // e.g. "http://directory.example:8080"; empty disables
    std::string register_path;
    std::string heartbeat_path;

    Config()
        : register_path("/api/kvm/register"),
          heartbeat_path("/api/kvm/heartbeat") {}
  };

  using RunningProbe = std::function<bool()>;
  using IdentityProbe = std::function<std::optional<std::string>()>;

  RegistryClient(Config config, std::shared_ptr<network::HttpClient> http);
  ~RegistryClient();

  RegistryClient(const RegistryClient &) = delete;
  RegistryClient &operator=(const RegistryClient &) = delete;

  // POST a registration record. Zero entries means no request at all.
  relay::RelayError Register(const std::vector<relay::RelayInfo> &entries,
                             const std::optional<std::string> &overlay_ip,
                             const std::string &location);

  relay::RelayError SendHeartbeat(const std::string &overlay_ip);

  // Beat once immediately, then every `interval`. Returns false if the
  // loop is already running.
  bool StartHeartbeat(std::chrono::milliseconds interval,
                      RunningProbe any_running, IdentityProbe overlay_ip);
  void StopHeartbeat();
  bool IsHeartbeatRunning() const { return heartbeat_running_; }

  uint64_t registrations_sent() const { return registrations_sent_; }
  uint64_t heartbeats_sent() const { return heartbeats_sent_; }
  uint64_t heartbeat_failures() const { return heartbeat_failures_; }

  // Record builders, exposed for tests
  static nlohmann::json
  BuildRegistration(const std::vector<relay::RelayInfo> &entries,
                    const std::string &overlay_ip, const std::string &location);
  static nlohmann::json BuildHeartbeat(const std::string &overlay_ip);

  // "KVM-<last octet>" for devices registered without a name
  static std::string DefaultDisplayName(const std::string &device_ip);

private:
  void HeartbeatLoop(std::chrono::milliseconds interval,
                     RunningProbe any_running, IdentityProbe overlay_ip);

  Config config_;
  std::shared_ptr<network::HttpClient> http_;

  std::atomic<uint64_t> registrations_sent_{0};
  std::atomic<uint64_t> heartbeats_sent_{0};
  std::atomic<uint64_t> heartbeat_failures_{0};

  std::atomic<bool> heartbeat_running_{false};
  std::thread heartbeat_thread_;
  std::mutex heartbeat_mutex_;
  std::condition_variable heartbeat_cv_;
};

} // namespace registry
} // namespace kvmrelay
