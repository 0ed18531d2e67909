// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_APPLICATION_HPP
#define KVMRELAY_APPLICATION_HPP

#include "app_config.hpp"
#include "network/http_client.hpp"
#include "network/overlay_identity.hpp"
#include "registry/registry_client.hpp"
#include "relay/relay_manager.hpp"
#include "rpc/rpc_server.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <memory>

namespace kvmrelay {
namespace app {

/**
 * Application - the relay daemon
 *
 * Startup order: data directory lock, overlay identity, relay manager,
 * registry client, control socket. Configured devices are relayed and
 * registered once on start; the heartbeat then runs until shutdown.
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();

  // Stops everything start() brought up and releases the data directory,
  // also after a failed start()
  void stop();

  // Block until SIGINT/SIGTERM or the "stop" command
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  // Announce every running relay to the directory service
  relay::RelayError register_relays();

  relay::RelayManager &relay_manager() { return *relay_manager_; }
  network::OverlayIdentity &identity() { return *identity_; }

  static Application *instance();

private:
  bool init_datadir();
  void start_configured_relays();
  void shutdown();
  void stop_services();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;
  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<network::OverlayIdentity> identity_;
  std::unique_ptr<relay::RelayManager> relay_manager_;
  std::shared_ptr<network::HttpClient> http_client_;
  std::unique_ptr<registry::RegistryClient> registry_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  static Application *instance_;
};

} // namespace app
} // namespace kvmrelay

#endif // KVMRELAY_APPLICATION_HPP
