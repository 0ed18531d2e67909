// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream> // Keep for signal handler and banner
#include <thread>

namespace kvmrelay {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_INFO("Initializing kvmrelay...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  identity_ = std::make_unique<network::OverlayIdentity>(config_.overlay_prefix);
  if (!config_.overlay_ip.empty()) {
    identity_->set_override(config_.overlay_ip);
  }
  auto overlay_ip = identity_->get();

  // Print startup banner (std::cout for immediate visibility)
  std::cout << GetStartupBanner(overlay_ip ? *overlay_ip : "") << std::flush;
  if (!overlay_ip) {
    LOG_WARN("No interface address matches overlay prefix {}; relays will "
             "run but will not be registered",
             config_.overlay_prefix);
  }

  relay_manager_ =
      std::make_unique<relay::RelayManager>(*identity_, config_.relay_config);

  network::BeastHttpClient::Config http_config;
  http_config.bearer_token = config_.api_token;
  http_client_ = std::make_shared<network::BeastHttpClient>(http_config);

  registry::RegistryClient::Config registry_config;
  registry_config.api_url = config_.api_url;
  registry_ =
      std::make_unique<registry::RegistryClient>(registry_config, http_client_);

  std::string socket_path = (config_.datadir / "relay.sock").string();
  rpc_server_ = std::make_unique<rpc::RPCServer>(
      socket_path, *relay_manager_, *identity_,
      [this]() { return register_relays(); },
      [this]() { request_shutdown(); });

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting kvmrelay...");

  setup_signal_handlers();

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    return false;
  }

  running_ = true;

  start_configured_relays();

  relay::RelayError err = register_relays();
  if (err != relay::RelayError::NONE) {
    LOG_WARN("Initial registration: {}", relay::RelayErrorString(err));
  }

  if (!config_.api_url.empty()) {
    registry_->StartHeartbeat(
        config_.heartbeat_interval,
        [this]() { return relay_manager_->has_running_relays(); },
        [this]() { return identity_->get(); });
  } else {
    LOG_INFO("No --api-url given; directory registration disabled");
  }

  LOG_INFO("kvmrelay started with {} relay(s)", relay_manager_->relay_count());
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::start_configured_relays() {
  for (const auto &device : config_.devices) {
    auto result =
        relay_manager_->start_relay(device.ip, device.port, device.name);
    if (!result.ok()) {
      LOG_ERROR("Cannot relay {}:{}: {}", device.ip, device.port,
                relay::RelayErrorString(result.error));
    }
  }
}

relay::RelayError Application::register_relays() {
  if (!registry_ || !relay_manager_) {
    return relay::RelayError::NONE;
  }
  // Interfaces may have come up since startup
  auto overlay_ip = identity_->get();
  if (!overlay_ip) {
    overlay_ip = identity_->refresh();
  }
  return registry_->Register(relay_manager_->list_relays(), overlay_ip,
                             config_.location);
}

void Application::stop() { shutdown(); }

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (running_.exchange(false)) {
    stop_services();
  }

  if (datadir_lock_) {
    datadir_lock_.reset();
    LOG_DEBUG("Released data directory lock");
  }
}

void Application::stop_services() {
  LOG_INFO("Shutting down kvmrelay...");

  if (registry_) {
    registry_->StopHeartbeat();
  }

  // Stop accepting commands before tearing down the relays they act on
  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  if (relay_manager_) {
    LOG_INFO("Stopping relays...");
    relay_manager_->stop_all();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // One daemon per data directory: both would want the same ports
  auto lock = std::make_unique<util::DirectoryLock>(config_.datadir);
  util::LockResult lock_result = lock->Acquire();
  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }
  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "kvmrelayd is probably already running.",
              config_.datadir.string());
    return false;
  }

  datadir_lock_ = std::move(lock);
  LOG_DEBUG("Successfully locked data directory");
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace kvmrelay
