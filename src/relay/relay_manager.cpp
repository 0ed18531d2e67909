// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/relay_manager.hpp"
#include "network/overlay_identity.hpp"
#include "util/logging.hpp"

namespace kvmrelay {
namespace relay {

RelayManager::RelayManager(network::OverlayIdentity &identity, Config config)
    : identity_(identity), config_(std::move(config)),
      allocator_(config_.bands) {}

RelayManager::~RelayManager() {
  stop_all();
  shutdown_io();
}

void RelayManager::ensure_io_running() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (work_guard_) {
    return;
  }

  if (io_context_.stopped()) {
    io_context_.restart();
  }
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));

  const size_t threads = config_.io_threads == 0 ? 1 : config_.io_threads;
  for (size_t i = 0; i < threads; i++) {
    io_threads_.emplace_back([this]() {
      // Handler exceptions must not take down the pool
      for (;;) {
        try {
          io_context_.run();
          break;
        } catch (const std::exception &e) {
          LOG_RELAY_ERROR("unhandled exception in relay handler: {}",
                          e.what());
        }
      }
    });
  }
  LOG_RELAY_DEBUG("relay I/O started with {} thread(s)", threads);
}

void RelayManager::shutdown_io() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (!work_guard_) {
    return;
  }

  work_guard_.reset();
  io_context_.stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

StartResult RelayManager::start_relay(const std::string &device_ip,
                                      uint16_t device_port,
                                      const std::string &display_name) {
  StartResult result;

  if (device_ip.empty() || device_port == 0) {
    LOG_RELAY_WARN("refusing to relay '{}:{}'", device_ip, device_port);
    result.error = RelayError::INVALID_ARGUMENT;
    return result;
  }

  DeviceKey key{device_ip, device_port};

  std::lock_guard<std::mutex> lock(relays_mutex_);

  auto it = relays_.find(key);
  if (it != relays_.end()) {
    result.tcp_listen_port = it->second.entry->tcp_listen_port();
    result.udp_listen_port = it->second.entry->udp_listen_port();
    LOG_RELAY_DEBUG("{} already relayed on :{}", key.ToString(),
                    result.tcp_listen_port);
    return result;
  }

  ensure_io_running();

  StreamRelay::Config stream_config;
  stream_config.bind_address = config_.bind_address;
  stream_config.connect_timeout = config_.connect_timeout;
  stream_config.first_data_timeout = config_.first_data_timeout;

  MediaRelay::Config media_config;
  media_config.bind_address = config_.bind_address;

  for (const auto &candidate : allocator_.Candidates(device_ip, device_port)) {
    auto entry = std::make_shared<RelayEntry>(device_ip, device_port,
                                              display_name, candidate.tcp_port,
                                              candidate.udp_port);

    auto stream = StreamRelay::create(io_context_, entry, stream_config);
    RelayError err = stream->start();
    if (err == RelayError::INVALID_ARGUMENT) {
      result.error = err;
      return result;
    }
    if (err != RelayError::NONE) {
      LOG_RELAY_DEBUG("{} TCP :{} taken, trying next offset", key.ToString(),
                      candidate.tcp_port);
      continue;
    }

    auto media = MediaRelay::create(io_context_, entry, media_config);
    err = media->start();
    if (err != RelayError::NONE) {
      // Both legs must share one offset; give the TCP port back
      stream->stop();
      if (err == RelayError::INVALID_ARGUMENT) {
        result.error = err;
        return result;
      }
      LOG_RELAY_DEBUG("{} UDP :{} taken, trying next offset", key.ToString(),
                      candidate.udp_port);
      continue;
    }

    entry->set_running(true);
    relays_.emplace(key, ActiveRelay{entry, stream, media});

    result.tcp_listen_port = candidate.tcp_port;
    result.udp_listen_port = candidate.udp_port;

    auto overlay_ip = identity_.get();
    LOG_RELAY_INFO("relay started for {} ({}) at {}:{} udp {}", key.ToString(),
                   display_name.empty() ? "unnamed" : display_name,
                   overlay_ip ? *overlay_ip : "<no overlay>",
                   candidate.tcp_port, candidate.udp_port);
    return result;
  }

  LOG_RELAY_ERROR("{}: no free rendezvous port pair", key.ToString());
  result.error = RelayError::ALLOCATION_FAILED;
  return result;
}

bool RelayManager::stop_relay(const std::string &device_ip,
                              uint16_t device_port) {
  ActiveRelay relay;
  {
    std::lock_guard<std::mutex> lock(relays_mutex_);
    auto it = relays_.find(DeviceKey{device_ip, device_port});
    if (it == relays_.end()) {
      return false;
    }
    relay = std::move(it->second);
    relays_.erase(it);
  }

  relay.entry->set_running(false);
  relay.stream->stop();
  relay.media->stop();
  LOG_RELAY_INFO("relay stopped for {}", relay.entry->key().ToString());
  return true;
}

void RelayManager::stop_all() {
  std::map<DeviceKey, ActiveRelay> relays;
  {
    std::lock_guard<std::mutex> lock(relays_mutex_);
    relays.swap(relays_);
  }

  for (auto &[key, relay] : relays) {
    relay.entry->set_running(false);
    relay.stream->stop();
    relay.media->stop();
  }
  if (!relays.empty()) {
    LOG_RELAY_INFO("stopped {} relay(s)", relays.size());
  }
}

std::vector<RelayInfo> RelayManager::list_relays() const {
  auto overlay_ip = identity_.get();

  std::lock_guard<std::mutex> lock(relays_mutex_);
  std::vector<RelayInfo> out;
  out.reserve(relays_.size());
  for (const auto &[key, relay] : relays_) {
    const RelayEntry &e = *relay.entry;
    RelayInfo info;
    info.device_ip = e.device_ip();
    info.device_port = e.device_port();
    info.display_name = e.display_name();
    info.tcp_listen_port = e.tcp_listen_port();
    info.udp_listen_port = e.udp_listen_port();
    info.udp_target_port = e.udp_target_port();
    info.running = e.running();
    if (overlay_ip) {
      info.access_url =
          "http://" + *overlay_ip + ":" + std::to_string(e.tcp_listen_port());
    }
    out.push_back(std::move(info));
  }
  return out;
}

bool RelayManager::has_running_relays() const {
  std::lock_guard<std::mutex> lock(relays_mutex_);
  for (const auto &[key, relay] : relays_) {
    if (relay.entry->running()) {
      return true;
    }
  }
  return false;
}

size_t RelayManager::relay_count() const {
  std::lock_guard<std::mutex> lock(relays_mutex_);
  return relays_.size();
}

std::shared_ptr<RelayEntry>
RelayManager::find_entry(const std::string &device_ip,
                         uint16_t device_port) const {
  std::lock_guard<std::mutex> lock(relays_mutex_);
  auto it = relays_.find(DeviceKey{device_ip, device_port});
  if (it == relays_.end()) {
    return nullptr;
  }
  return it->second.entry;
}

} // namespace relay
} // namespace kvmrelay
