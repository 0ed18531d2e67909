// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include "relay/media_relay.hpp"
#include "relay/port_allocator.hpp"
#include "relay/relay_types.hpp"
#include "relay/stream_relay.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kvmrelay {
namespace network {
class OverlayIdentity;
}

namespace relay {

/**
 * RelayManager - owns every relay on this host
 *
 * One entry per (device_ip, device_port). Starting a relay walks the port
 * ladder from the PortAllocator and binds a TCP/UDP pair at each offset
 * until both legs succeed.
 *
 * The manager also owns the io_context and its thread pool; threads are
 * started with the first relay and joined in the destructor.
 *
 * Thread-safety: all public methods may be called from any thread. The
 * table mutex is never held by relay I/O handlers.
 */
class RelayManager {
public:
  struct Config {
    PortBands bands;
    std::string bind_address;
    size_t io_threads;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds first_data_timeout;

    Config()
        : bind_address("0.0.0.0"), io_threads(4),
          connect_timeout(std::chrono::seconds(5)),
          first_data_timeout(std::chrono::seconds(10)) {}
  };

  RelayManager(network::OverlayIdentity &identity, Config config = Config{});
  ~RelayManager();

  RelayManager(const RelayManager &) = delete;
  RelayManager &operator=(const RelayManager &) = delete;

  // Idempotent: a running key returns its existing ports
  StartResult start_relay(const std::string &device_ip, uint16_t device_port,
                          const std::string &display_name);

  // Unknown keys are ignored. Returns true if a relay was removed.
  bool stop_relay(const std::string &device_ip, uint16_t device_port);

  void stop_all();

  std::vector<RelayInfo> list_relays() const;
  bool has_running_relays() const;
  size_t relay_count() const;

  // Shared handle to a live entry (nullptr if unknown)
  std::shared_ptr<RelayEntry> find_entry(const std::string &device_ip,
                                         uint16_t device_port) const;

  const PortAllocator &allocator() const { return allocator_; }

private:
  struct ActiveRelay {
    std::shared_ptr<RelayEntry> entry;
    std::shared_ptr<StreamRelay> stream;
    std::shared_ptr<MediaRelay> media;
  };

  void ensure_io_running();
  void shutdown_io();

  network::OverlayIdentity &identity_;
  Config config_;
  PortAllocator allocator_;

  mutable std::mutex relays_mutex_;
  std::map<DeviceKey, ActiveRelay> relays_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::mutex io_mutex_;
};

} // namespace relay
} // namespace kvmrelay
