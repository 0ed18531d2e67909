#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <future>
#include <optional>
#include <string>

namespace kvmrelay {
namespace relay {

/**
 * Error taxonomy for the relay subsystem
 *
 * Only ALLOCATION_FAILED and INVALID_ARGUMENT are ever returned to a caller;
 * the rest are absorbed where they happen and show up in logs only.
 */
enum class RelayError {
  NONE,
  PORT_CONFLICT,                // bind failed on one candidate (retried)
  ALLOCATION_FAILED,            // every candidate failed
  UPSTREAM_CONNECT_FAILED,      // device unreachable for one connection
  REGISTRATION_FAILED,          // directory service rejected/unreachable
  HEARTBEAT_FAILED,             // directory service rejected/unreachable
  OVERLAY_IDENTITY_UNAVAILABLE, // no overlay address on this host
  INVALID_ARGUMENT              // malformed start request
};

const char *RelayErrorString(RelayError error);

using IoStrand = boost::asio::strand<boost::asio::io_context::executor_type>;

// Run fn on strand and block until it has run. Runs inline when the caller
// is already on the strand or the io_context has stopped.
template <typename Fn>
void RunOnStrand(boost::asio::io_context &io_context, const IoStrand &strand,
                 Fn fn) {
  if (strand.running_in_this_thread() || io_context.stopped()) {
    fn();
    return;
  }
  std::promise<void> done;
  auto finished = done.get_future();
  boost::asio::post(strand, [&fn, &done]() {
    fn();
    done.set_value();
  });
  finished.wait();
}

// Key of the relay table: (device_ip, device_port)
struct DeviceKey {
  std::string ip;
  uint16_t port{0};

  bool operator<(const DeviceKey &other) const {
    if (ip != other.ip)
      return ip < other.ip;
    return port < other.port;
  }
  bool operator==(const DeviceKey &other) const {
    return ip == other.ip && port == other.port;
  }

  std::string ToString() const { return ip + ":" + std::to_string(port); }
};

/**
 * RelayEntry - state of one relayed device
 *
 * Everything except udp_target_port is fixed at construction. The stream
 * and media relays share the entry (never copy it) so the media hot path
 * always sees the latest learned port.
 */
class RelayEntry {
public:
  RelayEntry(std::string device_ip, uint16_t device_port,
             std::string display_name, uint16_t tcp_listen_port,
             uint16_t udp_listen_port)
      : key_{std::move(device_ip), device_port},
        display_name_(std::move(display_name)),
        tcp_listen_port_(tcp_listen_port), udp_listen_port_(udp_listen_port) {}

  RelayEntry(const RelayEntry &) = delete;
  RelayEntry &operator=(const RelayEntry &) = delete;

  const DeviceKey &key() const { return key_; }
  const std::string &device_ip() const { return key_.ip; }
  uint16_t device_port() const { return key_.port; }
  const std::string &display_name() const { return display_name_; }
  uint16_t tcp_listen_port() const { return tcp_listen_port_; }
  uint16_t udp_listen_port() const { return udp_listen_port_; }

  // Learned media port of the device; nullopt until the first report
  std::optional<uint16_t> udp_target_port() const {
    uint16_t port = udp_target_port_.load(std::memory_order_acquire);
    if (port == 0)
      return std::nullopt;
    return port;
  }

  // Last write wins. Port 0 is rejected so a known port is never cleared.
  bool set_udp_target_port(uint16_t port) {
    if (port == 0)
      return false;
    udp_target_port_.store(port, std::memory_order_release);
    return true;
  }

  bool running() const { return running_.load(); }
  void set_running(bool running) { running_.store(running); }

private:
  const DeviceKey key_;
  const std::string display_name_;
  const uint16_t tcp_listen_port_;
  const uint16_t udp_listen_port_;

  std::atomic<uint16_t> udp_target_port_{0};
  std::atomic<bool> running_{false};
};

/**
 * RelayInfo - read-only projection of an entry for display/diagnostics
 */
struct RelayInfo {
  std::string device_ip;
  uint16_t device_port{0};
  std::string display_name;
  uint16_t tcp_listen_port{0};
  uint16_t udp_listen_port{0};
  std::optional<uint16_t> udp_target_port;
  bool running{false};
  std::string access_url; // empty without an overlay identity
};

/**
 * Result of RelayManager::start_relay
 */
struct StartResult {
  RelayError error{RelayError::NONE};
  uint16_t tcp_listen_port{0};
  uint16_t udp_listen_port{0};

  bool ok() const { return error == RelayError::NONE; }
};

} // namespace relay
} // namespace kvmrelay
