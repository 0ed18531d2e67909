#pragma once

/*
 StreamRelay - TCP rendezvous listener for one relayed device

 Each inbound connection becomes a session:
   1. Read the request line (bounded by control::MAX_REQUEST_LINE).
   2. Port-learning requests are answered locally and update the entry's
      udp_target_port. They never reach the device.
   3. Anything else is opaque: connect to device_ip:device_port, replay the
      bytes already read, then splice both directions until EOF.

 Half-close: when one side finishes sending, the relay shuts down the write
 direction of the other socket so data already in flight still arrives.
 Both sockets are closed once both directions have drained.

 Threading
 - Sessions run on a strand of the shared io_context, so their handlers
   never overlap.
 - Accept handlers run on the relay's own strand. stop() closes the
   listening socket on that strand and returns once it is closed; live
   sessions keep draining.
*/

#include "relay/relay_types.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace kvmrelay {
namespace relay {

class StreamRelay : public std::enable_shared_from_this<StreamRelay> {
public:
  struct Config {
    std::string bind_address;
    std::chrono::milliseconds connect_timeout; // outbound connect to the device
    std::chrono::milliseconds first_data_timeout; // wait for a request line

    Config()
        : bind_address("0.0.0.0"), connect_timeout(std::chrono::seconds(5)),
          first_data_timeout(std::chrono::seconds(10)) {}
  };

  // Counters are informational only
  struct Stats {
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> control_requests{0};
    std::atomic<uint64_t> relayed{0};
    std::atomic<uint64_t> upstream_failures{0};
    std::atomic<uint64_t> active_sessions{0};
  };

  static std::shared_ptr<StreamRelay> create(boost::asio::io_context &io_context,
                                             std::shared_ptr<RelayEntry> entry,
                                             const Config &config = Config{});

  ~StreamRelay();

  // Bind entry->tcp_listen_port and begin accepting.
  // Returns PORT_CONFLICT if the port cannot be bound.
  RelayError start();

  // Close the listening socket and wait until it is closed. In-flight
  // sessions are left to drain. Must not be called from a session handler.
  void stop();

  bool is_listening() const { return listening_; }
  const RelayEntry &entry() const { return *entry_; }
  const Stats &stats() const { return *stats_; }

private:
  StreamRelay(boost::asio::io_context &io_context,
              std::shared_ptr<RelayEntry> entry, const Config &config);

  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  std::shared_ptr<RelayEntry> entry_;
  Config config_;
  std::shared_ptr<Stats> stats_;

  IoStrand strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> listening_{false};
};

} // namespace relay
} // namespace kvmrelay
