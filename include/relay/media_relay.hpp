#pragma once

/*
 MediaRelay - UDP forwarder for one relayed device

 One socket bound to entry->udp_listen_port. For every datagram:
   - from the device (device_ip:udp_target_port)  -> last external sender
   - from anyone else                             -> device_ip:udp_target_port

 Datagrams are dropped, never queued, while the target port is unknown or
 no external sender has been seen yet. Only the most recent external
 sender receives device traffic.

 Receive handlers run on the relay's own strand; stop() closes the socket
 there and returns once it is closed.
*/

#include "relay/relay_types.hpp"
#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kvmrelay {
namespace relay {

class MediaRelay : public std::enable_shared_from_this<MediaRelay> {
public:
  struct Config {
    std::string bind_address;

    Config() : bind_address("0.0.0.0") {}
  };

  struct Stats {
    std::atomic<uint64_t> forwarded_to_device{0};
    std::atomic<uint64_t> forwarded_to_peer{0};
    std::atomic<uint64_t> dropped{0};
  };

  static std::shared_ptr<MediaRelay> create(boost::asio::io_context &io_context,
                                            std::shared_ptr<RelayEntry> entry,
                                            const Config &config = Config{});

  ~MediaRelay();

  // Bind entry->udp_listen_port. PORT_CONFLICT if it is taken.
  RelayError start();
  void stop();

  bool is_running() const { return running_; }
  const RelayEntry &entry() const { return *entry_; }
  const Stats &stats() const { return stats_; }

  std::optional<boost::asio::ip::udp::endpoint> last_external_sender() const;

private:
  MediaRelay(boost::asio::io_context &io_context,
             std::shared_ptr<RelayEntry> entry, const Config &config);

  void start_receive();
  void handle_receive(const boost::system::error_code &ec, size_t bytes);
  void forward(const boost::asio::ip::udp::endpoint &to, size_t bytes);

  boost::asio::io_context &io_context_;
  std::shared_ptr<RelayEntry> entry_;
  Config config_;
  Stats stats_;

  IoStrand strand_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::ip::address device_address_;
  std::atomic<bool> running_{false};

  // Receive state: only one receive is ever outstanding
  std::array<char, 65536> recv_buffer_;
  boost::asio::ip::udp::endpoint sender_;

  mutable std::mutex sender_mutex_;
  std::optional<boost::asio::ip::udp::endpoint> last_external_;
};

} // namespace relay
} // namespace kvmrelay
