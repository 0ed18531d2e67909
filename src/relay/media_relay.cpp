// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/media_relay.hpp"
#include "util/logging.hpp"

namespace kvmrelay {
namespace relay {

using udp = boost::asio::ip::udp;

std::shared_ptr<MediaRelay>
MediaRelay::create(boost::asio::io_context &io_context,
                   std::shared_ptr<RelayEntry> entry, const Config &config) {
  return std::shared_ptr<MediaRelay>(
      new MediaRelay(io_context, std::move(entry), config));
}

MediaRelay::MediaRelay(boost::asio::io_context &io_context,
                       std::shared_ptr<RelayEntry> entry, const Config &config)
    : io_context_(io_context), entry_(std::move(entry)), config_(config),
      strand_(boost::asio::make_strand(io_context)), socket_(strand_) {}

MediaRelay::~MediaRelay() {
  boost::system::error_code ec;
  socket_.close(ec);
}

RelayError MediaRelay::start() {
  if (running_) {
    return RelayError::NONE;
  }

  boost::system::error_code ec;
  auto bind_addr = boost::asio::ip::make_address(config_.bind_address, ec);
  if (ec) {
    LOG_RELAY_ERROR("invalid bind address '{}': {}", config_.bind_address,
                    ec.message());
    return RelayError::INVALID_ARGUMENT;
  }
  device_address_ = boost::asio::ip::make_address(entry_->device_ip(), ec);
  if (ec) {
    LOG_RELAY_ERROR("invalid device address '{}': {}", entry_->device_ip(),
                    ec.message());
    return RelayError::INVALID_ARGUMENT;
  }

  // No SO_REUSEADDR: a second bind on the same port has to fail
  udp::endpoint endpoint(bind_addr, entry_->udp_listen_port());
  socket_.open(endpoint.protocol(), ec);
  if (!ec) {
    socket_.bind(endpoint, ec);
  }
  if (ec) {
    LOG_RELAY_DEBUG("UDP port {} unavailable: {}", entry_->udp_listen_port(),
                    ec.message());
    boost::system::error_code close_ec;
    socket_.close(close_ec);
    return RelayError::PORT_CONFLICT;
  }

  running_ = true;
  start_receive();

  LOG_RELAY_INFO("UDP :{} -> {} (media port not yet known)",
                 entry_->udp_listen_port(), entry_->device_ip());
  return RelayError::NONE;
}

void MediaRelay::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // handle_receive sends and re-arms on strand_
  RunOnStrand(io_context_, strand_, [this]() {
    boost::system::error_code ec;
    socket_.close(ec);
  });
  LOG_RELAY_DEBUG("UDP :{} closed (to device {}, to peer {}, dropped {})",
                  entry_->udp_listen_port(), stats_.forwarded_to_device.load(),
                  stats_.forwarded_to_peer.load(), stats_.dropped.load());
}

std::optional<udp::endpoint> MediaRelay::last_external_sender() const {
  std::lock_guard<std::mutex> lock(sender_mutex_);
  return last_external_;
}

void MediaRelay::start_receive() {
  socket_.async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_,
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  size_t bytes) {
        self->handle_receive(ec, bytes);
      });
}

void MediaRelay::handle_receive(const boost::system::error_code &ec,
                                size_t bytes) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    // ICMP port-unreachable from an earlier send surfaces here; keep going
    LOG_RELAY_TRACE("UDP :{} receive error: {}", entry_->udp_listen_port(),
                    ec.message());
    start_receive();
    return;
  }

  auto target_port = entry_->udp_target_port();
  if (!target_port) {
    stats_.dropped++;
    start_receive();
    return;
  }

  const bool from_device =
      sender_.address() == device_address_ && sender_.port() == *target_port;

  if (from_device) {
    std::optional<udp::endpoint> peer = last_external_sender();
    if (peer) {
      forward(*peer, bytes);
      stats_.forwarded_to_peer++;
    } else {
      stats_.dropped++;
    }
  } else {
    {
      std::lock_guard<std::mutex> lock(sender_mutex_);
      if (!last_external_ || *last_external_ != sender_) {
        LOG_RELAY_DEBUG("UDP :{} external sender now {}:{}",
                        entry_->udp_listen_port(),
                        sender_.address().to_string(), sender_.port());
      }
      last_external_ = sender_;
    }
    forward(udp::endpoint(device_address_, *target_port), bytes);
    stats_.forwarded_to_device++;
  }

  if (running_) {
    start_receive();
  }
}

void MediaRelay::forward(const udp::endpoint &to, size_t bytes) {
  boost::system::error_code ec;
  socket_.send_to(boost::asio::buffer(recv_buffer_.data(), bytes), to, 0, ec);
  if (ec) {
    LOG_RELAY_TRACE("UDP :{} send to {}:{} failed: {}",
                    entry_->udp_listen_port(), to.address().to_string(),
                    to.port(), ec.message());
  }
}

} // namespace relay
} // namespace kvmrelay
