// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/stream_relay.hpp"
#include "relay/control_channel.hpp"
#include "util/logging.hpp"
#include <array>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <vector>

namespace kvmrelay {
namespace relay {

namespace {

using tcp = boost::asio::ip::tcp;

constexpr size_t RELAY_BUFFER_SIZE = 64 * 1024;
constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(2);

// ============================================================================
// RelaySession
// ============================================================================

class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
  RelaySession(tcp::socket inbound, std::shared_ptr<RelayEntry> entry,
               std::shared_ptr<StreamRelay::Stats> stats,
               const StreamRelay::Config &config)
      : inbound_(std::move(inbound)), upstream_(inbound_.get_executor()),
        timer_(inbound_.get_executor()), entry_(std::move(entry)),
        stats_(std::move(stats)), config_(config),
        client_buf_(RELAY_BUFFER_SIZE), upstream_buf_(RELAY_BUFFER_SIZE) {
    stats_->active_sessions++;
  }

  ~RelaySession() { stats_->active_sessions--; }

  void start() {
    boost::system::error_code ec;
    inbound_.set_option(tcp::no_delay(true), ec);

    auto ep = inbound_.remote_endpoint(ec);
    if (!ec) {
      peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    timer_.expires_after(config_.first_data_timeout);
    timer_.async_wait([self = shared_from_this()](
                          const boost::system::error_code &ec) {
      if (ec || self->decided_) {
        return;
      }
      // Nothing recognizable arrived in time; treat the stream as opaque
      LOG_RELAY_TRACE("{} no request line from {} yet, relaying as opaque",
                      self->entry_->key().ToString(), self->peer_);
      self->go_opaque();
      boost::system::error_code cancel_ec;
      self->inbound_.cancel(cancel_ec);
    });

    read_head();
  }

private:
  void read_head() {
    inbound_.async_read_some(
        boost::asio::buffer(head_buf_),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    size_t n) {
          if (self->decided_) {
            // The timeout fired first; keep whatever arrived for the replay
            if (!ec && n > 0) {
              self->head_.append(self->head_buf_.data(), n);
            }
            return;
          }

          if (ec) {
            if (ec == boost::asio::error::eof && !self->head_.empty()) {
              self->go_opaque();
            } else {
              self->close_all();
            }
            return;
          }

          self->head_.append(self->head_buf_.data(), n);
          self->dispatch_head();
        });
  }

  void dispatch_head() {
    auto c = control::ClassifyRequestHead(head_);

    switch (c.kind) {
    case control::RequestKind::INCOMPLETE:
      read_head();
      return;

    case control::RequestKind::OPAQUE:
      go_opaque();
      return;

    case control::RequestKind::SET_MEDIA_PORT: {
      auto previous = entry_->udp_target_port();
      entry_->set_udp_target_port(c.port);
      stats_->control_requests++;
      if (!previous || *previous != c.port) {
        LOG_RELAY_INFO("{} media target port set to {} (reported by {})",
                       entry_->key().ToString(), c.port, peer_);
      }
      reply_locally(control::OkResponse());
      return;
    }

    case control::RequestKind::BAD_REQUEST:
      stats_->control_requests++;
      LOG_RELAY_WARN("{} malformed port report from {}",
                     entry_->key().ToString(), peer_);
      reply_locally(control::BadRequestResponse());
      return;

    case control::RequestKind::PREFLIGHT:
      stats_->control_requests++;
      reply_locally(control::PreflightResponse());
      return;
    }
  }

  // Answer a control request ourselves, then drain what the client still
  // sends so closing does not reset the connection under the response.
  void reply_locally(const std::string &response) {
    decided_ = true;
    timer_.cancel();

    boost::asio::async_write(
        inbound_, boost::asio::buffer(response),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    size_t) {
          if (ec) {
            self->close_all();
            return;
          }
          boost::system::error_code shutdown_ec;
          self->inbound_.shutdown(tcp::socket::shutdown_send, shutdown_ec);

          self->timer_.expires_after(DRAIN_TIMEOUT);
          self->timer_.async_wait(
              [self](const boost::system::error_code &ec) {
                if (!ec) {
                  self->close_all();
                }
              });
          self->drain();
        });
  }

  void drain() {
    inbound_.async_read_some(
        boost::asio::buffer(head_buf_),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    size_t) {
          if (ec) {
            self->close_all();
            return;
          }
          self->drain();
        });
  }

  void go_opaque() {
    if (opaque_) {
      return;
    }
    decided_ = true;
    opaque_ = true;
    timer_.cancel();
    connect_upstream();
  }

  void connect_upstream() {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(entry_->device_ip(), ec);
    if (ec) {
      stats_->upstream_failures++;
      LOG_RELAY_ERROR("{} invalid device address: {}",
                      entry_->key().ToString(), ec.message());
      close_all();
      return;
    }
    tcp::endpoint target(address, entry_->device_port());

    timer_.expires_after(config_.connect_timeout);
    timer_.async_wait([self = shared_from_this()](
                          const boost::system::error_code &ec) {
      if (ec || self->connected_) {
        return;
      }
      // Aborts the pending connect; its handler reports the failure
      boost::system::error_code close_ec;
      self->upstream_.close(close_ec);
    });

    upstream_.async_connect(
        target, [self = shared_from_this()](const boost::system::error_code &ec) {
          self->timer_.cancel();
          if (ec) {
            self->stats_->upstream_failures++;
            LOG_RELAY_DEBUG("{} upstream connect failed for {}: {}",
                            self->entry_->key().ToString(), self->peer_,
                            ec == boost::asio::error::operation_aborted
                                ? std::string("timed out")
                                : ec.message());
            self->close_all();
            return;
          }
          self->connected_ = true;
          self->on_upstream_connected();
        });
  }

  void on_upstream_connected() {
    boost::system::error_code opt_ec;
    upstream_.set_option(tcp::no_delay(true), opt_ec);
    upstream_.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

    stats_->relayed++;
    LOG_RELAY_TRACE("{} relaying {} -> {}:{}", entry_->key().ToString(), peer_,
                    entry_->device_ip(), entry_->device_port());

    if (head_.empty()) {
      start_splice();
      return;
    }

    // Replay the bytes consumed while looking for a control request
    boost::asio::async_write(
        upstream_, boost::asio::buffer(head_),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    size_t) {
          if (ec) {
            self->close_all();
            return;
          }
          self->start_splice();
        });
  }

  void start_splice() {
    open_directions_ = 2;
    pump(inbound_, upstream_, client_buf_);
    pump(upstream_, inbound_, upstream_buf_);
  }

  void pump(tcp::socket &from, tcp::socket &to, std::vector<char> &buf) {
    from.async_read_some(
        boost::asio::buffer(buf),
        [self = shared_from_this(), &from, &to,
         &buf](const boost::system::error_code &ec, size_t n) {
          if (ec) {
            // EOF (or error) on this side: half-close the other side so it
            // still receives everything already written
            boost::system::error_code shutdown_ec;
            to.shutdown(tcp::socket::shutdown_send, shutdown_ec);
            self->finish_direction();
            return;
          }

          boost::asio::async_write(
              to, boost::asio::buffer(buf.data(), n),
              [self, &from, &to, &buf](const boost::system::error_code &ec,
                                       size_t) {
                if (ec) {
                  self->close_all();
                  return;
                }
                self->pump(from, to, buf);
              });
        });
  }

  void finish_direction() {
    if (--open_directions_ == 0) {
      close_all();
    }
  }

  void close_all() {
    if (closed_) {
      return;
    }
    closed_ = true;

    timer_.cancel();
    boost::system::error_code ec;
    inbound_.shutdown(tcp::socket::shutdown_both, ec);
    inbound_.close(ec);
    upstream_.shutdown(tcp::socket::shutdown_both, ec);
    upstream_.close(ec);
  }

  tcp::socket inbound_;
  tcp::socket upstream_;
  boost::asio::steady_timer timer_;

  std::shared_ptr<RelayEntry> entry_;
  std::shared_ptr<StreamRelay::Stats> stats_;
  StreamRelay::Config config_;
  std::string peer_{"?"};

  std::array<char, 4096> head_buf_;
  std::string head_;
  std::vector<char> client_buf_;
  std::vector<char> upstream_buf_;

  // Only touched from the session strand
  bool decided_{false};
  bool opaque_{false};
  bool connected_{false};
  bool closed_{false};
  int open_directions_{0};
};

} // namespace

// ============================================================================
// StreamRelay
// ============================================================================

std::shared_ptr<StreamRelay>
StreamRelay::create(boost::asio::io_context &io_context,
                    std::shared_ptr<RelayEntry> entry, const Config &config) {
  return std::shared_ptr<StreamRelay>(
      new StreamRelay(io_context, std::move(entry), config));
}

StreamRelay::StreamRelay(boost::asio::io_context &io_context,
                         std::shared_ptr<RelayEntry> entry,
                         const Config &config)
    : io_context_(io_context), entry_(std::move(entry)), config_(config),
      stats_(std::make_shared<Stats>()),
      strand_(boost::asio::make_strand(io_context)), acceptor_(strand_) {}

StreamRelay::~StreamRelay() {
  boost::system::error_code ec;
  acceptor_.close(ec);
}

RelayError StreamRelay::start() {
  if (listening_) {
    return RelayError::NONE;
  }

  boost::system::error_code ec;
  auto bind_addr = boost::asio::ip::make_address(config_.bind_address, ec);
  if (ec) {
    LOG_RELAY_ERROR("invalid bind address '{}': {}", config_.bind_address,
                    ec.message());
    return RelayError::INVALID_ARGUMENT;
  }
  tcp::endpoint endpoint(bind_addr, entry_->tcp_listen_port());

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    LOG_RELAY_DEBUG("TCP port {} unavailable: {}", entry_->tcp_listen_port(),
                    ec.message());
    boost::system::error_code close_ec;
    acceptor_.close(close_ec);
    return RelayError::PORT_CONFLICT;
  }

  listening_ = true;
  start_accept();

  LOG_RELAY_INFO("TCP :{} -> {}:{}", entry_->tcp_listen_port(),
                 entry_->device_ip(), entry_->device_port());
  return RelayError::NONE;
}

void StreamRelay::stop() {
  if (!listening_.exchange(false)) {
    return;
  }

  // handle_accept re-arms the acceptor on strand_
  RunOnStrand(io_context_, strand_, [this]() {
    boost::system::error_code ec;
    acceptor_.close(ec);
  });
  LOG_RELAY_DEBUG("TCP :{} stopped listening ({} sessions still draining)",
                  entry_->tcp_listen_port(), stats_->active_sessions.load());
}

void StreamRelay::start_accept() {
  acceptor_.async_accept(
      boost::asio::make_strand(io_context_),
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  tcp::socket socket) {
        self->handle_accept(ec, std::move(socket));
      });
}

void StreamRelay::handle_accept(const boost::system::error_code &ec,
                                tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted || !listening_) {
      return;
    }
    LOG_RELAY_TRACE("accept error on :{}: {}", entry_->tcp_listen_port(),
                    ec.message());
    // Continue accepting despite error
    start_accept();
    return;
  }

  stats_->accepted++;

  try {
    auto session = std::make_shared<RelaySession>(std::move(socket), entry_,
                                                  stats_, config_);
    session->start();
  } catch (const std::exception &e) {
    LOG_RELAY_WARN("failed to start session on :{}: {}",
                   entry_->tcp_listen_port(), e.what());
  }

  if (listening_) {
    start_accept();
  }
}

} // namespace relay
} // namespace kvmrelay
