// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/http_client.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace kvmrelay {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

std::optional<ParsedUrl> ParseUrl(const std::string &url) {
  static const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return std::nullopt;
  }

  ParsedUrl out;
  std::string rest = url.substr(scheme.size());

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    out.target = rest.substr(slash);
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
    if (out.port.empty() ||
        out.port.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
  } else {
    out.host = authority;
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  return out;
}

BeastHttpClient::BeastHttpClient(Config config) : config_(std::move(config)) {
  if (config_.user_agent.empty()) {
    config_.user_agent = GetUserAgent();
  }
}

HttpResponse BeastHttpClient::Get(const std::string &url) {
  return Perform("GET", url, nullptr);
}

HttpResponse BeastHttpClient::PostJson(const std::string &url,
                                       const std::string &json_body) {
  return Perform("POST", url, &json_body);
}

HttpResponse BeastHttpClient::Perform(const std::string &method,
                                      const std::string &url,
                                      const std::string *json_body) {
  HttpResponse result;

  auto parsed = ParseUrl(url);
  if (!parsed) {
    result.error = "unsupported URL: " + url;
    return result;
  }

  http::request<http::string_body> req{
      method == "POST" ? http::verb::post : http::verb::get, parsed->target,
      11};
  req.set(http::field::host, parsed->host);
  req.set(http::field::user_agent, config_.user_agent);
  if (!config_.bearer_token.empty()) {
    req.set(http::field::authorization, "Bearer " + config_.bearer_token);
  }
  if (json_body) {
    req.set(http::field::content_type, "application/json");
    req.body() = *json_body;
  }
  req.prepare_payload();

  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  boost::asio::steady_timer deadline(ioc);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;

  bool timed_out = false;
  beast::error_code failure;

  auto finish = [&](const beast::error_code &ec) {
    failure = ec;
    deadline.cancel();
  };

  deadline.expires_after(config_.timeout);
  deadline.async_wait([&](const beast::error_code &ec) {
    if (ec) {
      return;
    }
    timed_out = true;
    resolver.cancel();
    beast::error_code close_ec;
    stream.socket().close(close_ec);
  });

  resolver.async_resolve(
      parsed->host, parsed->port,
      [&](const beast::error_code &ec, tcp::resolver::results_type results) {
        if (ec) {
          return finish(ec);
        }
        stream.async_connect(results, [&](const beast::error_code &ec,
                                          const tcp::endpoint &) {
          if (ec) {
            return finish(ec);
          }
          http::async_write(stream, req, [&](const beast::error_code &ec,
                                             std::size_t) {
            if (ec) {
              return finish(ec);
            }
            http::async_read(stream, buffer, res,
                             [&](const beast::error_code &ec, std::size_t) {
                               finish(ec);
                             });
          });
        });
      });

  try {
    ioc.run();
  } catch (const std::exception &e) {
    result.error = e.what();
    return result;
  }

  beast::error_code shutdown_ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

  if (timed_out) {
    result.error = "request timed out";
    return result;
  }
  if (failure) {
    result.error = failure.message();
    return result;
  }

  result.status = static_cast<int>(res.result_int());
  result.body = std::move(res.body());
  LOG_NET_TRACE("{} {} -> {}", method, url, result.status);
  return result;
}

} // namespace network
} // namespace kvmrelay
