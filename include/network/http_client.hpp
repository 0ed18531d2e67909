// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace kvmrelay {
namespace network {

struct HttpResponse {
  int status{0};      // 0 when no response was received
  std::string body;
  std::string error;  // transport error, empty on success

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// Pieces of an "http://host[:port][/path]" URL
struct ParsedUrl {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
};

// Only plain http URLs are supported; nullopt otherwise
std::optional<ParsedUrl> ParseUrl(const std::string &url);

/**
 * HttpClient - minimal blocking HTTP/1.1 client
 *
 * Abstract so the registry client and the peer tool can be exercised
 * against in-process fakes.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const std::string &url) = 0;
  virtual HttpResponse PostJson(const std::string &url,
                                const std::string &json_body) = 0;
};

/**
 * BeastHttpClient - HttpClient over Boost.Beast
 *
 * Each request resolves, connects, writes and reads on a private
 * io_context with a single overall deadline. Safe to call from any
 * thread; no state is shared between requests.
 */
class BeastHttpClient : public HttpClient {
public:
  struct Config {
    std::chrono::milliseconds timeout;
    std::string bearer_token; // sent as "Authorization: Bearer ..." if set
    std::string user_agent;

    Config() : timeout(std::chrono::seconds(10)) {}
  };

  explicit BeastHttpClient(Config config = Config{});

  HttpResponse Get(const std::string &url) override;
  HttpResponse PostJson(const std::string &url,
                        const std::string &json_body) override;

private:
  HttpResponse Perform(const std::string &method, const std::string &url,
                       const std::string *json_body);

  Config config_;
};

} // namespace network
} // namespace kvmrelay
