// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/control_channel.hpp"
#include <charconv>

namespace kvmrelay {
namespace relay {
namespace control {

namespace {

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// True while `head` could still grow into `prefix`
bool CouldBecome(std::string_view head, std::string_view prefix) {
  return head.size() < prefix.size() && StartsWith(prefix, head);
}

const std::string GET_PREFIX = "GET " + std::string(SET_MEDIA_PORT_PATH);
const std::string OPTIONS_PREFIX = "OPTIONS " + std::string(SET_MEDIA_PORT_PATH);

} // namespace

uint16_t ParsePortQuery(std::string_view target) {
  size_t q = target.find('?');
  if (q == std::string_view::npos) {
    return 0;
  }

  std::string_view query = target.substr(q + 1);
  while (!query.empty()) {
    size_t amp = query.find('&');
    std::string_view param = query.substr(0, amp);

    size_t eq = param.find('=');
    if (eq != std::string_view::npos && param.substr(0, eq) == "port") {
      std::string_view value = param.substr(eq + 1);
      if (value.empty() || value.size() > 5) {
        return 0;
      }
      unsigned int port = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), port);
      if (ec != std::errc() || ptr != value.data() + value.size() ||
          port == 0 || port > 65535) {
        return 0;
      }
      return static_cast<uint16_t>(port);
    }

    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return 0;
}

Classification ClassifyRequestHead(std::string_view head) {
  Classification result;

  const bool is_get = StartsWith(head, GET_PREFIX);
  const bool is_options = StartsWith(head, OPTIONS_PREFIX);

  if (!is_get && !is_options) {
    if (CouldBecome(head, GET_PREFIX) || CouldBecome(head, OPTIONS_PREFIX)) {
      result.kind = RequestKind::INCOMPLETE;
    } else {
      result.kind = RequestKind::OPAQUE;
    }
    return result;
  }

  size_t eol = head.find('\n');
  if (eol == std::string_view::npos) {
    result.kind = head.size() >= MAX_REQUEST_LINE ? RequestKind::BAD_REQUEST
                                                  : RequestKind::INCOMPLETE;
    return result;
  }

  if (is_options) {
    result.kind = RequestKind::PREFLIGHT;
    return result;
  }

  // "GET <target> HTTP/1.1"
  std::string_view line = head.substr(0, eol);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  std::string_view target = line.substr(4);
  size_t sp = target.find(' ');
  if (sp != std::string_view::npos) {
    target = target.substr(0, sp);
  }

  result.port = ParsePortQuery(target);
  result.kind = result.port != 0 ? RequestKind::SET_MEDIA_PORT
                                 : RequestKind::BAD_REQUEST;
  return result;
}

const std::string &OkResponse() {
  static const std::string response = "HTTP/1.1 200 OK\r\n"
                                      "Access-Control-Allow-Origin: *\r\n"
                                      "Content-Type: application/json\r\n"
                                      "Content-Length: 15\r\n"
                                      "Connection: close\r\n\r\n"
                                      "{\"status\":\"ok\"}";
  return response;
}

const std::string &BadRequestResponse() {
  static const std::string response = "HTTP/1.1 400 Bad Request\r\n"
                                      "Access-Control-Allow-Origin: *\r\n"
                                      "Content-Type: application/json\r\n"
                                      "Content-Length: 30\r\n"
                                      "Connection: close\r\n\r\n"
                                      "{\"status\":\"error\",\"port\":null}";
  return response;
}

const std::string &PreflightResponse() {
  static const std::string response =
      "HTTP/1.1 204 No Content\r\n"
      "Access-Control-Allow-Origin: *\r\n"
      "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
      "Access-Control-Allow-Headers: *\r\n"
      "Connection: close\r\n\r\n";
  return response;
}

std::string BuildSetMediaPortTarget(uint16_t port) {
  return std::string(SET_MEDIA_PORT_PATH) + "?port=" + std::to_string(port);
}

std::string BuildSetMediaPortUrl(const std::string &relay_ip,
                                 uint16_t tcp_listen_port, uint16_t port) {
  return "http://" + relay_ip + ":" + std::to_string(tcp_listen_port) +
         BuildSetMediaPortTarget(port);
}

} // namespace control
} // namespace relay
} // namespace kvmrelay
