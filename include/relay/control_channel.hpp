#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace kvmrelay {
namespace relay {
namespace control {

/*
 Port-learning channel

 The stream relay looks at the first bytes of every inbound connection.
 A request for the reserved path is answered by the relay itself and never
 reaches the device:

   GET /_relay/set-media-port?port=55123 HTTP/1.1    -> 200, target port set
   GET /_relay/set-media-port?port=abc HTTP/1.1      -> 400, nothing changes
   OPTIONS /_relay/set-media-port?port=55123 ...     -> 204 (CORS preflight)

 Everything else is opaque and spliced to the device unchanged.
*/

constexpr std::string_view SET_MEDIA_PORT_PATH = "/_relay/set-media-port";

// Longest request line we wait for before giving up on a control request
constexpr size_t MAX_REQUEST_LINE = 4096;

enum class RequestKind {
  INCOMPLETE,     // need more bytes to decide
  OPAQUE,         // not ours, forward to the device
  SET_MEDIA_PORT, // valid port-learning request
  BAD_REQUEST,    // reserved path with a missing/invalid port
  PREFLIGHT       // OPTIONS on the reserved path
};

struct Classification {
  RequestKind kind{RequestKind::INCOMPLETE};
  uint16_t port{0}; // set for SET_MEDIA_PORT only
};

/**
 * Classify the bytes received so far on a fresh connection.
 * Only ever looks at the request line.
 */
Classification ClassifyRequestHead(std::string_view head);

// Parse the numeric "port" query parameter (1..65535); 0 if absent/invalid
uint16_t ParsePortQuery(std::string_view target);

// Fixed responses written back by the relay
const std::string &OkResponse();
const std::string &BadRequestResponse();
const std::string &PreflightResponse();

// Request target for a port report: "/_relay/set-media-port?port=55123"
std::string BuildSetMediaPortTarget(uint16_t port);

// Full URL the remote peer calls
std::string BuildSetMediaPortUrl(const std::string &relay_ip,
                                 uint16_t tcp_listen_port, uint16_t port);

} // namespace control
} // namespace relay
} // namespace kvmrelay
