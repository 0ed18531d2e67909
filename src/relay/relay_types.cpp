// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/relay_types.hpp"

namespace kvmrelay {
namespace relay {

const char *RelayErrorString(RelayError error) {
  switch (error) {
  case RelayError::NONE:
    return "none";
  case RelayError::PORT_CONFLICT:
    return "port conflict";
  case RelayError::ALLOCATION_FAILED:
    return "allocation failed";
  case RelayError::UPSTREAM_CONNECT_FAILED:
    return "upstream connect failed";
  case RelayError::REGISTRATION_FAILED:
    return "registration failed";
  case RelayError::HEARTBEAT_FAILED:
    return "heartbeat failed";
  case RelayError::OVERLAY_IDENTITY_UNAVAILABLE:
    return "overlay identity unavailable";
  case RelayError::INVALID_ARGUMENT:
    return "invalid argument";
  }
  return "unknown";
}

} // namespace relay
} // namespace kvmrelay
