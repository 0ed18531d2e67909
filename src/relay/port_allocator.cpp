// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/port_allocator.hpp"
#include <boost/asio/ip/address_v4.hpp>

namespace kvmrelay {
namespace relay {

namespace {
constexpr uint32_t MAX_PORT = 65535;
constexpr uint16_t DEFAULT_WEB_PORT = 80;
} // namespace

PortAllocator::PortAllocator(PortBands bands) : bands_(std::move(bands)) {}

int PortAllocator::LastOctet(const std::string &device_ip) {
  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address_v4(device_ip, ec);
  if (ec) {
    return -1;
  }
  return addr.to_bytes()[3];
}

uint32_t PortAllocator::BaseTcpPort(const std::string &device_ip,
                                    uint16_t device_port) const {
  int last = LastOctet(device_ip);
  if (last < 0) {
    return bands_.tcp_base;
  }
  if (device_port == DEFAULT_WEB_PORT) {
    return static_cast<uint32_t>(bands_.tcp_base) + last;
  }
  return static_cast<uint32_t>(bands_.alt_tcp_base) + last;
}

std::vector<PortCandidate>
PortAllocator::Candidates(const std::string &device_ip,
                          uint16_t device_port) const {
  std::vector<PortCandidate> out;

  const uint32_t tcp = BaseTcpPort(device_ip, device_port);
  // Same offset from tcp_base, inside the UDP band. The alternate band sits
  // above tcp_base so the difference is never negative.
  const int64_t udp = static_cast<int64_t>(tcp) - bands_.tcp_base + bands_.udp_base;

  for (uint16_t offset : bands_.retry_offsets) {
    const int64_t tcp_port = static_cast<int64_t>(tcp) + offset;
    const int64_t udp_port = udp + offset;
    if (tcp_port <= 0 || udp_port <= 0 || tcp_port > MAX_PORT ||
        udp_port > MAX_PORT) {
      continue;
    }
    out.push_back(PortCandidate{static_cast<uint16_t>(tcp_port),
                                static_cast<uint16_t>(udp_port), offset});
  }
  return out;
}

} // namespace relay
} // namespace kvmrelay
