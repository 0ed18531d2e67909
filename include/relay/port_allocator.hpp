#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kvmrelay {
namespace relay {

/**
 * Port bands for rendezvous ports
 *
 * A device on port 80 lands in the TCP band at tcp_base + last octet,
 * any other device port in alt_tcp_base + last octet. The UDP port keeps
 * the same offset from tcp_base inside the UDP band.
 */
struct PortBands {
  uint16_t tcp_base{18000};
  uint16_t alt_tcp_base{19000};
  uint16_t udp_base{28000};
  std::vector<uint16_t> retry_offsets{0, 1000, 2000};
};

// One TCP/UDP pair to try; both legs always share the retry offset
struct PortCandidate {
  uint16_t tcp_port{0};
  uint16_t udp_port{0};
  uint16_t offset{0};

  bool operator==(const PortCandidate &other) const {
    return tcp_port == other.tcp_port && udp_port == other.udp_port &&
           offset == other.offset;
  }
};

/**
 * PortAllocator - deterministic rendezvous port proposals
 *
 * Pure: no sockets are touched here. The Relay Manager walks the returned
 * ladder and binds each pair in turn.
 */
class PortAllocator {
public:
  explicit PortAllocator(PortBands bands = PortBands{});

  // First TCP candidate (retry offset 0) for a device
  uint32_t BaseTcpPort(const std::string &device_ip, uint16_t device_port) const;

  // Full retry ladder in order; pairs past 65535 are left out
  std::vector<PortCandidate> Candidates(const std::string &device_ip,
                                        uint16_t device_port) const;

  const PortBands &bands() const { return bands_; }

  // 4th octet of a dotted-quad IPv4 address, -1 if the address is not one
  static int LastOctet(const std::string &device_ip);

private:
  PortBands bands_;
};

} // namespace relay
} // namespace kvmrelay
