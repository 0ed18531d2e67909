// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>

namespace kvmrelay {
namespace relay {

/*
 AddressRewriter - peer-side rewriting of session negotiation messages

 The media engine on the remote peer must believe the device lives at the
 relay. Before a negotiation message reaches it:

   candidate:1 1 udp 2122 192.168.68.100 55123 typ host
     -> candidate:1 1 udp 2122 10.147.20.5 28100 typ host
        and port 55123 is reported to the relay (once per session)

   c=IN IP4 192.168.68.100  ->  c=IN IP4 10.147.20.5

 0.0.0.0, loopback and the relay's own address are never touched.
 Reporting goes through the PortReporter callback; failures there are the
 reporter's business.
*/

struct RewriteTarget {
  std::string device_ip; // empty: rewrite any private (RFC1918/link-local) IPv4
  std::string relay_ip;  // overlay address of the relay host
  uint16_t udp_listen_port{0};
};

class AddressRewriter {
public:
  using PortReporter = std::function<void(uint16_t original_port)>;

  explicit AddressRewriter(RewriteTarget target, PortReporter reporter = {});

  bool ShouldRewrite(const std::string &address) const;

  // One candidate attribute, with or without the "a=" prefix
  std::string RewriteCandidate(const std::string &candidate);

  // Whole session description; line endings are preserved
  std::string RewriteSdp(const std::string &sdp);

  // Device signaling JSON ("new-ice-candidate", "offer", "answer").
  // Anything unparseable or of another type is returned unchanged.
  std::string RewriteSignalingMessage(const std::string &message);

  std::set<uint16_t> reported_ports() const;

  // New negotiation session: ports may be reported again
  void ResetSession();

  const RewriteTarget &target() const { return target_; }

private:
  void Report(uint16_t port);
  std::string RewriteEncodedDescription(const std::string &encoded,
                                        bool *changed);

  RewriteTarget target_;
  PortReporter reporter_;

  mutable std::mutex mutex_;
  std::set<uint16_t> reported_;
};

} // namespace relay
} // namespace kvmrelay
