// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kvmrelay {
namespace network {

/**
 * OverlayIdentity - this host's address on the overlay network
 *
 * Found by enumerating local IPv4 interface addresses and picking the first
 * one that starts with the configured prefix. The first hit is cached;
 * refresh() looks again. A host without an overlay address is a normal
 * state: callers get nullopt and carry on.
 */
class OverlayIdentity {
public:
  using AddressSource = std::function<std::vector<std::string>()>;

  static constexpr const char *DEFAULT_PREFIX = "10.147.";

  explicit OverlayIdentity(std::string prefix = DEFAULT_PREFIX);

  // Test seam: replaces interface enumeration
  OverlayIdentity(std::string prefix, AddressSource source);

  // Cached address, discovering it on first use
  std::optional<std::string> get();

  // Drop the cache and enumerate again
  std::optional<std::string> refresh();

  // Pin the identity (from configuration); empty string clears the pin
  void set_override(const std::string &address);

  const std::string &prefix() const { return prefix_; }

  // First address in `addresses` starting with `prefix`
  static std::optional<std::string>
  SelectByPrefix(const std::vector<std::string> &addresses,
                 const std::string &prefix);

  // IPv4 addresses of all local interfaces (getifaddrs)
  static std::vector<std::string> EnumerateInterfaceAddresses();

private:
  std::optional<std::string> discover_locked();

  const std::string prefix_;
  AddressSource source_;

  std::mutex mutex_;
  std::optional<std::string> cached_;
  std::string override_;
};

} // namespace network
} // namespace kvmrelay
