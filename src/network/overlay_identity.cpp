// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/overlay_identity.hpp"
#include "util/logging.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <netinet/in.h>

namespace kvmrelay {
namespace network {

OverlayIdentity::OverlayIdentity(std::string prefix)
    : OverlayIdentity(std::move(prefix), &EnumerateInterfaceAddresses) {}

OverlayIdentity::OverlayIdentity(std::string prefix, AddressSource source)
    : prefix_(std::move(prefix)), source_(std::move(source)) {}

std::optional<std::string> OverlayIdentity::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!override_.empty()) {
    return override_;
  }
  if (cached_) {
    return cached_;
  }
  return discover_locked();
}

std::optional<std::string> OverlayIdentity::refresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!override_.empty()) {
    return override_;
  }
  cached_.reset();
  return discover_locked();
}

void OverlayIdentity::set_override(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  override_ = address;
}

std::optional<std::string> OverlayIdentity::discover_locked() {
  std::vector<std::string> addresses;
  try {
    addresses = source_();
  } catch (const std::exception &e) {
    LOG_NET_WARN("interface enumeration failed: {}", e.what());
    return std::nullopt;
  }

  cached_ = SelectByPrefix(addresses, prefix_);
  if (cached_) {
    LOG_NET_INFO("overlay identity: {}", *cached_);
  } else {
    LOG_NET_DEBUG("no interface address with prefix {} ({} candidates)",
                  prefix_, addresses.size());
  }
  return cached_;
}

std::optional<std::string>
OverlayIdentity::SelectByPrefix(const std::vector<std::string> &addresses,
                                const std::string &prefix) {
  if (prefix.empty()) {
    return std::nullopt;
  }
  for (const auto &addr : addresses) {
    if (addr.compare(0, prefix.size(), prefix) == 0) {
      return addr;
    }
  }
  return std::nullopt;
}

std::vector<std::string> OverlayIdentity::EnumerateInterfaceAddresses() {
  std::vector<std::string> out;

  struct ifaddrs *ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    LOG_NET_WARN("getifaddrs failed: {}", std::strerror(errno));
    return out;
  }

  for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    char buf[INET_ADDRSTRLEN] = {0};
    auto *sin = reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
      out.emplace_back(buf);
    }
  }

  freeifaddrs(ifaddr);
  return out;
}

} // namespace network
} // namespace kvmrelay
