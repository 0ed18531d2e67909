// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_VERSION_HPP
#define KVMRELAY_VERSION_HPP

#include <string>

namespace kvmrelay {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// User agent for directory service requests
// Format: kvmrelay/1.0.0
inline std::string GetUserAgent() { return "kvmrelay/" + GetVersionString(); }

// Full version info for display
inline std::string GetFullVersionString() {
  return "kvmrelay version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m"; // Overlay address found
constexpr const char *RED = "\033[1;31m";   // No overlay address
} // namespace colors

// Print startup banner with the overlay address (empty when not found yet)
inline std::string GetStartupBanner(const std::string &overlay_ip) {
  const char *color = overlay_ip.empty() ? colors::RED : colors::GREEN;
  const std::string overlay_str = overlay_ip.empty() ? "(not found)" : overlay_ip;

  std::string banner;
  banner += "\n";
  banner += color;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "║                      KVM  OVERLAY  RELAY                      ║\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  std::string version_str = GetVersionString();
  banner += "║  Version: " + version_str;
  // Pad to align with box
  size_t version_padding = 54 - version_str.length();
  banner += std::string(version_padding, ' ') + "║\n";

  banner += "║  Overlay: " + overlay_str;
  size_t overlay_padding = 54 - overlay_str.length();
  banner += std::string(overlay_padding, ' ') + "║\n";

  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += "║  " + GetCopyrightString();
  size_t copyright_padding = 62 - GetCopyrightString().length();
  banner += std::string(copyright_padding, ' ') + "║\n";
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace kvmrelay

#endif // KVMRELAY_VERSION_HPP
