// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace peerlink {

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
constexpr const char *COPYRIGHT_HOLDERS = "The PeerLink Developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "PeerLink version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// Startup banner for peerlinkd
inline std::string GetStartupBanner(const std::string &display_name) {
  std::string banner;
  banner += "\n";
  banner += "  PeerLink " + GetVersionString() + "\n";
  banner += "  Device:  " + display_name + "\n";
  banner += "  " + GetCopyrightString() + "\n\n";
  return banner;
}

} // namespace peerlink
