// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace netsession {

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

// Full version info for display
inline std::string GetFullVersionString() {
  return "netsessiond version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // Responder
constexpr const char *GREEN = "\033[1;32m"; // Client
} // namespace colors

// Startup banner; mode is "RESPONDER" or "CLIENT"
inline std::string GetStartupBanner(const std::string &mode,
                                    const std::string &endpoint) {
  const char *color = mode == "CLIENT" ? colors::GREEN : colors::BLUE;

  // Box is 65 display chars wide
  auto line = [](const std::string &label, const std::string &value) {
    std::string text = "║  " + label + value;
    size_t used = 3 + label.length() + value.length();
    text += std::string(used < 64 ? 64 - used : 0, ' ') + "║\n";
    return text;
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner += line("", "netsessiond - datagram session server");
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("Version:  ", GetVersionString());
  banner += line("Mode:     ", mode);
  banner += line("Endpoint: ", endpoint);
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("", GetCopyrightString());
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace netsession
