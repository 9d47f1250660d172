// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace peerlink {

// Library version
constexpr int PEERLINK_VERSION_MAJOR = 1;
constexpr int PEERLINK_VERSION_MINOR = 0;
constexpr int PEERLINK_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(PEERLINK_VERSION_MAJOR) + "." +
         std::to_string(PEERLINK_VERSION_MINOR) + "." +
         std::to_string(PEERLINK_VERSION_PATCH);
}

// Full version info for logs
inline std::string GetFullVersionString() {
  return "peerlink version " + GetVersionString();
}

} // namespace peerlink
