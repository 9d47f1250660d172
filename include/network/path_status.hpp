// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

// Interface kinds a satisfied path may use (bit set)
enum class InterfaceType : uint32_t {
  None = 0,
  Cellular = 1 << 0,
  Wifi = 1 << 1,
  WiredEthernet = 1 << 2,
  Other = 1 << 3,
  Loopback = 1 << 4
};

inline InterfaceType operator|(InterfaceType a, InterfaceType b) {
  return static_cast<InterfaceType>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline bool HasInterface(InterfaceType set, InterfaceType flag) {
  return (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) != 0;
}

// Why a path is unusable, when the platform says
enum class UnsatisfiedReason {
  CellularDenied,
  LocalNetworkDenied,
  NotAvailable,
  WifiDenied,
  VpnInactive,
  Unknown,
  Unsupported
};

std::string InterfacesToString(InterfaceType interfaces);
std::string UnsatisfiedReasonToString(UnsatisfiedReason reason);

/**
 * PathStatus - usability of the host's network path
 *
 * reason is meaningful for Unsatisfied only, interfaces for Satisfied only;
 * the factories keep the other field cleared so equality stays exact.
 */
struct PathStatus {
  enum class Kind { Unknown, Unsatisfied, Satisfied, RequiresConnection };

  Kind kind{Kind::Unknown};
  std::optional<UnsatisfiedReason> reason;
  InterfaceType interfaces{InterfaceType::None};

  static PathStatus Unknown() { return PathStatus{}; }
  static PathStatus Unsatisfied(std::optional<UnsatisfiedReason> reason) {
    PathStatus status;
    status.kind = Kind::Unsatisfied;
    status.reason = reason;
    return status;
  }
  static PathStatus Satisfied(InterfaceType interfaces) {
    PathStatus status;
    status.kind = Kind::Satisfied;
    status.interfaces = interfaces;
    return status;
  }
  static PathStatus RequiresConnection() {
    PathStatus status;
    status.kind = Kind::RequiresConnection;
    return status;
  }

  bool IsSatisfied() const { return kind == Kind::Satisfied; }

  bool operator==(const PathStatus &other) const {
    return kind == other.kind && reason == other.reason &&
           interfaces == other.interfaces;
  }
  bool operator!=(const PathStatus &other) const { return !(*this == other); }

  std::string ToString() const;
};

// One update from the platform path monitor
struct NetworkPath {
  PathStatus status;
  bool is_expensive{false};
  bool is_constrained{false};

  bool operator==(const NetworkPath &other) const {
    return status == other.status && is_expensive == other.is_expensive &&
           is_constrained == other.is_constrained;
  }
  bool operator!=(const NetworkPath &other) const { return !(*this == other); }
};

} // namespace network
} // namespace peerlink
