// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/path_status.hpp"

namespace peerlink {
namespace network {

std::string InterfacesToString(InterfaceType interfaces) {
  static const struct {
    InterfaceType flag;
    const char *name;
  } kNames[] = {
      {InterfaceType::Cellular, "cellular"},
      {InterfaceType::Wifi, "wifi"},
      {InterfaceType::WiredEthernet, "wiredEthernet"},
      {InterfaceType::Other, "other"},
      {InterfaceType::Loopback, "loopback"},
  };

  std::string out;
  for (const auto &entry : kNames) {
    if (HasInterface(interfaces, entry.flag)) {
      if (!out.empty()) {
        out += ",";
      }
      out += entry.name;
    }
  }
  return out.empty() ? "none" : out;
}

std::string UnsatisfiedReasonToString(UnsatisfiedReason reason) {
  switch (reason) {
  case UnsatisfiedReason::CellularDenied:
    return "cellularDenied";
  case UnsatisfiedReason::LocalNetworkDenied:
    return "localNetworkDenied";
  case UnsatisfiedReason::NotAvailable:
    return "notAvailable";
  case UnsatisfiedReason::WifiDenied:
    return "wifiDenied";
  case UnsatisfiedReason::VpnInactive:
    return "vpnInactive";
  case UnsatisfiedReason::Unknown:
    return "unknown";
  case UnsatisfiedReason::Unsupported:
    return "unsupported";
  }
  return "unknown";
}

std::string PathStatus::ToString() const {
  switch (kind) {
  case Kind::Unknown:
    return "unknown";
  case Kind::Unsatisfied:
    return reason ? "unsatisfied(" + UnsatisfiedReasonToString(*reason) + ")"
                  : "unsatisfied";
  case Kind::Satisfied:
    return "satisfied(" + InterfacesToString(interfaces) + ")";
  case Kind::RequiresConnection:
    return "requiresConnection";
  }
  return "unknown";
}

} // namespace network
} // namespace peerlink
